#include "backends/webcam/opencv_webcam_impl.hpp"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <climits>
#include <cmath>
#include <string>
#include <utility>

namespace chronosnap::backends::webcam {

struct OpenCvWebcamImpl::Impl {
  cv::VideoCapture capture;
};

const char* ToString(const OpenCvCaptureProperty property) {
  switch (property) {
  case OpenCvCaptureProperty::kFrameWidth:
    return "frame_width";
  case OpenCvCaptureProperty::kFrameHeight:
    return "frame_height";
  }
  return "unknown";
}

OpenCvWebcamImpl::OpenCvWebcamImpl() : impl_(std::make_unique<Impl>()) {}

OpenCvWebcamImpl::~OpenCvWebcamImpl() = default;

bool OpenCvWebcamImpl::OpenDevice(const std::size_t device_index, std::string& error) {
  error.clear();
  if (device_index > static_cast<std::size_t>(INT_MAX)) {
    error = "capture index " + std::to_string(device_index) + " is out of range for OpenCV";
    return false;
  }
  try {
    cv::VideoCapture capture;
    if (!capture.open(static_cast<int>(device_index), cv::CAP_ANY)) {
      error = "OpenCV could not open capture index " + std::to_string(device_index);
      return false;
    }
    impl_->capture.release();
    impl_->capture = std::move(capture);
  } catch (const cv::Exception& ex) {
    error = "OpenCV raised while opening capture index " + std::to_string(device_index) + ": " +
            ex.what();
    return false;
  }
  return true;
}

bool OpenCvWebcamImpl::CloseDevice(std::string& error) {
  error.clear();
  if (!impl_->capture.isOpened()) {
    return true;
  }
  try {
    impl_->capture.release();
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV raised while releasing capture: ") + ex.what();
    return false;
  }
  return true;
}

bool OpenCvWebcamImpl::SetProperty(const OpenCvCaptureProperty property, const double value,
                                   std::string& error) {
  error.clear();
  if (!impl_->capture.isOpened()) {
    error = "capture must be open before setting OpenCV property";
    return false;
  }
  try {
    if (!impl_->capture.set(ToOpenCvPropertyId(property), value)) {
      error = "OpenCV rejected property set for " + std::string(ToString(property));
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = "OpenCV raised while setting " + std::string(ToString(property)) + ": " + ex.what();
    return false;
  }
  return true;
}

bool OpenCvWebcamImpl::GetProperty(const OpenCvCaptureProperty property, double& value,
                                   std::string& error) const {
  error.clear();
  if (!impl_->capture.isOpened()) {
    error = "capture must be open before reading OpenCV property";
    return false;
  }
  double read_value = 0.0;
  try {
    read_value = impl_->capture.get(ToOpenCvPropertyId(property));
  } catch (const cv::Exception& ex) {
    error = "OpenCV raised while reading " + std::string(ToString(property)) + ": " + ex.what();
    return false;
  }
  if (!std::isfinite(read_value) || read_value <= 0.0) {
    error = "OpenCV returned an unreadable value for property " + std::string(ToString(property));
    return false;
  }
  value = read_value;
  return true;
}

bool OpenCvWebcamImpl::GrabFrame(std::string& error) {
  error.clear();
  if (!impl_->capture.isOpened()) {
    error = "capture must be open before grabbing a frame";
    return false;
  }
  try {
    if (!impl_->capture.grab()) {
      error = "driver returned no frame (device removed or stream stalled)";
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV raised while grabbing a frame: ") + ex.what();
    return false;
  }
  return true;
}

bool OpenCvWebcamImpl::RetrieveFrame(cv::Mat& frame, std::string& error) {
  error.clear();
  if (!impl_->capture.isOpened()) {
    error = "capture must be open before retrieving a frame";
    return false;
  }
  try {
    if (!impl_->capture.retrieve(frame) || frame.empty()) {
      error = "grabbed frame could not be retrieved";
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV raised while retrieving a frame: ") + ex.what();
    return false;
  }
  return true;
}

std::vector<std::size_t>
OpenCvWebcamImpl::EnumerateDeviceIndices(const std::size_t max_probe_index) {
  std::vector<std::size_t> device_indices;
  for (std::size_t index = 0; index <= max_probe_index; ++index) {
    try {
      cv::VideoCapture capture;
      if (!capture.open(static_cast<int>(index), cv::CAP_ANY)) {
        continue;
      }
      device_indices.push_back(index);
      capture.release();
    } catch (const cv::Exception&) {
      // Probing is best-effort; an index that throws is treated as absent.
      continue;
    }
  }
  return device_indices;
}

int OpenCvWebcamImpl::ToOpenCvPropertyId(const OpenCvCaptureProperty property) {
  switch (property) {
  case OpenCvCaptureProperty::kFrameWidth:
    return cv::CAP_PROP_FRAME_WIDTH;
  case OpenCvCaptureProperty::kFrameHeight:
    return cv::CAP_PROP_FRAME_HEIGHT;
  }
  return cv::CAP_PROP_FRAME_WIDTH;
}

} // namespace chronosnap::backends::webcam
