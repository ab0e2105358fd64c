#include "backends/webcam/webcam_capture_device.hpp"

#include "backends/webcam/device_enumeration.hpp"
#include "core/errors/device_error.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace chronosnap::backends::webcam {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

std::string FallbackName(const std::size_t index) {
  return "Camera " + std::to_string(index);
}

std::uint32_t ToDimension(const double value) {
  return static_cast<std::uint32_t>(std::lround(value));
}

} // namespace

WebcamCaptureDevice::~WebcamCaptureDevice() {
  // Destructors cannot report; the OpenCV handle is dropped either way.
  std::string ignored;
  (void)impl_.CloseDevice(ignored);
}

bool WebcamCaptureDevice::Open(const std::size_t index, const Resolution& preferred,
                               std::string& error) {
  error.clear();
  if (open_) {
    error = FormatDeviceError(DeviceErrorCode::kDeviceBusy,
                              "handle already owns capture index " +
                                  std::to_string(capture_index_.value_or(index)));
    return false;
  }

  std::string open_error;
  if (!impl_.OpenDevice(index, open_error)) {
    WebcamDeviceInfo ignored;
    const DeviceErrorCode code = LookupCaptureIndex(index, ignored) == CaptureIndexLookup::kAbsent
                                     ? DeviceErrorCode::kDeviceNotFound
                                     : core::errors::ClassifyOpenFailure(open_error);
    error = FormatDeviceError(code, "unable to open capture index " + std::to_string(index) +
                                        ": " + open_error);
    return false;
  }

  // Drivers may refuse the requested size and silently keep another one, so a
  // rejected set is not an error; only the read-back decides.
  std::string set_error;
  if (preferred.width > 0U && preferred.height > 0U) {
    (void)impl_.SetProperty(OpenCvCaptureProperty::kFrameWidth, preferred.width, set_error);
    (void)impl_.SetProperty(OpenCvCaptureProperty::kFrameHeight, preferred.height, set_error);
  }

  double width = 0.0;
  double height = 0.0;
  std::string get_error;
  if (!impl_.GetProperty(OpenCvCaptureProperty::kFrameWidth, width, get_error) ||
      !impl_.GetProperty(OpenCvCaptureProperty::kFrameHeight, height, get_error)) {
    std::string close_error;
    (void)impl_.CloseDevice(close_error);
    error = FormatDeviceError(DeviceErrorCode::kFormatNegotiationFailed,
                              "capture index " + std::to_string(index) +
                                  " did not report a frame size: " + get_error);
    return false;
  }

  WebcamDeviceInfo known;
  std::string name = FallbackName(index);
  if (LookupCaptureIndex(index, known) == CaptureIndexLookup::kFound &&
      !known.friendly_name.empty()) {
    name = known.friendly_name;
  }

  open_ = true;
  capture_index_ = index;
  device_name_ = std::move(name);
  resolution_ = Resolution{.width = ToDimension(width), .height = ToDimension(height)};
  return true;
}

bool WebcamCaptureDevice::Close(std::string& error) {
  error.clear();
  if (!open_) {
    return true;
  }
  std::string close_error;
  const bool closed = impl_.CloseDevice(close_error);
  ResetOpenState();
  if (!closed) {
    error = FormatDeviceError(DeviceErrorCode::kUnknown, close_error);
    return false;
  }
  return true;
}

bool WebcamCaptureDevice::IsOpen() const {
  return open_;
}

std::optional<std::string> WebcamCaptureDevice::DeviceName() const {
  return device_name_;
}

std::optional<Resolution> WebcamCaptureDevice::NegotiatedResolution() const {
  return resolution_;
}

bool WebcamCaptureDevice::ReadFrame(RawFrame& frame, std::string& error) {
  error.clear();
  if (!open_) {
    error = FormatDeviceError(DeviceErrorCode::kDeviceNotStarted, "Device not started");
    return false;
  }

  std::string grab_error;
  if (!impl_.GrabFrame(grab_error)) {
    error = FormatDeviceError(DeviceErrorCode::kFrameAcquisitionFailed, grab_error);
    return false;
  }

  cv::Mat pixels;
  std::string retrieve_error;
  if (!impl_.RetrieveFrame(pixels, retrieve_error)) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed, retrieve_error);
    return false;
  }

  frame.layout = pixels.channels() == 1 ? PixelLayout::kGray8 : PixelLayout::kBgr24;
  frame.data = std::move(pixels);
  return true;
}

void WebcamCaptureDevice::ResetOpenState() {
  open_ = false;
  capture_index_.reset();
  device_name_.reset();
  resolution_.reset();
}

} // namespace chronosnap::backends::webcam
