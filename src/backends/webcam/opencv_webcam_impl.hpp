#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace chronosnap::backends::webcam {

// Narrow property surface used by the capture path.
//
// Keeping this enum tiny avoids leaking OpenCV constants through the rest of
// the backend.
enum class OpenCvCaptureProperty {
  kFrameWidth = 0,
  kFrameHeight,
};

const char* ToString(OpenCvCaptureProperty property);

// Thin OpenCV wrapper used by `WebcamCaptureDevice`.
//
// Responsibilities:
// - open/close a device index with OpenCV VideoCapture
// - set/read back frame-size properties
// - grab one frame and retrieve it as a BGR matrix
//
// Every OpenCV exception is converted into an error string here so callers only
// ever see the bool + error contract.
class OpenCvWebcamImpl {
public:
  OpenCvWebcamImpl();
  ~OpenCvWebcamImpl();

  OpenCvWebcamImpl(const OpenCvWebcamImpl&) = delete;
  OpenCvWebcamImpl& operator=(const OpenCvWebcamImpl&) = delete;

  bool OpenDevice(std::size_t device_index, std::string& error);
  bool CloseDevice(std::string& error);

  bool SetProperty(OpenCvCaptureProperty property, double value, std::string& error);
  bool GetProperty(OpenCvCaptureProperty property, double& value, std::string& error) const;

  // Pulls the next frame from the driver queue without decoding it.
  bool GrabFrame(std::string& error);

  // Decodes the most recently grabbed frame into `frame` (BGR, CV_8UC3).
  bool RetrieveFrame(cv::Mat& frame, std::string& error);

  // Best-effort camera index probe used by discovery when neither a fixture
  // nor V4L2 is available. Indices that fail `VideoCapture::open` are skipped.
  static std::vector<std::size_t> EnumerateDeviceIndices(std::size_t max_probe_index);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  static int ToOpenCvPropertyId(OpenCvCaptureProperty property);
};

} // namespace chronosnap::backends::webcam
