#pragma once

#include "backends/capture_device.hpp"
#include "backends/webcam/opencv_webcam_impl.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace chronosnap::backends::webcam {

// OpenCV-backed webcam handle.
//
// Open flow:
// 1) open the capture index through OpenCV
// 2) request the preferred frame size
// 3) read the size back; whatever the driver reports is the negotiated size
// 4) resolve a name for this one index from the fixture or its V4L2 node
//    (falls back to "Camera N"); other indices are left untouched
//
// Frames come back as packed BGR, the layout OpenCV retrieves by default.
class WebcamCaptureDevice final : public ICaptureDevice {
public:
  WebcamCaptureDevice() = default;
  ~WebcamCaptureDevice() override;

  bool Open(std::size_t index, const Resolution& preferred, std::string& error) override;
  bool Close(std::string& error) override;
  bool IsOpen() const override;

  std::optional<std::string> DeviceName() const override;
  std::optional<Resolution> NegotiatedResolution() const override;

  bool ReadFrame(RawFrame& frame, std::string& error) override;

private:
  void ResetOpenState();

  OpenCvWebcamImpl impl_;
  bool open_ = false;
  std::optional<std::size_t> capture_index_;
  std::optional<std::string> device_name_;
  std::optional<Resolution> resolution_;
};

} // namespace chronosnap::backends::webcam
