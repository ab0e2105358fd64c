#pragma once

#include "backends/capture_device.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chronosnap::backends::webcam {

// Production factory: OpenCV handles plus V4L2/OpenCV/fixture discovery.
class WebcamDeviceFactory final : public ICaptureDeviceFactory {
public:
  std::unique_ptr<ICaptureDevice> CreateDevice() override;

  bool EnumerateDevices(std::vector<CaptureDeviceInfo>& devices,
                        std::string& error) const override;
};

std::shared_ptr<ICaptureDeviceFactory> CreateWebcamDeviceFactory();

} // namespace chronosnap::backends::webcam
