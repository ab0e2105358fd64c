#include "backends/webcam/webcam_factory.hpp"

#include "backends/webcam/device_enumeration.hpp"
#include "backends/webcam/webcam_capture_device.hpp"

namespace chronosnap::backends::webcam {

std::unique_ptr<ICaptureDevice> WebcamDeviceFactory::CreateDevice() {
  return std::make_unique<WebcamCaptureDevice>();
}

bool WebcamDeviceFactory::EnumerateDevices(std::vector<CaptureDeviceInfo>& devices,
                                           std::string& error) const {
  devices.clear();
  error.clear();

  std::vector<WebcamDeviceInfo> discovered;
  if (!EnumerateConnectedDevices(discovered, error)) {
    return false;
  }

  devices.reserve(discovered.size());
  for (std::size_t i = 0; i < discovered.size(); ++i) {
    devices.push_back(ToCaptureDeviceInfo(discovered[i], i));
  }
  return true;
}

std::shared_ptr<ICaptureDeviceFactory> CreateWebcamDeviceFactory() {
  return std::make_shared<WebcamDeviceFactory>();
}

} // namespace chronosnap::backends::webcam
