#include "backends/capture_device.hpp"

namespace chronosnap::backends {

const char* ToString(const PixelLayout layout) {
  switch (layout) {
  case PixelLayout::kBgr24:
    return "bgr24";
  case PixelLayout::kRgb24:
    return "rgb24";
  case PixelLayout::kGray8:
    return "gray8";
  case PixelLayout::kYuyv:
    return "yuyv";
  case PixelLayout::kMjpeg:
    return "mjpeg";
  }
  return "unknown";
}

} // namespace chronosnap::backends
