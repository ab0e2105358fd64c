#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronosnap::backends {

struct Resolution {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

inline bool operator==(const Resolution& left, const Resolution& right) {
  return left.width == right.width && left.height == right.height;
}

inline bool operator!=(const Resolution& left, const Resolution& right) {
  return !(left == right);
}

// Native layout of a captured frame before the codec canonicalizes it.
enum class PixelLayout {
  kBgr24 = 0,
  kRgb24,
  kGray8,
  kYuyv,
  kMjpeg,
};

const char* ToString(PixelLayout layout);

// One frame exactly as the device produced it. For `kMjpeg`, `data` is a
// single-row CV_8UC1 buffer holding the compressed bytes; every other layout
// is a width x height matrix.
struct RawFrame {
  PixelLayout layout = PixelLayout::kBgr24;
  cv::Mat data;
};

// One enumerated capture device as shown to the front-end. `id` is the decimal
// capture index accepted by `start`.
struct CaptureDeviceInfo {
  std::string id;
  std::string name;
};

// Exclusive capture-device handle contract.
//
// Implementations are not thread-safe and must only be touched from the one
// thread that owns them (the device worker). Open/close semantics:
// - `Open` on an already-open handle is a state conflict and fails
// - `Close` on a closed handle succeeds
// - name and resolution are only present while open
class ICaptureDevice {
public:
  virtual ~ICaptureDevice() = default;

  // Opens capture index `index` and negotiates a resolution as close to
  // `preferred` as the driver allows.
  virtual bool Open(std::size_t index, const Resolution& preferred, std::string& error) = 0;

  virtual bool Close(std::string& error) = 0;

  virtual bool IsOpen() const = 0;

  virtual std::optional<std::string> DeviceName() const = 0;
  virtual std::optional<Resolution> NegotiatedResolution() const = 0;

  // Acquires one frame in the device's native layout.
  virtual bool ReadFrame(RawFrame& frame, std::string& error) = 0;
};

// Creates fresh device handles and lists attached devices. Factories are shared
// between the worker (CreateDevice) and caller threads (EnumerateDevices), so
// implementations must keep both calls free of shared mutable state.
class ICaptureDeviceFactory {
public:
  virtual ~ICaptureDeviceFactory() = default;

  virtual std::unique_ptr<ICaptureDevice> CreateDevice() = 0;

  virtual bool EnumerateDevices(std::vector<CaptureDeviceInfo>& devices,
                                std::string& error) const = 0;
};

} // namespace chronosnap::backends
