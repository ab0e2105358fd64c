#include "codec/frame_codec.hpp"

#include "core/base64.hpp"
#include "core/errors/device_error.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace chronosnap::codec {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

std::string DescribeMat(const cv::Mat& mat) {
  return std::to_string(mat.cols) + "x" + std::to_string(mat.rows) + " with " +
         std::to_string(mat.channels()) + " channel(s)";
}

bool ExpectChannels(const backends::RawFrame& frame, const int channels, std::string& error) {
  if (frame.data.depth() != CV_8U || frame.data.channels() != channels) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed,
                              std::string(backends::ToString(frame.layout)) + " frame expects " +
                                  std::to_string(channels) + " 8-bit channel(s), got " +
                                  DescribeMat(frame.data));
    return false;
  }
  return true;
}

} // namespace

bool DecodeFrame(const backends::RawFrame& frame, cv::Mat& bgr, std::string& error) {
  error.clear();
  if (frame.data.empty()) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed, "frame buffer is empty");
    return false;
  }

  try {
    switch (frame.layout) {
    case backends::PixelLayout::kBgr24:
      if (!ExpectChannels(frame, 3, error)) {
        return false;
      }
      bgr = frame.data;
      return true;
    case backends::PixelLayout::kRgb24:
      if (!ExpectChannels(frame, 3, error)) {
        return false;
      }
      cv::cvtColor(frame.data, bgr, cv::COLOR_RGB2BGR);
      return true;
    case backends::PixelLayout::kGray8:
      if (!ExpectChannels(frame, 1, error)) {
        return false;
      }
      cv::cvtColor(frame.data, bgr, cv::COLOR_GRAY2BGR);
      return true;
    case backends::PixelLayout::kYuyv:
      if (!ExpectChannels(frame, 2, error)) {
        return false;
      }
      if (frame.data.cols % 2 != 0) {
        error = FormatDeviceError(DeviceErrorCode::kDecodeFailed,
                                  "yuyv frame width must be even, got " + DescribeMat(frame.data));
        return false;
      }
      cv::cvtColor(frame.data, bgr, cv::COLOR_YUV2BGR_YUYV);
      return true;
    case backends::PixelLayout::kMjpeg: {
      if (!ExpectChannels(frame, 1, error)) {
        return false;
      }
      const cv::Mat compressed = frame.data.isContinuous() ? frame.data : frame.data.clone();
      cv::Mat decoded = cv::imdecode(compressed.reshape(1, 1), cv::IMREAD_COLOR);
      if (decoded.empty()) {
        error = FormatDeviceError(DeviceErrorCode::kDecodeFailed,
                                  "mjpeg payload of " + std::to_string(compressed.total()) +
                                      " bytes is not a decodable JPEG");
        return false;
      }
      bgr = decoded;
      return true;
    }
    }
  } catch (const cv::Exception& ex) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed,
                              std::string(backends::ToString(frame.layout)) +
                                  " conversion raised: " + ex.what());
    return false;
  }

  error = FormatDeviceError(DeviceErrorCode::kDecodeFailed, "unsupported pixel layout");
  return false;
}

bool EncodeJpeg(const cv::Mat& bgr, const int quality, std::vector<std::uint8_t>& jpeg,
                std::string& error) {
  error.clear();
  if (bgr.empty()) {
    error = FormatDeviceError(DeviceErrorCode::kEncodeFailed, "nothing to encode (empty image)");
    return false;
  }

  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
  std::vector<uchar> buffer;
  try {
    if (!cv::imencode(".jpg", bgr, buffer, params)) {
      error = FormatDeviceError(DeviceErrorCode::kEncodeFailed,
                                "JPEG encoder rejected " + DescribeMat(bgr));
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = FormatDeviceError(DeviceErrorCode::kEncodeFailed,
                              std::string("JPEG encoder raised: ") + ex.what());
    return false;
  }

  jpeg.assign(buffer.begin(), buffer.end());
  return true;
}

std::string ToDataUri(std::string_view mime_type, const std::vector<std::uint8_t>& bytes) {
  std::string uri = "data:";
  uri.append(mime_type);
  uri += ";base64,";
  uri += core::EncodeBase64(bytes);
  return uri;
}

bool EncodeFrameToDataUri(const backends::RawFrame& frame, const int quality,
                          std::string& data_uri, std::string& error) {
  error.clear();
  cv::Mat bgr;
  if (!DecodeFrame(frame, bgr, error)) {
    return false;
  }
  std::vector<std::uint8_t> jpeg;
  if (!EncodeJpeg(bgr, quality, jpeg, error)) {
    return false;
  }
  data_uri = ToDataUri(kJpegMimeType, jpeg);
  return true;
}

bool DecodeDataUri(std::string_view data_uri, std::string& mime_type,
                   std::vector<std::uint8_t>& bytes, std::string& error) {
  error.clear();
  constexpr std::string_view kScheme = "data:";
  constexpr std::string_view kBase64Marker = ";base64,";

  if (data_uri.substr(0, kScheme.size()) != kScheme) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed, "payload is not a data URI");
    return false;
  }
  const std::size_t marker = data_uri.find(kBase64Marker);
  if (marker == std::string_view::npos) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed,
                              "data URI is not base64-encoded");
    return false;
  }

  std::string base64_error;
  if (!core::DecodeBase64(data_uri.substr(marker + kBase64Marker.size()), bytes, base64_error)) {
    error = FormatDeviceError(DeviceErrorCode::kDecodeFailed, base64_error);
    return false;
  }
  mime_type = std::string(data_uri.substr(kScheme.size(), marker - kScheme.size()));
  return true;
}

} // namespace chronosnap::codec
