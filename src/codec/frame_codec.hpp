#pragma once

#include "backends/capture_device.hpp"

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chronosnap::codec {

inline constexpr std::string_view kJpegMimeType = "image/jpeg";
inline constexpr std::string_view kJpegDataUriPrefix = "data:image/jpeg;base64,";

// Converts a native frame into a canonical 8-bit BGR image.
// Fails with DECODE_FAILED when the buffer does not match its layout tag.
bool DecodeFrame(const backends::RawFrame& frame, cv::Mat& bgr, std::string& error);

// JPEG-compresses a BGR image. `quality` is handed to the encoder untouched;
// OpenCV's JPEG encoder clamps it to [0, 100], and nothing here normalizes it.
bool EncodeJpeg(const cv::Mat& bgr, int quality, std::vector<std::uint8_t>& jpeg,
                std::string& error);

std::string ToDataUri(std::string_view mime_type, const std::vector<std::uint8_t>& bytes);

// Full capture pipeline: decode -> JPEG -> `data:image/jpeg;base64,...`.
bool EncodeFrameToDataUri(const backends::RawFrame& frame, int quality, std::string& data_uri,
                          std::string& error);

// Splits `data:<mime>;base64,<payload>` into its mime type and decoded bytes.
bool DecodeDataUri(std::string_view data_uri, std::string& mime_type,
                   std::vector<std::uint8_t>& bytes, std::string& error);

} // namespace chronosnap::codec
