#include "storage/file_store.hpp"

#include "core/base64.hpp"
#include "core/errors/device_error.hpp"
#include "core/fs_utils.hpp"

#include <cstdint>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace chronosnap::storage {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

} // namespace

bool IsPlainFileName(std::string_view file_name) {
  if (file_name.empty() || file_name == "." || file_name == "..") {
    return false;
  }
  return file_name.find_first_of("/\\") == std::string_view::npos &&
         file_name.find('\0') == std::string_view::npos;
}

bool SaveBytesToDisk(const fs::path& dir, std::string_view file_name,
                     const std::vector<std::uint8_t>& bytes, fs::path& written_path,
                     std::string& error) {
  error.clear();
  if (!IsPlainFileName(file_name)) {
    error = FormatDeviceError(DeviceErrorCode::kInvalidRequest,
                              "file name '" + std::string(file_name) +
                                  "' must be a plain name without path separators");
    return false;
  }

  std::string detail;
  if (!core::EnsureDirectory(dir, detail)) {
    error = FormatDeviceError(DeviceErrorCode::kStorageFailed, detail);
    return false;
  }

  const fs::path target = dir / fs::path(std::string(file_name));
  if (!core::WriteBinaryFileAtomic(target, bytes, detail)) {
    error = FormatDeviceError(DeviceErrorCode::kStorageFailed, detail);
    return false;
  }
  written_path = target;
  return true;
}

bool SaveFileToDisk(const fs::path& dir, std::string_view file_name, std::string_view data_base64,
                    fs::path& written_path, std::string& error) {
  error.clear();
  std::vector<std::uint8_t> bytes;
  std::string detail;
  if (!core::DecodeBase64(data_base64, bytes, detail)) {
    error = FormatDeviceError(DeviceErrorCode::kInvalidRequest, "failed to decode base64: " + detail);
    return false;
  }
  return SaveBytesToDisk(dir, file_name, bytes, written_path, error);
}

bool CheckDirectoryWritable(const fs::path& dir, bool& writable, std::string& error) {
  error.clear();
  writable = false;

  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    std::string detail;
    if (!core::EnsureDirectory(dir, detail)) {
      error = FormatDeviceError(DeviceErrorCode::kStorageFailed, detail);
      return false;
    }
  }

  const fs::path probe = dir / kWriteProbeFileName;
  {
    std::ofstream out(probe, std::ios::binary | std::ios::trunc);
    if (!out) {
      return true;
    }
    out << "test";
    if (!out) {
      out.close();
      std::error_code cleanup_ec;
      (void)fs::remove(probe, cleanup_ec);
      return true;
    }
  }

  std::error_code remove_ec;
  (void)fs::remove(probe, remove_ec);
  writable = true;
  return true;
}

} // namespace chronosnap::storage
