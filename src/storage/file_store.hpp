#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chronosnap::storage {

// Name of the probe file `CheckDirectoryWritable` writes and removes.
inline constexpr const char* kWriteProbeFileName = ".chronosnap_write_test";

// Decodes `data_base64` and writes it to `dir/file_name`, creating `dir` when
// missing. `written_path` receives the final path. Errors are STORAGE_FAILED,
// or INVALID_REQUEST for unsafe names and malformed base64.
bool SaveFileToDisk(const std::filesystem::path& dir, std::string_view file_name,
                    std::string_view data_base64, std::filesystem::path& written_path,
                    std::string& error);

// Writes raw `bytes` to `dir/file_name` with the same rules as SaveFileToDisk.
bool SaveBytesToDisk(const std::filesystem::path& dir, std::string_view file_name,
                     const std::vector<std::uint8_t>& bytes, std::filesystem::path& written_path,
                     std::string& error);

// Creates `dir` if needed (failure is an error), then probes it with a small
// write. An unwritable directory is `writable = false`, not an error.
bool CheckDirectoryWritable(const std::filesystem::path& dir, bool& writable, std::string& error);

// A plain file name: non-empty, no separators, not "." or "..".
bool IsPlainFileName(std::string_view file_name);

} // namespace chronosnap::storage
