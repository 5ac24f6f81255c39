#ifndef ARMGUARD_CORE_FS_UTILS_HPP_
#define ARMGUARD_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace armguard::core {

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Publishes `text` at `output_path` through a sibling temp file and a rename,
// so a reader never observes a half-written report. The temp file is removed
// on every failure path.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  const std::filesystem::path parent_dir = output_path.parent_path();
  if (!parent_dir.empty() && !EnsureDirectory(parent_dir, error)) {
    return false;
  }

  static std::atomic<std::uint64_t> temp_counter{0};
  const std::filesystem::path temp_path =
      output_path.string() + ".tmp." +
      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "." +
      std::to_string(temp_counter.fetch_add(1U, std::memory_order_relaxed));

  std::error_code cleanup_ec;
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out_file << text;
    out_file.flush();
    if (!out_file) {
      out_file.close();
      std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (rename_ec) {
    std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
    return false;
  }
  return true;
}

} // namespace armguard::core

#endif // ARMGUARD_CORE_FS_UTILS_HPP_
