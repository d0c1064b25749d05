#include "starlane/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace starlane {

namespace {

std::filesystem::path temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const std::string base = target.filename().string();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();

  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string name = base + ".tmp." + std::to_string(now);
    if (attempt > 0) name += "." + std::to_string(attempt);
    std::filesystem::path candidate = dir.empty() ? std::filesystem::path(name) : (dir / name);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }

  std::string name = base + ".tmp." + std::to_string(now);
  return dir.empty() ? std::filesystem::path(name) : (dir / name);
}

// Removes the temp file unless released after a successful rename.
struct TempFileGuard {
  std::filesystem::path path;
  bool active{true};
  explicit TempFileGuard(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFileGuard() {
    if (!active) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
  void release() { active = false; }
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(std::filesystem::path(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory: " + p.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  const std::filesystem::path tmp = temp_sibling_path(p);
  TempFileGuard guard(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // Windows rename does not replace an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(p, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");

  guard.release();
}

} // namespace starlane
