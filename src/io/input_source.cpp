#include "io/input_source.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <sys/statfs.h>

#include "core/errors.hpp"

namespace ccwc {

namespace fs = std::filesystem;

namespace {

constexpr long kProcSuperMagic = 0x9fa0;
constexpr long kSysfsMagic = 0x62656572;

// procfs and sysfs report a size of 0 for files that do have content.
bool on_pseudo_filesystem(const std::string& path) {
  struct statfs info {};
  if (::statfs(path.c_str(), &info) != 0) return false;
  const long type = static_cast<long>(info.f_type);
  return type == kProcSuperMagic || type == kSysfsMagic;
}

}  // namespace

InputSource InputSource::open_file(const std::string& path) {
  std::error_code ec;
  const fs::file_status st = fs::status(path, ec);
  if (st.type() == fs::file_type::not_found) {
    throw CountError(ErrorKind::InputNotFound, path);
  }
  if (fs::is_directory(st)) {
    throw CountError(ErrorKind::InputIOError, path, "Is a directory");
  }

  errno = 0;
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    const int err = errno;
    if (err == EACCES || err == EPERM) {
      throw CountError(ErrorKind::InputPermissionDenied, path);
    }
    if (err == ENOENT) {
      throw CountError(ErrorKind::InputNotFound, path);
    }
    throw CountError(ErrorKind::InputIOError, path,
                     err != 0 ? std::strerror(err) : "cannot open file");
  }

  InputSource src;
  src.stream_ = file.get();
  src.owned_ = std::move(file);
  src.name_ = path;
  src.path_ = path;
  return src;
}

InputSource InputSource::borrow(std::istream& in, const std::string& name) {
  InputSource src;
  src.stream_ = &in;
  src.name_ = name;
  return src;
}

InputSource InputSource::from_string(const std::string& data, const std::string& name) {
  auto buffer = std::make_unique<std::istringstream>(data, std::ios::in | std::ios::binary);
  InputSource src;
  src.stream_ = buffer.get();
  src.owned_ = std::move(buffer);
  src.name_ = name;
  return src;
}

std::optional<std::uintmax_t> InputSource::regular_file_size() const {
  if (path_.empty()) return std::nullopt;

  std::error_code ec;
  const fs::file_status st = fs::status(path_, ec);
  if (ec || !fs::is_regular_file(st)) return std::nullopt;

  const std::uintmax_t size = fs::file_size(path_, ec);
  if (ec) return std::nullopt;
  if (size == 0 && on_pseudo_filesystem(path_)) return std::nullopt;
  return size;
}

}  // namespace ccwc
