#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace ccwc {

/// A sequential, byte-oriented input handed to the counting engine.
///
/// Sources opened from the filesystem own their stream and close it when
/// the InputSource is destroyed.  Standard input is borrowed and left open.
/// Only filesystem-backed sources can report regular-file metadata.
class InputSource {
public:
  /// Open `path` for binary reading.
  /// Throws CountError (InputNotFound, InputPermissionDenied, InputIOError).
  static InputSource open_file(const std::string& path);

  /// Wrap an already-open stream such as std::cin.  The stream is not owned.
  static InputSource borrow(std::istream& in, const std::string& name = "-");

  /// Construct from an in-memory buffer (useful for tests).
  static InputSource from_string(const std::string& data,
                                 const std::string& name = "<memory>");

  InputSource(InputSource&&) = default;
  InputSource& operator=(InputSource&&) = default;

  std::istream& stream() { return *stream_; }

  /// Display name used in diagnostics and output ("-" for stdin).
  const std::string& name() const { return name_; }

  /// Filesystem path, empty for borrowed and in-memory sources.
  const std::string& path() const { return path_; }

  /// Size reported by filesystem metadata when the source is a regular
  /// file; std::nullopt for pipes, devices, in-memory data, zero-sized
  /// procfs/sysfs entries, or when the lookup fails.
  std::optional<std::uintmax_t> regular_file_size() const;

private:
  InputSource() = default;

  std::unique_ptr<std::istream> owned_;
  std::istream* stream_{nullptr};
  std::string name_;
  std::string path_;
};

}  // namespace ccwc
