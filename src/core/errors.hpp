#pragma once

#include <stdexcept>
#include <string>

namespace ccwc {

/// Categories of failure that the counting core can report.
///
/// Decode-level problems are not listed: malformed byte sequences are
/// replaced with U+FFFD and never surface as errors.
enum class ErrorKind {
  InputNotFound,
  InputPermissionDenied,
  InputIOError,
  UnsupportedEncoding
};

inline const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InputNotFound:
      return "No such file or directory";
    case ErrorKind::InputPermissionDenied:
      return "Permission denied";
    case ErrorKind::InputIOError:
      return "I/O error";
    case ErrorKind::UnsupportedEncoding:
      return "unsupported encoding";
  }
  return "unknown error";
}

/// Exception thrown by the counting core.  `subject()` names the failing
/// input (or the encoding identifier for UnsupportedEncoding).
class CountError : public std::runtime_error {
public:
  CountError(ErrorKind kind, const std::string& subject, const std::string& detail = "")
      : std::runtime_error(subject + ": " + (detail.empty() ? to_string(kind) : detail)),
        kind_(kind),
        subject_(subject) {}

  ErrorKind kind() const { return kind_; }
  const std::string& subject() const { return subject_; }

  /// Input-level errors are reported and skipped; configuration errors abort.
  bool is_fatal() const { return kind_ == ErrorKind::UnsupportedEncoding; }

private:
  ErrorKind kind_;
  std::string subject_;
};

}  // namespace ccwc
