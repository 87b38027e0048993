#pragma once

#include <algorithm>
#include <cstddef>
#include <istream>
#include <string>

#include "core/errors.hpp"

namespace ccwc {

/// Pulls fixed-size byte chunks from a stream.
///
/// Every call to `next()` yields a non-empty chunk until the input is
/// exhausted, then a single empty chunk (return value 0) marks end of
/// stream; further calls keep returning 0.  With a chunk size of 0 the first
/// call reads the entire input in one shot.  The reader never rewinds: to
/// start over, reopen the input.
///
/// A failed read on the underlying stream throws CountError(InputIOError).
class ChunkReader {
public:
  /// Block size used to grow the buffer when reading a whole input at once.
  static constexpr std::size_t kSlurpBlock = 64 * 1024;

  ChunkReader(std::istream& in, std::size_t chunk_size, const std::string& name = "<stream>")
      : in_(in), chunk_size_(chunk_size), name_(name) {}

  /// Fill `out` with the next chunk and return its length.
  std::size_t next(std::string& out) {
    out.clear();
    if (done_) return 0;

    if (chunk_size_ == 0) {
      read_all(out);
      done_ = true;
    } else {
      read_chunk(out);
    }

    if (!out.empty()) ++chunks_read_;
    return out.size();
  }

  /// Number of non-empty chunks produced so far.
  std::size_t chunks_read() const { return chunks_read_; }

  /// True once the end of stream has been observed.
  bool exhausted() const { return done_; }

private:
  std::size_t read_some(char* dst, std::size_t n) {
    in_.read(dst, static_cast<std::streamsize>(n));
    if (in_.bad()) {
      throw CountError(ErrorKind::InputIOError, name_, "read failed");
    }
    return static_cast<std::size_t>(in_.gcount());
  }

  // The buffer grows with the data actually read, so a huge chunk size
  // costs no more memory than the input itself.
  void read_chunk(std::string& out) {
    std::size_t filled = 0;
    while (filled < chunk_size_) {
      const std::size_t step = std::min(chunk_size_ - filled, kSlurpBlock);
      out.resize(filled + step);
      const std::size_t got = read_some(&out[filled], step);
      filled += got;
      if (got < step) {
        done_ = true;
        break;
      }
    }
    out.resize(filled);
  }

  void read_all(std::string& out) {
    std::size_t filled = 0;
    for (;;) {
      out.resize(filled + kSlurpBlock);
      const std::size_t got = read_some(&out[filled], kSlurpBlock);
      filled += got;
      if (got < kSlurpBlock) break;
    }
    out.resize(filled);
  }

  std::istream& in_;
  std::size_t chunk_size_;
  std::string name_;
  bool done_{false};
  std::size_t chunks_read_{0};
};

}  // namespace ccwc
