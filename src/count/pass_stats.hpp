#pragma once

#include <cstddef>

namespace ccwc {

/// Bookkeeping about one traversal of an input, for diagnostics.
struct PassStats {
  std::size_t chunks = 0;       ///< Non-empty chunks read.
  bool used_metadata = false;   ///< Byte count came from file metadata, no read.
};

}  // namespace ccwc
