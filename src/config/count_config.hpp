#pragma once

#include <cstddef>
#include <string>

#include "text/whitespace.hpp"

namespace ccwc {

/// Settings shared by every counting operation of one engine.
struct CountConfig {
  std::size_t chunk_size = 65536;  ///< Bytes per read; 0 reads the whole input at once.
  std::string encoding = "utf-8";  ///< Text encoding used for character counts.
  WhitespaceMode whitespace = WhitespaceMode::Ascii;
};

}  // namespace ccwc
