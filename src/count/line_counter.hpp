#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "count/pass_stats.hpp"
#include "io/input_source.hpp"

namespace ccwc {

/// Counts newline bytes ('\n').  A final line without a trailing newline is
/// not counted, matching the traditional wc convention.
class LineCounter {
public:
  explicit LineCounter(std::size_t chunk_size) : chunk_size_(chunk_size) {}

  std::uint64_t count(InputSource& src, PassStats* stats = nullptr) const;

  static std::uint64_t count_chunk(std::string_view chunk);

private:
  std::size_t chunk_size_;
};

}  // namespace ccwc
