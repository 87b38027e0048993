#pragma once

#include <cstddef>
#include <cstdint>

#include "count/pass_stats.hpp"
#include "io/input_source.hpp"
#include "text/decoder.hpp"

namespace ccwc {

/// Counts decoded characters (code points) across a chunk stream.
///
/// A character split over a chunk boundary is completed when its remaining
/// bytes arrive; a final flush after the last chunk turns an incomplete
/// trailing sequence into one substitution character.
class CharCounter {
public:
  CharCounter(std::size_t chunk_size, const Decoder& decoder)
      : chunk_size_(chunk_size), decoder_(decoder) {}

  std::uint64_t count(InputSource& src, PassStats* stats = nullptr) const;

private:
  std::size_t chunk_size_;
  Decoder decoder_;
};

}  // namespace ccwc
