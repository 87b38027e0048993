#pragma once

#include "config/count_config.hpp"
#include "core/metrics.hpp"
#include "count/pass_stats.hpp"
#include "io/input_source.hpp"
#include "text/decoder.hpp"

namespace ccwc {

/// Computes lines, words, chars, and bytes in a single read pass.
///
/// Each chunk is read once and fed to every metric while it is in memory.
/// The word-boundary state and the decoder carry-over state travel
/// independently from chunk to chunk.  This is the only way to get several
/// metrics from a pipe, which cannot be read twice.
class MultiMetricCounter {
public:
  MultiMetricCounter(const CountConfig& cfg, const Decoder& decoder)
      : cfg_(cfg), decoder_(decoder) {}

  Counts count(InputSource& src, PassStats* stats = nullptr) const;

private:
  CountConfig cfg_;
  Decoder decoder_;
};

}  // namespace ccwc
