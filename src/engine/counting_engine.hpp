#pragma once

#include <iosfwd>
#include <string>

#include "config/count_config.hpp"
#include "core/metrics.hpp"
#include "io/input_source.hpp"
#include "text/decoder.hpp"

namespace ccwc {

/// Picks a counting strategy for each input.
///
/// One requested metric runs the dedicated counter for it, so a byte count
/// never pays for decoding and may be answered from file metadata.  Two or
/// more metrics run the single-pass MultiMetricCounter.  An empty request
/// means the default set {lines, words, bytes}.
///
/// The encoding is resolved when the engine is constructed; an unknown
/// identifier throws CountError(UnsupportedEncoding) before any input is
/// touched.
class CountingEngine {
public:
  enum class Strategy {
    Single,
    Multi
  };

  explicit CountingEngine(const CountConfig& cfg);

  /// Count one input.  All counting state is local to the call.
  CountResult count(InputSource& src, MetricSet requested) const;

  /// Strategy that `count` would use for this request.
  static Strategy strategy_for(const MetricSet& requested);

  const CountConfig& config() const { return cfg_; }
  const Decoder& decoder() const { return decoder_; }

  /// Enable a one-line trace per input on `log` (nullptr disables).
  void set_log(std::ostream* log) { log_ = log; }

private:
  CountConfig cfg_;
  Decoder decoder_;
  std::ostream* log_{nullptr};
};

}  // namespace ccwc
