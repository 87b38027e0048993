#include "engine/counting_engine.hpp"

#include <ostream>

#include "count/byte_counter.hpp"
#include "count/char_counter.hpp"
#include "count/line_counter.hpp"
#include "count/multi_metric_counter.hpp"
#include "count/pass_stats.hpp"
#include "count/word_counter.hpp"

namespace ccwc {

CountingEngine::CountingEngine(const CountConfig& cfg)
    : cfg_(cfg), decoder_(Decoder::for_name(cfg.encoding)) {}

CountingEngine::Strategy CountingEngine::strategy_for(const MetricSet& requested) {
  const MetricSet effective = requested.empty() ? MetricSet::defaults() : requested;
  return effective.size() == 1 ? Strategy::Single : Strategy::Multi;
}

CountResult CountingEngine::count(InputSource& src, MetricSet requested) const {
  if (requested.empty()) requested = MetricSet::defaults();

  PassStats stats;
  Counts counts;
  const Strategy strategy = strategy_for(requested);

  if (strategy == Strategy::Multi) {
    counts = MultiMetricCounter(cfg_, decoder_).count(src, &stats);
  } else {
    Metric only = Metric::Bytes;
    for (Metric m : kAllMetrics) {
      if (requested.contains(m)) only = m;
    }
    switch (only) {
      case Metric::Lines:
        counts.lines = LineCounter(cfg_.chunk_size).count(src, &stats);
        break;
      case Metric::Words:
        counts.words = WordCounter(cfg_.chunk_size, cfg_.whitespace, decoder_).count(src, &stats);
        break;
      case Metric::Chars:
        counts.chars = CharCounter(cfg_.chunk_size, decoder_).count(src, &stats);
        break;
      case Metric::Bytes:
        counts.bytes = ByteCounter(cfg_.chunk_size).count(src, &stats);
        break;
    }
  }

  if (log_) {
    *log_ << "[ccwc] " << src.name()
          << ": strategy=" << (strategy == Strategy::Multi ? "multi" : "single")
          << " chunks=" << stats.chunks
          << (stats.used_metadata ? " (size from metadata)" : "")
          << " encoding=" << decoder_.name()
          << " whitespace=" << to_string(cfg_.whitespace)
          << "\n";
  }

  return CountResult(requested, counts);
}

}  // namespace ccwc
