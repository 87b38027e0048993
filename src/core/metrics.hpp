#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace ccwc {

/// The four countable quantities, in output order.
enum class Metric {
  Lines,
  Words,
  Chars,
  Bytes
};

inline constexpr std::array<Metric, 4> kAllMetrics = {
    Metric::Lines, Metric::Words, Metric::Chars, Metric::Bytes};

inline const char* metric_name(Metric m) {
  switch (m) {
    case Metric::Lines: return "lines";
    case Metric::Words: return "words";
    case Metric::Chars: return "chars";
    case Metric::Bytes: return "bytes";
  }
  return "?";
}

/// A small closed set of metrics.
class MetricSet {
public:
  MetricSet() = default;
  MetricSet(std::initializer_list<Metric> metrics) {
    for (Metric m : metrics) insert(m);
  }

  /// The set used when nothing was requested explicitly.
  static MetricSet defaults() { return {Metric::Lines, Metric::Words, Metric::Bytes}; }
  static MetricSet all() { return {Metric::Lines, Metric::Words, Metric::Chars, Metric::Bytes}; }

  void insert(Metric m) { bits_ |= bit(m); }
  bool contains(Metric m) const { return (bits_ & bit(m)) != 0; }
  bool empty() const { return bits_ == 0; }

  std::size_t size() const {
    std::size_t n = 0;
    for (Metric m : kAllMetrics) {
      if (contains(m)) ++n;
    }
    return n;
  }

  bool operator==(const MetricSet& other) const { return bits_ == other.bits_; }
  bool operator!=(const MetricSet& other) const { return bits_ != other.bits_; }

private:
  static unsigned bit(Metric m) { return 1u << static_cast<unsigned>(m); }

  unsigned bits_{0};
};

/// Raw totals for all four metrics.
struct Counts {
  std::uint64_t lines = 0;
  std::uint64_t words = 0;
  std::uint64_t chars = 0;
  std::uint64_t bytes = 0;

  std::uint64_t get(Metric m) const {
    switch (m) {
      case Metric::Lines: return lines;
      case Metric::Words: return words;
      case Metric::Chars: return chars;
      case Metric::Bytes: return bytes;
    }
    return 0;
  }

  Counts& operator+=(const Counts& other) {
    lines += other.lines;
    words += other.words;
    chars += other.chars;
    bytes += other.bytes;
    return *this;
  }

  bool operator==(const Counts& other) const {
    return lines == other.lines && words == other.words &&
           chars == other.chars && bytes == other.bytes;
  }
};

/// Outcome of counting one input for a set of requested metrics.
///
/// `counts` holds every metric the chosen strategy computed; the
/// multi-metric pass fills all four even when only a subset was requested.
/// Callers project through `value()` / `requested()`.
class CountResult {
public:
  CountResult(MetricSet requested, const Counts& counts)
      : requested_(requested), counts_(counts) {}

  const MetricSet& requested() const { return requested_; }
  const Counts& counts() const { return counts_; }

  bool has(Metric m) const { return requested_.contains(m); }
  std::uint64_t value(Metric m) const { return counts_.get(m); }

private:
  MetricSet requested_;
  Counts counts_;
};

}  // namespace ccwc
