#pragma once

#include <cstddef>
#include <cstdint>

#include "count/pass_stats.hpp"
#include "io/input_source.hpp"

namespace ccwc {

/// Total byte length of an input.
///
/// Regular files are answered from filesystem metadata without reading.
/// Pipes, standard input, in-memory sources, and files whose metadata
/// cannot be read are streamed and their chunk lengths summed.
class ByteCounter {
public:
  explicit ByteCounter(std::size_t chunk_size) : chunk_size_(chunk_size) {}

  std::uint64_t count(InputSource& src, PassStats* stats = nullptr) const;

  /// Streaming path only, ignoring any metadata.
  std::uint64_t count_stream(InputSource& src, PassStats* stats = nullptr) const;

private:
  std::size_t chunk_size_;
};

}  // namespace ccwc
