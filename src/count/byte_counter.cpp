#include "count/byte_counter.hpp"

#include <string>

#include "io/chunk_reader.hpp"

namespace ccwc {

std::uint64_t ByteCounter::count(InputSource& src, PassStats* stats) const {
  if (const auto size = src.regular_file_size()) {
    if (stats) stats->used_metadata = true;
    return static_cast<std::uint64_t>(*size);
  }
  return count_stream(src, stats);
}

std::uint64_t ByteCounter::count_stream(InputSource& src, PassStats* stats) const {
  ChunkReader reader(src.stream(), chunk_size_, src.name());
  std::string chunk;
  std::uint64_t total = 0;
  while (reader.next(chunk) > 0) {
    total += chunk.size();
  }
  if (stats) stats->chunks = reader.chunks_read();
  return total;
}

}  // namespace ccwc
