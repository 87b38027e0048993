#include "count/line_counter.hpp"

#include <algorithm>
#include <string>

#include "io/chunk_reader.hpp"

namespace ccwc {

std::uint64_t LineCounter::count_chunk(std::string_view chunk) {
  return static_cast<std::uint64_t>(std::count(chunk.begin(), chunk.end(), '\n'));
}

std::uint64_t LineCounter::count(InputSource& src, PassStats* stats) const {
  ChunkReader reader(src.stream(), chunk_size_, src.name());
  std::string chunk;
  std::uint64_t lines = 0;
  while (reader.next(chunk) > 0) {
    lines += count_chunk(chunk);
  }
  if (stats) stats->chunks = reader.chunks_read();
  return lines;
}

}  // namespace ccwc
