#include "count/char_counter.hpp"

#include <string>

#include "io/chunk_reader.hpp"

namespace ccwc {

std::uint64_t CharCounter::count(InputSource& src, PassStats* stats) const {
  ChunkReader reader(src.stream(), chunk_size_, src.name());
  DecoderState state;
  std::string chunk;
  std::uint64_t chars = 0;
  while (reader.next(chunk) > 0) {
    chars += decoder_.count(chunk, state, false);
  }
  chars += decoder_.count({}, state, true);
  if (stats) stats->chunks = reader.chunks_read();
  return chars;
}

}  // namespace ccwc
