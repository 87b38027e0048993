#include "count/word_counter.hpp"

#include <string>

#include "io/chunk_reader.hpp"

namespace ccwc {

std::uint64_t WordCounter::count(InputSource& src, PassStats* stats) const {
  ChunkReader reader(src.stream(), chunk_size_, src.name());
  WordBoundaryState boundary;
  std::string chunk;
  std::uint64_t words = 0;

  if (mode_ == WhitespaceMode::Ascii) {
    while (reader.next(chunk) > 0) {
      words += count_chunk(chunk, boundary);
    }
  } else {
    DecoderState state;
    std::u32string decoded;
    while (reader.next(chunk) > 0) {
      decoded.clear();
      decoder_.decode_into(chunk, state, false, decoded);
      words += count_chunk(decoded, boundary);
    }
    decoded.clear();
    decoder_.decode_into({}, state, true, decoded);
    words += count_chunk(decoded, boundary);
  }

  if (stats) stats->chunks = reader.chunks_read();
  return words;
}

}  // namespace ccwc
