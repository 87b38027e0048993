#include "count/multi_metric_counter.hpp"

#include <string>

#include "count/line_counter.hpp"
#include "count/word_counter.hpp"
#include "io/chunk_reader.hpp"

namespace ccwc {

Counts MultiMetricCounter::count(InputSource& src, PassStats* stats) const {
  ChunkReader reader(src.stream(), cfg_.chunk_size, src.name());
  WordBoundaryState boundary;
  DecoderState state;
  std::string chunk;
  std::u32string decoded;
  Counts counts;

  const bool unicode_words = cfg_.whitespace == WhitespaceMode::Unicode;

  while (reader.next(chunk) > 0) {
    counts.bytes += chunk.size();
    counts.lines += LineCounter::count_chunk(chunk);

    if (unicode_words) {
      // Decode once and reuse the code points for both chars and words.
      decoded.clear();
      decoder_.decode_into(chunk, state, false, decoded);
      counts.chars += decoded.size();
      counts.words += WordCounter::count_chunk(decoded, boundary);
    } else {
      counts.chars += decoder_.count(chunk, state, false);
      counts.words += WordCounter::count_chunk(chunk, boundary);
    }
  }

  // Flush the decoder so a truncated trailing character still counts.
  decoded.clear();
  decoder_.decode_into({}, state, true, decoded);
  counts.chars += decoded.size();
  if (unicode_words) {
    counts.words += WordCounter::count_chunk(decoded, boundary);
  }

  if (stats) stats->chunks = reader.chunks_read();
  return counts;
}

}  // namespace ccwc
