#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "count/pass_stats.hpp"
#include "io/input_source.hpp"
#include "text/decoder.hpp"
#include "text/whitespace.hpp"

namespace ccwc {

/// Carried between chunks of one word count.  The start of a stream behaves
/// as if it were preceded by whitespace.
struct WordBoundaryState {
  bool previous_ended_in_whitespace = true;
};

/// Count whitespace-delimited tokens in one chunk, then correct for a word
/// that straddles the boundary with the previous chunk: when the previous
/// chunk ended inside a word and this chunk starts inside one, the two
/// halves were counted twice and one is subtracted.  `state` is updated from
/// the chunk's last element.  Empty chunks count 0 and leave `state` alone.
template <typename CharT, typename IsSpace>
std::uint64_t count_chunk_words(std::basic_string_view<CharT> chunk, IsSpace is_space,
                                WordBoundaryState& state) {
  if (chunk.empty()) return 0;

  std::uint64_t tokens = 0;
  bool in_token = false;
  for (CharT c : chunk) {
    if (is_space(c)) {
      in_token = false;
    } else if (!in_token) {
      in_token = true;
      ++tokens;
    }
  }

  const bool starts_with_whitespace = is_space(chunk.front());
  if (!state.previous_ended_in_whitespace && !starts_with_whitespace) {
    --tokens;
  }
  state.previous_ended_in_whitespace = is_space(chunk.back());
  return tokens;
}

/// Counts words across a chunk stream.
///
/// In ASCII mode the raw bytes are classified directly and no decoding
/// happens.  In Unicode mode each chunk is first decoded with `decoder`
/// and the resulting code points are classified.
class WordCounter {
public:
  WordCounter(std::size_t chunk_size, WhitespaceMode mode, const Decoder& decoder)
      : chunk_size_(chunk_size), mode_(mode), decoder_(decoder) {}

  std::uint64_t count(InputSource& src, PassStats* stats = nullptr) const;

  static std::uint64_t count_chunk(std::string_view chunk, WordBoundaryState& state) {
    return count_chunk_words(chunk,
                             [](char c) { return is_ascii_space(static_cast<unsigned char>(c)); },
                             state);
  }

  static std::uint64_t count_chunk(std::u32string_view chunk, WordBoundaryState& state) {
    return count_chunk_words(chunk, [](char32_t c) { return is_unicode_space(c); }, state);
  }

private:
  std::size_t chunk_size_;
  WhitespaceMode mode_;
  Decoder decoder_;
};

}  // namespace ccwc
