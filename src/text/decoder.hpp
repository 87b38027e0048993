#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ccwc {

/// Text encodings the incremental decoder understands.
enum class Encoding {
  Utf8,
  Utf16LE,
  Utf16BE,
  Utf32LE,
  Utf32BE,
  Latin1,
  Ascii
};

/// Substitution character emitted for malformed input.
inline constexpr char32_t kReplacementChar = 0xFFFD;

/// Carry-over bytes of a character that was split across chunks.
///
/// Owned by the caller and passed to every `Decoder::decode` call of one
/// stream.  A fresh (default) state must be used for each new input.
struct DecoderState {
  std::array<unsigned char, 4> pending{};
  std::size_t pending_size{0};
  std::size_t expected{0};  ///< Total length of the UTF-8 sequence in `pending`.

  bool empty() const { return pending_size == 0; }
  void reset() { *this = DecoderState{}; }
};

/// Stateless incremental decoder for one encoding.
///
/// `decode()` consumes a chunk of raw bytes, invokes `sink(char32_t)` for
/// every code point completed by those bytes, and leaves the bytes of an
/// unfinished trailing character in `state`.  Passing `final = true` (usually
/// with an empty chunk) flushes the state: leftover bytes become a single
/// U+FFFD.  Malformed sequences are replaced by U+FFFD; decoding never fails.
class Decoder {
public:
  explicit Decoder(Encoding encoding) : encoding_(encoding) {}

  /// Look up an encoding by identifier ("utf-8", "UTF16LE", "latin_1", ...).
  /// Throws CountError(UnsupportedEncoding) for unknown identifiers.
  static Decoder for_name(const std::string& name);

  /// Canonical identifiers accepted by `for_name`.
  static std::vector<std::string> supported_names();

  Encoding encoding() const { return encoding_; }
  const char* name() const;

  template <typename Sink>
  void decode(std::string_view bytes, DecoderState& state, bool final, Sink&& sink) const {
    for (char ch : bytes) {
      feed(static_cast<unsigned char>(ch), state, sink);
    }
    if (final && !state.empty()) {
      state.reset();
      sink(kReplacementChar);
    }
  }

  /// Number of code points completed by `bytes` (plus the flush when final).
  std::uint64_t count(std::string_view bytes, DecoderState& state, bool final) const;

  /// Append the code points completed by `bytes` to `out`.
  void decode_into(std::string_view bytes, DecoderState& state, bool final,
                   std::u32string& out) const;

private:
  template <typename Sink>
  void feed(unsigned char b, DecoderState& st, Sink& sink) const {
    switch (encoding_) {
      case Encoding::Utf8:
        feed_utf8(b, st, sink);
        return;
      case Encoding::Utf16LE:
      case Encoding::Utf16BE:
        feed_utf16(b, st, sink);
        return;
      case Encoding::Utf32LE:
      case Encoding::Utf32BE:
        feed_utf32(b, st, sink);
        return;
      case Encoding::Latin1:
        sink(static_cast<char32_t>(b));
        return;
      case Encoding::Ascii:
        sink(b < 0x80 ? static_cast<char32_t>(b) : kReplacementChar);
        return;
    }
  }

  // Maximal-subpart substitution: an invalid continuation byte ends the
  // pending sequence with one U+FFFD and is then decoded on its own.
  template <typename Sink>
  static void feed_utf8(unsigned char b, DecoderState& st, Sink& sink) {
    if (st.pending_size > 0) {
      if (valid_utf8_continuation(st, b)) {
        st.pending[st.pending_size++] = b;
        if (st.pending_size == st.expected) {
          sink(assemble_utf8(st));
          st.reset();
        }
        return;
      }
      st.reset();
      sink(kReplacementChar);
    }

    if (b < 0x80) {
      sink(static_cast<char32_t>(b));
      return;
    }
    const std::size_t len = utf8_sequence_length(b);
    if (len == 0) {
      sink(kReplacementChar);
      return;
    }
    st.pending[0] = b;
    st.pending_size = 1;
    st.expected = len;
  }

  template <typename Sink>
  void feed_utf16(unsigned char b, DecoderState& st, Sink& sink) const {
    st.pending[st.pending_size++] = b;
    if (st.pending_size == 2) {
      const char32_t unit = utf16_unit(st, 0);
      if (unit >= 0xD800 && unit <= 0xDBFF) return;  // wait for the low half
      st.reset();
      sink(unit >= 0xDC00 && unit <= 0xDFFF ? kReplacementChar : unit);
      return;
    }
    if (st.pending_size == 4) {
      const char32_t high = utf16_unit(st, 0);
      const char32_t low = utf16_unit(st, 2);
      if (low >= 0xDC00 && low <= 0xDFFF) {
        st.reset();
        sink(0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00));
        return;
      }
      // Lone high surrogate: substitute it and restart from the second unit.
      sink(kReplacementChar);
      const unsigned char b0 = st.pending[2];
      const unsigned char b1 = st.pending[3];
      st.reset();
      feed_utf16(b0, st, sink);
      feed_utf16(b1, st, sink);
    }
  }

  template <typename Sink>
  void feed_utf32(unsigned char b, DecoderState& st, Sink& sink) const {
    st.pending[st.pending_size++] = b;
    if (st.pending_size < 4) return;

    char32_t cp = 0;
    if (encoding_ == Encoding::Utf32LE) {
      for (int i = 3; i >= 0; --i) cp = (cp << 8) | st.pending[static_cast<std::size_t>(i)];
    } else {
      for (std::size_t i = 0; i < 4; ++i) cp = (cp << 8) | st.pending[i];
    }
    st.reset();
    const bool valid = cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
    sink(valid ? cp : kReplacementChar);
  }

  char32_t utf16_unit(const DecoderState& st, std::size_t offset) const {
    const char32_t a = st.pending[offset];
    const char32_t b = st.pending[offset + 1];
    return encoding_ == Encoding::Utf16LE ? (b << 8) | a : (a << 8) | b;
  }

  static std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
  }

  static bool valid_utf8_continuation(const DecoderState& st, unsigned char b) {
    if (st.pending_size == 1) {
      // Second byte ranges exclude overlongs, surrogates and > U+10FFFF.
      switch (st.pending[0]) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;
        case 0xED: return b >= 0x80 && b <= 0x9F;
        case 0xF0: return b >= 0x90 && b <= 0xBF;
        case 0xF4: return b >= 0x80 && b <= 0x8F;
        default: break;
      }
    }
    return b >= 0x80 && b <= 0xBF;
  }

  static char32_t assemble_utf8(const DecoderState& st) {
    static constexpr unsigned char kLeadMask[] = {0, 0, 0x1F, 0x0F, 0x07};
    char32_t cp = st.pending[0] & kLeadMask[st.expected];
    for (std::size_t i = 1; i < st.expected; ++i) {
      cp = (cp << 6) | (st.pending[i] & 0x3F);
    }
    return cp;
  }

  Encoding encoding_;
};

}  // namespace ccwc
