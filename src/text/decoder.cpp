#include "text/decoder.hpp"

#include <cctype>
#include <utility>

#include "core/errors.hpp"

namespace ccwc {

namespace {

struct EncodingAlias {
  const char* key;  // lowercase, without '-' and '_'
  Encoding encoding;
};

constexpr EncodingAlias kAliases[] = {
    {"utf8", Encoding::Utf8},
    {"utf16le", Encoding::Utf16LE},
    {"utf16be", Encoding::Utf16BE},
    {"utf32le", Encoding::Utf32LE},
    {"utf32be", Encoding::Utf32BE},
    {"latin1", Encoding::Latin1},
    {"iso88591", Encoding::Latin1},
    {"l1", Encoding::Latin1},
    {"ascii", Encoding::Ascii},
    {"usascii", Encoding::Ascii},
};

std::string normalize(const std::string& name) {
  std::string key;
  key.reserve(name.size());
  for (char c : name) {
    if (c == '-' || c == '_') continue;
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return key;
}

}  // namespace

Decoder Decoder::for_name(const std::string& name) {
  const std::string key = normalize(name);
  for (const auto& alias : kAliases) {
    if (key == alias.key) return Decoder(alias.encoding);
  }
  throw CountError(ErrorKind::UnsupportedEncoding, name);
}

std::vector<std::string> Decoder::supported_names() {
  return {"utf-8", "utf-16le", "utf-16be", "utf-32le", "utf-32be", "latin-1", "ascii"};
}

const char* Decoder::name() const {
  switch (encoding_) {
    case Encoding::Utf8: return "utf-8";
    case Encoding::Utf16LE: return "utf-16le";
    case Encoding::Utf16BE: return "utf-16be";
    case Encoding::Utf32LE: return "utf-32le";
    case Encoding::Utf32BE: return "utf-32be";
    case Encoding::Latin1: return "latin-1";
    case Encoding::Ascii: return "ascii";
  }
  return "?";
}

std::uint64_t Decoder::count(std::string_view bytes, DecoderState& state, bool final) const {
  std::uint64_t n = 0;
  decode(bytes, state, final, [&n](char32_t) { ++n; });
  return n;
}

void Decoder::decode_into(std::string_view bytes, DecoderState& state, bool final,
                          std::u32string& out) const {
  decode(bytes, state, final, [&out](char32_t cp) { out.push_back(cp); });
}

}  // namespace ccwc
