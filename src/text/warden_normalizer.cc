#include "text/warden_normalizer.h"
#include "util/logger.h"
#include <algorithm>
#include <cstddef>
#include <iterator>

namespace warden {

const char kTransformUtf8Repaired[] = "utf8_repaired";
const char kTransformConfusablesFolded[] = "confusables_folded";
const char kTransformInvisibleRemoved[] = "invisible_removed";
const char kTransformWhitespaceCollapsed[] = "whitespace_collapsed";
const char kTransformTruncated[] = "truncated";
const char kTransformEncodingDecoded[] = "encoding_decoded";

const char kReplacementCharacter[] = "\xEF\xBF\xBD";

namespace {

constexpr uint32_t kReplacementCodepoint = 0xFFFD;

struct DecodedChar {
  uint32_t codepoint;
  size_t begin;
  size_t end;
  bool repaired;
};

bool IsContinuation(unsigned char ch) {
  return (ch & 0xC0) == 0x80;
}

// Decode one code point starting at pos. Malformed, overlong and surrogate
// sequences consume a single byte and yield U+FFFD.
DecodedChar DecodeAt(const std::string& s, size_t pos) {
  const unsigned char lead = static_cast<unsigned char>(s[pos]);
  const size_t remaining = s.size() - pos;

  if (lead < 0x80) {
    return {lead, pos, pos + 1, false};
  }

  size_t length = 0;
  uint32_t cp = 0;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;

  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    cp = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    cp = lead & 0x0F;
    if (lead == 0xE0) min_second = 0xA0;  // overlong
    if (lead == 0xED) max_second = 0x9F;  // UTF-16 surrogates
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    cp = lead & 0x07;
    if (lead == 0xF0) min_second = 0x90;  // overlong
    if (lead == 0xF4) max_second = 0x8F;  // above U+10FFFF
  } else {
    return {kReplacementCodepoint, pos, pos + 1, true};
  }

  if (remaining < length) {
    return {kReplacementCodepoint, pos, pos + 1, true};
  }

  const unsigned char second = static_cast<unsigned char>(s[pos + 1]);
  if (second < min_second || second > max_second) {
    return {kReplacementCodepoint, pos, pos + 1, true};
  }
  cp = (cp << 6) | (second & 0x3F);

  for (size_t i = 2; i < length; i++) {
    const unsigned char ch = static_cast<unsigned char>(s[pos + i]);
    if (!IsContinuation(ch)) {
      return {kReplacementCodepoint, pos, pos + 1, true};
    }
    cp = (cp << 6) | (ch & 0x3F);
  }

  return {cp, pos, pos + length, false};
}

void EncodeUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

struct ConfusableEntry {
  uint32_t codepoint;
  const char* ascii;
};

// Sorted by code point for binary search
const ConfusableEntry kConfusables[] = {
  {0x0261, "g"},
  {0x0391, "A"}, {0x0392, "B"}, {0x0395, "E"}, {0x0396, "Z"}, {0x0397, "H"},
  {0x0399, "I"}, {0x039A, "K"}, {0x039C, "M"}, {0x039D, "N"}, {0x039F, "O"},
  {0x03A1, "P"}, {0x03A4, "T"}, {0x03A5, "Y"}, {0x03A7, "X"},
  {0x03B1, "a"}, {0x03B9, "i"}, {0x03BD, "v"}, {0x03BF, "o"}, {0x03C1, "p"},
  {0x0405, "S"}, {0x0406, "I"}, {0x0408, "J"},
  {0x0410, "A"}, {0x0412, "B"}, {0x0415, "E"}, {0x041A, "K"}, {0x041C, "M"},
  {0x041D, "H"}, {0x041E, "O"}, {0x0420, "P"}, {0x0421, "C"}, {0x0422, "T"},
  {0x0425, "X"},
  {0x0430, "a"}, {0x0435, "e"}, {0x043E, "o"}, {0x0440, "p"}, {0x0441, "c"},
  {0x0443, "y"}, {0x0445, "x"},
  {0x0455, "s"}, {0x0456, "i"}, {0x0458, "j"},
  {0x04BB, "h"},
  {0x0501, "d"},
  {0x2010, "-"}, {0x2011, "-"}, {0x2012, "-"}, {0x2013, "-"}, {0x2014, "-"},
  {0x2015, "-"},
  {0x2018, "'"}, {0x2019, "'"}, {0x201A, "'"}, {0x201B, "'"},
  {0x201C, "\""}, {0x201D, "\""}, {0x201E, "\""}, {0x201F, "\""},
  {0x2024, "."}, {0x2026, "..."},
  {0x2032, "'"}, {0x2033, "\""},
  {0x2039, "<"}, {0x203A, ">"},
  {0x2044, "/"},
  {0x2212, "-"},
  {0x2215, "/"},
  {0x2223, "|"},
  {0xFB00, "ff"}, {0xFB01, "fi"}, {0xFB02, "fl"},
};

// ============================================================
// Escape decoding
// ============================================================

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

bool ReadHex(const std::string& s, size_t pos, size_t digits, uint32_t* value) {
  if (pos + digits > s.size()) {
    return false;
  }
  uint32_t result = 0;
  for (size_t i = 0; i < digits; i++) {
    int digit = HexValue(s[pos + i]);
    if (digit < 0) return false;
    result = (result << 4) | static_cast<uint32_t>(digit);
  }
  *value = result;
  return true;
}

bool IsScalarValue(uint32_t cp) {
  return cp > 0 && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

// Length of a "%XX" or "\xXX" escape at pos, 0 when there is none
size_t ByteEscapeAt(const std::string& s, size_t pos, unsigned char* byte) {
  uint32_t value = 0;
  if (s[pos] == '%' && ReadHex(s, pos + 1, 2, &value)) {
    *byte = static_cast<unsigned char>(value);
    return 3;
  }
  if (s[pos] == '\\' && pos + 1 < s.size() && (s[pos + 1] == 'x' || s[pos + 1] == 'X') &&
      ReadHex(s, pos + 2, 2, &value)) {
    *byte = static_cast<unsigned char>(value);
    return 4;
  }
  return 0;
}

// A run of byte escapes of one kind decodes only if it spells valid UTF-8
bool DecodeByteEscapes(const std::string& s, size_t pos, DecodedChar* out) {
  unsigned char byte = 0;
  size_t length = ByteEscapeAt(s, pos, &byte);
  if (length == 0) {
    return false;
  }
  if (byte < 0x80) {
    *out = {byte, pos, pos + length, false};
    return true;
  }

  std::string bytes(1, static_cast<char>(byte));
  size_t cursor = pos + length;
  while (bytes.size() < 4 && cursor < s.size() && s[cursor] == s[pos]) {
    unsigned char next = 0;
    size_t next_length = ByteEscapeAt(s, cursor, &next);
    if (next_length == 0 || next < 0x80) {
      break;
    }
    bytes.push_back(static_cast<char>(next));
    cursor += next_length;

    DecodedChar dc = DecodeAt(bytes, 0);
    if (!dc.repaired && dc.end == bytes.size()) {
      *out = {dc.codepoint, pos, cursor, false};
      return true;
    }
  }
  return false;
}

// Four-digit backslash-u escapes
bool DecodeUnicodeEscape(const std::string& s, size_t pos, DecodedChar* out) {
  uint32_t cp = 0;
  if (s[pos] != '\\' || pos + 1 >= s.size() || s[pos + 1] != 'u' ||
      !ReadHex(s, pos + 2, 4, &cp) || !IsScalarValue(cp)) {
    return false;
  }
  *out = {cp, pos, pos + 6, false};
  return true;
}

struct NamedEntity {
  const char* name;
  uint32_t codepoint;
};

const NamedEntity kNamedEntities[] = {
  {"amp", '&'}, {"apos", '\''}, {"colon", ':'}, {"gt", '>'}, {"lt", '<'},
  {"nbsp", 0x00A0}, {"quot", '"'}, {"sol", '/'},
};

// "&#NN;", "&#xHH;" and a few named entities
bool DecodeEntity(const std::string& s, size_t pos, DecodedChar* out) {
  if (s[pos] != '&') {
    return false;
  }
  // Longest accepted form is "&#x10FFFF;"
  auto limit = s.begin() + static_cast<std::ptrdiff_t>(std::min(s.size(), pos + 11));
  auto found_semi = std::find(s.begin() + static_cast<std::ptrdiff_t>(pos) + 1, limit, ';');
  if (found_semi == limit) {
    return false;
  }
  size_t semi = static_cast<size_t>(found_semi - s.begin());
  const std::string body = s.substr(pos + 1, semi - pos - 1);
  if (body.empty()) {
    return false;
  }

  uint32_t cp = 0;
  if (body[0] == '#') {
    bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
    size_t i = hex ? 2 : 1;
    if (i >= body.size()) {
      return false;
    }
    for (; i < body.size(); i++) {
      int digit = hex ? HexValue(body[i]) : (body[i] >= '0' && body[i] <= '9' ? body[i] - '0' : -1);
      if (digit < 0) return false;
      cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(digit);
      if (cp > 0x10FFFF) return false;
    }
    if (!IsScalarValue(cp)) {
      return false;
    }
  } else {
    const NamedEntity* found = nullptr;
    for (const auto& entity : kNamedEntities) {
      if (body == entity.name) {
        found = &entity;
        break;
      }
    }
    if (!found) {
      return false;
    }
    cp = found->codepoint;
  }

  *out = {cp, pos, semi + 1, false};
  return true;
}

bool DecodeEscape(const std::string& s, size_t pos, DecodedChar* out) {
  switch (s[pos]) {
    case '%':
      return DecodeByteEscapes(s, pos, out);
    case '\\':
      return DecodeUnicodeEscape(s, pos, out) || DecodeByteEscapes(s, pos, out);
    case '&':
      return DecodeEntity(s, pos, out);
    default:
      return false;
  }
}

}  // namespace

// ============================================================
// Character classes
// ============================================================

bool Normalizer::FoldConfusable(uint32_t codepoint, std::string* ascii) {
  // Fullwidth ASCII block
  if (codepoint >= 0xFF01 && codepoint <= 0xFF5E) {
    *ascii = std::string(1, static_cast<char>(codepoint - 0xFEE0));
    return true;
  }
  // Circled Latin letters
  if (codepoint >= 0x24B6 && codepoint <= 0x24CF) {
    *ascii = std::string(1, static_cast<char>('A' + (codepoint - 0x24B6)));
    return true;
  }
  if (codepoint >= 0x24D0 && codepoint <= 0x24E9) {
    *ascii = std::string(1, static_cast<char>('a' + (codepoint - 0x24D0)));
    return true;
  }
  // Mathematical alphanumeric letters: runs of 52 (A-Z then a-z)
  if (codepoint >= 0x1D400 && codepoint <= 0x1D6A3) {
    uint32_t offset = (codepoint - 0x1D400) % 52;
    char ch = offset < 26 ? static_cast<char>('A' + offset)
                          : static_cast<char>('a' + (offset - 26));
    *ascii = std::string(1, ch);
    return true;
  }
  // Mathematical digits
  if (codepoint >= 0x1D7CE && codepoint <= 0x1D7FF) {
    *ascii = std::string(1, static_cast<char>('0' + (codepoint - 0x1D7CE) % 10));
    return true;
  }

  const ConfusableEntry* begin = std::begin(kConfusables);
  const ConfusableEntry* end = std::end(kConfusables);
  const ConfusableEntry* it = std::lower_bound(
      begin, end, codepoint,
      [](const ConfusableEntry& entry, uint32_t cp) { return entry.codepoint < cp; });
  if (it != end && it->codepoint == codepoint) {
    *ascii = it->ascii;
    return true;
  }
  return false;
}

bool Normalizer::IsInvisible(uint32_t cp) {
  // C0 controls other than whitespace, DEL, C1 controls
  if (cp < 0x20) {
    return cp != '\t' && cp != '\n' && cp != '\r' && cp != 0x0B && cp != 0x0C;
  }
  if (cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) return true;

  switch (cp) {
    case 0x00AD:  // soft hyphen
    case 0x034F:  // combining grapheme joiner
    case 0x061C:  // arabic letter mark
    case 0x180E:  // mongolian vowel separator
    case 0x200B:  // zero-width space
    case 0x200C:  // zero-width non-joiner
    case 0x200D:  // zero-width joiner
    case 0x200E:  // left-to-right mark
    case 0x200F:  // right-to-left mark
    case 0xFEFF:  // zero-width no-break space (BOM)
      return true;
    default:
      break;
  }
  if (cp >= 0x202A && cp <= 0x202E) return true;  // bidi embeddings/overrides
  if (cp >= 0x2060 && cp <= 0x2064) return true;  // word joiner, invisible operators
  if (cp >= 0x2066 && cp <= 0x206F) return true;  // bidi isolates, deprecated formats
  if (cp >= 0xFE00 && cp <= 0xFE0F) return true;  // variation selectors
  if (cp >= 0xE0000 && cp <= 0xE007F) return true;  // tag characters (ASCII smuggling)
  return false;
}

bool Normalizer::IsWhitespace(uint32_t cp) {
  switch (cp) {
    case ' ': case '\t': case '\n': case '\r': case 0x0B: case 0x0C:
    case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
    case 0x205F: case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

// ============================================================
// Normalize
// ============================================================

namespace {

void AddTag(std::vector<std::string>* tags, const char* tag) {
  if (std::find(tags->begin(), tags->end(), tag) == tags->end()) {
    tags->push_back(tag);
  }
}

bool IsLineBreak(uint32_t cp) {
  return cp == '\n' || cp == '\r' || cp == 0x2028 || cp == 0x2029 || cp == 0x0B || cp == 0x0C;
}

}  // namespace

namespace {

// Output of one canonicalization pass; offsets refer to that pass's input
struct PassResult {
  std::string text;
  std::vector<size_t> begin;
  std::vector<size_t> end;
  std::vector<std::string> tags;
  bool decoded = false;
};

// Decoding a nested escape can expose another one; passes stop when a pass
// decodes nothing or this limit is reached
constexpr int kMaxDecodePasses = 8;

PassResult CanonicalizePass(const std::string& input) {
  PassResult result;
  result.text.reserve(input.size());
  result.begin.reserve(input.size());
  result.end.reserve(input.size());

  // Pending whitespace run, emitted lazily so leading/trailing runs vanish
  bool pending_space = false;
  bool pending_newline = false;
  bool run_was_modified = false;
  size_t pending_begin = 0;
  size_t pending_end = 0;

  auto emit = [&result](const std::string& bytes, size_t begin, size_t end) {
    result.text += bytes;
    for (size_t i = 0; i < bytes.size(); i++) {
      result.begin.push_back(begin);
      result.end.push_back(end);
    }
  };

  auto flush_pending = [&]() {
    if (!pending_space) return;
    if (!result.text.empty()) {
      emit(pending_newline ? "\n" : " ", pending_begin, pending_end);
    } else {
      run_was_modified = true;  // leading whitespace dropped
    }
    if (run_was_modified) {
      AddTag(&result.tags, kTransformWhitespaceCollapsed);
    }
    pending_space = false;
    pending_newline = false;
    run_was_modified = false;
  };

  size_t pos = 0;
  while (pos < input.size()) {
    DecodedChar dc;
    if (DecodeEscape(input, pos, &dc)) {
      result.decoded = true;
      AddTag(&result.tags, kTransformEncodingDecoded);
    } else {
      dc = DecodeAt(input, pos);
    }
    pos = dc.end;

    if (dc.repaired) {
      AddTag(&result.tags, kTransformUtf8Repaired);
    }

    if (Normalizer::IsInvisible(dc.codepoint)) {
      AddTag(&result.tags, kTransformInvisibleRemoved);
      continue;
    }

    if (Normalizer::IsWhitespace(dc.codepoint)) {
      if (!pending_space) {
        pending_space = true;
        pending_begin = dc.begin;
        // A lone ' ' or '\n' is already canonical; anything else is a change
        run_was_modified = !(dc.codepoint == ' ' || dc.codepoint == '\n');
      } else {
        run_was_modified = true;
      }
      pending_end = dc.end;
      if (IsLineBreak(dc.codepoint)) {
        if (!pending_newline && dc.codepoint != '\n') run_was_modified = true;
        pending_newline = true;
      }
      continue;
    }

    std::string folded;
    if (dc.codepoint >= 0x80 && Normalizer::FoldConfusable(dc.codepoint, &folded)) {
      AddTag(&result.tags, kTransformConfusablesFolded);
    } else {
      folded.clear();
      EncodeUtf8(dc.codepoint, &folded);
    }

    flush_pending();
    emit(folded, dc.begin, dc.end);
  }

  if (pending_space) {
    // Trailing whitespace is trimmed
    AddTag(&result.tags, kTransformWhitespaceCollapsed);
  }
  return result;
}

std::string AsciiLower(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) -> char {
                   return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a')
                                                 : static_cast<char>(c);
                 });
  return lowered;
}

}  // namespace

NormalizedText Normalizer::Normalize(const std::string& raw) const {
  NormalizedText result;
  result.original_ = raw;

  PassResult pass = CanonicalizePass(raw);
  for (const auto& tag : pass.tags) {
    AddTag(&result.transformations_, tag.c_str());
  }

  for (int count = 1; pass.decoded && count < kMaxDecodePasses; count++) {
    PassResult next = CanonicalizePass(pass.text);
    if (next.text == pass.text) {
      break;
    }
    // Compose offsets so they keep pointing into the raw input
    for (size_t i = 0; i < next.text.size(); i++) {
      size_t last = next.end[i] - 1;
      next.begin[i] = pass.begin[next.begin[i]];
      next.end[i] = pass.end[last];
    }
    for (const auto& tag : next.tags) {
      AddTag(&result.transformations_, tag.c_str());
    }
    pass = std::move(next);
  }

  result.text_ = std::move(pass.text);
  result.orig_begin_ = std::move(pass.begin);
  result.orig_end_ = std::move(pass.end);

  if (max_length_ > 0 && result.text_.size() > max_length_) {
    size_t cut = max_length_;
    while (cut > 0 && IsContinuation(static_cast<unsigned char>(result.text_[cut]))) {
      cut--;
    }
    while (cut > 0 && (result.text_[cut - 1] == ' ' || result.text_[cut - 1] == '\n')) {
      cut--;
    }
    result.original_truncated_at_ = result.orig_begin_[cut];
    result.truncated_at_ = cut;
    result.text_.resize(cut);
    result.orig_begin_.resize(cut);
    result.orig_end_.resize(cut);
    AddTag(&result.transformations_, kTransformTruncated);
    LOG_DEBUG("Normalizer", "Input truncated from " + std::to_string(raw.size()) +
              " raw bytes at normalized offset " + std::to_string(cut));
  }

  result.folded_ = AsciiLower(result.text_);
  return result;
}

NormalizedText Normalizer::Verbatim(const std::string& raw) {
  NormalizedText result;
  result.original_ = raw;
  result.text_ = raw;
  result.folded_ = AsciiLower(raw);
  result.orig_begin_.resize(raw.size());
  result.orig_end_.resize(raw.size());
  for (size_t i = 0; i < raw.size(); i++) {
    result.orig_begin_[i] = i;
    result.orig_end_[i] = i + 1;
  }
  return result;
}

std::string Normalizer::CollapseWhitespace(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  bool in_run = false;
  bool run_has_newline = false;
  for (char ch : text) {
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f') {
      in_run = true;
      if (ch != ' ' && ch != '\t') run_has_newline = true;
      continue;
    }
    if (in_run && !result.empty()) {
      result += run_has_newline ? '\n' : ' ';
    }
    in_run = false;
    run_has_newline = false;
    result += ch;
  }
  return result;
}

// ============================================================
// NormalizedText
// ============================================================

bool NormalizedText::WasTransformed(const std::string& tag) const {
  return std::find(transformations_.begin(), transformations_.end(), tag) !=
         transformations_.end();
}

Span NormalizedText::ToOriginal(const Span& span) const {
  if (span.start >= span.end || span.end > text_.size()) {
    if (span.start < orig_begin_.size()) {
      return {orig_begin_[span.start], orig_begin_[span.start]};
    }
    return {original_.size(), original_.size()};
  }
  return {orig_begin_[span.start], orig_end_[span.end - 1]};
}

Span NormalizedText::FromOriginal(const Span& span) const {
  size_t first = text_.size();
  size_t last = 0;
  bool found = false;
  for (size_t i = 0; i < text_.size(); i++) {
    if (orig_begin_[i] >= span.start && orig_end_[i] <= span.end) {
      if (!found) first = i;
      last = i + 1;
      found = true;
    }
  }
  if (!found) {
    return {0, 0};
  }
  return {first, last};
}

}  // namespace warden
