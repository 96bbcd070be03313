#ifndef WARDEN_NORMALIZER_H_
#define WARDEN_NORMALIZER_H_

#include "core/warden_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// ============================================================
// NormalizedText - canonical text plus a map back to the raw input
// ============================================================
//
// text()   : canonical form (escapes decoded, valid UTF-8, homoglyphs
//            folded, invisible characters removed, whitespace collapsed and
//            trimmed)
// folded() : ASCII-lowercased copy of text(), byte-for-byte the same length,
//            which is what detectors match against
//
// Every byte of text() remembers the byte range of the raw character it came
// from, so spans found in text() can be reported and redacted in original().
class NormalizedText {
 public:
  NormalizedText() = default;

  const std::string& original() const { return original_; }
  const std::string& text() const { return text_; }
  const std::string& folded() const { return folded_; }
  const std::vector<std::string>& transformations() const { return transformations_; }

  bool empty() const { return text_.empty(); }
  size_t size() const { return text_.size(); }

  // Offset in text() where the input was cut, if it exceeded the limit
  const std::optional<size_t>& truncated_at() const { return truncated_at_; }
  // Same point expressed as an offset into original()
  const std::optional<size_t>& original_truncated_at() const { return original_truncated_at_; }

  bool WasTransformed(const std::string& tag) const;

  // Map a span of text() to the raw byte range it was produced from
  Span ToOriginal(const Span& span) const;

  // Map a raw byte range to the smallest span of text() covering every byte
  // derived from it. Returns an empty span when nothing survived.
  Span FromOriginal(const Span& span) const;

 private:
  friend class Normalizer;

  std::string original_;
  std::string text_;
  std::string folded_;
  std::vector<size_t> orig_begin_;  // per byte of text_
  std::vector<size_t> orig_end_;    // per byte of text_
  std::vector<std::string> transformations_;
  std::optional<size_t> truncated_at_;
  std::optional<size_t> original_truncated_at_;
};

// Transformation tags recorded in NormalizedText::transformations()
extern const char kTransformUtf8Repaired[];
extern const char kTransformConfusablesFolded[];
extern const char kTransformInvisibleRemoved[];
extern const char kTransformWhitespaceCollapsed[];
extern const char kTransformTruncated[];
extern const char kTransformEncodingDecoded[];

// U+FFFD, substituted for every malformed byte
extern const char kReplacementCharacter[];

// ============================================================
// Normalizer
// ============================================================
//
// Total function: any byte string produces a NormalizedText. Steps run in a
// fixed order: escape decoding (percent, backslash-x, backslash-u, HTML
// entities) and UTF-8 repair, confusable folding, invisible-character removal
// and whitespace collapse, lowercase copy, truncation. The decoding steps
// repeat while a pass still decodes something, so nested escapes unwrap.
class Normalizer {
 public:
  // max_length == 0 disables truncation
  explicit Normalizer(size_t max_length = 0) : max_length_(max_length) {}

  NormalizedText Normalize(const std::string& raw) const;

  // Identity view of raw bytes: text() is raw unchanged and folded() its
  // ASCII-lowercased copy. Used to scan text exactly as it will be emitted.
  static NormalizedText Verbatim(const std::string& raw);

  size_t max_length() const { return max_length_; }

  // Exposed for tests and the sanitizer
  static bool FoldConfusable(uint32_t codepoint, std::string* ascii);
  static bool IsInvisible(uint32_t codepoint);
  static bool IsWhitespace(uint32_t codepoint);

  // Collapse whitespace runs of an already-valid UTF-8 string the same way
  // Normalize() does (runs containing a newline become "\n", others " ").
  static std::string CollapseWhitespace(const std::string& text);

 private:
  size_t max_length_;
};

}  // namespace warden

#endif  // WARDEN_NORMALIZER_H_
