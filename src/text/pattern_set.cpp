// Compiled text patterns implementation (ICU regular expressions).

#include "text/pattern_set.h"

#include <cstdio>
#include <memory>
#include <utility>

#include <unicode/parseerr.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>
#include <unicode/utypes.h>

namespace quill {

namespace {

constexpr PatternId kAllPatterns[kPatternCount] = {
    PatternId::Word,         PatternId::SentenceTerminator, PatternId::ParagraphBreak,
    PatternId::PassiveVoice, PatternId::Adverb,             PatternId::Dialogue,
};

}  // namespace

const char* patternIdToString(PatternId id) {
  switch (id) {
    case PatternId::Word:               return "word";
    case PatternId::SentenceTerminator: return "sentence_terminator";
    case PatternId::ParagraphBreak:     return "paragraph_break";
    case PatternId::PassiveVoice:       return "passive_voice";
    case PatternId::Adverb:             return "adverb";
    case PatternId::Dialogue:           return "dialogue";
  }
  return "unknown";
}

const char* patternSource(PatternId id) {
  switch (id) {
    case PatternId::Word:               return R"(\b\w+\b)";
    case PatternId::SentenceTerminator: return R"([.!?]+)";
    case PatternId::ParagraphBreak:     return R"(\n\p{White_Space}*\n)";
    case PatternId::PassiveVoice:       return R"(\b(was|were|been|being)\p{White_Space}+\w+ed\b)";
    case PatternId::Adverb:             return R"(\b\w+ly\b)";
    case PatternId::Dialogue:           return R"("[^"]*")";
  }
  return "";
}

std::optional<PatternSet> PatternSet::compile(std::string* error) {
  PatternSet set;
  for (PatternId id : kAllPatterns) {
    UParseError parse_error;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> compiled(icu::RegexPattern::compile(
        icu::UnicodeString::fromUTF8(patternSource(id)), 0, parse_error, status));
    if (U_FAILURE(status) || !compiled) {
      std::fprintf(stderr, "[PatternSet] failed to compile %s pattern at offset %d: %s\n",
                   patternIdToString(id), parse_error.offset, u_errorName(status));
      if (error != nullptr) {
        *error = std::string("failed to compile ") + patternIdToString(id) +
                 " pattern: " + u_errorName(status);
      }
      return std::nullopt;
    }
    set.patterns_[static_cast<size_t>(id)] = std::move(compiled);
  }
  return set;
}

const icu::RegexPattern& PatternSet::pattern(PatternId id) const {
  return *patterns_[static_cast<size_t>(id)];
}

std::vector<TextSpan> PatternSet::findAll(PatternId id, std::string_view text) const {
  std::vector<TextSpan> spans;

  UErrorCode status = U_ZERO_ERROR;
  icu::LocalUTextPointer input(
      utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));
  std::unique_ptr<icu::RegexMatcher> matcher(pattern(id).matcher(status));
  if (U_FAILURE(status) || !matcher) {
    std::fprintf(stderr, "[PatternSet] cannot create %s matcher: %s\n",
                 patternIdToString(id), u_errorName(status));
    return spans;
  }

  // Native indices of a UTF-8 UText are byte offsets.
  matcher->reset(input.getAlias());
  while (matcher->find(status)) {
    int64_t start = matcher->start64(status);
    int64_t end = matcher->end64(status);
    if (U_FAILURE(status)) break;
    spans.push_back({static_cast<TextPos>(start), static_cast<TextPos>(end)});
  }

  if (U_FAILURE(status)) {
    std::fprintf(stderr, "[PatternSet] %s match stopped after %zu matches: %s\n",
                 patternIdToString(id), spans.size(), u_errorName(status));
  }
  return spans;
}

size_t PatternSet::countMatches(PatternId id, std::string_view text) const {
  return findAll(id, text).size();
}

std::vector<std::string_view> PatternSet::split(PatternId id, std::string_view text) const {
  std::vector<std::string_view> fragments;
  TextPos last = 0;
  for (const TextSpan& span : findAll(id, text)) {
    fragments.push_back(text.substr(last, span.start - last));
    last = span.end;
  }
  fragments.push_back(text.substr(last));
  return fragments;
}

}  // namespace quill
