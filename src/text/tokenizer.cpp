// Tokenizer implementation.

#include "text/tokenizer.h"

#include "text/unicode_text.h"

namespace quill {

std::vector<std::string_view> Tokenizer::words(std::string_view text) const {
  std::vector<std::string_view> result;
  for (const TextSpan& span : patterns_.findAll(PatternId::Word, text)) {
    result.push_back(text.substr(span.start, span.length()));
  }
  return result;
}

std::vector<std::string_view> Tokenizer::sentences(std::string_view text) const {
  return splitNonBlank(PatternId::SentenceTerminator, text);
}

std::vector<std::string_view> Tokenizer::paragraphs(std::string_view text) const {
  return splitNonBlank(PatternId::ParagraphBreak, text);
}

TokenizedText Tokenizer::tokenize(std::string_view text) const {
  TokenizedText result;
  result.words = words(text);
  result.sentences = sentences(text);
  result.paragraphs = paragraphs(text);
  return result;
}

std::vector<std::string_view> Tokenizer::splitNonBlank(PatternId id,
                                                       std::string_view text) const {
  std::vector<std::string_view> result;
  for (std::string_view fragment : patterns_.split(id, text)) {
    if (!isBlank(fragment)) {
      result.push_back(fragment);
    }
  }
  return result;
}

}  // namespace quill
