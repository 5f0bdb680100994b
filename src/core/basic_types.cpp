// Basic types implementation.

#include "core/basic_types.h"

namespace quill {

const char* suggestionTypeToString(SuggestionType type) {
  switch (type) {
    case SuggestionType::SentenceLength: return "sentence_length";
    case SuggestionType::PassiveVoice:   return "passive_voice";
    case SuggestionType::AdverbUsage:    return "adverb_usage";
  }
  return "unknown";
}

const char* suggestionPriorityToString(SuggestionPriority priority) {
  switch (priority) {
    case SuggestionPriority::Low:    return "low";
    case SuggestionPriority::Medium: return "medium";
    case SuggestionPriority::High:   return "high";
  }
  return "unknown";
}

}  // namespace quill
