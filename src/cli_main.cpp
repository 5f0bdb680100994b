/// @file
/// @brief CLI entry point for the quill text analyzer.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/result_json.h"
#include "core/version_info.h"
#include "engine.h"

namespace {

enum class Command { None, Analyze, Optimize, Hash, Resolve };

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Command command = Command::None;
  std::string input;  ///< Empty = stdin.
  bool json_output = false;
  bool pretty = false;
  bool verbose = false;
  size_t sentence_limit = 25;
  bool help = false;  ///< Usage was printed; exit cleanly.
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("quill_cli - text metrics and writing suggestions\n\n");
  std::printf("Usage: quill_cli COMMAND [options] [FILE]\n\n");
  std::printf("Commands:\n");
  std::printf("  analyze          Counts, readability and style metrics\n");
  std::printf("  optimize         Writing suggestions\n");
  std::printf("  hash             Content hash (base64 SHA-256)\n");
  std::printf("  resolve          Resolve a JSON array of conflict records\n");
  std::printf("\nOptions:\n");
  std::printf("  --json             JSON output\n");
  std::printf("  --pretty           Indented JSON output (implies --json)\n");
  std::printf("  --sentence-limit N Words per sentence before flagging (default 25)\n");
  std::printf("  --verbose          Diagnostics on stderr\n");
  std::printf("  --help             Show this help\n");
  std::printf("\nFILE defaults to stdin (required for resolve).\n");
}

Command commandFromString(const char* name) {
  if (std::strcmp(name, "analyze") == 0) return Command::Analyze;
  if (std::strcmp(name, "optimize") == 0) return Command::Optimize;
  if (std::strcmp(name, "hash") == 0) return Command::Hash;
  if (std::strcmp(name, "resolve") == 0) return Command::Resolve;
  return Command::None;
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if the caller should exit (help shown or bad arguments).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      opts.help = true;
      return false;
    }
    if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--pretty") == 0) {
      opts.json_output = true;
      opts.pretty = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(arg, "--sentence-limit") == 0 && idx + 1 < argc) {
      int limit = std::atoi(argv[++idx]);
      if (limit <= 0) {
        std::fprintf(stderr, "Error: --sentence-limit must be positive\n");
        return false;
      }
      opts.sentence_limit = static_cast<size_t>(limit);
    } else if (opts.command == Command::None) {
      opts.command = commandFromString(arg);
      if (opts.command == Command::None) {
        std::fprintf(stderr, "Error: unknown command '%s'\n", arg);
        return false;
      }
    } else if (opts.input.empty()) {
      opts.input = arg;
    } else {
      std::fprintf(stderr, "Error: unexpected argument '%s'\n", arg);
      return false;
    }
  }

  if (opts.command == Command::None) {
    printUsage();
    opts.help = argc <= 1;
    return false;
  }
  if (opts.command == Command::Resolve && opts.input.empty()) {
    std::fprintf(stderr, "Error: resolve needs a conflict file\n");
    return false;
  }
  return true;
}

/// @brief Read a whole file, or stdin when path is empty.
bool readInput(const std::string& path, std::string& out) {
  if (path.empty()) {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

void printAnalysis(const quill::AnalysisResult& result) {
  const auto& complexity = result.complexity_metrics;
  const auto& style = result.style_metrics;
  std::printf("Words:        %zu\n", result.word_count);
  std::printf("Characters:   %zu\n", result.character_count);
  std::printf("Sentences:    %zu\n", result.sentence_count);
  std::printf("Paragraphs:   %zu\n", result.paragraph_count);
  std::printf("Readability:  %.2f\n", result.readability_score);
  std::printf("\nComplexity\n");
  std::printf("  Words/sentence:     %.2f\n", complexity.avg_words_per_sentence);
  std::printf("  Syllables/word:     %.2f\n", complexity.avg_syllables_per_word);
  std::printf("  Fog index:          %.2f\n", complexity.fog_index);
  std::printf("  Flesch ease:        %.2f\n", complexity.flesch_reading_ease);
  std::printf("  Unique word ratio:  %.3f\n", complexity.unique_word_ratio);
  std::printf("\nStyle\n");
  std::printf("  Passive voice/sentence: %.3f\n", style.passive_voice_ratio);
  std::printf("  Adverbs/word:           %.3f\n", style.adverb_ratio);
  std::printf("  Dialogue/paragraph:     %.3f\n", style.dialogue_ratio);
  std::printf("\nHash:         %s\n", result.content_hash.c_str());
}

void printSuggestions(const std::vector<quill::OptimizationSuggestion>& suggestions) {
  if (suggestions.empty()) {
    std::printf("No suggestions.\n");
    return;
  }
  for (const auto& suggestion : suggestions) {
    std::printf("[%-6s] %-15s %zu-%zu  %s\n",
                quill::suggestionPriorityToString(suggestion.priority),
                quill::suggestionTypeToString(suggestion.type), suggestion.start_pos,
                suggestion.end_pos, suggestion.message.c_str());
  }
  std::printf("\n%zu suggestions\n", suggestions.size());
}

void printConflicts(const std::vector<quill::CollaborationConflict>& conflicts) {
  for (const auto& conflict : conflicts) {
    std::printf("%s (%s, %zu-%zu): %s\n", conflict.conflict_id.c_str(),
                conflict.conflict_type.c_str(), conflict.start_pos, conflict.end_pos,
                conflict.resolution_suggestion.c_str());
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return opts.help ? 0 : 1;
  }

  quill::EngineConfig config;
  config.long_sentence_word_limit = opts.sentence_limit;
  config.verbose = opts.verbose;

  std::string error;
  std::optional<quill::TextEngine> engine = quill::TextEngine::create(config, &error);
  if (!engine) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  std::string input;
  if (!readInput(opts.input, input)) {
    std::fprintf(stderr, "Error: failed to read %s\n",
                 opts.input.empty() ? "stdin" : opts.input.c_str());
    return 1;
  }

  if (opts.verbose) {
    std::fprintf(stderr, "quill_cli v%s\n", QUILL_VERSION);
  }

  switch (opts.command) {
    case Command::Analyze: {
      quill::AnalysisResult result = engine->analyzeText(input);
      if (opts.json_output) {
        std::printf("%s\n", quill::analysisResultToJson(result, opts.pretty).c_str());
      } else {
        printAnalysis(result);
      }
      break;
    }
    case Command::Optimize: {
      auto suggestions = engine->optimizeText(input);
      if (opts.json_output) {
        std::printf("%s\n", quill::suggestionsToJson(suggestions, opts.pretty).c_str());
      } else {
        printSuggestions(suggestions);
      }
      break;
    }
    case Command::Hash:
      std::printf("%s\n", engine->generateContentHash(input).c_str());
      break;
    case Command::Resolve: {
      std::vector<quill::CollaborationConflict> conflicts;
      if (!quill::conflictsFromJson(input.data(), input.size(), conflicts, &error)) {
        std::fprintf(stderr, "Error: %s: %s\n", opts.input.c_str(), error.c_str());
        return 1;
      }
      auto resolved = engine->resolveConflicts(std::move(conflicts));
      if (opts.json_output) {
        std::printf("%s\n", quill::conflictsToJson(resolved, opts.pretty).c_str());
      } else {
        printConflicts(resolved);
      }
      break;
    }
    case Command::None:
      break;
  }

  return 0;
}
