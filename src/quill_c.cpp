// Implementation of C API for WASM and FFI bindings.

#include "quill_c.h"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/result_json.h"
#include "core/version_info.h"
#include "engine.h"

namespace {

/// @brief Internal state held per QuillHandle.
struct QuillInstance {
  explicit QuillInstance(quill::TextEngine engine_in) : engine(std::move(engine_in)) {}

  quill::TextEngine engine;
  std::string output;
  bool has_output = false;
  QuillInfo info = {};
  std::string last_error;
};

/// @brief Read a positive size member. Zero, negative, non-finite and
/// out-of-range numbers become 0, which validateConfig rejects.
void readLimit(const std::map<std::string, quill::JsonValue>& kv, const char* name,
               size_t& out) {
  auto it = kv.find(name);
  if (it == kv.end() || it->second.type != quill::JsonValue::Number) return;
  out = it->second.asSize(0);
}

/// @brief Parse an EngineConfig from a JSON key-value map.
quill::EngineConfig configFromJson(const std::map<std::string, quill::JsonValue>& kv) {
  quill::EngineConfig config;
  readLimit(kv, "long_sentence_word_limit", config.long_sentence_word_limit);
  readLimit(kv, "suggestion_position_stride", config.suggestion_position_stride);

  auto it = kv.find("verbose");
  if (it != kv.end()) {
    config.verbose = it->second.asBool(false);
  }
  return config;
}

QuillHandle createInstance(const quill::EngineConfig& config, QuillError* error) {
  auto set_error = [error](QuillError code) {
    if (error) *error = code;
  };

  if (!quill::validateConfig(config)) {
    set_error(QUILL_ERROR_INVALID_CONFIG);
    return nullptr;
  }
  std::optional<quill::TextEngine> engine = quill::TextEngine::create(config);
  if (!engine) {
    set_error(QUILL_ERROR_INIT_FAILED);
    return nullptr;
  }
  set_error(QUILL_OK);
  return new QuillInstance(std::move(*engine));
}

/// @brief View over caller text; NULL is allowed only for empty text.
bool textView(const char* text, size_t length, std::string_view& out) {
  if (!text) {
    if (length != 0) return false;
    out = std::string_view();
    return true;
  }
  out = std::string_view(text, length);
  return true;
}

void storeOutput(QuillInstance* instance, std::string output) {
  instance->output = std::move(output);
  instance->has_output = true;
  instance->last_error.clear();
}

QuillError failWith(QuillInstance* instance, QuillError error, std::string detail) {
  instance->has_output = false;
  instance->output.clear();
  instance->last_error = std::move(detail);
  return error;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

QuillHandle quill_create(void) {
  return createInstance(quill::EngineConfig(), nullptr);
}

QuillHandle quill_create_from_json(const char* json, size_t length, QuillError* error) {
  if (!json && length != 0) {
    if (error) *error = QUILL_ERROR_INVALID_PARAM;
    return nullptr;
  }

  quill::EngineConfig config;
  if (length > 0) {
    quill::JsonValue root;
    if (!quill::parseJson(json, length, root) || root.type != quill::JsonValue::Object) {
      if (error) *error = QUILL_ERROR_INVALID_JSON;
      return nullptr;
    }
    config = configFromJson(quill::parseJsonObject(json, length));
  }
  return createInstance(config, error);
}

void quill_destroy(QuillHandle handle) {
  delete static_cast<QuillInstance*>(handle);
}

// ============================================================================
// Operations
// ============================================================================

QuillError quill_analyze_text(QuillHandle handle, const char* text, size_t length) {
  if (!handle) return QUILL_ERROR_INVALID_PARAM;
  auto* instance = static_cast<QuillInstance*>(handle);

  std::string_view view;
  if (!textView(text, length, view)) {
    return failWith(instance, QUILL_ERROR_INVALID_PARAM, "text is NULL");
  }

  quill::AnalysisResult result = instance->engine.analyzeText(view);

  instance->info = {};
  instance->info.word_count = result.word_count;
  instance->info.sentence_count = result.sentence_count;
  instance->info.paragraph_count = result.paragraph_count;
  instance->info.character_count = result.character_count;
  instance->info.readability_score = result.readability_score;

  storeOutput(instance, quill::analysisResultToJson(result));
  return QUILL_OK;
}

QuillError quill_optimize_text(QuillHandle handle, const char* text, size_t length) {
  if (!handle) return QUILL_ERROR_INVALID_PARAM;
  auto* instance = static_cast<QuillInstance*>(handle);

  std::string_view view;
  if (!textView(text, length, view)) {
    return failWith(instance, QUILL_ERROR_INVALID_PARAM, "text is NULL");
  }

  std::vector<quill::OptimizationSuggestion> suggestions = instance->engine.optimizeText(view);

  instance->info = {};
  instance->info.suggestion_count = suggestions.size();

  storeOutput(instance, quill::suggestionsToJson(suggestions));
  return QUILL_OK;
}

QuillError quill_resolve_conflicts(QuillHandle handle, const char* json, size_t length) {
  if (!handle) return QUILL_ERROR_INVALID_PARAM;
  auto* instance = static_cast<QuillInstance*>(handle);
  if (!json) {
    return failWith(instance, QUILL_ERROR_INVALID_PARAM, "conflict JSON is NULL");
  }

  std::vector<quill::CollaborationConflict> conflicts;
  std::string detail;
  if (!quill::conflictsFromJson(json, length, conflicts, &detail)) {
    return failWith(instance, QUILL_ERROR_INVALID_JSON, detail);
  }

  storeOutput(instance,
              quill::conflictsToJson(instance->engine.resolveConflicts(std::move(conflicts))));
  return QUILL_OK;
}

QuillError quill_content_hash(QuillHandle handle, const char* text, size_t length) {
  if (!handle) return QUILL_ERROR_INVALID_PARAM;
  auto* instance = static_cast<QuillInstance*>(handle);

  std::string_view view;
  if (!textView(text, length, view)) {
    return failWith(instance, QUILL_ERROR_INVALID_PARAM, "text is NULL");
  }

  storeOutput(instance, instance->engine.generateContentHash(view));
  return QUILL_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

QuillOutput* quill_get_output(QuillHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<QuillInstance*>(handle);
  if (!instance->has_output) return nullptr;

  auto* result = static_cast<QuillOutput*>(malloc(sizeof(QuillOutput)));
  if (!result) return nullptr;

  result->length = instance->output.size();
  result->data = static_cast<char*>(malloc(result->length + 1));
  if (!result->data) {
    free(result);
    return nullptr;
  }

  memcpy(result->data, instance->output.c_str(), result->length + 1);
  return result;
}

void quill_free_output(QuillOutput* output) {
  if (output) {
    free(output->data);
    free(output);
  }
}

const QuillInfo* quill_get_info(QuillHandle handle) {
  static const QuillInfo kEmptyInfo = {};
  if (!handle) return &kEmptyInfo;
  return &static_cast<QuillInstance*>(handle)->info;
}

// ============================================================================
// Error Handling
// ============================================================================

const char* quill_error_string(QuillError error) {
  switch (error) {
    case QUILL_OK: return "No error";
    case QUILL_ERROR_INVALID_PARAM: return "Invalid parameter";
    case QUILL_ERROR_INVALID_CONFIG: return "Invalid configuration";
    case QUILL_ERROR_INIT_FAILED: return "Engine initialization failed";
    case QUILL_ERROR_INVALID_JSON: return "Invalid JSON input";
  }
  return "Unknown error";
}

const char* quill_last_error_detail(QuillHandle handle) {
  if (!handle) return "";
  return static_cast<QuillInstance*>(handle)->last_error.c_str();
}

// ============================================================================
// Utilities
// ============================================================================

const char* quill_version(void) {
  return QUILL_VERSION;
}

}  // extern "C"
