// Single-shot heuristic resolution of pre-detected edit conflicts.

#ifndef QUILL_COLLAB_CONFLICT_RESOLVER_H
#define QUILL_COLLAB_CONFLICT_RESOLVER_H

#include <vector>

#include "core/basic_types.h"

namespace quill {

/// Conflict type names understood by the resolver.
constexpr const char* kConflictTextInsertion = "text_insertion";
constexpr const char* kConflictTextDeletion = "text_deletion";
constexpr const char* kConflictTextModification = "text_modification";

/// Suggestion for every other conflict type.
constexpr const char* kManualResolution = "Manual resolution required";

/// @brief Propose a resolution for one conflict.
///
///   text_insertion    -> user_a_change + " " + user_b_change
///   text_deletion     -> the change with fewer code points (ties keep user_a_change)
///   text_modification -> user_b_change (timestamp is not consulted)
///   anything else     -> "Manual resolution required"
///
/// @param conflict Conflict descriptor.
/// @return Copy of conflict with only resolution_suggestion overwritten.
CollaborationConflict resolveConflict(CollaborationConflict conflict);

/// @brief Resolve a list of conflicts.
/// @return Same length and order as the input.
std::vector<CollaborationConflict> resolveConflicts(std::vector<CollaborationConflict> conflicts);

}  // namespace quill

#endif  // QUILL_COLLAB_CONFLICT_RESOLVER_H
