// Conflict resolver implementation.

#include "collab/conflict_resolver.h"

#include <utility>

#include "text/unicode_text.h"

namespace quill {

CollaborationConflict resolveConflict(CollaborationConflict conflict) {
  const std::string& type = conflict.conflict_type;

  if (type == kConflictTextInsertion) {
    conflict.resolution_suggestion = conflict.user_a_change + " " + conflict.user_b_change;
  } else if (type == kConflictTextDeletion) {
    // Fewer code points wins; ties keep user_a_change.
    bool keep_b = countCodePoints(conflict.user_b_change) < countCodePoints(conflict.user_a_change);
    conflict.resolution_suggestion = keep_b ? conflict.user_b_change : conflict.user_a_change;
  } else if (type == kConflictTextModification) {
    conflict.resolution_suggestion = conflict.user_b_change;
  } else {
    conflict.resolution_suggestion = kManualResolution;
  }
  return conflict;
}

std::vector<CollaborationConflict> resolveConflicts(std::vector<CollaborationConflict> conflicts) {
  for (auto& conflict : conflicts) {
    conflict = resolveConflict(std::move(conflict));
  }
  return conflicts;
}

}  // namespace quill
