#pragma once

#include <string>

namespace sme::core {

// Strong ID types. Opaque to the engine: compared and ordered, never parsed.
// Ordering is lexicographic on the underlying string, which gives every ranking
// and grouping step a deterministic final tie-break.

struct ParticipantId {
  std::string value;
  auto operator<=>(const ParticipantId&) const = default;
};

struct SubjectId {
  std::string value;
  auto operator<=>(const SubjectId&) const = default;
};

}  // namespace sme::core
