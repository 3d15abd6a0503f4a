#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "api/artifact/store/v1.hpp"

namespace artifact::metadata {

enum class TagMatch {
  kEquals,
  kPrefix,
};

// One provenance tag clause over a top-level metadata key.
struct TagPredicate {
  std::string key;
  std::string value;
  TagMatch    match = TagMatch::kEquals;
};

// Bounds over metadata created_at_ms: after_ms inclusive, before_ms exclusive.
struct TimeRange {
  std::optional<int64_t> after_ms;
  std::optional<int64_t> before_ms;
};

/*
  Selector

  A set of independent, optional clauses:

    ids            artifact custom_id is in the set
    hashes         artifact uuid is in the set
    parent_hashes  any of the artifact's parent_uuids is in the set
    tags           each predicate is its own clause
    created        created_at_ms lies inside the range (both bounds)

  COMBINATION: an artifact matches when ANY supplied clause matches.
  Clauses are evaluated in the order above and the first match wins.

  An absent clause is never evaluated, so it neither matches everything nor
  excludes anything. A selector with no clause matches nothing. A supplied
  but empty set matches nothing.
*/
struct Selector {
  std::optional<std::unordered_set<std::string>> ids;
  std::optional<std::unordered_set<std::string>> hashes;
  std::optional<std::unordered_set<std::string>> parent_hashes;
  std::vector<TagPredicate>                      tags;
  std::optional<TimeRange>                       created;

  static Selector ByIds(std::vector<std::string> ids);
  static Selector ByHashes(std::vector<std::string> hashes);
  static Selector ByParentHashes(std::vector<std::string> parent_hashes);

  bool HasClauses() const;
};

bool Matches(const Selector& selector, const artifact::store::v1::Artifact& artifact);

} // namespace artifact::metadata
