#include "selector.hpp"

#include <iterator>

#include "artifact_record.hpp"

namespace artifact::metadata {

using artifact::store::v1::Artifact;

namespace {

std::unordered_set<std::string> ToSet(std::vector<std::string> values) {
  return {std::make_move_iterator(values.begin()), std::make_move_iterator(values.end())};
}

bool MatchesTag(const TagPredicate& predicate, const Artifact& artifact) {
  auto value = MetadataString(artifact.metadata(), predicate.key);
  if (!value) {
    return false;
  }

  switch (predicate.match) {
    case TagMatch::kEquals:
      return *value == predicate.value;
    case TagMatch::kPrefix:
      return value->compare(0, predicate.value.size(), predicate.value) == 0;
  }
  return false;
}

bool MatchesRange(const TimeRange& range, const Artifact& artifact) {
  auto created_at = MetadataInt(artifact.metadata(), kCreatedAtKey);
  if (!created_at) {
    return false;
  }
  if (range.after_ms && *created_at < *range.after_ms) {
    return false;
  }
  if (range.before_ms && *created_at >= *range.before_ms) {
    return false;
  }
  return true;
}

} // namespace

Selector Selector::ByIds(std::vector<std::string> ids) {
  Selector selector;
  selector.ids = ToSet(std::move(ids));
  return selector;
}

Selector Selector::ByHashes(std::vector<std::string> hashes) {
  Selector selector;
  selector.hashes = ToSet(std::move(hashes));
  return selector;
}

Selector Selector::ByParentHashes(std::vector<std::string> parent_hashes) {
  Selector selector;
  selector.parent_hashes = ToSet(std::move(parent_hashes));
  return selector;
}

bool Selector::HasClauses() const {
  return ids.has_value() || hashes.has_value() || parent_hashes.has_value() || !tags.empty() || created.has_value();
}

bool Matches(const Selector& selector, const Artifact& artifact) {
  if (selector.ids && selector.ids->contains(artifact.custom_id())) {
    return true;
  }

  if (selector.hashes && selector.hashes->contains(artifact.uuid())) {
    return true;
  }

  if (selector.parent_hashes) {
    for (const auto& parent : artifact.parent_uuids()) {
      if (selector.parent_hashes->contains(parent)) {
        return true;
      }
    }
  }

  for (const auto& predicate : selector.tags) {
    if (MatchesTag(predicate, artifact)) {
      return true;
    }
  }

  if (selector.created && MatchesRange(*selector.created, artifact)) {
    return true;
  }

  return false;
}

} // namespace artifact::metadata
