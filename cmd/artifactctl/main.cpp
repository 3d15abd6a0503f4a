#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/document/document_codec.hpp"
#include "internal/document/document_hash.hpp"
#include "internal/factory.hpp"
#include "internal/metadata/selector.hpp"
#include "internal/observability/logging.hpp"

using artifact::metadata::Selector;
using artifact::metadata::TagMatch;
using artifact::metadata::TagPredicate;

static void Usage() {
  std::cout << "Usage:\n"
            << "  artifactctl --config <config.yaml> ls\n"
            << "  artifactctl --config <config.yaml> show <hash>\n"
            << "  artifactctl --config <config.yaml> select <selector flags>\n"
            << "  artifactctl --config <config.yaml> rm <selector flags> [--cascade]\n"
            << "  artifactctl --config <config.yaml> gc\n"
            << "  artifactctl --config <config.yaml> lineage <hash> [up|down] [max_depth]\n"
            << "\n"
            << "Selector flags (repeatable, OR-combined):\n"
            << "  --id <logical id>  --hash <hash>  --parent <hash>\n"
            << "  --tag key=value  --tag-prefix key=prefix\n"
            << "  --after <unix ms>  --before <unix ms>\n";
}

static bool ValidHash(const std::string& hash) {
  if (artifact::document::IsWellFormedHash(hash)) return true;
  std::cerr << "invalid hash: expected 64 lowercase hex chars, got '" << hash << "'\n";
  return false;
}

static std::optional<TagPredicate> ParseTag(const std::string& arg, TagMatch match) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::cerr << "invalid tag '" << arg << "', expected key=value\n";
    return std::nullopt;
  }
  return TagPredicate{arg.substr(0, eq), arg.substr(eq + 1), match};
}

static void Insert(std::optional<std::unordered_set<std::string>>& clause, std::string value) {
  if (!clause) clause.emplace();
  clause->insert(std::move(value));
}

// Parses selector flags from args; sets cascade when --cascade is present.
static std::optional<Selector> ParseSelector(const std::vector<std::string>& args, bool* cascade) {
  Selector selector;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& flag = args[i];
    if (flag == "--cascade" && cascade) {
      *cascade = true;
      continue;
    }

    if (i + 1 >= args.size()) {
      std::cerr << "missing value for " << flag << "\n";
      return std::nullopt;
    }
    const auto& value = args[++i];

    if (flag == "--id") {
      Insert(selector.ids, value);
    } else if (flag == "--hash") {
      Insert(selector.hashes, value);
    } else if (flag == "--parent") {
      Insert(selector.parent_hashes, value);
    } else if (flag == "--tag" || flag == "--tag-prefix") {
      auto tag = ParseTag(value, flag == "--tag" ? TagMatch::kEquals : TagMatch::kPrefix);
      if (!tag) return std::nullopt;
      selector.tags.push_back(std::move(*tag));
    } else if (flag == "--after" || flag == "--before") {
      if (!selector.created) selector.created.emplace();
      const int64_t ms = std::stoll(value);
      if (flag == "--after") {
        selector.created->after_ms = ms;
      } else {
        selector.created->before_ms = ms;
      }
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return std::nullopt;
    }
  }

  if (!selector.HasClauses()) {
    std::cerr << "selector needs at least one clause\n";
    return std::nullopt;
  }
  return selector;
}

static int Run(artifact::factory::Runtime& runtime, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "ls") {
    for (const auto& artifact : runtime.index->List()) {
      std::cout << artifact.uuid() << " " << artifact.custom_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (args.size() != 1) return 1;
    if (!ValidHash(args[0])) return 1;

    auto document = runtime.layer->GetDocument(args[0]);
    if (!document) {
      std::cerr << "not found: " << args[0] << "\n";
      return 3;
    }
    std::cout << artifact::document::JsonDocumentCodec().Serialize(*document) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "select") {
    auto selector = ParseSelector(args, nullptr);
    if (!selector) return 1;

    for (const auto& hash : runtime.index->Select(*selector)) {
      std::cout << hash << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "rm") {
    bool cascade  = false;
    auto selector = ParseSelector(args, &cascade);
    if (!selector) return 1;

    std::cout << "removed=" << runtime.layer->Remove(*selector, cascade) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "gc") {
    std::cout << "collected=" << runtime.layer->CollectGarbage() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lineage") {
    if (args.empty() || args.size() > 3) return 1;
    if (!ValidHash(args[0])) return 1;

    auto direction = artifact::lineage::Direction::kUpstream;
    if (args.size() >= 2) {
      if (args[1] == "down") {
        direction = artifact::lineage::Direction::kDownstream;
      } else if (args[1] != "up") {
        std::cerr << "unsupported direction: " << args[1] << "\n";
        return 1;
      }
    }
    const uint32_t max_depth = args.size() == 3 ? static_cast<uint32_t>(std::stoul(args[2])) : 0;

    for (const auto& edge : runtime.layer->Lineage(args[0], direction, max_depth)) {
      std::cout << edge.parent << " -> " << edge.child << " depth=" << edge.depth << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  const std::string        cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = artifact::config::ConfigLoader::LoadFromYaml(config_path);
    artifact::observability::InitializeLogging(config.logging());

    auto runtime = artifact::factory::BuildRuntime(config);
    int  rc      = Run(runtime, cmd, args);

    artifact::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    ARTIFACT_LOG_ERROR("Command failed", {artifact::observability::StringField("command", cmd), artifact::observability::StringField("error", e.what())});
    artifact::observability::ShutdownLogging();
    return 2;
  }
}
