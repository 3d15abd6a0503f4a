#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/storage/object/object_content_store.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using artifact::storage::ContentStore;
using artifact::storage::ContentStorePtr;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "artifact_store_content_store_tests" / (name + "-" + artifact::util::RandomToken());
  std::filesystem::create_directories(dir);
  return dir;
}

std::shared_ptr<arrow::Buffer> Bytes(const std::string& s) {
  return arrow::Buffer::FromString(s);
}

void VerifyPutGetExists(ContentStore& store) {
  assert(!store.Exists("h1"));

  store.Put("h1", Bytes("payload-one"));
  assert(store.Exists("h1"));
  assert(store.Get("h1")->ToString() == "payload-one");

  // identical bytes: no-op
  store.Put("h1", Bytes("payload-one"));
  assert(store.Get("h1")->ToString() == "payload-one");
}

void VerifyDifferentBytesRejected(ContentStore& store) {
  store.Put("h2", Bytes("original"));

  bool threw = false;
  try {
    store.Put("h2", Bytes("tampered"));
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw && "Put of different bytes under an existing hash must fail.");
  assert(store.Get("h2")->ToString() == "original");
}

void VerifyMissingIsNotFound(ContentStore& store) {
  bool threw = false;
  try {
    (void)store.Get("absent");
  } catch (const artifact::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void VerifyRemoveAndList(ContentStore& store) {
  store.Put("h3", Bytes("three"));
  auto keys = store.List();
  assert(std::find(keys.begin(), keys.end(), "h3") != keys.end());

  store.Remove("h3");
  store.Remove("h3");
  assert(!store.Exists("h3"));

  keys = store.List();
  assert(std::find(keys.begin(), keys.end(), "h3") == keys.end());
}

void VerifyPathUnsafeHashRejected(ContentStore& store) {
  for (const std::string bad : {"../escape", "a/b", "", "meta.json"}) {
    bool threw = false;
    try {
      store.Put(bad, Bytes("x"));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void VerifyConcurrentPutsOfDistinctKeys(ContentStore& store) {
  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&store, i] {
      const auto key = "k" + std::to_string(i);
      store.Put(key, Bytes("value-" + std::to_string(i)));
      store.Put(key, Bytes("value-" + std::to_string(i)));
    });
  }
  for (auto& writer : writers) writer.join();

  for (int i = 0; i < 8; ++i) {
    assert(store.Get("k" + std::to_string(i))->ToString() == "value-" + std::to_string(i));
  }
}

// Same key, different bytes, all at once: exactly one writer wins and every
// other one sees an IntegrityError.
void VerifyConcurrentConflictingPuts(ContentStore& store) {
  std::atomic<int>         stored{0};
  std::atomic<int>         rejected{0};
  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&, i] {
      try {
        store.Put("contended", Bytes("value-" + std::to_string(i)));
        ++stored;
      } catch (const artifact::util::IntegrityError&) {
        ++rejected;
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(stored == 1);
  assert(rejected == 7);

  const auto winner = store.Get("contended")->ToString();
  assert(winner.rfind("value-", 0) == 0);
}

void RunContract(const std::string& name, const std::function<ContentStorePtr()>& make) {
  auto store = make();
  VerifyPutGetExists(*store);
  VerifyDifferentBytesRejected(*store);
  VerifyMissingIsNotFound(*store);
  VerifyRemoveAndList(*store);
  VerifyPathUnsafeHashRejected(*store);
  VerifyConcurrentPutsOfDistinctKeys(*store);
  std::cout << "  contract ok: " << name << "\n";
}

void TestDiskLayoutAndReservedNames() {
  const auto root = FreshDir("layout");
  artifact::storage::DiskContentStore store(root);

  store.Put("abc", Bytes("data"));
  assert(std::filesystem::is_regular_file(root / "abc"));

  // snapshot, lock and temp files share the root but are not payloads
  std::ofstream(root / "metadata.json") << "{}";
  std::ofstream(root / ".abc.1234.tmp") << "partial";

  const auto keys = store.List();
  assert(keys.size() == 1 && keys.front() == "abc");

  // a second instance over the same root sees the payload
  artifact::storage::DiskContentStore reopened(root);
  assert(reopened.Root() == root);
  assert(reopened.Get("abc")->ToString() == "data");
}

void TestFactoryBuildsConfiguredBackend() {
  artifact::runtime::config::ContentStoreConfig ram;
  ram.mutable_ram();
  assert(artifact::storage::StorageFactory::Build(ram)->BackendName() == "ram");

  artifact::runtime::config::ContentStoreConfig disk;
  disk.mutable_disk()->set_root_path(FreshDir("factory").string());
  assert(artifact::storage::StorageFactory::Build(disk)->BackendName() == "disk");
}

} // namespace

int main() {
  RunContract("ram", [] { return std::make_shared<artifact::storage::RamContentStore>(); });
  RunContract("disk", [] { return std::make_shared<artifact::storage::DiskContentStore>(FreshDir("disk"), /*fsync=*/true); });
  RunContract("object", [] {
    auto [fs, root] = artifact::storage::common::Unwrap(artifact::storage::common::ResolveFileSystem(FreshDir("object").string()));
    return std::make_shared<artifact::storage::ObjectContentStore>(std::move(fs), std::move(root));
  });

  {
    artifact::storage::RamContentStore ram;
    VerifyConcurrentConflictingPuts(ram);

    const auto                          root = FreshDir("contended");
    artifact::storage::DiskContentStore disk(root);
    VerifyConcurrentConflictingPuts(disk);

    // losers clean up their temp files
    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
      (void)entry;
      ++files;
    }
    assert(files == 1);
  }

  TestDiskLayoutAndReservedNames();
  TestFactoryBuildsConfiguredBackend();

  std::cout << "artifact_store_unit_content_store: pass\n";
  return 0;
}
