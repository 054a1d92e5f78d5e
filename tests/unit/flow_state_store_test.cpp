#include "internal/store/flow_state_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/memory_cache_backend.hpp"
#include "internal/codec/compression.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstate::cache::CacheOptions;
using flowstate::cache::MemoryCacheBackend;
using flowstate::cache::SecureCache;
using flowstate::codec::CodecOptions;
using flowstate::codec::StateCodec;
using flowstate::codec::StateEncryption;
using flowstate::db::memory::MemoryRepository;
using flowstate::store::FlowStateStore;
using flowstate::store::StoreOptions;

namespace keys  = flowstate::state::keys;
namespace state = flowstate::state;
namespace util  = flowstate::util;

struct Stack {
  std::shared_ptr<MemoryRepository>   repository;
  std::shared_ptr<MemoryCacheBackend> backend;
  std::shared_ptr<SecureCache>        cache;
  std::shared_ptr<FlowStateStore>     store;
};

Stack MakeStack(StoreOptions options = {}, bool with_cache = true) {
  auto key = std::make_shared<StateEncryption>(std::string(StateEncryption::kKeySize, 's'));

  CodecOptions codec_options;
  codec_options.sensitive_fields = {"api_keys"};
  auto codec                     = std::make_shared<StateCodec>(codec_options, key);

  Stack stack;
  stack.repository = std::make_shared<MemoryRepository>();
  if (with_cache) {
    stack.backend = std::make_shared<MemoryCacheBackend>(64);
    stack.cache   = std::make_shared<SecureCache>(stack.backend, key, CacheOptions{});
  }
  stack.store = std::make_shared<FlowStateStore>(stack.repository, codec, stack.cache, options);
  return stack;
}

state::State Doc(const std::string& flow_id, const std::string& tenant_id = "tenant-a") {
  auto doc = state::NewInitialState(flow_id, tenant_id, state::MakeEmptyList());
  state::SetString(&doc, "api_keys", "sk-secret-value");
  return doc;
}

void TestVersionStartsAtOneAndIncrements() {
  auto s = MakeStack();

  auto first = s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  assert(first.version == 1);
  assert(!first.timestamp.empty());

  auto second = s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "initialization", 1);
  assert(second.version == 2);

  auto third = s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  assert(third.version == 3);

  auto loaded = s.store->Load("flow-1", "tenant-a");
  assert(loaded.has_value());
  assert(loaded->version == 3);
  assert(loaded->phase == "initialization");
  assert(loaded->status == "initialized");
  assert(state::GetString(loaded->state, "api_keys") == "sk-secret-value");
  assert(state::GetString(loaded->state, keys::kUpdatedAt) == third.timestamp);
}

void TestStaleVersionIsRejected() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");

  bool threw = false;
  try {
    s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "", 1);
  } catch (const util::ConcurrentModificationError& e) {
    threw = true;
    assert(e.ExpectedVersion() == 1);
    assert(e.ActualVersion() == 2);
    assert(e.Kind() == util::ErrorKind::kConflict);
  }
  assert(threw);
  assert(s.store->Load("flow-1", "tenant-a")->version == 2);

  bool create_only = false;
  try {
    s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "", 0);
  } catch (const util::ConcurrentModificationError&) {
    create_only = true;
  }
  assert(create_only);

  bool missing = false;
  try {
    s.store->Save("flow-9", "tenant-a", Doc("flow-9"), "", 4);
  } catch (const util::ConcurrentModificationError& e) {
    missing = e.ActualVersion() == 0;
  }
  assert(missing);
  assert(!s.store->Load("flow-9", "tenant-a").has_value());
}

void TestInvalidStateIsNotWritten() {
  auto s = MakeStack();

  auto doc = Doc("flow-1");
  state::SetNumber(&doc, keys::kProgress, 150);
  bool invalid = false;
  try {
    s.store->Save("flow-1", "tenant-a", doc, "");
  } catch (const util::ValidationError&) {
    invalid = true;
  }
  assert(invalid);

  bool mismatch = false;
  try {
    s.store->Save("flow-1", "tenant-b", Doc("flow-1"), "");
  } catch (const util::ValidationError&) {
    mismatch = true;
  }
  assert(mismatch);
  assert(!s.store->LoadRaw("flow-1", "tenant-a").has_value());
  assert(!s.store->LoadRaw("flow-1", "tenant-b").has_value());
}

void TestSensitiveFieldsAreEncryptedAtRest() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");

  auto raw = s.store->LoadRaw("flow-1", "tenant-a");
  assert(raw.has_value());
  auto plain = flowstate::codec::GzipDecompress(raw->state_blob, flowstate::codec::kDefaultMaxBytes);
  assert(plain.has_value());
  assert(plain->find("sk-secret-value") == std::string::npos);
}

void TestCacheIsTransparent() {
  auto cached   = MakeStack();
  auto uncached = MakeStack({}, false);

  for (auto* s : {&cached, &uncached}) {
    s->store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
    s->store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  }

  auto a = cached.store->Load("flow-1", "tenant-a");
  auto b = uncached.store->Load("flow-1", "tenant-a");
  assert(a->version == b->version);
  assert(a->phase == b->phase);
  assert(a->status == b->status);
  assert(cached.cache->Stats().hits == 1);

  // a conflicting write drops the cached copy; the next load reads through
  bool conflict = false;
  try {
    cached.store->Save("flow-1", "tenant-a", Doc("flow-1"), "", 1);
  } catch (const util::ConcurrentModificationError&) {
    conflict = true;
  }
  assert(conflict);
  auto after = cached.store->Load("flow-1", "tenant-a");
  assert(after->version == 2);
  assert(cached.cache->Stats().hits == 1);
  assert(cached.cache->Stats().misses == 1);
}

void TestCachedEntryForAnotherFlowIsIgnored() {
  auto s = MakeStack();
  s.store->Save("b:c", "a", Doc("b:c", "a"), "");
  s.store->Save("c", "a:b", Doc("c", "a:b"), "");

  auto first  = s.store->Load("b:c", "a");
  auto second = s.store->Load("c", "a:b");
  assert(state::GetString(first->state, keys::kTenantId) == "a");
  assert(state::GetString(second->state, keys::kTenantId) == "a:b");

  // plant flow-1's sealed entry under flow-2's key
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  s.store->Load("flow-1", "tenant-a");
  auto sealed = s.backend->Get(SecureCache::Key("tenant-a", "flow-1", SecureCache::kLiveSlot));
  assert(sealed.has_value());
  s.backend->Set(SecureCache::Key("tenant-a", "flow-2", SecureCache::kLiveSlot), *sealed, std::chrono::seconds(60));

  assert(!s.store->Load("flow-2", "tenant-a").has_value());
  assert(!s.backend->Get(SecureCache::Key("tenant-a", "flow-2", SecureCache::kLiveSlot)).has_value());
}

void TestLateCacheWriteCannotRollBack() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  auto v1 = s.store->LoadRaw("flow-1", "tenant-a");
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");

  // a writer that committed v1 publishing after v3 was cached
  flowstate::v1::CachedState stale;
  stale.set_version(v1->version);
  stale.set_phase(v1->phase);
  stale.set_status(v1->status);
  stale.set_state_blob(v1->state_blob);
  assert(!s.cache->Set("tenant-a", "flow-1", SecureCache::kLiveSlot, stale));

  auto loaded = s.store->Load("flow-1", "tenant-a");
  assert(loaded->version == 3);
  assert(s.cache->Stats().hits == 1);
}

void TestTransitionCheckpointCommitsWithTheWrite() {
  auto s = MakeStack();
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");

  flowstate::store::PriorCheckpoint checkpoint{"cp-rejected", ""};
  bool                              conflict = false;
  try {
    s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "data_import", 5, checkpoint);
  } catch (const util::ConcurrentModificationError&) {
    conflict = true;
  }
  assert(conflict);
  assert(s.store->ListCheckpoints("flow-1", "tenant-a").empty());

  checkpoint.checkpoint_id = "cp-kept";
  auto saved               = s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "data_import", 1, checkpoint);
  assert(saved.version == 2);

  auto checkpoints = s.store->ListCheckpoints("flow-1", "tenant-a");
  assert(checkpoints.size() == 1);
  assert(checkpoints[0].checkpoint_id == "cp-kept");
  assert(checkpoints[0].state_version == 1);
  assert(checkpoints[0].phase == "initialization");
  assert(s.cache->Get("tenant-a", "flow-1", SecureCache::CheckpointSlot("cp-kept")).has_value());

  // creating a flow has no prior record to snapshot
  checkpoint.checkpoint_id = "cp-none";
  s.store->Save("flow-2", "tenant-a", Doc("flow-2"), "", 0, checkpoint);
  assert(s.store->ListCheckpoints("flow-2", "tenant-a").empty());
}

void TestCheckpointRingIsBounded() {
  StoreOptions options;
  options.checkpoint_limit = 3;
  auto s                   = MakeStack(options);
  s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");

  std::string first, last;
  for (int i = 0; i < 5; ++i) {
    auto id = s.store->CreateCheckpoint("flow-1", "tenant-a", i == 4 ? "data_import" : "");
    if (i == 0) first = id;
    last = id;
  }

  auto checkpoints = s.store->ListCheckpoints("flow-1", "tenant-a");
  assert(checkpoints.size() == 3);
  assert(checkpoints.back().checkpoint_id == last);
  assert(checkpoints.back().phase == "data_import");
  assert(checkpoints.front().phase == "initialization");
  for (const auto& cp : checkpoints) {
    assert(cp.checkpoint_id != first);
    assert(cp.decodable);
    assert(cp.state_version == 1);
    assert(state::GetString(cp.snapshot, "api_keys") == "sk-secret-value");
  }

  // checkpoints never bump the state version
  assert(s.store->Load("flow-1", "tenant-a")->version == 1);

  assert(s.cache->Get("tenant-a", "flow-1", SecureCache::CheckpointSlot(last)).has_value());

  bool missing = false;
  try {
    s.store->CreateCheckpoint("flow-2", "tenant-a", "");
  } catch (const util::NotFoundError&) {
    missing = true;
  }
  assert(missing);
  assert(s.store->ListCheckpoints("flow-2", "tenant-a").empty());
}

void TestVersionHistoryCleanup() {
  auto s = MakeStack();
  for (int i = 0; i < 5; ++i) {
    s.store->Save("flow-1", "tenant-a", Doc("flow-1"), "");
  }

  auto versions = s.store->GetVersions("flow-1", "tenant-a");
  assert(versions.size() == 5);
  assert(versions.front().version == 1);
  assert(versions.back().version == 5);

  assert(s.store->CleanupOldVersions("flow-1", "tenant-a", 2) == 3);
  versions = s.store->GetVersions("flow-1", "tenant-a");
  assert(versions.size() == 2);
  assert(versions.front().version == 4);

  assert(s.store->CleanupOldVersions("flow-1", "tenant-a", 5) == 0);
  assert(s.store->CleanupOldVersions("flow-1", "tenant-a", 0) == 1);
  assert(s.store->GetVersions("flow-1", "tenant-a").size() == 1);
}

void TestArchivedSnapshotsAreBounded() {
  StoreOptions options;
  options.archive_limit = 2;
  auto s                = MakeStack(options);

  s.store->ArchiveSnapshot("flow-1", "tenant-a", "blob-1", 1, "first");
  s.store->ArchiveSnapshot("flow-1", "tenant-a", "blob-22", 2, "second");
  auto newest = s.store->ArchiveSnapshot("flow-1", "tenant-a", "blob-333", 3, "third");

  auto archives = s.store->ListArchivedSnapshots("flow-1", "tenant-a");
  assert(archives.size() == 2);
  bool found_newest = false;
  for (const auto& archive : archives) {
    assert(archive.version >= 2);
    if (archive.archive_id == newest) {
      found_newest = true;
      assert(archive.reason == "third");
      assert(archive.size_bytes == 8);
    }
  }
  assert(found_newest);
}

void TestDeleteAndListFlows() {
  auto s = MakeStack();
  s.store->Save("flow-b", "tenant-a", Doc("flow-b"), "");
  s.store->Save("flow-a", "tenant-a", Doc("flow-a"), "");
  s.store->Save("flow-c", "tenant-b", Doc("flow-c", "tenant-b"), "");

  auto flows = s.store->ListFlows("tenant-a");
  assert(flows.size() == 2);
  assert(flows[0].flow_id == "flow-a");
  assert(flows[1].flow_id == "flow-b");

  s.store->Delete("flow-a", "tenant-a");
  assert(!s.store->Load("flow-a", "tenant-a").has_value());
  assert(s.store->GetVersions("flow-a", "tenant-a").empty());
  assert(s.store->ListFlows("tenant-a").size() == 1);

  bool missing = false;
  try {
    s.store->Delete("flow-a", "tenant-a");
  } catch (const util::NotFoundError&) {
    missing = true;
  }
  assert(missing);

  // same flow id under another tenant is a different flow
  assert(!s.store->Load("flow-c", "tenant-a").has_value());
  assert(s.store->Load("flow-c", "tenant-b").has_value());
}

} // namespace

int main() {
  TestVersionStartsAtOneAndIncrements();
  TestStaleVersionIsRejected();
  TestInvalidStateIsNotWritten();
  TestSensitiveFieldsAreEncryptedAtRest();
  TestCacheIsTransparent();
  TestCachedEntryForAnotherFlowIsIgnored();
  TestLateCacheWriteCannotRollBack();
  TestTransitionCheckpointCommitsWithTheWrite();
  TestCheckpointRingIsBounded();
  TestVersionHistoryCleanup();
  TestArchivedSnapshotsAreBounded();
  TestDeleteAndListFlows();

  std::cout << "flowstate_unit_flow_state_store: pass\n";
  return 0;
}
