#include "internal/cache/secure_cache.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace flowstate::cache {

namespace {

constexpr std::string_view kKeyPrefix       = "flowstate:";
constexpr std::string_view kCheckpointSlot  = "checkpoint.";

} // namespace

CacheOptions CacheOptions::FromConfig(const flowstate::runtime::config::RuntimeConfig& config) {
  const auto&  cache = config.cache();
  CacheOptions options;
  options.enabled = cache.enabled();
  if (cache.live_state_ttl_seconds() > 0) {
    options.live_ttl = std::chrono::seconds(cache.live_state_ttl_seconds());
  }
  if (cache.checkpoint_ttl_seconds() > 0) {
    options.checkpoint_ttl = std::chrono::seconds(cache.checkpoint_ttl_seconds());
  }
  return options;
}

SecureCache::SecureCache(std::shared_ptr<CacheBackend> backend, std::shared_ptr<const codec::StateEncryption> encryption, CacheOptions options)
    : backend_(std::move(backend)), encryption_(std::move(encryption)), options_(options) {
  if (options_.enabled && (!backend_ || !encryption_)) {
    FLOWSTATE_LOG_WARN("State cache disabled: no backend or no encryption key",
                       {observability::BoolField("has_backend", backend_ != nullptr),
                        observability::BoolField("has_key", encryption_ != nullptr)});
    options_.enabled = false;
  }
}

std::string SecureCache::Key(std::string_view tenant_id, std::string_view flow_id, std::string_view slot) {
  std::string key(kKeyPrefix);
  key.append(std::to_string(tenant_id.size())).append(":").append(tenant_id).append(":");
  key.append(std::to_string(flow_id.size())).append(":").append(flow_id).append(":");
  key.append(slot);
  return key;
}

std::string SecureCache::CheckpointSlot(std::string_view checkpoint_id) {
  return std::string(kCheckpointSlot) + std::string(checkpoint_id);
}

bool SecureCache::Enabled() const {
  return options_.enabled;
}

std::chrono::seconds SecureCache::TtlFor(std::string_view slot) const {
  return slot.substr(0, kCheckpointSlot.size()) == kCheckpointSlot ? options_.checkpoint_ttl : options_.live_ttl;
}

void SecureCache::RecordError(std::string_view op, const std::string& key, const std::exception& ex) {
  errors_.fetch_add(1, std::memory_order_relaxed);
  FLOWSTATE_LOG_WARN("State cache operation failed",
                     {observability::StringField("op", op), observability::StringField("key", key), observability::StringField("error", ex.what())});
}

std::optional<flowstate::v1::CachedState> SecureCache::Get(const std::string& tenant_id, const std::string& flow_id, std::string_view slot) {
  if (!Enabled()) {
    return std::nullopt;
  }

  const auto key = Key(tenant_id, flow_id, slot);
  try {
    auto sealed = backend_->Get(key);
    if (sealed) {
      flowstate::v1::CachedState value;
      if (value.ParseFromString(encryption_->Open(*sealed))) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        observability::Metrics::Instance().RecordCacheLookup(true);
        return value;
      }
      FLOWSTATE_LOG_WARN("Dropping unparseable cache entry", {observability::StringField("key", key)});
      backend_->Delete(key);
    }
  } catch (const std::exception& ex) {
    RecordError("get", key, ex);
  }

  misses_.fetch_add(1, std::memory_order_relaxed);
  observability::Metrics::Instance().RecordCacheLookup(false);
  return std::nullopt;
}

bool SecureCache::Set(const std::string& tenant_id, const std::string& flow_id, std::string_view slot, const flowstate::v1::CachedState& value) {
  if (!Enabled()) {
    return false;
  }

  const auto key = Key(tenant_id, flow_id, slot);
  try {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (auto sealed = backend_->Get(key)) {
      flowstate::v1::CachedState existing;
      if (existing.ParseFromString(encryption_->Open(*sealed)) && existing.version() > value.version()) {
        FLOWSTATE_LOG_DEBUG("Skipping stale cache write",
                            {observability::StringField("key", key), observability::IntField("cached_version", static_cast<int64_t>(existing.version())),
                             observability::IntField("version", static_cast<int64_t>(value.version()))});
        return false;
      }
    }

    auto copy = value;
    copy.set_cached_at_ms(util::NowMillis());
    backend_->Set(key, encryption_->Seal(copy.SerializeAsString()), TtlFor(slot));
    return true;
  } catch (const std::exception& ex) {
    RecordError("set", key, ex);
  }
  return false;
}

void SecureCache::Invalidate(const std::string& tenant_id, const std::string& flow_id) {
  if (!Enabled()) {
    return;
  }

  const auto prefix = Key(tenant_id, flow_id, "");
  try {
    std::lock_guard<std::mutex> lock(write_mutex_);
    backend_->DeletePrefix(prefix);
  } catch (const std::exception& ex) {
    RecordError("invalidate", prefix, ex);
  }
}

void SecureCache::Clear() {
  if (!backend_) {
    return;
  }
  try {
    backend_->Clear();
  } catch (const std::exception& ex) {
    RecordError("clear", std::string(kKeyPrefix), ex);
  }
}

CacheStats SecureCache::Stats() const {
  return CacheStats{hits_.load(std::memory_order_relaxed), misses_.load(std::memory_order_relaxed), errors_.load(std::memory_order_relaxed)};
}

} // namespace flowstate::cache
