#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/secure_cache.hpp"
#include "internal/codec/state_codec.hpp"
#include "internal/codec/state_encryption.hpp"
#include "internal/core/flow_state_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/migration/state_migrator.hpp"
#include "internal/recovery/recovery_engine.hpp"
#include "internal/store/flow_state_store.hpp"

namespace flowstate::factory {

/*
  RuntimeDependencies

  Owns all long-lived engine objects.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<const codec::StateEncryption> encryption;
  std::shared_ptr<const codec::StateCodec>      codec;
  std::shared_ptr<cache::SecureCache>           cache;

  std::shared_ptr<store::FlowStateStore>     store;
  std::shared_ptr<recovery::RecoveryEngine> recovery;
  std::shared_ptr<core::FlowStateManager>    manager;
  std::shared_ptr<migration::StateMigrator>  migrator;
};

/*
  BuildRepository

  Opens the configured backend and brings its schema up to date.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const flowstate::runtime::config::RuntimeConfig& config);

// config must already have defaults applied (ConfigLoader does this).
RuntimeDependencies BuildRuntime(const flowstate::runtime::config::RuntimeConfig& config);

} // namespace flowstate::factory
