#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/artifact_layer.hpp"
#include "internal/core/caching_interceptor.hpp"

namespace artifact::factory {

/*
  Runtime

  Owns the long-lived objects of one store instance.
*/
struct Runtime {
  storage::ContentStorePtr   store;
  metadata::MetadataIndexPtr index;
  document::DocumentCodecPtr codec;

  std::shared_ptr<core::ArtifactLayer>      layer;
  std::shared_ptr<core::CachingInterceptor> interceptor;
};

/*
  BuildRuntime

  Constructs the store from runtime config.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete backend types.
*/
Runtime BuildRuntime(const artifact::runtime::config::RuntimeConfig& config);

document::DocumentCodecPtr BuildCodec(artifact::runtime::config::CodecFormat format);

} // namespace artifact::factory
