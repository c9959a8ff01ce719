#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/catalog_source.hpp"
#include "internal/locate/position_locator.hpp"
#include "internal/rollback/change_stream_processor.hpp"
#include "internal/stream/event_source.hpp"

namespace flashback::factory {

/*
  Composition root: the only place that knows concrete source and catalog
  types.
*/

std::shared_ptr<stream::EventSource> BuildEventSource(const flashback::runtime::config::RuntimeConfig& config);

// Throws std::runtime_error when no backend is configured or the configured
// one was not built in; util::CatalogError when it cannot be opened.
std::shared_ptr<catalog::CatalogSource> BuildCatalogSource(const flashback::runtime::config::RuntimeConfig& config);

rollback::ProcessorOptions ProcessorOptionsFrom(const flashback::runtime::config::RuntimeConfig& config);

locate::LocatorOptions LocatorOptionsFrom(const flashback::runtime::config::RuntimeConfig& config);

} // namespace flashback::factory
