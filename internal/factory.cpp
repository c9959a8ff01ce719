#include "factory.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "internal/catalog/sqlite/sqlite_catalog_source.hpp"
#include "internal/stream/capture/capture_event_source.hpp"
#if FLASHBACK_CATALOG_MYSQL
#include "internal/catalog/mysql/mysql_catalog_source.hpp"
#endif

namespace flashback::factory {

using flashback::runtime::config::RuntimeConfig;

std::shared_ptr<stream::EventSource> BuildEventSource(const RuntimeConfig& config) {
  const auto& capture = config.source().capture();

  stream::capture::CaptureSourceOptions options;
  options.directory     = capture.directory();
  options.file_prefix   = capture.file_prefix();
  options.poll_interval = std::chrono::milliseconds(capture.poll_interval_ms());

  return std::make_shared<stream::capture::CaptureEventSource>(std::move(options));
}

std::shared_ptr<catalog::CatalogSource> BuildCatalogSource(const RuntimeConfig& config) {
  const auto& catalog = config.catalog();

  if (catalog.has_sqlite()) {
    std::map<std::string, std::string> attach(catalog.sqlite().attach().begin(), catalog.sqlite().attach().end());
    return catalog::sqlite::SqliteCatalogSource::Open(catalog.sqlite().path(), attach);
  }

  if (catalog.has_mysql()) {
#if FLASHBACK_CATALOG_MYSQL
    catalog::mysql::MysqlEndpoint endpoint;
    endpoint.host            = catalog.mysql().host();
    endpoint.port            = catalog.mysql().port();
    endpoint.user            = catalog.mysql().user();
    endpoint.password        = catalog.mysql().password();
    endpoint.connect_timeout = std::chrono::milliseconds(catalog.mysql().connect_timeout_ms());
    return std::make_shared<catalog::mysql::MysqlCatalogSource>(std::move(endpoint));
#else
    throw std::runtime_error("mysql catalog requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no catalog backend configured");
}

rollback::ProcessorOptions ProcessorOptionsFrom(const RuntimeConfig& config) {
  rollback::ProcessorOptions options;
  options.channel_capacity = config.rollback().channel_capacity();
  options.connect_timeout  = std::chrono::milliseconds(config.rollback().connect_timeout_ms());
  return options;
}

locate::LocatorOptions LocatorOptionsFrom(const RuntimeConfig& config) {
  locate::LocatorOptions options;
  options.probe_timeout  = std::chrono::milliseconds(config.locator().probe_timeout_ms());
  options.replay_timeout = std::chrono::milliseconds(config.locator().replay_timeout_ms());
  options.settle_delay   = std::chrono::milliseconds(config.locator().settle_delay_ms());
  return options;
}

} // namespace flashback::factory
