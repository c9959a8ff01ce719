#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/catalog/table_catalog.hpp"
#include "internal/cli/arguments.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/locate/position_locator.hpp"
#include "internal/locate/position_report.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rollback/change_stream_processor.hpp"
#include "internal/rollback/statement_sink.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using flashback::observability::IntField;
using flashback::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFatal    = 2;
constexpr int kExitNotFound = 3;

int RunRollback(const flashback::cli::Arguments& args, const flashback::runtime::config::RuntimeConfig& config) {
  auto source   = flashback::factory::BuildEventSource(config);
  auto catalog  = std::make_shared<flashback::catalog::TableCatalog>(flashback::factory::BuildCatalogSource(config));
  auto options  = flashback::factory::ProcessorOptionsFrom(config);
  auto output   = args.output.value_or(config.rollback().output_path());

  flashback::rollback::ScriptHeader header;
  header.generated_at_ms = flashback::util::ToUnixMillis(flashback::util::Now());
  header.source_file     = args.file;

  auto script = std::make_shared<flashback::rollback::ScriptFileSink>(output, header);
  auto echo   = std::make_shared<flashback::rollback::LogSink>();
  flashback::rollback::TeeSink sink({script, echo});

  flashback::rollback::ChangeStreamProcessor processor(source, catalog, options);
  flashback::rollback::TableFilter           filter(args.databases, args.tables);
  flashback::rollback::StartPosition         start{args.file, args.position};

  FLASHBACK_LOG_INFO("Starting rollback run", {StringField("output", output), StringField("file", args.file.value_or("<current>"))});

  std::atomic<bool>                   finished{false};
  std::exception_ptr                  failure;
  flashback::rollback::RunSummary     summary;

  std::jthread worker([&](std::stop_token stop) {
    try {
      summary = processor.Run(start, filter, sink, stop);
    } catch (const std::exception&) {
      failure = std::current_exception();
    }
    finished = true;
  });

  while (g_running && !finished) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  if (!finished) {
    FLASHBACK_LOG_INFO("Stop requested, disconnecting");
    worker.request_stop();
  }
  worker.join();

  if (failure) {
    std::rethrow_exception(failure);
  }

  FLASHBACK_LOG_INFO("Rollback script written",
                     {StringField("output", output), IntField("statements", static_cast<std::int64_t>(summary.statements))});
  return kExitOk;
}

int RunLocate(const flashback::cli::Arguments& args, const flashback::runtime::config::RuntimeConfig& config) {
  flashback::locate::PositionLocator locator(flashback::factory::BuildEventSource(config), flashback::factory::LocatorOptionsFrom(config));
  flashback::rollback::TableFilter   filter(args.databases, args.tables);

  auto result = locator.Locate(args.window, filter);

  flashback::locate::ReportContext context{args.config_path, filter};
  std::cout << flashback::locate::FormatReport(result, context);

  return result.Found() ? kExitOk : kExitNotFound;
}

} // namespace

int main(int argc, char** argv) {
  flashback::cli::Arguments args;
  try {
    args = flashback::cli::ParseArguments(argc, argv);
  } catch (const flashback::util::ArgumentError& e) {
    std::cerr << "error: " << e.what() << "\n" << flashback::cli::Usage();
    return kExitUsage;
  }

  if (args.command == flashback::cli::Command::kHelp) {
    std::cout << flashback::cli::Usage();
    return kExitOk;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flashback::config::ConfigLoader::LoadFromYaml(args.config_path);

    flashback::observability::InitializeLogging(config.logging());

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int code = args.command == flashback::cli::Command::kRollback ? RunRollback(args, config) : RunLocate(args, config);

    flashback::observability::ShutdownLogging();
    return code;
  } catch (const flashback::util::ArgumentError& e) {
    std::cerr << "error: " << e.what() << "\n" << flashback::cli::Usage();
    flashback::observability::ShutdownLogging();
    return kExitUsage;
  } catch (const std::exception& e) {
    FLASHBACK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    flashback::observability::ShutdownLogging();
    return kExitFatal;
  }
}
