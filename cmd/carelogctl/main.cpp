#include <arrow/io/file.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_extraction_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/time.hpp"

using carelog::pipeline::ImportOutcome;
using carelog::review::ReviewSession;

namespace {

constexpr int kExitOk     = 0;
constexpr int kExitUsage  = 1;
constexpr int kExitFailed = 2;
constexpr int kExitQueued = 3;

volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

void Usage() {
  std::cout << "Usage:\n"
            << "  carelogctl [--config <cfg.yaml>] import <file> [--date YYYY-MM-DD] [--confirm-all] [--commit] [--save-on-failure]\n"
            << "  carelogctl [--config <cfg.yaml>] pending list\n"
            << "  carelogctl [--config <cfg.yaml>] pending retry <id> [--confirm-all] [--commit]\n"
            << "  carelogctl [--config <cfg.yaml>] pending discard <id>\n"
            << "\n"
            << "Exit codes: 0 ok, 1 usage, 2 failure, 3 report queued for retry\n";
}

struct Options {
  std::string                config_path;
  std::optional<std::string> date;
  bool                       confirm_all     = false;
  bool                       commit          = false;
  bool                       save_on_failure = false;
  std::vector<std::string>   positional;
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "--date") {
      if (i + 1 >= argc) {
        std::cerr << arg << " needs a value\n";
        return std::nullopt;
      }
      if (arg == "--config") {
        options.config_path = argv[++i];
      } else {
        options.date = argv[++i];
      }
    } else if (arg == "--confirm-all") {
      options.confirm_all = true;
    } else if (arg == "--commit") {
      options.commit = true;
    } else if (arg == "--save-on-failure") {
      options.save_on_failure = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown option: " << arg << "\n";
      return std::nullopt;
    } else {
      options.positional.push_back(arg);
    }
  }
  return options;
}

void PrintSession(const ReviewSession& session) {
  for (const auto& candidate : session.Candidates()) {
    std::cout << candidate.id << "  " << carelog::model::ToString(candidate.kind) << "  "
              << carelog::util::FormatClockTime(candidate.start_time);
    if (candidate.end_time) std::cout << "-" << carelog::util::FormatClockTime(*candidate.end_time);
    if (candidate.quantity_text) std::cout << "  qty=" << *candidate.quantity_text;
    if (candidate.kind == carelog::model::EventKind::kDiaper) {
      std::cout << "  wet=" << (candidate.wet ? "yes" : "no") << " dirty=" << (candidate.dirty ? "yes" : "no");
    }
    if (!candidate.details.empty()) std::cout << "  \"" << candidate.details << "\"";
    std::cout << "  [" << carelog::model::ToString(candidate.review_state) << "]";
    if (candidate.duplicate_flag) std::cout << "  duplicate: " << candidate.duplicate_reason.value_or("");
    std::cout << "\n";
  }

  const auto summary = session.Summary();
  std::cout << "candidates=" << session.Size() << " duplicates=" << summary.duplicates << "\n";
}

ImportOutcome WaitInterruptible(const carelog::pipeline::ImportHandle& handle) {
  auto running = handle;
  while (!running.Ready()) {
    if (g_interrupted) running.Cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return running.Wait();
}

// Review and commit of a freshly extracted session.
int Finish(carelog::factory::Application& app, ReviewSession& session, const Options& options,
           const carelog::model::SourceDocument* source) {
  PrintSession(session);

  if (options.confirm_all) {
    auto status = session.ConfirmAll();
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return kExitFailed;
    }
  }
  if (!options.commit) return kExitOk;

  auto outcome = app.pipeline->Commit(session, source);
  for (const auto& item : outcome.result.items) {
    if (item.ok()) {
      std::cout << "committed " << item.candidate_id << " -> " << item.reference->ToString() << "\n";
    } else {
      std::cout << "failed " << item.candidate_id << ": " << item.status.ToString() << "\n";
    }
  }

  if (outcome.queued) {
    std::cout << "queued " << outcome.queued->id << "\n";
    return kExitQueued;
  }
  if (!outcome.queue_status.ok()) std::cerr << outcome.queue_status.ToString() << "\n";
  return outcome.result.AllSucceeded() ? kExitOk : kExitFailed;
}

int RunImport(carelog::factory::Application& app, const Options& options) {
  namespace common = carelog::storage::common;

  auto day = options.date ? carelog::util::ParseDate(*options.date) : std::optional(carelog::util::Today());
  if (!day) {
    std::cerr << "invalid --date: " << *options.date << "\n";
    return kExitUsage;
  }

  const auto& path  = options.positional[1];
  auto        bytes = common::ReadAll(common::Unwrap(arrow::io::ReadableFile::Open(path)));
  const auto  name  = path.substr(path.find_last_of('/') + 1);

  auto document = app.pipeline->Prepare(name, bytes, *day);
  if (!document.ok()) {
    std::cerr << document.status().ToString() << "\n";
    return kExitFailed;
  }

  auto handle = app.pipeline->StartImport(*document);
  if (!handle.ok()) {
    std::cerr << handle.status().ToString() << "\n";
    return kExitFailed;
  }

  auto outcome = WaitInterruptible(*handle);
  if (!outcome.ok()) {
    if (outcome.queued) {
      std::cout << "queued " << outcome.queued->id << ": " << outcome.status.ToString() << "\n";
      return kExitQueued;
    }
    std::cerr << outcome.status.ToString() << "\n";
    if (options.save_on_failure && outcome.status.code == carelog::util::StatusCode::kMalformedResponse) {
      auto saved = app.pipeline->SaveForLater(*document);
      if (saved.ok()) {
        std::cout << "queued " << saved->id << "\n";
        return kExitQueued;
      }
      std::cerr << saved.status().ToString() << "\n";
    }
    return kExitFailed;
  }

  return Finish(app, outcome.session, options, &*document);
}

int RunPending(carelog::factory::Application& app, const Options& options) {
  const auto& sub = options.positional[1];

  if (sub == "list") {
    auto reports = app.queue->List();
    if (!reports.ok()) {
      std::cerr << reports.status().ToString() << "\n";
      return kExitFailed;
    }
    for (const auto& report : *reports) {
      std::cout << report.id << "  " << carelog::util::FormatDateTime(report.created_at) << "  "
                << carelog::model::ToString(report.format) << "  " << carelog::util::FormatDate(report.reference_day) << "  "
                << report.size_bytes << "B  " << report.source_name << "\n";
    }
    return kExitOk;
  }

  if (options.positional.size() < 3) {
    Usage();
    return kExitUsage;
  }
  const auto& id = options.positional[2];

  if (sub == "retry") {
    auto handle = app.pipeline->StartRetry(id);
    if (!handle.ok()) {
      std::cerr << handle.status().ToString() << "\n";
      return kExitFailed;
    }
    auto outcome = WaitInterruptible(*handle);
    if (!outcome.ok()) {
      std::cerr << outcome.status.ToString() << "\n";
      return kExitFailed;
    }
    // the retry dequeued the report; commit re-queues it on a transient failure
    return Finish(app, outcome.session, options, outcome.source ? &*outcome.source : nullptr);
  }

  if (sub == "discard") {
    auto status = app.queue->Discard(id);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return kExitFailed;
    }
    std::cout << "discarded " << id << "\n";
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  auto options = ParseArgs(argc, argv);
  if (!options || options->positional.size() < 2 ||
      (options->positional[0] != "import" && options->positional[0] != "pending")) {
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = options->config_path.empty() ? carelog::config::ConfigLoader::Defaults()
                                               : carelog::config::ConfigLoader::LoadFromYaml(options->config_path);

    // queued reports would vanish on exit
    if (config.database().has_memory()) {
      std::cerr << "carelogctl needs a durable database: set database.sqlite.path in the config\n";
      return kExitUsage;
    }

    carelog::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    carelog::extraction::ExtractionServicePtr service;
    if (!config.extraction().endpoint().empty()) {
      service = carelog::grpc::GrpcExtractionClient::Connect(config.extraction().endpoint(), config.extraction().use_tls());
    }
    auto app = carelog::factory::Build(config, service);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const int code = options->positional[0] == "import" ? RunImport(app, *options) : RunPending(app, *options);
    carelog::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    CARELOG_LOG_ERROR("Fatal error", {carelog::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    carelog::observability::ShutdownLogging();
    return kExitFailed;
  }
}
