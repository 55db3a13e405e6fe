#include "core/ids.h"
#include "core/job_runner.h"
#include "core/logger.h"
#include "core/stream_event.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/scan_client.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void handle_sigint(int) { g_interrupted.store(true); }

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--base-url URL] [--device-id ID] [--forward-pings] "
               "IMAGE.jpg [IMAGE.jpg ...]\n"
            << "Environment: SPINE_API_BASE_URL, SPINE_DEVICE_ID, "
               "SPINE_LOG_LEVEL, SPINE_MAX_SERVER_RETRIES,\n"
            << "             SPINE_STREAM_IDLE_TIMEOUT_MS, SPINE_MAX_RECONNECTS, "
               "SPINE_MAX_CONCURRENT_STREAMS,\n"
            << "             SPINE_REQUEST_TIMEOUT_MS, SPINE_FORWARD_PINGS\n";
}

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

std::string describe_book(const spine::core::remote::BookResult &book) {
  std::ostringstream out;
  out << book.title << " by " << book.author;
  if (book.isbn) {
    out << " isbn=" << *book.isbn;
  }
  if (book.confidence) {
    out << " confidence=" << *book.confidence;
  }
  if (book.enrichment_status) {
    out << " enrichment=" << spine::core::remote::to_string(*book.enrichment_status);
  }
  return out.str();
}

std::string describe_event(const spine::core::StreamEvent &event) {
  using namespace spine::core;
  std::ostringstream out;
  out << kind_name(event);
  if (const auto *progress = event.get_if<ProgressEvent>()) {
    out << ": " << progress->message;
  } else if (const auto *item = event.get_if<ResultItemEvent>()) {
    out << ": " << describe_book(item->book);
  } else if (const auto *completed = event.get_if<CompletedEvent>()) {
    out << ": " << (completed->inline_items ? completed->inline_items->size() : 0)
        << " results";
  } else if (const auto *error = event.get_if<ErrorEvent>()) {
    out << ": " << error->message;
    if (error->code) {
      out << " (" << *error->code << ")";
    }
  } else if (const auto *degraded = event.get_if<EnrichmentDegradedEvent>()) {
    out << ": " << degraded->title.value_or("?") << " via "
        << degraded->fallback_source.value_or("?");
  }
  if (event.id) {
    out << " [id=" << *event.id << "]";
  }
  return out.str();
}

} // namespace

int main(int argc, char *argv[]) {
  auto config = spine::infra::ScanClientConfig::from_environment();

  std::vector<std::string> images;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "--base-url" && i + 1 < argc) {
      config.api_base_url = argv[++i];
    } else if (arg == "--device-id" && i + 1 < argc) {
      config.device_id = argv[++i];
    } else if (arg == "--forward-pings") {
      config.forward_pings = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    } else {
      images.push_back(arg);
    }
  }
  if (images.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  std::shared_ptr<spine::core::ILogger> logger =
      spine::infra::create_console_logger(config.log_level);
  for (const auto &warning : config.warnings) {
    logger->warn("startup", "app", "config_invalid", warning);
  }
  if (config.device_id.empty()) {
    config.device_id = spine::core::generate_id("cli");
  }
  logger->info("startup", "app", "config",
               "base_url=" + config.api_base_url +
                   " device_id=" + config.device_id +
                   " max_streams=" + std::to_string(config.max_concurrent_streams));

  std::signal(SIGINT, handle_sigint);

  spine::infra::ScanClient client(config, logger);
  auto runner = client.make_runner();
  std::mutex print_mutex;

  std::vector<spine::core::JobTicket> tickets;
  for (const auto &path : images) {
    auto bytes = read_file(path);
    if (!bytes) {
      logger->error("startup", "app", "image_unreadable", path);
      continue;
    }
    const std::string label = path;
    tickets.push_back(runner->start(
        std::move(*bytes), config.device_id,
        [&print_mutex, label](const spine::core::StreamEvent &event) {
          std::lock_guard<std::mutex> lock(print_mutex);
          std::cout << "[" << label << "] " << describe_event(event) << "\n";
        }));
  }
  if (tickets.empty()) {
    return 1;
  }

  // Forward Ctrl-C to every job.
  std::atomic<bool> done{false};
  std::thread watcher([&tickets, &done]() {
    while (!done.load()) {
      if (g_interrupted.load()) {
        for (auto &ticket : tickets) {
          ticket.cancel();
        }
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  int exit_code = 0;
  for (auto &ticket : tickets) {
    const auto outcome = ticket.wait();
    std::lock_guard<std::mutex> lock(print_mutex);
    std::cout << "job " << outcome.job_key << " ("
              << outcome.job_id.value_or("no server job") << "): "
              << spine::core::to_string(outcome.state);
    if (outcome.canceled_by_caller) {
      std::cout << " (canceled by caller)";
    }
    std::cout << ", " << outcome.results.size() << " results\n";
    for (const auto &book : outcome.results) {
      std::cout << "  - " << describe_book(book) << "\n";
    }
    if (outcome.error) {
      std::cout << "  error: " << spine::core::describe(*outcome.error) << "\n";
    }
    if (outcome.cleanup_error) {
      std::cout << "  cleanup: " << spine::core::describe(*outcome.cleanup_error)
                << "\n";
    }
    if (outcome.state != spine::core::JobState::Completed) {
      exit_code = 1;
    }
  }

  done.store(true);
  watcher.join();
  return exit_code;
}
