#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include "server/config.hpp"
#include "server/processor.hpp"
#include "server/server.hpp"

using gsupbridge::server::Server;
using gsupbridge::server::ServerConfig;
using gsupbridge::server::StaticProcessor;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/gsupbridge.json";
  if (argc > 1) {
    config_path = argv[1];
  }

  ServerConfig cfg;
  std::string error;
  if (!gsupbridge::server::load_config(config_path, cfg, error)) {
    std::cerr << "[server] " << error << "\n";
    return 1;
  }

  // Ensure the log dir exists and set up a rotating logger.
  try {
    auto log_dir = std::filesystem::path(cfg.log.file).parent_path();
    if (!log_dir.empty()) std::filesystem::create_directories(log_dir);
    auto logger = spdlog::rotating_logger_mt("gsupbridge", cfg.log.file,
                                             cfg.log.max_size, cfg.log.max_files);
    spdlog::set_default_logger(logger);
  } catch (const std::exception& ex) {
    std::cerr << "[server] cannot open log " << cfg.log.file << ": " << ex.what()
              << "\n";
    return 1;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_on(spdlog::level::warn);

  StaticProcessor processor(cfg.subscribers);
  Server server(cfg.host, cfg.port, processor);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  if (!server.start()) {
    std::cerr << "[server] failed to start\n";
    return 1;
  }

  std::cout << "[server] listening on " << cfg.host << ":" << server.port()
            << " (" << processor.subscriber_count()
            << " subscribers). Press Ctrl+C to stop.\n";

  while (!g_stop.load()) {
    server.poll_once(200);
  }

  server.stop();
  spdlog::info("server stopped");
  std::cout << "[server] stopped.\n";
  return 0;
}
