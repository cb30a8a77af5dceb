#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <asio.hpp>
#include <mcpbridge/bridge/pending_table.hpp>
#include <mcpbridge/bridge/rpc_bridge.hpp>
#include <mcpbridge/config/config.hpp>
#include <mcpbridge/http/http_server.hpp>
#include <mcpbridge/process/supervisor.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using mcpbridge::bridge::PendingTable;
using mcpbridge::bridge::RpcBridge;
using mcpbridge::config::BridgeConfig;
using mcpbridge::http::HttpServer;
using mcpbridge::process::ProcessSupervisor;

/**
 * @brief HTTP front end for a stdio MCP server.
 *
 * Launches the command named by MCP_CONFIG_FILE/MCP_SERVER_NAME or
 * MCP_COMMAND and serves it on POST /mcp, with liveness on GET /health.
 */

namespace {

auto MakeLogger(const BridgeConfig &config) -> std::shared_ptr<spdlog::logger> {
  std::shared_ptr<spdlog::logger> logger;
  if (config.log_file) {
    logger = spdlog::basic_logger_mt(
        "mcp_http_bridge", config.log_file->string());
  } else {
    logger = spdlog::stdout_color_mt("mcp_http_bridge");
  }
  logger->set_level(config.log_level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

// Everything the running bridge is made of, torn down in reverse order.
struct BridgeApp {
  BridgeApp(asio::any_io_executor executor, const BridgeConfig &config,
            std::shared_ptr<spdlog::logger> logger)
      : pending(executor, logger),
        supervisor(executor, pending, logger, config.shutdown_grace),
        bridge(supervisor, pending, config.call_timeout, logger),
        server(executor, config.host, config.port, bridge, logger) {
  }

  PendingTable pending;
  ProcessSupervisor supervisor;
  RpcBridge bridge;
  HttpServer server;
};

auto RunBridge(BridgeApp &app, const BridgeConfig &config)
    -> asio::awaitable<bool> {
  if (config.restart_on_exit) {
    app.supervisor.SetRestartPolicy(
        mcpbridge::process::MaxRestartsPolicy(config.max_restarts));
  }

  auto started = co_await app.supervisor.Start(config.launch);
  if (!started) {
    spdlog::error(
        "Failed to start MCP process: {}", started.error().Message());
    co_return false;
  }

  auto listening = co_await app.server.Start();
  if (!listening) {
    spdlog::error("{}", listening.error().Message());
    co_await app.supervisor.Shutdown();
    co_return false;
  }

  asio::co_spawn(app.server.GetStrand(), app.server.Run(), asio::detached);
  co_return true;
}

auto ShutDown(BridgeApp &app) -> asio::awaitable<void> {
  app.server.Stop();
  co_await app.supervisor.Shutdown();
  spdlog::info("Bridge shutdown complete");
}

auto HandleError(std::exception_ptr eptr) -> void {
  try {
    if (eptr) {
      std::rethrow_exception(eptr);
    }
  } catch (const std::exception &e) {
    spdlog::error("Bridge error: {}", e.what());
  }
}

}  // namespace

auto main() -> int {
  auto config = mcpbridge::config::LoadFromEnvironment();
  if (!config) {
    spdlog::error("{}", config.error().Message());
    return 1;
  }

  try {
    spdlog::set_default_logger(MakeLogger(*config));
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    return 1;
  }
  auto logger = spdlog::default_logger();

  asio::thread_pool pool(config->threads);
  auto executor = pool.get_executor();
  BridgeApp app(executor, *config, logger);

  std::atomic<int> exit_code{0};
  asio::signal_set signals(executor, SIGINT, SIGTERM);

  asio::co_spawn(
      executor, RunBridge(app, *config),
      [&](std::exception_ptr eptr, bool running) {
        HandleError(eptr);
        if (eptr || !running) {
          exit_code = 1;
          signals.cancel();
          pool.stop();
        }
      });

  signals.async_wait([&](const asio::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    spdlog::info("Received signal {}, shutting down", signo);
    asio::co_spawn(
        executor, ShutDown(app), [&](std::exception_ptr eptr) {
          HandleError(eptr);
          pool.stop();
        });
  });

  pool.join();
  return exit_code;
}
