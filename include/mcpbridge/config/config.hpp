#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "mcpbridge/error/error.hpp"

namespace mcpbridge::config {

/// How to launch the MCP process.
struct LaunchConfig {
  std::string command;
  std::vector<std::string> args;
  std::optional<std::filesystem::path> cwd;
  std::map<std::string, std::string> env;
  // When false the child sees only `env`.
  bool inherit_env{true};
};

struct BridgeConfig {
  LaunchConfig launch;
  std::string host{"0.0.0.0"};
  uint16_t port{8000};
  std::chrono::milliseconds call_timeout{30000};
  std::size_t threads{4};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::optional<std::filesystem::path> log_file;
  bool restart_on_exit{false};
  std::size_t max_restarts{5};
  std::chrono::milliseconds shutdown_grace{2000};
};

using EnvLookup =
    std::function<std::optional<std::string>(const std::string &name)>;

/// Reads from the real process environment.
auto SystemEnvironment(const std::string &name) -> std::optional<std::string>;

/**
 * @brief Resolves the full bridge configuration from MCP_* variables.
 *
 * MCP_CONFIG_FILE with MCP_SERVER_NAME takes precedence over MCP_COMMAND.
 *
 * @param lookup Source of environment variables
 */
auto LoadFromEnvironment(const EnvLookup &lookup = SystemEnvironment)
    -> std::expected<BridgeConfig, error::BridgeError>;

/**
 * @brief Extracts `mcpServers[server_name]` from a client config document.
 *
 * @param document A parsed `{"mcpServers": {...}}` document
 * @param server_name Key of the server entry
 */
auto LoadServerEntry(
    const nlohmann::json &document, std::string_view server_name)
    -> std::expected<LaunchConfig, error::BridgeError>;

auto LoadServerFile(
    const std::filesystem::path &path, std::string_view server_name)
    -> std::expected<LaunchConfig, error::BridgeError>;

/**
 * @brief Splits a command line the way a POSIX shell would tokenize it.
 *
 * Supports single quotes, double quotes with backslash escapes and
 * backslash escapes outside quotes. No expansion is performed.
 */
auto SplitCommandLine(std::string_view command_line)
    -> std::expected<std::vector<std::string>, error::BridgeError>;

}  // namespace mcpbridge::config
