#include "mcpbridge/config/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::config {

using error::BridgeError;
using error::ErrorKind;

namespace {

template <typename T>
auto ParseNumber(const std::string &name, const std::string &value)
    -> std::expected<T, BridgeError> {
  T number{};
  auto trimmed = utils::Trim(value);
  const auto *first = trimmed.data();
  const auto *last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, number);
  if (trimmed.empty() || ec != std::errc() || ptr != last) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        "Invalid value for " + name + ": '" + value + "'");
  }
  return number;
}

auto ParseFlag(const std::string &name, const std::string &value)
    -> std::expected<bool, BridgeError> {
  auto lowered = utils::ToLower(utils::Trim(value));
  if (lowered == "1" || lowered == "true" || lowered == "on" ||
      lowered == "yes") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "off" ||
      lowered == "no" || lowered.empty()) {
    return false;
  }
  return BridgeError::UnexpectedFromKind(
      ErrorKind::kConfigError,
      "Invalid value for " + name + ": '" + value + "'");
}

auto ParseLogLevel(const std::string &value)
    -> std::expected<spdlog::level::level_enum, BridgeError> {
  auto lowered = utils::ToLower(utils::Trim(value));
  auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off && lowered != "off") {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError, "Invalid value for MCP_LOG_LEVEL: '" + value +
                                     "'");
  }
  return level;
}

auto ResolveLaunch(const EnvLookup &lookup)
    -> std::expected<LaunchConfig, BridgeError> {
  auto config_file = lookup("MCP_CONFIG_FILE");
  auto server_name = lookup("MCP_SERVER_NAME");

  if (config_file && server_name) {
    spdlog::info(
        "Loading configuration for '{}' from {}", *server_name, *config_file);
    return LoadServerFile(*config_file, *server_name);
  }

  if (auto command = lookup("MCP_COMMAND")) {
    auto words = SplitCommandLine(*command);
    if (!words) {
      return std::unexpected(words.error());
    }
    if (words->empty()) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError, "MCP_COMMAND is empty");
    }
    LaunchConfig launch;
    launch.command = words->front();
    launch.args.assign(words->begin() + 1, words->end());
    return launch;
  }

  return BridgeError::UnexpectedFromKind(
      ErrorKind::kConfigError,
      "Configuration missing. Set MCP_CONFIG_FILE and MCP_SERVER_NAME, or "
      "MCP_COMMAND.");
}

}  // namespace

auto SystemEnvironment(const std::string &name) -> std::optional<std::string> {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

auto LoadFromEnvironment(const EnvLookup &lookup)
    -> std::expected<BridgeConfig, BridgeError> {
  BridgeConfig config;

  auto launch = ResolveLaunch(lookup);
  if (!launch) {
    return std::unexpected(launch.error());
  }
  config.launch = std::move(*launch);

  if (auto cwd = lookup("MCP_CWD"); cwd && !cwd->empty()) {
    config.launch.cwd = std::filesystem::path(*cwd);
  }

  if (auto host = lookup("MCP_HOST"); host && !host->empty()) {
    config.host = *host;
  }

  if (auto port = lookup("MCP_PORT")) {
    auto parsed = ParseNumber<uint16_t>("MCP_PORT", *port);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    config.port = *parsed;
  }

  if (auto timeout = lookup("MCP_CALL_TIMEOUT_MS")) {
    auto parsed = ParseNumber<int64_t>("MCP_CALL_TIMEOUT_MS", *timeout);
    if (!parsed || *parsed <= 0) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError,
          "Invalid value for MCP_CALL_TIMEOUT_MS: '" + *timeout + "'");
    }
    config.call_timeout = std::chrono::milliseconds(*parsed);
  }

  if (auto threads = lookup("MCP_THREADS")) {
    auto parsed = ParseNumber<std::size_t>("MCP_THREADS", *threads);
    if (!parsed || *parsed == 0) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError,
          "Invalid value for MCP_THREADS: '" + *threads + "'");
    }
    config.threads = *parsed;
  }

  if (auto level = lookup("MCP_LOG_LEVEL")) {
    auto parsed = ParseLogLevel(*level);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    config.log_level = *parsed;
  }

  if (auto log_file = lookup("MCP_LOG_FILE"); log_file && !log_file->empty()) {
    config.log_file = std::filesystem::path(*log_file);
  }

  if (auto restart = lookup("MCP_RESTART")) {
    auto parsed = ParseFlag("MCP_RESTART", *restart);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    config.restart_on_exit = *parsed;
  }

  if (auto max_restarts = lookup("MCP_MAX_RESTARTS")) {
    auto parsed = ParseNumber<std::size_t>("MCP_MAX_RESTARTS", *max_restarts);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }
    config.max_restarts = *parsed;
  }

  if (auto grace = lookup("MCP_SHUTDOWN_GRACE_MS")) {
    auto parsed = ParseNumber<int64_t>("MCP_SHUTDOWN_GRACE_MS", *grace);
    if (!parsed || *parsed < 0) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError,
          "Invalid value for MCP_SHUTDOWN_GRACE_MS: '" + *grace + "'");
    }
    config.shutdown_grace = std::chrono::milliseconds(*parsed);
  }

  return config;
}

auto LoadServerEntry(
    const nlohmann::json &document, std::string_view server_name)
    -> std::expected<LaunchConfig, BridgeError> {
  const std::string name(server_name);

  if (!document.is_object() || !document.contains("mcpServers") ||
      !document["mcpServers"].is_object() ||
      !document["mcpServers"].contains(name)) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        "Server '" + name + "' not found in 'mcpServers' configuration");
  }

  const auto &entry = document["mcpServers"][name];
  if (!entry.is_object() || !entry.contains("command") ||
      !entry["command"].is_string() ||
      entry["command"].get<std::string>().empty()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        "No 'command' specified for server '" + name + "'");
  }

  LaunchConfig launch;
  launch.command = entry["command"].get<std::string>();

  if (entry.contains("args")) {
    const auto &args = entry["args"];
    if (!args.is_array()) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError,
          "'args' for server '" + name + "' must be an array of strings");
    }
    for (const auto &arg : args) {
      if (!arg.is_string()) {
        return BridgeError::UnexpectedFromKind(
            ErrorKind::kConfigError,
            "'args' for server '" + name + "' must be an array of strings");
      }
      launch.args.push_back(arg.get<std::string>());
    }
  }

  if (entry.contains("env")) {
    const auto &env = entry["env"];
    if (!env.is_object()) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError,
          "'env' for server '" + name + "' must be an object of strings");
    }
    for (const auto &[key, value] : env.items()) {
      if (!value.is_string()) {
        return BridgeError::UnexpectedFromKind(
            ErrorKind::kConfigError,
            "'env." + key + "' for server '" + name + "' must be a string");
      }
      launch.env[key] = value.get<std::string>();
    }
  }

  return launch;
}

auto LoadServerFile(
    const std::filesystem::path &path, std::string_view server_name)
    -> std::expected<LaunchConfig, BridgeError> {
  std::ifstream input(path);
  if (!input) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError, "Config file not found at " + path.string());
  }

  auto document = nlohmann::json::parse(input, nullptr, false);
  if (document.is_discarded()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        "Failed to parse JSON config file at " + path.string());
  }

  return LoadServerEntry(document, server_name);
}

auto SplitCommandLine(std::string_view command_line)
    -> std::expected<std::vector<std::string>, BridgeError> {
  enum class Quote { kNone, kSingle, kDouble };

  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  Quote quote = Quote::kNone;

  for (std::size_t i = 0; i < command_line.size(); ++i) {
    char c = command_line[i];

    switch (quote) {
      case Quote::kSingle:
        if (c == '\'') {
          quote = Quote::kNone;
        } else {
          current += c;
        }
        continue;

      case Quote::kDouble:
        if (c == '"') {
          quote = Quote::kNone;
        } else if (
            c == '\\' && i + 1 < command_line.size() &&
            std::string_view("\"\\$`").find(command_line[i + 1]) !=
                std::string_view::npos) {
          current += command_line[++i];
        } else {
          current += c;
        }
        continue;

      case Quote::kNone:
        break;
    }

    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
    } else if (c == '\'') {
      quote = Quote::kSingle;
      in_word = true;
    } else if (c == '"') {
      quote = Quote::kDouble;
      in_word = true;
    } else if (c == '\\') {
      if (i + 1 >= command_line.size()) {
        return BridgeError::UnexpectedFromKind(
            ErrorKind::kConfigError, "Trailing backslash in command line");
      }
      current += command_line[++i];
      in_word = true;
    } else {
      current += c;
      in_word = true;
    }
  }

  if (quote != Quote::kNone) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError, "Unterminated quote in command line");
  }

  if (in_word) {
    words.push_back(std::move(current));
  }
  return words;
}

}  // namespace mcpbridge::config
