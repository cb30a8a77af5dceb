#pragma once

#include <expected>
#include <optional>

#include <sys/types.h>

#include "mcpbridge/config/config.hpp"
#include "mcpbridge/error/error.hpp"

namespace mcpbridge::process {

/// A freshly started child. The caller owns the three descriptors.
struct SpawnedProcess {
  pid_t pid{-1};
  int stdin_fd{-1};
  int stdout_fd{-1};
  int stderr_fd{-1};
};

/**
 * @brief Starts the MCP process with its stdio connected to new pipes.
 *
 * Fails with kProcessDown if the pipes cannot be created, the fork fails or
 * the command cannot be executed (reported back before this returns).
 */
auto Spawn(const config::LaunchConfig &launch)
    -> std::expected<SpawnedProcess, error::BridgeError>;

/**
 * @brief Reaps `pid` without blocking.
 *
 * @return The exit code (128 + signal for a signalled child), or
 * std::nullopt while the child is still running.
 */
auto TryReap(pid_t pid) -> std::optional<int>;

auto SendSignal(pid_t pid, int signal) -> bool;

/// Writes to a closed pipe must fail with EPIPE instead of killing us.
void IgnoreSigpipe();

}  // namespace mcpbridge::process
