#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>

#include "mcpbridge/bridge/completion.hpp"
#include "mcpbridge/error/error.hpp"
#include "mcpbridge/message/response.hpp"
#include "mcpbridge/message/types.hpp"

namespace mcpbridge::bridge {

/// What a waiting caller receives: the matched Response or the reason the
/// call failed before one arrived.
using CallOutcome = std::expected<message::Response, error::BridgeError>;

using CompletionHandle = Completion<CallOutcome>;

struct PendingCall {
  int64_t id;
  std::chrono::steady_clock::time_point created_at;
  std::shared_ptr<CompletionHandle> handle;
};

/**
 * @brief Correlation ledger from in-flight request id to waiting caller.
 *
 * Every operation holds the table mutex only for the map update. Handles are
 * fulfilled after the entry has been removed, so a handle is fulfilled at
 * most once and never while the lock is held.
 */
class PendingTable {
 public:
  explicit PendingTable(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  PendingTable(const PendingTable &) = delete;
  PendingTable(PendingTable &&) = delete;
  auto operator=(const PendingTable &) -> PendingTable & = delete;
  auto operator=(PendingTable &&) -> PendingTable & = delete;

  ~PendingTable();

  /**
   * @brief Inserts a new pending call.
   *
   * @param id The bridge-allocated request id
   * @return The completion handle to wait on, or kDuplicateId if the id is
   * already outstanding
   */
  auto Register(int64_t id)
      -> std::expected<std::shared_ptr<CompletionHandle>, error::BridgeError>;

  /**
   * @brief Delivers a response to the caller waiting for `id`.
   *
   * @return false if no call is waiting for `id`; the response is discarded
   */
  auto Resolve(const message::RequestId &id, message::Response response)
      -> bool;

  /// Fails the single call waiting for `id`. Returns false if there is none.
  auto Fail(const message::RequestId &id, error::BridgeError error) -> bool;

  /// Drops the entry for `id` without fulfilling it (timeout path).
  auto Remove(int64_t id) -> bool;

  /**
   * @brief Fails every outstanding call and clears the table.
   *
   * @return The number of calls that were failed
   */
  auto FailAll(const error::BridgeError &error) -> std::size_t;

  /// Removes entries that are already fulfilled or whose caller is gone.
  auto Sweep() -> std::size_t;

  [[nodiscard]] auto Contains(int64_t id) const -> bool;

  [[nodiscard]] auto Size() const -> std::size_t;

  [[nodiscard]] auto Empty() const -> bool {
    return Size() == 0;
  }

 private:
  auto Take(const message::RequestId &id) -> std::shared_ptr<CompletionHandle>;

  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  asio::any_io_executor executor_;

  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;

  std::unordered_map<int64_t, PendingCall> calls_;
};

}  // namespace mcpbridge::bridge
