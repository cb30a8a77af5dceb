#include "mcpbridge/bridge/pending_table.hpp"

#include <vector>

namespace mcpbridge::bridge {

using error::BridgeError;
using error::ErrorKind;

PendingTable::PendingTable(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

PendingTable::~PendingTable() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, call] : calls_) {
    call.handle->Close();
  }
  calls_.clear();
}

auto PendingTable::Register(int64_t id)
    -> std::expected<std::shared_ptr<CompletionHandle>, BridgeError> {
  auto handle = std::make_shared<CompletionHandle>(executor_);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = calls_.try_emplace(
        id, PendingCall{
                .id = id,
                .created_at = std::chrono::steady_clock::now(),
                .handle = handle});
    if (!inserted) {
      Logger()->error(
          "PendingTable duplicate request id {} (outstanding for {} ms)", id,
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second.created_at)
              .count());
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kDuplicateId,
          "Request id " + std::to_string(id) + " is already outstanding");
    }
  }

  Logger()->debug("PendingTable registered id {}", id);
  return handle;
}

auto PendingTable::Take(const message::RequestId &id)
    -> std::shared_ptr<CompletionHandle> {
  // Bridge-allocated ids are always integers; any other id never originated
  // here.
  if (!std::holds_alternative<int64_t>(id)) {
    return nullptr;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = calls_.find(std::get<int64_t>(id));
  if (it == calls_.end()) {
    return nullptr;
  }
  auto handle = std::move(it->second.handle);
  calls_.erase(it);
  return handle;
}

auto PendingTable::Resolve(
    const message::RequestId &id, message::Response response) -> bool {
  auto handle = Take(id);
  if (!handle) {
    Logger()->warn(
        "PendingTable discarding response for unknown id {}",
        message::RequestIdToString(id));
    return false;
  }

  Logger()->debug(
      "PendingTable resolved id {}", message::RequestIdToString(id));
  return handle->Fulfill(std::move(response));
}

auto PendingTable::Fail(const message::RequestId &id, BridgeError error)
    -> bool {
  auto handle = Take(id);
  if (!handle) {
    return false;
  }

  Logger()->debug(
      "PendingTable failing id {}: {}", message::RequestIdToString(id),
      error.Message());
  return handle->Fulfill(std::unexpected(std::move(error)));
}

auto PendingTable::Remove(int64_t id) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.erase(id) > 0;
}

auto PendingTable::FailAll(const BridgeError &error) -> std::size_t {
  std::unordered_map<int64_t, PendingCall> failed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failed.swap(calls_);
  }

  for (auto &[id, call] : failed) {
    call.handle->Fulfill(std::unexpected(error));
  }

  if (!failed.empty()) {
    Logger()->info(
        "PendingTable failed {} outstanding call(s): {}", failed.size(),
        error.Message());
  }
  return failed.size();
}

auto PendingTable::Sweep() -> std::size_t {
  std::vector<std::shared_ptr<CompletionHandle>> swept;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = calls_.begin(); it != calls_.end();) {
      // use_count of 1 means only the table still holds the handle.
      if (it->second.handle->IsFulfilled() ||
          it->second.handle.use_count() == 1) {
        swept.push_back(std::move(it->second.handle));
        it = calls_.erase(it);
      } else {
        ++it;
      }
    }
  }

  if (!swept.empty()) {
    Logger()->debug("PendingTable swept {} stale entries", swept.size());
  }
  return swept.size();
}

auto PendingTable::Contains(int64_t id) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.contains(id);
}

auto PendingTable::Size() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.size();
}

}  // namespace mcpbridge::bridge
