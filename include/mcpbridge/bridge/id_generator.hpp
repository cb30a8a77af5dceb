#pragma once

#include <atomic>
#include <cstdint>

namespace mcpbridge::bridge {

/**
 * @brief Interface for generating request IDs.
 *
 * Ids handed to the MCP process must be unique among outstanding calls.
 */
class IdGenerator {
 public:
  IdGenerator() = default;
  IdGenerator(const IdGenerator &) = default;
  IdGenerator(IdGenerator &&) = delete;
  auto operator=(const IdGenerator &) -> IdGenerator & = default;
  auto operator=(IdGenerator &&) -> IdGenerator & = delete;
  virtual ~IdGenerator() = default;

  /**
   * @brief Generate the next request ID.
   *
   * @return A unique request ID.
   */
  virtual auto NextId() -> int64_t = 0;
};

/**
 * @brief Generates incrementing numeric IDs starting from 1.
 */
class IncrementalIdGenerator : public IdGenerator {
 public:
  auto NextId() -> int64_t override {
    return counter_++;
  }

 private:
  std::atomic<int64_t> counter_{1};
};

}  // namespace mcpbridge::bridge
