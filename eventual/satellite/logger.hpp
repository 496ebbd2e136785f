#pragma once

#include <eventual/result/types/unit.hpp>

#include <eventual/threads/lockfree/atomic_array.hpp>

#include <fmt/core.h>

#include <wheels/core/assert.hpp>

#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eventual::satellite {

// Sharded named counters
// Logger<false, _> compiles every call away

template <bool CollectMetrics, bool AtomicMetrics>
class Logger {
 public:
  class LoggerShard {
   public:
    void Increment(std::string_view, size_t) {
    }
  };

  class Metrics {
   public:
    void Print() const {
    }

    Unit Data() && {
      return {};
    }
  };

  explicit Logger(const std::vector<std::string>&, size_t) {
  }

  // Pinned
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  Metrics GatherMetrics() const {
    return {};
  }

  LoggerShard* Shard(size_t) {
    return &singleton_;
  }

 private:
  LoggerShard singleton_{};
};

template <bool AtomicMetrics>
class Logger<true, AtomicMetrics> {
  struct StringHash {  // NOLINT
    using is_transparent = void;  // NOLINT

    size_t operator()(std::string_view name) const {
      return std::hash<std::string_view>{}(name);
    }
  };

  using Indices =
      std::unordered_map<std::string, size_t, StringHash, std::equal_to<>>;

 public:
  class LoggerShard {
    friend class Logger;

   public:
    LoggerShard(const Indices& indices)  // NOLINT
        : indices_(indices),
          counters_(indices.size()) {
    }

    // Pinned
    LoggerShard(const LoggerShard&) = delete;
    LoggerShard& operator=(const LoggerShard&) = delete;

    void Increment(std::string_view name, size_t diff) {
      auto pos = indices_.find(name);

      WHEELS_VERIFY(pos != indices_.end(), "You must use a valid metric name!");

      counters_.FetchAdd(pos->second, diff);
    }

   private:
    size_t LookUp(size_t index) const {
      return counters_.Load(index);
    }

   private:
    const Indices& indices_;
    threads::lockfree::MaybeAtomicArray<size_t, AtomicMetrics> counters_;
  };

  class Metrics {
    friend class Logger;

   public:
    void Print() const {
      for (const auto& [name, count] : data_) {
        fmt::println("{}: {}", name, count);
      }
    }

    // Order is unspecified
    std::vector<std::pair<std::string, size_t>> Data() && {
      return std::move(data_);
    }

   private:
    std::vector<std::pair<std::string, size_t>> data_{};
  };

  explicit Logger(const std::vector<std::string>& names, size_t num_shards) {
    for (size_t i = 0; i < names.size(); ++i) {
      indices_[names[i]] = i;
    }

    for (size_t i = 0; i < num_shards; ++i) {
      shards_.emplace_back(indices_);
    }
  }

  // Pinned
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  LoggerShard* Shard(size_t index) {
    WHEELS_VERIFY(index < shards_.size(), "Shard index out of range");
    return &shards_[index];
  }

  // Sums all shards
  Metrics GatherMetrics() const {
    Metrics metrics;

    for (const auto& [name, index] : indices_) {
      size_t total = 0;
      for (const auto& shard : shards_) {
        total += shard.LookUp(index);
      }
      metrics.data_.emplace_back(name, total);
    }

    return metrics;
  }

 private:
  Indices indices_{};
  std::deque<LoggerShard> shards_{};
};

}  // namespace eventual::satellite
