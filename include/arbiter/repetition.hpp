#pragma once

/// @file repetition.hpp
/// Occurrence counts of committed positions, owned by one game.

#include <arbiter/codec.hpp>

#include <cstddef>
#include <unordered_map>

namespace arbiter {

class RepetitionTable {
   public:
    /// Count one more occurrence of `key` and return the new total.
    int increment(const PositionKey& key);

    /// Remove one occurrence of `key`. Keys that reach zero are dropped.
    void decrement(const PositionKey& key);

    [[nodiscard]] int count(const PositionKey& key) const;

    /// Number of distinct positions recorded.
    [[nodiscard]] std::size_t size() const noexcept { return counts_.size(); }

    void clear() noexcept { counts_.clear(); }

    [[nodiscard]] bool operator==(const RepetitionTable&) const = default;

   private:
    std::unordered_map<PositionKey, int, PositionKeyHash> counts_;
};

}  // namespace arbiter
