/// @file repetition.cpp
/// RepetitionTable implementation.

#include <arbiter/repetition.hpp>

namespace arbiter {

int RepetitionTable::increment(const PositionKey& key) {
    return ++counts_[key];
}

void RepetitionTable::decrement(const PositionKey& key) {
    auto it = counts_.find(key);
    if (it == counts_.end()) return;
    if (--it->second == 0) {
        counts_.erase(it);
    }
}

int RepetitionTable::count(const PositionKey& key) const {
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}

}  // namespace arbiter
