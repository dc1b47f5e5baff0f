// File: src/engine/keyed_lock_table.cpp
#include "engine/keyed_lock_table.hpp"

namespace kte {

KeyedLockTable::KeyedLockTable(size_t stripes)
    : stripes_(stripes == 0 ? 1 : stripes)
{
}

std::unique_lock<std::mutex> KeyedLockTable::Lock(const StateKey& key) {
    return std::unique_lock<std::mutex>(stripes_[StripeFor(key)]);
}

size_t KeyedLockTable::StripeFor(const StateKey& key) const {
    return StateKey::Hash()(key) % stripes_.size();
}

} // namespace kte
