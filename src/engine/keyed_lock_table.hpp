// File: src/engine/keyed_lock_table.hpp
#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace kte {

/// KeyedLockTable: Striped mutexes serialising work per (student, concept)
///
/// Every key maps to one of a fixed number of stripes. Two updates of the
/// same key always contend on the same stripe; updates of different keys
/// usually do not. Callers must never hold two stripes at once, since two
/// keys may share a stripe.
class KeyedLockTable {
public:
    /// @param stripes Number of mutexes (minimum 1)
    explicit KeyedLockTable(size_t stripes);

    KeyedLockTable(const KeyedLockTable&) = delete;
    KeyedLockTable& operator=(const KeyedLockTable&) = delete;

    /// Block until the key's stripe is held
    std::unique_lock<std::mutex> Lock(const StateKey& key);

    size_t StripeFor(const StateKey& key) const;
    size_t GetStripeCount() const { return stripes_.size(); }

private:
    std::vector<std::mutex> stripes_;
};

} // namespace kte
