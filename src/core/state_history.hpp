// File: src/core/state_history.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mmq {

/// Fixed-capacity ring buffer of the most recent states
///
/// Keeps only the last `capacity` pushed values. Values are addressed by how
/// far back they were pushed: Get(0) is the newest, Get(Size() - 1) the
/// oldest still retained. Once full, each Push overwrites the oldest value.
///
/// Not thread-safe. Each scan owns its own history.
///
/// @tparam Value Stored state type (must be movable)
template<typename Value>
class StateHistory {
public:
    /// @param capacity Maximum number of retained values (minimum 1)
    explicit StateHistory(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
        slots_.reserve(capacity_);
    }

    /// Append a value, evicting the oldest when full
    void Push(Value value) {
        if (slots_.size() < capacity_) {
            slots_.push_back(std::move(value));
            head_ = slots_.size() - 1;
            return;
        }
        head_ = (head_ + 1) % capacity_;
        slots_[head_] = std::move(value);
    }

    /// Get a retained value by distance back from the newest
    /// @param distance_back 0 for the newest value
    /// @throws std::out_of_range if the value is not retained
    const Value& Get(size_t distance_back) const {
        if (distance_back >= slots_.size()) {
            throw std::out_of_range("StateHistory: distance_back exceeds retained history");
        }
        size_t index = (head_ + capacity_ - distance_back) % capacity_;
        return slots_[index];
    }

    /// Newest value
    /// @throws std::out_of_range if empty
    const Value& Latest() const { return Get(0); }

    /// Check whether a value this far back is retained
    bool Has(size_t distance_back) const { return distance_back < slots_.size(); }

    size_t Size() const { return slots_.size(); }
    size_t Capacity() const { return capacity_; }
    bool Empty() const { return slots_.empty(); }

    void Clear() {
        slots_.clear();
        head_ = 0;
    }

private:
    size_t capacity_;
    size_t head_{0};
    std::vector<Value> slots_;
};

} // namespace mmq
