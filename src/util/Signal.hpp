/**
 * @file Signal.hpp
 * @brief Minimal thread-safe signal/slot mechanism.
 *
 * Slots are invoked synchronously on the emitting thread. The slot list is
 * copied before dispatch so a slot may disconnect itself while running.
 */

#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include "Types.hpp"

namespace oc {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = u64;

    ConnectionId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        ConnectionId id = nextId_++;
        slots_.push_back({id, std::move(slot)});
        return id;
    }

    void disconnect(ConnectionId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& s) { return s.id == id; });
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) {
        std::vector<Entry> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = slots_;
        }
        for (auto& entry : snapshot) {
            entry.slot(args...);
        }
    }

private:
    struct Entry {
        ConnectionId id;
        Slot slot;
    };

    std::vector<Entry> slots_;
    ConnectionId nextId_{1};
    std::mutex mutex_;
};

} // namespace oc
