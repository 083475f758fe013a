#pragma once
// Signal.hpp - Minimal synchronous signal/slot for non-QObject classes
// Slots run on the emitting thread, in connection order.

#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace rs {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = u64;

    ConnectionId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        ConnectionId id = ++nextId_;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(ConnectionId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& s) { return s.first == id; });
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) {
        std::vector<std::pair<ConnectionId, Slot>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = slots_;
        }
        for (auto& [id, slot] : snapshot) {
            slot(args...);
        }
    }

    usize connectionCount() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionId, Slot>> slots_;
    ConnectionId nextId_{0};
};

// Disconnects on destruction; for slots that capture a shorter-lived object
template <typename... Args>
class ScopedConnection {
public:
    ScopedConnection() = default;
    ScopedConnection(Signal<Args...>& signal,
                     typename Signal<Args...>::ConnectionId id)
        : signal_(&signal), id_(id) {
    }
    ScopedConnection(ScopedConnection&& other) noexcept
        : signal_(std::exchange(other.signal_, nullptr)), id_(other.id_) {
    }
    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            reset();
            signal_ = std::exchange(other.signal_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ~ScopedConnection() {
        reset();
    }

    void reset() {
        if (signal_) {
            signal_->disconnect(id_);
            signal_ = nullptr;
        }
    }

private:
    Signal<Args...>* signal_{nullptr};
    typename Signal<Args...>::ConnectionId id_{0};
};

} // namespace rs
