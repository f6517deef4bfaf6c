#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace turnstile {

template<typename T> class ObservableQueue;

namespace detail {

// Published items, shared between a queue and its observers.
// Readers take the shared lock, the publishing thread takes it exclusively.
template<typename T>
struct LogBuffer {
    mutable std::shared_mutex mutex;
    std::deque<T> items;
};

} // namespace detail

// Read handle into an ObservableQueue.
//
// Holds its own cursor (index of the next unread item, relative to the front
// of the buffer) and a weak reference to the buffer, so it never keeps the
// queue alive. Reads against a destroyed queue return nothing.
//
// An observer may be moved to another thread. Reading the SAME observer from
// two threads at once is not supported: load, lookup and advance are separate
// steps and both callers may receive the same item.
template<typename T>
class Observer {
public:
    Observer(Observer&&) noexcept = default;
    Observer& operator=(Observer&&) noexcept = default;
    Observer(const Observer&) = delete;
    Observer& operator=(const Observer&) = delete;

    // Next unread item, transformed by f. Advances only when an item exists.
    //
    // For copyable T the item is copied out and f runs after the buffer lock
    // is released, so f may push into the queue or step its scheduler. For
    // move-only T, f runs under the shared lock and must not do either.
    template<typename F>
    auto map_next(F&& f) const
        -> std::optional<std::decay_t<std::invoke_result_t<F&, const T&>>> {
        if (!cursor_) return std::nullopt;
        auto buffer = buffer_.lock();
        if (!buffer) return std::nullopt;

        if constexpr (std::is_copy_constructible_v<T>) {
            std::optional<T> item;
            {
                std::shared_lock<std::shared_mutex> lock(buffer->mutex);
                size_t index = cursor_->load(std::memory_order_relaxed);
                if (index >= buffer->items.size()) return std::nullopt;
                item.emplace(buffer->items[index]);
                cursor_->fetch_add(1, std::memory_order_relaxed);
            }
            const T& ref = *item;
            return f(ref);
        } else {
            std::shared_lock<std::shared_mutex> lock(buffer->mutex);
            size_t index = cursor_->load(std::memory_order_relaxed);
            if (index >= buffer->items.size()) return std::nullopt;
            const T& item = buffer->items[index];
            cursor_->fetch_add(1, std::memory_order_relaxed);
            return f(item);
        }
    }

    // Copy of the next unread item.
    std::optional<T> next() const {
        return map_next([](const T& item) { return item; });
    }

    // True once the queue is gone (or this observer was moved from).
    bool expired() const { return !cursor_ || buffer_.expired(); }

private:
    friend class ObservableQueue<T>;

    Observer(std::shared_ptr<std::atomic<size_t>> cursor,
             std::weak_ptr<detail::LogBuffer<T>> buffer)
        : cursor_(std::move(cursor)), buffer_(std::move(buffer)) {}

    std::shared_ptr<std::atomic<size_t>> cursor_;
    std::weak_ptr<detail::LogBuffer<T>> buffer_;
};

// Append-only log with any number of independent readers.
//
// Items are only stored while someone is subscribed. Space is reclaimed
// lazily: on every push the prefix consumed by all live observers is dropped
// and their cursors are shifted back by the same amount.
template<typename T>
class ObservableQueue {
public:
    ObservableQueue() : buffer_(std::make_shared<detail::LogBuffer<T>>()) {}

    ObservableQueue(const ObservableQueue&) = delete;
    ObservableQueue& operator=(const ObservableQueue&) = delete;

    void push(T item) {
        // Nothing is buffered for unobserved types.
        if (observers_.empty()) return;

        {
            std::unique_lock<std::shared_mutex> lock(buffer_->mutex);
            buffer_->items.push_back(std::move(item));
        }
        synchronize();
    }

    // New observers only see items pushed after subscribing.
    Observer<T> subscribe() {
        size_t front = 0;
        {
            std::shared_lock<std::shared_mutex> lock(buffer_->mutex);
            front = buffer_->items.size();
        }
        auto cursor = std::make_shared<std::atomic<size_t>>(front);
        observers_.push_back(cursor);
        return Observer<T>(std::move(cursor), buffer_);
    }

    // Purge dropped observers and discard items every live observer has read.
    void synchronize() {
        std::unique_lock<std::shared_mutex> lock(buffer_->mutex);

        observers_.erase(
            std::remove_if(observers_.begin(), observers_.end(),
                           [](const std::weak_ptr<std::atomic<size_t>>& w) {
                               return w.expired();
                           }),
            observers_.end());

        std::vector<std::shared_ptr<std::atomic<size_t>>> live;
        live.reserve(observers_.size());
        size_t new_front = std::numeric_limits<size_t>::max();
        for (const auto& weak : observers_) {
            if (auto cursor = weak.lock()) {
                new_front = std::min(new_front, cursor->load(std::memory_order_relaxed));
                live.push_back(std::move(cursor));
            }
        }
        new_front = std::min(new_front, buffer_->items.size());

        for (const auto& cursor : live) {
            cursor->fetch_sub(new_front, std::memory_order_relaxed);
        }
        auto& items = buffer_->items;
        items.erase(items.begin(),
                    items.begin() + static_cast<std::ptrdiff_t>(new_front));
    }

    // Number of items currently buffered.
    size_t len() const {
        std::shared_lock<std::shared_mutex> lock(buffer_->mutex);
        return buffer_->items.size();
    }

    // Tracked observers. Dropped ones are only forgotten on the next push.
    size_t observer_count() const { return observers_.size(); }

private:
    std::shared_ptr<detail::LogBuffer<T>> buffer_;
    std::vector<std::weak_ptr<std::atomic<size_t>>> observers_;
};

} // namespace turnstile
