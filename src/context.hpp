#pragma once
#include "event.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace turnstile {

// Staging area for events emitted by handlers during one epoch.
// Owned by the scheduler and emptied after every step().
class Sender {
public:
    // Runs in the epoch right after the current one. Everything staged this
    // way during one epoch shares that follow-up epoch, regardless of type.
    template<typename T>
    void send_immediate(T event) {
        immediate_.push_back(make_scheduled(std::move(event)));
    }

    // Runs in its own epoch, appended at the end of the queue.
    template<typename T>
    void send_delayed(T event) {
        delayed_.push_back(make_scheduled(std::move(event)));
    }

    // Staged immediate events in staging order; leaves the buffer empty.
    Epoch take_immediate();

    // Staged delayed events in staging order; leaves the buffer empty.
    std::vector<ScheduledEvent> take_delayed();

    void clear();
    bool empty() const;
    size_t immediate_count() const { return immediate_.size(); }
    size_t delayed_count() const { return delayed_.size(); }

private:
    Epoch immediate_;
    std::vector<ScheduledEvent> delayed_;
};

// Capability handed to handlers for the duration of one event's dispatch.
class SchedulerContext {
public:
    explicit SchedulerContext(Sender& sender) : sender_(sender) {}

    SchedulerContext(const SchedulerContext&) = delete;
    SchedulerContext& operator=(const SchedulerContext&) = delete;

    template<typename T>
    void send_immediate(T event) {
        sender_.send_immediate(std::move(event));
    }

    template<typename T>
    void send_delayed(T event) {
        sender_.send_delayed(std::move(event));
    }

private:
    Sender& sender_;
};

} // namespace turnstile
