#pragma once
#include "config.hpp"
#include "context.hpp"
#include "event.hpp"
#include "handler.hpp"
#include "handler_set.hpp"
#include "observer.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace turnstile {

// Turn-based dispatcher of typed events over a caller-owned World.
//
// Events are queued in epochs. Each step() runs one epoch: every event goes
// through the priority-ordered handler chain of its type, then events the
// handlers staged become new epochs (immediate ones at the front, delayed
// ones at the back). Events that finish their chain are published to the
// type's observable log.
//
// Single-threaded: all calls must come from one driver thread. Observers
// returned by observe() are the only part safe to use from other threads.
template<typename World>
class Scheduler {
public:
    Scheduler() = default;
    explicit Scheduler(SchedulerConfig config) : config_(std::move(config)) {}

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = default;
    Scheduler& operator=(Scheduler&&) = default;

    // The event type is taken from the handler's first parameter unless
    // given explicitly, e.g. add_system<Hit>([](auto& hit) { ... }).
    template<typename T = detail::Inferred, typename F>
    void add_system(F handler) {
        add_system_with_priority<T>(std::move(handler), 0);
    }

    template<typename T = detail::Inferred, typename F>
    void add_system_with_priority(F handler, int32_t priority) {
        using Event = typename detail::resolve_event<T, F>::type;
        entry<Event>().add_handler(make_handler<Event, World>(std::move(handler)),
                                   priority);
    }

    // Send an event into its own epoch.
    template<typename T>
    void send(T event) {
        queue_.push_back(single_epoch(make_scheduled(std::move(event))));
    }

    // Send a group of events into a single epoch.
    template<typename T>
    void send_many(std::vector<T> events) {
        Epoch epoch;
        epoch.reserve(events.size());
        for (auto& event : events) {
            epoch.push_back(make_scheduled(std::move(event)));
        }
        queue_.push_back(std::move(epoch));
    }

    // Process the front epoch. Returns false when there was nothing to do.
    bool step(World& world) {
        if (queue_.empty()) return false;

        Epoch epoch = std::move(queue_.front());
        queue_.pop_front();

        try {
            for (auto& scheduled : epoch) {
                dispatch(scheduled, world);
            }
        } catch (...) {
            // Keep what handlers already staged; the rest of the epoch is lost.
            merge_staged();
            throw;
        }
        merge_staged();
        return true;
    }

    // Step until the queue is empty or max_drain_steps is reached.
    // Returns the number of epochs processed.
    size_t drain(World& world) {
        size_t steps = 0;
        while (config_.max_drain_steps == 0 || steps < config_.max_drain_steps) {
            if (!step(world)) return steps;
            ++steps;
        }
        if (!queue_.empty()) {
            std::cerr << "[scheduler] Drain stopped after " << steps
                      << " steps with " << queue_.size() << " epochs pending\n";
        }
        return steps;
    }

    // Subscribe to fully processed events of type T. T does not need any
    // handlers: with none registered every sent T is simply broadcast.
    template<typename T>
    Observer<T> observe() {
        return entry<T>().observe();
    }

    bool is_empty() const { return queue_.empty(); }
    size_t pending_epochs() const { return queue_.size(); }

    template<typename T>
    size_t handler_count() const {
        auto it = handlers_.find(type_key<T>());
        if (it == handlers_.end()) return 0;
        return it->second->handler_count();
    }

    template<typename T>
    bool has_entry() const {
        return handlers_.find(type_key<T>()) != handlers_.end();
    }

    // Drop every pending epoch. Handlers and observers are kept.
    void clear() {
        queue_.clear();
        sender_.clear();
    }

    const SchedulerConfig& config() const { return config_; }

private:
    template<typename T>
    HandlerSet<T, World>& entry() {
        auto& slot = handlers_[type_key<T>()];
        if (!slot) slot = std::make_unique<HandlerSet<T, World>>();
        return static_cast<HandlerSet<T, World>&>(*slot);
    }

    void dispatch(ScheduledEvent& scheduled, World& world) {
        auto it = handlers_.find(scheduled.key);
        if (it == handlers_.end()) {
            if (config_.trace_dispatch) {
                std::cerr << "[scheduler] Dropping event with no handlers: "
                          << scheduled.name << "\n";
            }
            return;
        }

        if (config_.trace_dispatch) {
            std::cerr << "[scheduler] Executing handlers for: "
                      << it->second->name() << "\n";
        }
        bool published = it->second->dispatch(*scheduled.event, world, sender_);
        if (!published && config_.trace_dispatch) {
            std::cerr << "[scheduler] Event cancelled: " << it->second->name() << "\n";
        }
    }

    void merge_staged() {
        // Immediate results share one epoch and run next.
        Epoch immediate = sender_.take_immediate();
        if (!immediate.empty()) {
            queue_.push_front(std::move(immediate));
        }
        for (auto& event : sender_.take_delayed()) {
            queue_.push_back(single_epoch(std::move(event)));
        }
    }

    SchedulerConfig config_;
    std::unordered_map<TypeKey, std::unique_ptr<HandlerSetBase<World>>> handlers_;
    std::deque<Epoch> queue_;
    Sender sender_;
};

} // namespace turnstile
