#pragma once
#include "context.hpp"
#include "event.hpp"
#include "event_result.hpp"
#include "handler.hpp"
#include "observer.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace turnstile {

// Registry entry as seen by the scheduler: everything it needs without
// knowing the event type.
template<typename World>
class HandlerSetBase {
public:
    virtual ~HandlerSetBase() = default;

    // Runs the handler chain for one boxed event of this set's type.
    // Returns false when a handler broke the chain.
    virtual bool dispatch(ErasedEvent& event, World& world, Sender& sender) = 0;

    virtual size_t handler_count() const = 0;
    virtual std::string_view name() const = 0;
};

// Priority-ordered handler chain for event type T, plus the log fully
// processed T events are published to.
template<typename T, typename World>
class HandlerSet final : public HandlerSetBase<World> {
public:
    // Lower priority runs first; equal priorities keep registration order.
    void add_handler(EventHandler<T, World> handler, int32_t priority) {
        handlers_.push_back(Entry{priority, std::move(handler)});
        std::stable_sort(handlers_.begin(), handlers_.end(),
                         [](const Entry& a, const Entry& b) {
                             return a.priority < b.priority;
                         });
    }

    Observer<T> observe() { return observable_.subscribe(); }

    bool dispatch(ErasedEvent& erased, World& world, Sender& sender) override {
        // Keyed by type_key<T>(), so the box always holds a T.
        T& event = static_cast<BoxedEvent<T>&>(erased).value;
        SchedulerContext cx(sender);

        for (const auto& entry : handlers_) {
            switch (entry.handler(event, world, cx)) {
                case EventResult::Ok:
                    break;
                case EventResult::Continue:
                    continue;
                case EventResult::Break:
                    return false;
            }
        }
        observable_.push(std::move(event));
        return true;
    }

    size_t handler_count() const override { return handlers_.size(); }
    std::string_view name() const override { return event_name<T>(); }

private:
    struct Entry {
        int32_t priority;
        EventHandler<T, World> handler;
    };

    std::vector<Entry> handlers_;
    ObservableQueue<T> observable_;
};

} // namespace turnstile
