#pragma once
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace turnstile {

// Key-based event dispatch, no RTTI and no dynamic_cast.
// Any value type is an event. The key of T is the address of a static owned
// by type_key<T>(), unique per type within the program.

using TypeKey = const void*;

template<typename T>
TypeKey type_key() {
    static const char key = 0;
    return &key;
}

namespace detail {

// Pulls "T = <type>" out of a __PRETTY_FUNCTION__ / __FUNCSIG__ string.
// Returns an empty view when the layout is not recognised.
std::string_view extract_type_name(std::string_view signature);

template<typename T>
std::string_view pretty_type_name() {
#if defined(__clang__) || defined(__GNUC__)
    return extract_type_name(__PRETTY_FUNCTION__);
#elif defined(_MSC_VER)
    return extract_type_name(__FUNCSIG__);
#else
    return {};
#endif
}

template<typename T, typename = void>
struct has_tag : std::false_type {};

template<typename T>
struct has_tag<T, std::void_t<decltype(T::TAG)>> : std::true_type {};

} // namespace detail

// Human-readable name of an event type, for diagnostics only.
// Uses the type's TAG constant when it declares one.
template<typename T>
std::string_view event_name() {
    if constexpr (detail::has_tag<T>::value) {
        return T::TAG;
    } else {
        std::string_view name = detail::pretty_type_name<T>();
        return name.empty() ? std::string_view("event") : name;
    }
}

// ── Type-erased storage ─────────────────────────────────────────

struct ErasedEvent {
    virtual ~ErasedEvent() = default;
};

template<typename T>
struct BoxedEvent final : ErasedEvent {
    explicit BoxedEvent(T v) : value(std::move(v)) {}
    T value;
};

// An event waiting in the queue, boxed together with the key of its type.
// The key is the one the registry is indexed by, so the box can only ever
// reach the handler set of its own type.
struct ScheduledEvent {
    TypeKey key = nullptr;
    std::string_view name;
    std::unique_ptr<ErasedEvent> event;
};

// Events that run together within one step().
using Epoch = std::vector<ScheduledEvent>;

template<typename T>
ScheduledEvent make_scheduled(T event) {
    return ScheduledEvent{type_key<T>(), event_name<T>(),
                          std::make_unique<BoxedEvent<T>>(std::move(event))};
}

// Epoch holding just one event.
Epoch single_epoch(ScheduledEvent event);

} // namespace turnstile
