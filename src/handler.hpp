#pragma once
#include "context.hpp"
#include "event_result.hpp"
#include <functional>
#include <type_traits>
#include <utility>

namespace turnstile {

// Canonical form every registered handler is adapted into.
template<typename T, typename World>
using EventHandler = std::function<EventResult(T&, World&, SchedulerContext&)>;

namespace detail {

template<typename...>
struct always_false : std::false_type {};

template<typename First, typename...>
struct first_arg {
    using type = First;
};

// Signature introspection for plain functions, function pointers and
// objects with a single non-template call operator.
template<typename F>
struct callable_traits : callable_traits<decltype(&F::operator())> {};

template<typename R, typename... Args>
struct callable_traits<R(Args...)> {
    static_assert(sizeof...(Args) > 0, "handler must take the event as its first parameter");
    using event_arg = typename first_arg<Args...>::type;
};

template<typename R, typename... Args>
struct callable_traits<R(Args...) noexcept> : callable_traits<R(Args...)> {};

template<typename R, typename... Args>
struct callable_traits<R (*)(Args...)> : callable_traits<R(Args...)> {};

template<typename R, typename... Args>
struct callable_traits<R (*)(Args...) noexcept> : callable_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) noexcept> : callable_traits<R(Args...)> {};

template<typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const noexcept> : callable_traits<R(Args...)> {};

// Marks "take the event type from the handler's signature".
struct Inferred {};

template<typename T, typename F>
struct resolve_event {
    using type = T;
};

template<typename F>
struct resolve_event<Inferred, F> {
    using type = std::remove_cv_t<std::remove_reference_t<
        typename callable_traits<std::decay_t<F>>::event_arg>>;
};

} // namespace detail

// Event type handled by F: its first parameter with references and cv dropped.
template<typename F>
using handler_event_t = typename detail::resolve_event<detail::Inferred, F>::type;

// Wraps any of the four accepted handler shapes into an EventHandler:
//   f(T&)
//   f(T&, World&)
//   f(T&, SchedulerContext&)
//   f(T&, World&, SchedulerContext&)
// each returning EventResult.
//
// Shapes are tried in that order. Generic lambdas may take the event as
// `auto&`, but any SchedulerContext parameter must be written out: a trailing
// `auto&` is instantiated with World& first, which fails inside the body
// rather than falling through to the next shape.
template<typename T, typename World, typename F>
EventHandler<T, World> make_handler(F f) {
    if constexpr (std::is_invocable_r_v<EventResult, F&, T&>) {
        return [f = std::move(f)](T& event, World&, SchedulerContext&) mutable {
            return f(event);
        };
    } else if constexpr (std::is_invocable_r_v<EventResult, F&, T&, World&>) {
        return [f = std::move(f)](T& event, World& world, SchedulerContext&) mutable {
            return f(event, world);
        };
    } else if constexpr (std::is_invocable_r_v<EventResult, F&, T&, SchedulerContext&>) {
        return [f = std::move(f)](T& event, World&, SchedulerContext& cx) mutable {
            return f(event, cx);
        };
    } else if constexpr (std::is_invocable_r_v<EventResult, F&, T&, World&, SchedulerContext&>) {
        return f;
    } else {
        static_assert(detail::always_false<F>::value,
                      "handler must be callable as f(T&), f(T&, World&), "
                      "f(T&, SchedulerContext&) or f(T&, World&, SchedulerContext&) "
                      "and return EventResult");
        return {};
    }
}

} // namespace turnstile
