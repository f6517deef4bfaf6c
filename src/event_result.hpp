#pragma once

namespace turnstile {

// Outcome of a single handler invocation.
// Ok and Continue both move on to the next handler in the chain; Continue
// only signals that the handler declined to act.
// Break stops the chain and keeps the event out of the observable log.
enum class EventResult {
    Ok,
    Continue,
    Break,
};

const char* to_string(EventResult result);

} // namespace turnstile
