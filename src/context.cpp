#include "context.hpp"

namespace turnstile {

Epoch Sender::take_immediate() {
    Epoch epoch;
    epoch.swap(immediate_);
    return epoch;
}

std::vector<ScheduledEvent> Sender::take_delayed() {
    std::vector<ScheduledEvent> events;
    events.swap(delayed_);
    return events;
}

void Sender::clear() {
    immediate_.clear();
    delayed_.clear();
}

bool Sender::empty() const {
    return immediate_.empty() && delayed_.empty();
}

} // namespace turnstile
