#include "event_result.hpp"

namespace turnstile {

const char* to_string(EventResult result) {
    switch (result) {
        case EventResult::Ok:       return "Ok";
        case EventResult::Continue: return "Continue";
        case EventResult::Break:    return "Break";
    }
    return "Unknown";
}

} // namespace turnstile
