#include "event.hpp"

namespace turnstile {

namespace detail {

std::string_view extract_type_name(std::string_view signature) {
    // gcc:   "... pretty_type_name() [with T = Attack; std::string_view = ...]"
    // clang: "... pretty_type_name() [T = Attack]"
    // msvc:  "... pretty_type_name<struct Attack>(void)"
    constexpr std::string_view marker = "T = ";
    size_t start = signature.find(marker);
    if (start != std::string_view::npos) {
        start += marker.size();
        // The name may itself contain ';' or ']' (arrays, lambdas), so only
        // stop at one that is outside every bracket opened after the marker.
        int depth = 0;
        for (size_t i = start; i < signature.size(); i++) {
            char c = signature[i];
            if (c == '<' || c == '(' || c == '[') {
                depth++;
            } else if ((c == '>' || c == ')') && depth > 0) {
                depth--;
            } else if (c == ']') {
                if (depth == 0) return signature.substr(start, i - start);
                depth--;
            } else if (c == ';' && depth == 0) {
                return signature.substr(start, i - start);
            }
        }
        return {};
    }

    constexpr std::string_view open = "pretty_type_name<";
    start = signature.find(open);
    if (start == std::string_view::npos) return {};
    start += open.size();
    size_t end = signature.rfind(">(");
    if (end == std::string_view::npos || end <= start) return {};
    std::string_view name = signature.substr(start, end - start);
    for (std::string_view prefix : {"struct ", "class ", "enum ", "union "}) {
        if (name.substr(0, prefix.size()) == prefix) {
            name.remove_prefix(prefix.size());
            break;
        }
    }
    return name;
}

} // namespace detail

Epoch single_epoch(ScheduledEvent event) {
    Epoch epoch;
    epoch.push_back(std::move(event));
    return epoch;
}

} // namespace turnstile
