#include "message_log.hpp"

#include <algorithm>
#include <utility>

void MessageLog::add(std::string text, Color color) {
    // Keep some scrollback
    if (msgs.size() >= MAX_LINES) {
        msgs.erase(msgs.begin(), msgs.begin() + static_cast<std::ptrdiff_t>(TRIM_LINES));
    }
    msgs.push_back({std::move(text), color});
}

size_t MessageLog::count(const std::string& text) const {
    return static_cast<size_t>(std::count_if(msgs.begin(), msgs.end(),
        [&](const Message& m) { return m.text == text; }));
}
