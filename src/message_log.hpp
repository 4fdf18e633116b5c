#pragma once
#include "common.hpp"

#include <string>
#include <vector>

struct Message {
    std::string text;
    Color color = colors::White;
};

// Ordered narration of everything that happened, newest last.
// Bounded scrollback: once it grows past MAX_LINES the oldest TRIM_LINES are dropped.
class MessageLog {
public:
    static constexpr size_t MAX_LINES = 400;
    static constexpr size_t TRIM_LINES = 100;

    void add(std::string text, Color color = colors::White);

    const std::vector<Message>& messages() const { return msgs; }
    size_t size() const { return msgs.size(); }
    bool empty() const { return msgs.empty(); }
    const Message& back() const { return msgs.back(); }

    // Counts lines whose text matches exactly.
    size_t count(const std::string& text) const;

    void clear() { msgs.clear(); }

private:
    std::vector<Message> msgs;
};
