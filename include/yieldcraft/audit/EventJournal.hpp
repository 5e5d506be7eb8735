#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

#include "yieldcraft/core/Types.hpp"

namespace yieldcraft {

// Append-only booking log, one JSON object per line. Each record is flushed
// as it is written; existing lines are never rewritten.
class EventJournal {
public:
    explicit EventJournal(
        const std::string& path
    );

    ~EventJournal();

    EventJournal(const EventJournal&) = delete;
    EventJournal& operator=(const EventJournal&) = delete;

    bool isOpen() const { return out.is_open(); }
    const std::string& path() const { return path_; }
    size_t written() const { return written_; }

    void append(
        const BookingEvent& event
    );

    // Missing file reads as an empty log. Throws std::runtime_error on a malformed line.
    static std::vector<BookingEvent> readAll(
        const std::string& path
    );

private:
    std::string path_;
    std::ofstream out;
    size_t written_ = 0;
};

}
