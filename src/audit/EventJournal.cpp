#include "yieldcraft/audit/EventJournal.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "yieldcraft/io/JsonCodec.hpp"

using json = nlohmann::json;

namespace yieldcraft {

EventJournal::EventJournal(
    const std::string& path
) : path_(path) {
    out.open(
        path,
        std::ios::out |
        std::ios::app
    );
    if (!out.is_open()) {
        std::cerr << "[JOURNAL] Cannot open " << path << " for append\n";
    }
}

EventJournal::~EventJournal() {
    if (out.is_open()) {
        out.close();
    }
}

void EventJournal::append(
    const BookingEvent& event
) {
    if (!out.is_open()) {
        throw std::runtime_error("event journal not open: " + path_);
    }

    json j = event;
    out << j.dump() << '\n';
    out.flush();
    ++written_;
}

std::vector<BookingEvent> EventJournal::readAll(
    const std::string& path
) {
    std::vector<BookingEvent> events;
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[JOURNAL] " << path << " not found, starting with empty log\n";
        return events;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        try {
            events.push_back(json::parse(line).get<BookingEvent>());
        } catch (const std::exception& e) {
            throw std::runtime_error(
                path + ":" + std::to_string(line_no) + ": bad event record: " + e.what());
        }
    }
    return events;
}

}
