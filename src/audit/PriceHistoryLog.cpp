#include "yieldcraft/audit/PriceHistoryLog.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "yieldcraft/io/JsonCodec.hpp"

using json = nlohmann::json;

namespace yieldcraft {

PriceHistoryLog::PriceHistoryLog(
    const std::string& path
) : path_(path) {
    out.open(
        path,
        std::ios::out |
        std::ios::app
    );
    if (!out.is_open()) {
        std::cerr << "[JOURNAL] Cannot open price history " << path << "\n";
    }
}

void PriceHistoryLog::append(
    const PriceHistoryRow& row
) {
    if (!out.is_open()) {
        throw std::runtime_error("price history not open: " + path_);
    }

    json j{
        {"unit_id", row.unit_id},
        {"recorded_at", formatTimestamp(row.recorded_at)},
        {"remaining_stock", row.remaining_stock},
        {"final_price", row.final_price},
        {"lead_days", row.lead_days ? json(*row.lead_days) : json(nullptr)}
    };
    out << j.dump() << '\n';
    out.flush();
    ++written_;
}

void PriceHistoryLog::record(
    const PricingResult& result,
    int remaining_stock,
    const Timestamp& recorded_at
) {
    PriceHistoryRow row;
    row.unit_id = result.unit_id;
    row.recorded_at = recorded_at;
    row.remaining_stock = remaining_stock;
    row.final_price = result.final_price;
    row.lead_days = result.lead_days;
    append(row);
}

std::vector<PriceHistoryRow> PriceHistoryLog::readAll(
    const std::string& path
) {
    std::vector<PriceHistoryRow> rows;
    std::ifstream in(path);
    if (!in.is_open()) {
        return rows;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        try {
            json j = json::parse(line);
            PriceHistoryRow row;
            row.unit_id = j.at("unit_id").get<uint64_t>();
            row.recorded_at = parseTimestamp(j.at("recorded_at").get<std::string>());
            row.remaining_stock = j.at("remaining_stock").get<int>();
            row.final_price = j.at("final_price").get<double>();
            if (j.contains("lead_days") && !j["lead_days"].is_null()) {
                row.lead_days = j["lead_days"].get<int>();
            }
            rows.push_back(row);
        } catch (const std::exception& e) {
            throw std::runtime_error(
                path + ":" + std::to_string(line_no) + ": bad price record: " + e.what());
        }
    }
    return rows;
}

}
