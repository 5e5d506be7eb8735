#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "yieldcraft/pricing/PricingCalculator.hpp"

namespace yieldcraft {

struct PriceHistoryRow {
    uint64_t unit_id = 0;
    Timestamp recorded_at;
    int remaining_stock = 0;
    double final_price = 0.0;
    std::optional<int> lead_days;
};

// Price snapshots written after each pricing pass, one JSON object per line.
class PriceHistoryLog {
public:
    explicit PriceHistoryLog(
        const std::string& path
    );

    PriceHistoryLog(const PriceHistoryLog&) = delete;
    PriceHistoryLog& operator=(const PriceHistoryLog&) = delete;

    bool isOpen() const { return out.is_open(); }
    size_t written() const { return written_; }

    void append(
        const PriceHistoryRow& row
    );

    void record(
        const PricingResult& result,
        int remaining_stock,
        const Timestamp& recorded_at
    );

    static std::vector<PriceHistoryRow> readAll(
        const std::string& path
    );

private:
    std::string path_;
    std::ofstream out;
    size_t written_ = 0;
};

}
