#include "sudoku/core/Statistics.hpp"

#include <algorithm>

namespace sudoku::core {

std::uint64_t DifficultyStats::averageMs() const noexcept {
    if (games <= 0) {
        return 0;
    }
    return total_ms / static_cast<std::uint64_t>(games);
}

bool Statistics::record(Difficulty difficulty, std::uint64_t time_ms) {
    auto& entry = entries_[DifficultyIndex(difficulty)];
    const bool new_record = !entry.hasBest() || time_ms < entry.best_ms;
    entry.best_ms = entry.hasBest() ? std::min(entry.best_ms, time_ms) : time_ms;
    entry.total_ms += time_ms;
    ++entry.games;
    return new_record;
}

void Statistics::reset() noexcept {
    entries_.fill(DifficultyStats{});
}

Json Statistics::ToJson() const {
    Json json = Json::object();
    for (Difficulty difficulty : kDifficulties) {
        const auto& entry = get(difficulty);
        Json item;
        item["games"] = entry.games;
        item["best_ms"] = entry.best_ms;
        item["average_ms"] = entry.averageMs();
        item["total_ms"] = entry.total_ms;
        json[ToString(difficulty)] = item;
    }
    return json;
}

Statistics Statistics::FromJson(const Json& json) {
    Statistics stats;
    if (!json.is_object()) {
        return stats;
    }
    for (Difficulty difficulty : kDifficulties) {
        const char* key = ToString(difficulty);
        if (!json.contains(key) || !json[key].is_object()) {
            continue;
        }
        const Json& item = json[key];
        DifficultyStats entry;
        entry.games = std::max(0, item.value("games", 0));
        entry.best_ms = item.value("best_ms", std::uint64_t{0});
        if (item.contains("total_ms")) {
            entry.total_ms = item["total_ms"].get<std::uint64_t>();
        } else {
            // Hand-edited files may carry only the average.
            entry.total_ms = item.value("average_ms", std::uint64_t{0}) *
                             static_cast<std::uint64_t>(entry.games);
        }
        if (entry.games == 0) {
            entry = DifficultyStats{};
        }
        stats.entries_[DifficultyIndex(difficulty)] = entry;
    }
    return stats;
}

std::string Statistics::Serialize() const {
    return ToJson().dump();
}

Statistics Statistics::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

bool Statistics::operator==(const Statistics& other) const noexcept {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& a = entries_[i];
        const auto& b = other.entries_[i];
        if (a.games != b.games || a.best_ms != b.best_ms || a.total_ms != b.total_ms) {
            return false;
        }
    }
    return true;
}

}  // namespace sudoku::core
