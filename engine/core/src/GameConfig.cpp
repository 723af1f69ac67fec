#include "sudoku/core/GameConfig.hpp"

#include <algorithm>
#include <cstdint>

namespace sudoku::core {

namespace {

// Clamps before narrowing so out-of-range integers cannot wrap.
int ClampedInt(const Json& json, int lo, int hi) {
    if (json.is_number_unsigned()) {
        const std::uint64_t value = json.get<std::uint64_t>();
        return value > static_cast<std::uint64_t>(hi) ? hi : std::max(lo, static_cast<int>(value));
    }
    return static_cast<int>(std::clamp<std::int64_t>(json.get<std::int64_t>(), lo, hi));
}

}  // namespace

Json GameConfig::ToJson() const {
    Json json;
    json["language"] = language;
    json["window_size"] = {window_size[0], window_size[1]};
    json["sound_on"] = sound_on;
    json["unique_solution"] = unique_solution;
    json["max_attempts"] = max_attempts;
    json["auto_clear_notes"] = auto_clear_notes;
    Json clue_json = Json::object();
    for (Difficulty difficulty : kDifficulties) {
        clue_json[ToString(difficulty)] = clueCount(difficulty);
    }
    json["clues"] = clue_json;
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (!json.is_object()) {
        return config;
    }
    if (json.contains("language") && json["language"].is_string()) {
        config.language = json["language"].get<std::string>();
    }
    if (json.contains("window_size") && json["window_size"].is_array() &&
        json["window_size"].size() == 2 && json["window_size"][0].is_number_integer() &&
        json["window_size"][1].is_number_integer()) {
        config.window_size[0] = ClampedInt(json["window_size"][0], 1, kMaxWindowSide);
        config.window_size[1] = ClampedInt(json["window_size"][1], 1, kMaxWindowSide);
    }
    if (json.contains("sound_on") && json["sound_on"].is_boolean()) {
        config.sound_on = json["sound_on"].get<bool>();
    }
    if (json.contains("unique_solution") && json["unique_solution"].is_boolean()) {
        config.unique_solution = json["unique_solution"].get<bool>();
    }
    if (json.contains("max_attempts") && json["max_attempts"].is_number_integer()) {
        config.max_attempts = ClampedInt(json["max_attempts"], 1, 10000);
    }
    if (json.contains("auto_clear_notes") && json["auto_clear_notes"].is_boolean()) {
        config.auto_clear_notes = json["auto_clear_notes"].get<bool>();
    }
    if (json.contains("clues") && json["clues"].is_object()) {
        const Json& clue_json = json["clues"];
        for (Difficulty difficulty : kDifficulties) {
            const char* key = ToString(difficulty);
            if (clue_json.contains(key) && clue_json[key].is_number_integer()) {
                config.clues[DifficultyIndex(difficulty)] =
                    ClampedInt(clue_json[key], kMinClues, kMaxClues);
            }
        }
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(2);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace sudoku::core
