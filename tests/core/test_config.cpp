#include <cassert>
#include <iostream>

#include "sudoku/core/Difficulty.hpp"
#include "sudoku/core/GameConfig.hpp"

using namespace sudoku::core;

namespace {

void TestDefaults() {
    GameConfig config;
    assert(config.language == "eng_EN");
    assert(config.window_size[0] == 800 && config.window_size[1] == 600);
    assert(config.sound_on);
    assert(config.unique_solution);
    assert(config.auto_clear_notes);
    assert(config.max_attempts == 200);
    assert(config.clueCount(Difficulty::Easy) == 30);
    assert(config.clueCount(Difficulty::Medium) == 28);
    assert(config.clueCount(Difficulty::Hard) == 26);
    assert(config.clueCount(Difficulty::Expert) == 24);
}

void TestRoundTrip() {
    GameConfig config;
    config.language = "nor_NO";
    config.window_size = {{1024, 768}};
    config.sound_on = false;
    config.unique_solution = false;
    config.max_attempts = 50;
    config.auto_clear_notes = false;
    config.clues[DifficultyIndex(Difficulty::Hard)] = 22;

    GameConfig loaded = GameConfig::Deserialize(config.Serialize());
    assert(loaded.language == "nor_NO");
    assert(loaded.window_size[0] == 1024 && loaded.window_size[1] == 768);
    assert(!loaded.sound_on);
    assert(!loaded.unique_solution);
    assert(loaded.max_attempts == 50);
    assert(!loaded.auto_clear_notes);
    assert(loaded.clueCount(Difficulty::Hard) == 22);
    assert(loaded.clueCount(Difficulty::Easy) == 30);
}

void TestInvalidValuesFallBack() {
    GameConfig config = GameConfig::Deserialize(R"({
        "language": 5,
        "window_size": [640],
        "sound_on": "yes",
        "max_attempts": 0,
        "clues": {"easy": 3, "medium": 99, "hard": "many"}
    })");
    assert(config.language == "eng_EN");
    assert(config.window_size[0] == 800);
    assert(config.sound_on);
    assert(config.max_attempts == 1);
    assert(config.clueCount(Difficulty::Easy) == kMinClues);
    assert(config.clueCount(Difficulty::Medium) == kMaxClues);
    assert(config.clueCount(Difficulty::Hard) == 26);

    GameConfig from_array = GameConfig::FromJson(Json::array({1, 2}));
    assert(from_array.language == "eng_EN");
}

void TestHugeIntegersClamp() {
    GameConfig config = GameConfig::Deserialize(R"({
        "window_size": [4294967297, -4294967297],
        "max_attempts": 4294967297,
        "clues": {"easy": 4294967326, "hard": -4294967296}
    })");
    assert(config.window_size[0] == kMaxWindowSide);
    assert(config.window_size[1] == 1);
    assert(config.max_attempts == 10000);
    assert(config.clueCount(Difficulty::Easy) == kMaxClues);
    assert(config.clueCount(Difficulty::Hard) == kMinClues);

    config = GameConfig::Deserialize(R"({"max_attempts": 18446744073709551615})");
    assert(config.max_attempts == 10000);
}

void TestDifficultyNames() {
    for (Difficulty difficulty : kDifficulties) {
        auto parsed = ParseDifficulty(ToString(difficulty));
        assert(parsed.has_value() && *parsed == difficulty);
    }
    assert(!ParseDifficulty("impossible").has_value());
    assert(DefaultClueCount(Difficulty::Expert) == 24);
}

}  // namespace

int main() {
    TestDefaults();
    TestRoundTrip();
    TestInvalidValuesFallBack();
    TestHugeIntegersClamp();
    TestDifficultyNames();
    std::cout << "All config tests passed.\n";
    return 0;
}
