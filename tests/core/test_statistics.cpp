#include <cassert>
#include <iostream>

#include "sudoku/core/GameClock.hpp"
#include "sudoku/core/Statistics.hpp"

using namespace sudoku::core;

namespace {

void TestRecord() {
    Statistics stats;
    assert(!stats.get(Difficulty::Easy).hasBest());
    assert(stats.get(Difficulty::Easy).averageMs() == 0);

    assert(stats.record(Difficulty::Easy, 120000));
    assert(!stats.record(Difficulty::Easy, 180000));
    assert(stats.record(Difficulty::Easy, 90000));

    const auto& easy = stats.get(Difficulty::Easy);
    assert(easy.games == 3);
    assert(easy.best_ms == 90000);
    assert(easy.total_ms == 390000);
    assert(easy.averageMs() == 130000);

    // Other difficulties are untouched.
    assert(stats.get(Difficulty::Hard).games == 0);

    stats.reset();
    assert(stats == Statistics{});
}

void TestJson() {
    Statistics stats;
    stats.record(Difficulty::Medium, 61000);
    stats.record(Difficulty::Medium, 59000);

    Json json = stats.ToJson();
    assert(json["medium"]["games"] == 2);
    assert(json["medium"]["best_ms"] == 59000);
    assert(json["medium"]["average_ms"] == 60000);
    assert(json["easy"]["games"] == 0);

    assert(Statistics::Deserialize(stats.Serialize()) == stats);
}

void TestLenientJson() {
    // Average without total, negative counts and junk are tolerated.
    auto stats = Statistics::Deserialize(R"({
        "easy": {"games": 2, "best_ms": 1000, "average_ms": 1500},
        "hard": {"games": -4, "best_ms": 7},
        "expert": "nonsense"
    })");
    assert(stats.get(Difficulty::Easy).total_ms == 3000);
    assert(stats.get(Difficulty::Easy).averageMs() == 1500);
    assert(stats.get(Difficulty::Hard).games == 0);
    assert(stats.get(Difficulty::Hard).best_ms == 0);
    assert(stats.get(Difficulty::Expert).games == 0);

    assert(Statistics::FromJson(Json::array()) == Statistics{});
}

void TestGameClock() {
    std::uint64_t now = 1000;
    GameClock clock([&now] { return now; });
    assert(clock.elapsedMs() == 0);

    clock.start();
    now += 1500;
    assert(clock.elapsedMs() == 1500);

    clock.pause();
    now += 10000;
    assert(clock.elapsedMs() == 1500);

    clock.start();
    now += 500;
    assert(clock.elapsedMs() == 2000);

    clock.reset(60000);
    assert(!clock.running());
    assert(clock.elapsedMs() == 60000);
}

void TestFormatDuration() {
    assert(FormatDuration(0) == "00:00");
    assert(FormatDuration(59999) == "00:59");
    assert(FormatDuration(61000) == "01:01");
    assert(FormatDuration(100ull * 60 * 1000 + 5000) == "100:05");
}

}  // namespace

int main() {
    TestRecord();
    TestJson();
    TestLenientJson();
    TestGameClock();
    TestFormatDuration();
    std::cout << "All statistics tests passed.\n";
    return 0;
}
