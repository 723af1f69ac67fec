#include "sudoku/core/GameClock.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace sudoku::core {

ClockFn SteadyClock() {
    return [] {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
    };
}

GameClock::GameClock(ClockFn clock) : clock_(std::move(clock)) {}

void GameClock::reset(std::uint64_t elapsed_ms) {
    banked_ms_ = elapsed_ms;
    started_at_ = 0;
    running_ = false;
}

void GameClock::start() {
    if (running_) {
        return;
    }
    started_at_ = clock_();
    running_ = true;
}

void GameClock::pause() {
    if (!running_) {
        return;
    }
    banked_ms_ = elapsedMs();
    running_ = false;
}

std::uint64_t GameClock::elapsedMs() const {
    if (!running_) {
        return banked_ms_;
    }
    const std::uint64_t now = clock_();
    return banked_ms_ + (now >= started_at_ ? now - started_at_ : 0);
}

std::string FormatDuration(std::uint64_t ms) {
    const std::uint64_t total_seconds = ms / 1000;
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << total_seconds / 60 << ':' << std::setw(2)
        << std::setfill('0') << total_seconds % 60;
    return out.str();
}

}  // namespace sudoku::core
