#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace sudoku::core {

// Milliseconds from an arbitrary monotonic origin.
using ClockFn = std::function<std::uint64_t()>;

ClockFn SteadyClock();

// Play time that only advances while running.
class GameClock {
public:
    explicit GameClock(ClockFn clock = SteadyClock());

    void reset(std::uint64_t elapsed_ms = 0);
    void start();
    void pause();

    bool running() const noexcept { return running_; }
    std::uint64_t elapsedMs() const;

private:
    ClockFn clock_;
    std::uint64_t banked_ms_ = 0;
    std::uint64_t started_at_ = 0;
    bool running_ = false;
};

// MM:SS; minutes keep growing past 99.
std::string FormatDuration(std::uint64_t ms);

}  // namespace sudoku::core
