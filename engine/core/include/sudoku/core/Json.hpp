#pragma once

#include <nlohmann/json.hpp>

namespace sudoku::core {

using Json = nlohmann::json;

}  // namespace sudoku::core
