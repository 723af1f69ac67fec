#include "sudoku/core/SavedGame.hpp"

#include <stdexcept>

namespace sudoku::core {

namespace {

Json PositionToJson(const Position& pos) {
    return Json::array({pos.row, pos.col});
}

Position PositionFromJson(const Json& json) {
    if (!json.is_array() || json.size() != 2) {
        throw std::runtime_error("saved game: position must be [row, col]");
    }
    Position pos{json[0].get<int>(), json[1].get<int>()};
    if (!InGrid(pos)) {
        throw std::runtime_error("saved game: position out of range");
    }
    return pos;
}

int CheckedValue(const Json& json) {
    const int value = json.get<int>();
    if (value != kEmptyValue && !IsDigit(value)) {
        throw std::runtime_error("saved game: value out of range");
    }
    return value;
}

NoteMask CheckedNotes(const Json& json) {
    const int notes = json.get<int>();
    if (notes < 0 || notes > kAllNotes) {
        throw std::runtime_error("saved game: notes out of range");
    }
    return static_cast<NoteMask>(notes);
}

Json MoveToJson(const Move& move) {
    Json json;
    json["pos"] = PositionToJson(move.position);
    json["prev_value"] = move.prev_value;
    json["new_value"] = move.new_value;
    json["prev_notes"] = move.prev_notes;
    json["new_notes"] = move.new_notes;
    Json peers = Json::array();
    for (const auto& peer : move.cleared_peer_notes) {
        peers.push_back(PositionToJson(peer));
    }
    json["cleared_peer_notes"] = peers;
    return json;
}

Move MoveFromJson(const Json& json) {
    Move move;
    move.position = PositionFromJson(json.at("pos"));
    move.prev_value = CheckedValue(json.at("prev_value"));
    move.new_value = CheckedValue(json.at("new_value"));
    move.prev_notes = CheckedNotes(json.at("prev_notes"));
    move.new_notes = CheckedNotes(json.at("new_notes"));
    if (json.contains("cleared_peer_notes")) {
        for (const auto& peer : json["cleared_peer_notes"]) {
            move.cleared_peer_notes.push_back(PositionFromJson(peer));
        }
    }
    return move;
}

// Walks the history back from the newest move. Each move must find its cell
// exactly as it left it, and undoing it must never touch a clue.
void CheckHistory(Board board, const std::vector<Move>& history) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        const Cell& target = board.cell(it->position);
        if (target.value != it->new_value || target.notes != it->new_notes) {
            throw std::runtime_error("saved game: history does not match the board");
        }
        if (it->prev_value != kEmptyValue && it->prev_notes != 0) {
            throw std::runtime_error("saved game: history holds notes on a filled cell");
        }
        if (Revert(board, *it) != MoveStatus::Ok) {
            throw std::runtime_error("saved game: history touches a clue");
        }
    }
}

}  // namespace

Json SavedGame::ToJson() const {
    Json json;
    json["version"] = version;
    json["difficulty"] = ToString(difficulty);
    json["elapsed_ms"] = elapsed_ms;
    json["notes_mode"] = notes_mode;
    json["selected"] = PositionToJson(selected);

    std::string fixed;
    Json notes = Json::array();
    for (const auto& cell : board.cells()) {
        fixed.push_back(cell.fixed ? '1' : '0');
        notes.push_back(cell.notes);
    }
    json["values"] = ToString(board);
    json["fixed"] = fixed;
    json["notes"] = notes;

    Json moves = Json::array();
    for (const auto& move : history) {
        moves.push_back(MoveToJson(move));
    }
    json["history"] = moves;
    return json;
}

SavedGame SavedGame::FromJson(const Json& json) {
    SavedGame game;
    game.version = json.value("version", kVersion);
    if (game.version > kVersion) {
        throw std::runtime_error("saved game: unsupported version " +
                                 std::to_string(game.version));
    }
    auto difficulty = ParseDifficulty(json.value("difficulty", std::string{}));
    if (!difficulty) {
        throw std::runtime_error("saved game: unknown difficulty");
    }
    game.difficulty = *difficulty;
    game.elapsed_ms = json.value("elapsed_ms", std::uint64_t{0});
    game.notes_mode = json.value("notes_mode", false);
    if (json.contains("selected")) {
        const Json& selected = json["selected"];
        if (selected.is_array() && selected.size() == 2 && selected[0].get<int>() >= 0) {
            game.selected = PositionFromJson(selected);
        }
    }

    auto board = ParseBoard(json.at("values").get<std::string>(), false);
    if (!board) {
        throw std::runtime_error("saved game: values must hold 81 cells");
    }
    game.board = *board;

    const auto fixed = json.at("fixed").get<std::string>();
    const Json& notes = json.at("notes");
    if (fixed.size() != kCellCount || !notes.is_array() || notes.size() != kCellCount) {
        throw std::runtime_error("saved game: fixed/notes must hold 81 cells");
    }
    for (int i = 0; i < kCellCount; ++i) {
        Cell& cell = game.board.cell(i / kGridSize, i % kGridSize);
        cell.fixed = fixed[static_cast<std::size_t>(i)] == '1';
        cell.notes = CheckedNotes(notes[static_cast<std::size_t>(i)]);
        if (cell.fixed && cell.value == kEmptyValue) {
            throw std::runtime_error("saved game: empty clue");
        }
        if (cell.value != kEmptyValue && cell.notes != 0) {
            throw std::runtime_error("saved game: notes on a filled cell");
        }
    }

    if (json.contains("history")) {
        for (const auto& move : json["history"]) {
            game.history.push_back(MoveFromJson(move));
        }
    }
    CheckHistory(game.board, game.history);
    return game;
}

std::string SavedGame::Serialize() const {
    return ToJson().dump();
}

SavedGame SavedGame::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

std::vector<std::uint8_t> SavedGame::SerializeBinary() const {
    return Json::to_msgpack(ToJson());
}

SavedGame SavedGame::DeserializeBinary(const std::vector<std::uint8_t>& bytes) {
    auto json = Json::from_msgpack(bytes);
    return FromJson(json);
}

}  // namespace sudoku::core
