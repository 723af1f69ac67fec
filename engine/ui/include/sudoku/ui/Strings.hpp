#pragma once

#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "sudoku/core/Json.hpp"

namespace sudoku::ui {

enum class Language { Polish, English, Norwegian, Spanish };

// Order of the menu's language button.
inline constexpr std::array<Language, 4> kLanguages{
    {Language::Polish, Language::English, Language::Norwegian, Language::Spanish}};

const char* LanguageCode(Language language) noexcept;
std::optional<Language> ParseLanguage(const std::string& code);
Language NextLanguage(Language language) noexcept;

// UI text for one language. Lookups of unknown keys return the key itself.
class Strings {
public:
    Strings() = default;
    Strings(Language language, std::map<std::string, std::string> table);

    static Strings FromJson(Language language, const core::Json& json);
    // Reads assets/languages/<code>.json; an unreadable file gives an empty table.
    static Strings Load(Language language);

    Language language() const noexcept { return language_; }
    bool empty() const noexcept { return table_.empty(); }
    bool contains(const std::string& key) const { return table_.count(key) != 0; }

    std::string get(const std::string& key) const;

private:
    Language language_ = Language::English;
    std::map<std::string, std::string> table_;
    mutable std::set<std::string> reported_missing_;
};

}  // namespace sudoku::ui
