#include "sudoku/ui/Strings.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <utility>

#include "sudoku/app/AssetFS.hpp"

namespace sudoku::ui {

const char* LanguageCode(Language language) noexcept {
    switch (language) {
        case Language::Polish:
            return "pol_PL";
        case Language::English:
            return "eng_EN";
        case Language::Norwegian:
            return "nor_NO";
        case Language::Spanish:
            return "spa_ES";
    }
    return "eng_EN";
}

std::optional<Language> ParseLanguage(const std::string& code) {
    for (Language language : kLanguages) {
        if (code == LanguageCode(language)) {
            return language;
        }
    }
    return std::nullopt;
}

Language NextLanguage(Language language) noexcept {
    auto it = std::find(kLanguages.begin(), kLanguages.end(), language);
    if (it == kLanguages.end() || ++it == kLanguages.end()) {
        return kLanguages.front();
    }
    return *it;
}

Strings::Strings(Language language, std::map<std::string, std::string> table)
    : language_(language), table_(std::move(table)) {}

Strings Strings::FromJson(Language language, const core::Json& json) {
    std::map<std::string, std::string> table;
    if (json.is_object()) {
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it.value().is_string()) {
                table[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return Strings(language, std::move(table));
}

Strings Strings::Load(Language language) {
    const std::string filename = std::string("languages/") + LanguageCode(language) + ".json";
    const auto path = sudoku::app::AssetPath(filename);
    std::ifstream in(path);
    if (!in) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Language file %s not found",
                    filename.c_str());
        return Strings(language, {});
    }
    try {
        core::Json json = core::Json::parse(in);
        return FromJson(language, json);
    } catch (const std::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Invalid language file %s: %s",
                    path.string().c_str(), ex.what());
        return Strings(language, {});
    }
}

std::string Strings::get(const std::string& key) const {
    auto it = table_.find(key);
    if (it != table_.end()) {
        return it->second;
    }
    if (reported_missing_.insert(key).second) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Missing %s string: %s",
                    LanguageCode(language_), key.c_str());
    }
    return key;
}

}  // namespace sudoku::ui
