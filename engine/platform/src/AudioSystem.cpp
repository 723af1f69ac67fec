#include "sudoku/platform/AudioSystem.hpp"

#include <SDL2/SDL.h>

#include "sudoku/app/AssetFS.hpp"

namespace sudoku::platform {

AudioSystem::~AudioSystem() {
    Shutdown();
}

bool AudioSystem::Initialize() {
    if (initialized_) {
        return true;
    }
    // WAV needs no decoder library, so Mix_Init is skipped.
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        return false;
    }
    Mix_AllocateChannels(8);
    Mix_Volume(-1, static_cast<int>(MIX_MAX_VOLUME * 0.8f));

    click_ = LoadChunk("click.wav");
    error_ = LoadChunk("error.wav");
    win_ = LoadChunk("win.wav");

    initialized_ = true;
    return true;
}

void AudioSystem::Shutdown() {
    if (!initialized_) {
        return;
    }
    FreeChunk(click_);
    FreeChunk(error_);
    FreeChunk(win_);
    Mix_CloseAudio();
    initialized_ = false;
}

void AudioSystem::PlayClick() const {
    Play(click_);
}

void AudioSystem::PlayError() const {
    Play(error_);
}

void AudioSystem::PlayWin() const {
    Play(win_);
}

void AudioSystem::FreeChunk(Mix_Chunk*& chunk) {
    if (chunk) {
        Mix_FreeChunk(chunk);
        chunk = nullptr;
    }
}

void AudioSystem::Play(Mix_Chunk* chunk) const {
    if (!chunk || muted_) {
        return;
    }
    if (Mix_PlayChannel(-1, chunk, 0) < 0) {
        SDL_LogDebug(SDL_LOG_CATEGORY_AUDIO, "Mix_PlayChannel failed: %s", Mix_GetError());
    }
}

Mix_Chunk* AudioSystem::LoadChunk(const std::string& filename) {
    std::filesystem::path path = sudoku::app::AssetPath("sounds/" + filename);
    if (!sudoku::app::FileExists(path)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Sound %s not found", filename.c_str());
        return nullptr;
    }
    Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str());
    if (!chunk) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to load %s: %s", filename.c_str(),
                    Mix_GetError());
    }
    return chunk;
}

}  // namespace sudoku::platform
