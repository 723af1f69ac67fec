#pragma once

#include <SDL2/SDL_mixer.h>

#include <string>

namespace sudoku::platform {

class AudioSystem {
public:
    AudioSystem() = default;
    ~AudioSystem();

    AudioSystem(const AudioSystem&) = delete;
    AudioSystem& operator=(const AudioSystem&) = delete;

    bool Initialize();
    void Shutdown();

    bool initialized() const noexcept { return initialized_; }
    void SetMuted(bool muted) noexcept { muted_ = muted; }
    bool muted() const noexcept { return muted_; }

    void PlayClick() const;
    void PlayError() const;
    void PlayWin() const;

private:
    static void FreeChunk(Mix_Chunk*& chunk);
    void Play(Mix_Chunk* chunk) const;

    Mix_Chunk* LoadChunk(const std::string& filename);

    bool initialized_ = false;
    bool muted_ = false;
    Mix_Chunk* click_ = nullptr;
    Mix_Chunk* error_ = nullptr;
    Mix_Chunk* win_ = nullptr;
};

}  // namespace sudoku::platform
