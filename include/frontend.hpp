#pragma once

#include "system.hpp"
#include <SDL2/SDL.h>
#include <cstdint>
#include <string>

/**
 * SDL2 host window. Draws the System's frame letterboxed at 256:240,
 * feeds keyboard state to controller 1 and paces to the NTSC field rate.
 *
 * Keys: Ctrl+R soft reset, P pause, Escape quit.
 */
class Frontend {
public:
    explicit Frontend(int scale);
    ~Frontend();

    Frontend(const Frontend&) = delete;
    Frontend& operator=(const Frontend&) = delete;

    // Initialize SDL (video, timer)
    bool init();

    // Run until the window is closed. CpuFault propagates to the caller.
    void run(System& system, const std::string& rom_name);

private:
    int scale;
    SDL_Window* window;
    SDL_Renderer* renderer;
    SDL_Texture* texture;
    bool paused;
    System::RgbFrame rgb;

    // False once the window is closed or Escape is pressed
    bool handle_events(System& system);
    void update_title(const std::string& rom_name, double fps);

    uint8_t read_buttons() const;
    SDL_Rect letterbox() const;
    void present(const System& system);

    void cleanup();
};
