#include "frontend.hpp"
#include "system.hpp"
#include "controller.hpp"
#include "ppu.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <thread>

namespace {

struct KeyBinding {
    SDL_Scancode key;
    uint8_t button;
};

// Arrows/X/Z/Q/E, with WASD/K/J and Enter/Space/Shift as alternates
const KeyBinding key_bindings[] = {
    {SDL_SCANCODE_UP, Controller::UP},         {SDL_SCANCODE_W, Controller::UP},
    {SDL_SCANCODE_DOWN, Controller::DOWN},     {SDL_SCANCODE_S, Controller::DOWN},
    {SDL_SCANCODE_LEFT, Controller::LEFT},     {SDL_SCANCODE_A, Controller::LEFT},
    {SDL_SCANCODE_RIGHT, Controller::RIGHT},   {SDL_SCANCODE_D, Controller::RIGHT},
    {SDL_SCANCODE_X, Controller::A},           {SDL_SCANCODE_K, Controller::A},
    {SDL_SCANCODE_Z, Controller::B},           {SDL_SCANCODE_J, Controller::B},
    {SDL_SCANCODE_Q, Controller::SELECT},      {SDL_SCANCODE_RSHIFT, Controller::SELECT},
    {SDL_SCANCODE_LSHIFT, Controller::SELECT},
    {SDL_SCANCODE_E, Controller::START},       {SDL_SCANCODE_RETURN, Controller::START},
    {SDL_SCANCODE_SPACE, Controller::START},
};

// NTSC field rate
const std::chrono::nanoseconds frame_period(16639267);

}

Frontend::Frontend(int scale)
    : scale(scale), window(nullptr), renderer(nullptr), texture(nullptr), paused(false) {
}

Frontend::~Frontend() {
    cleanup();
}

bool Frontend::init() {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
        std::cerr << "SDL_Init: " << SDL_GetError() << std::endl;
        return false;
    }

    window = SDL_CreateWindow("nesemu",
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              PPU::SCREEN_WIDTH * scale, PPU::SCREEN_HEIGHT * scale,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        std::cout << "No vsync renderer, pacing with the timer" << std::endl;
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    }
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer: " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");

    texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGB24, SDL_TEXTUREACCESS_STREAMING,
                                PPU::SCREEN_WIDTH, PPU::SCREEN_HEIGHT);
    if (!texture) {
        std::cerr << "SDL_CreateTexture: " << SDL_GetError() << std::endl;
        return false;
    }

    return true;
}

void Frontend::run(System& system, const std::string& rom_name) {
    using clock = std::chrono::steady_clock;

    auto deadline = clock::now();
    auto fps_window_start = deadline;
    int frames_in_window = 0;

    update_title(rom_name, 0.0);

    while (handle_events(system)) {
        if (!paused) {
            system.set_controller_input(0, read_buttons());
            system.step_frame();
        }
        present(system);

        frames_in_window++;
        auto now = clock::now();
        std::chrono::duration<double> window_length = now - fps_window_start;
        if (window_length.count() >= 1.0) {
            update_title(rom_name, frames_in_window / window_length.count());
            frames_in_window = 0;
            fps_window_start = now;
        }

        deadline += frame_period;
        if (deadline > now) {
            std::this_thread::sleep_until(deadline);
        } else {
            // Running behind; don't try to catch up
            deadline = now;
        }
    }
}

bool Frontend::handle_events(System& system) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT) {
            return false;
        }
        if (event.type != SDL_KEYDOWN || event.key.repeat) {
            continue;
        }

        switch (event.key.keysym.sym) {
            case SDLK_ESCAPE:
                return false;
            case SDLK_r:
                if (event.key.keysym.mod & KMOD_CTRL) {
                    std::cout << "Soft reset" << std::endl;
                    system.reset();
                }
                break;
            case SDLK_p:
                paused = !paused;
                std::cout << (paused ? "Paused" : "Running") << std::endl;
                break;
            default:
                break;
        }
    }
    return true;
}

void Frontend::update_title(const std::string& rom_name, double fps) {
    std::ostringstream title;
    title << "nesemu - " << rom_name;
    if (fps > 0.0) {
        title << " - " << std::fixed << std::setprecision(1) << fps << " fps";
    }
    if (paused) {
        title << " [paused]";
    }
    SDL_SetWindowTitle(window, title.str().c_str());
}

// Largest 256:240 rectangle centred in the window
SDL_Rect Frontend::letterbox() const {
    int win_w = 0;
    int win_h = 0;
    SDL_GetWindowSize(window, &win_w, &win_h);

    SDL_Rect rect;
    if (win_w * PPU::SCREEN_HEIGHT > win_h * PPU::SCREEN_WIDTH) {
        rect.h = win_h;
        rect.w = win_h * PPU::SCREEN_WIDTH / PPU::SCREEN_HEIGHT;
    } else {
        rect.w = win_w;
        rect.h = win_w * PPU::SCREEN_HEIGHT / PPU::SCREEN_WIDTH;
    }
    rect.x = (win_w - rect.w) / 2;
    rect.y = (win_h - rect.h) / 2;
    return rect;
}

void Frontend::present(const System& system) {
    system.frame_rgb(rgb);
    SDL_UpdateTexture(texture, nullptr, rgb.data(), PPU::SCREEN_WIDTH * 3);

    SDL_Rect dest = letterbox();
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, &dest);
    SDL_RenderPresent(renderer);
}

uint8_t Frontend::read_buttons() const {
    const uint8_t* keys = SDL_GetKeyboardState(nullptr);
    uint8_t buttons = 0x00;
    for (const KeyBinding& binding : key_bindings) {
        if (keys[binding.key]) {
            buttons |= binding.button;
        }
    }
    return buttons;
}

void Frontend::cleanup() {
    if (texture) SDL_DestroyTexture(texture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) SDL_DestroyWindow(window);
    texture = nullptr;
    renderer = nullptr;
    window = nullptr;
    SDL_Quit();
}
