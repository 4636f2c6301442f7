#include "frontend.hpp"
#include "system.hpp"
#include "cartridge.hpp"
#include "demo_rom.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

// ===== COMMAND LINE =====
struct Options {
    std::string rom_path;       // Empty: built-in demo ROM
    std::string input_path;     // Per-frame button masks for headless runs
    int scale = 3;
    int headless_frames = 0;    // 0: interactive
    bool trace = false;
};

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [rom_file.nes]\n"
              << "  --scale N       window scale factor (default 3)\n"
              << "  --headless N    run N frames without a window and print a frame checksum\n"
              << "  --input FILE    controller 1 button masks, one hex byte per line (headless)\n"
              << "  --trace         print every executed instruction to stderr\n"
              << "Without a ROM the built-in demo is run." << std::endl;
}

static bool parse_int(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size() && out > 0;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--scale" && has_value) {
            if (!parse_int(argv[++i], options.scale)) {
                std::cerr << "Invalid scale: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--headless" && has_value) {
            if (!parse_int(argv[++i], options.headless_frames)) {
                std::cerr << "Invalid frame count: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--input" && has_value) {
            options.input_path = argv[++i];
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            options.rom_path = arg;
        }
    }
    return true;
}

// ===== FILE HELPERS =====
static bool read_file(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

static std::string save_path(const std::string& rom_path) {
    size_t last_dot = rom_path.find_last_of('.');
    size_t last_slash = rom_path.find_last_of("/\\");
    if (last_dot != std::string::npos && (last_slash == std::string::npos || last_dot > last_slash)) {
        return rom_path.substr(0, last_dot) + ".sav";
    }
    return rom_path + ".sav";
}

static void load_battery_ram(System& system, const std::string& path) {
    std::vector<uint8_t> saved;
    if (!read_file(path, saved)) {
        return;
    }

    std::vector<uint8_t>& ram = system.cartridge_ram();
    if (saved.size() != ram.size()) {
        std::cerr << "Ignoring " << path << ": expected " << ram.size()
                  << " bytes, found " << saved.size() << std::endl;
        return;
    }
    ram = saved;
    std::cout << "Loaded save RAM from " << path << std::endl;
}

static void save_battery_ram(System& system, const std::string& path) {
    std::ofstream file(path, std::ios::binary);
    const std::vector<uint8_t>& ram = system.cartridge_ram();
    file.write(reinterpret_cast<const char*>(ram.data()), ram.size());
    if (!file) {
        std::cerr << "Failed to write " << path << std::endl;
        return;
    }
    std::cout << "Saved RAM to " << path << std::endl;
}

static bool read_input_script(const std::string& path, std::vector<uint8_t>& masks) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        try {
            masks.push_back(static_cast<uint8_t>(std::stoul(line, nullptr, 16) & 0xFF));
        } catch (const std::exception&) {
            std::cerr << "Bad input line in " << path << ": " << line << std::endl;
            return false;
        }
    }
    return true;
}

// FNV-1a over the palette-index frame
static uint32_t frame_checksum(const PPU::FrameBuffer& frame) {
    uint32_t hash = 2166136261u;
    for (uint8_t pixel : frame) {
        hash ^= pixel;
        hash *= 16777619u;
    }
    return hash;
}

static int run_headless(System& system, const Options& options) {
    std::vector<uint8_t> masks;
    if (!options.input_path.empty() && !read_input_script(options.input_path, masks)) {
        std::cerr << "Failed to read input script: " << options.input_path << std::endl;
        return 1;
    }

    for (int frame = 0; frame < options.headless_frames; frame++) {
        // The last mask stays held once the script runs out
        if (!masks.empty()) {
            size_t index = (size_t)frame < masks.size() ? (size_t)frame : masks.size() - 1;
            system.set_controller_input(0, masks[index]);
        }
        system.step_frame();
    }

    std::cout << "Frames: " << options.headless_frames
              << "  CPU cycles: " << system.get_cycles()
              << "  Checksum: " << std::hex << std::setw(8) << std::setfill('0')
              << frame_checksum(system.frame()) << std::dec << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<uint8_t> rom;
    std::string rom_name = "demo";
    if (options.rom_path.empty()) {
        std::cout << "No ROM given, running built-in demo" << std::endl;
        rom = make_demo_rom();
    } else {
        if (!read_file(options.rom_path, rom)) {
            std::cerr << "Failed to open ROM file: " << options.rom_path << std::endl;
            return 1;
        }
        rom_name = options.rom_path;
        size_t last_slash = rom_name.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            rom_name = rom_name.substr(last_slash + 1);
        }
    }

    std::unique_ptr<System> system;
    try {
        system = System::load(rom);
    } catch (const RomError& e) {
        std::cerr << "Failed to load ROM: " << e.what() << std::endl;
        return 1;
    }

    if (options.trace) {
        system->get_cpu().set_trace(&std::cerr);
    }

    bool battery = !options.rom_path.empty() && system->get_cartridge().has_battery();
    if (battery) {
        load_battery_ram(*system, save_path(options.rom_path));
    }

    int status = 0;
    try {
        if (options.headless_frames > 0) {
            status = run_headless(*system, options);
        } else {
            Frontend frontend(options.scale);
            if (!frontend.init()) {
                std::cerr << "Failed to initialize frontend" << std::endl;
                return 1;
            }
            frontend.run(*system, rom_name);
        }
    } catch (const CpuFault& e) {
        std::cerr << "CPU fault: " << e.what() << std::endl;
        status = 2;
    }

    if (battery) {
        save_battery_ram(*system, save_path(options.rom_path));
    }

    return status;
}
