#include "application.hpp"
#include "screenshot.hpp"

#include <SDL.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace sgba {

namespace {

struct ButtonName {
    const char* name;
    uint32_t mask;
};

constexpr ButtonName BUTTON_NAMES[] = {
    {"A", Buttons::A},
    {"B", Buttons::B},
    {"Select", Buttons::Select},
    {"Start", Buttons::Start},
    {"Right", Buttons::Right},
    {"Left", Buttons::Left},
    {"Up", Buttons::Up},
    {"Down", Buttons::Down},
    {"R", Buttons::R},
    {"L", Buttons::L},
};

} // namespace

Application::Application() = default;

Application::~Application() {
    destroy_window();
}

void Application::print_usage(const char* program_name) {
    std::cout << "supergba - Game Boy Advance emulator\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] ROM_FILE\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help          Show this help message and exit\n";
    std::cout << "  -v, --version       Show version information and exit\n";
    std::cout << "  -d, --debug         Enable debug output and the register overlay\n";
    std::cout << "  --bios PATH         Boot through a BIOS image (overrides the config)\n";
    std::cout << "  --config PATH       Configuration file (default: "
              << EmulatorConfiguration::DEFAULT_CONFIG_PATH << ")\n";
    std::cout << "\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DEBUG=1             Enable debug output\n";
    std::cout << "  HEADLESS=1          Run without a window (for automated testing)\n";
    std::cout << "  FRAMES=N            Run for N frames then exit (requires HEADLESS=1)\n";
    std::cout << "  SAVE_SCREENSHOT=N      Save screenshot at frame N\n";
    std::cout << "  SAVE_SCREENSHOT=path   Save screenshot at exit to specified path\n";
    std::cout << "\n";
    std::cout << "Keys:\n";
    std::cout << "  Escape quits, F12 saves a screenshot. Buttons come from the config key_map.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " game.gba\n";
    std::cout << "  " << program_name << " --bios gba_bios.bin game.gba\n";
    std::cout << "  HEADLESS=1 FRAMES=300 SAVE_SCREENSHOT=out.png " << program_name << " demo.gba\n";
}

void Application::print_version() {
    std::cout << "supergba v0.1.0\n";
}

bool Application::parse_command_line(int argc, char* argv[], std::string& rom_path) {
    rom_path.clear();

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return false;
        }
        else if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--debug") == 0) {
            m_debug_mode = true;
            std::cout << "Debug mode enabled\n";
        }
        else if (std::strcmp(arg, "--bios") == 0 || std::strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            if (arg[2] == 'b') {
                m_bios_override = argv[++i];
            } else {
                m_config_path = argv[++i];
            }
        }
        else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else {
            rom_path = arg;
        }
    }

    return true;
}

void Application::read_environment() {
    const char* headless_env = std::getenv("HEADLESS");
    if (headless_env && headless_env[0] != '0') {
        m_headless_mode = true;
    }

    const char* frames_env = std::getenv("FRAMES");
    if (frames_env) {
        m_headless_frames = std::atoi(frames_env);
        if (m_headless_frames <= 0) {
            m_headless_frames = 600;
        }
    }

    // Frame number or output path
    const char* screenshot_env = std::getenv("SAVE_SCREENSHOT");
    if (screenshot_env) {
        int frame_num = std::atoi(screenshot_env);
        if (frame_num > 0) {
            m_screenshot_at_frame = frame_num;
        } else if (screenshot_env[0] != '\0') {
            m_screenshot_output_path = screenshot_env;
            m_screenshot_at_frame = -2;
        }
    }
}

bool Application::initialize(int argc, char* argv[]) {
    if (!parse_command_line(argc, argv, m_rom_path)) {
        m_running = false;
        // Help and version exit cleanly; everything else is a usage error
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0 ||
                std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
                return true;
            }
        }
        return false;
    }

    // The core reads DEBUG on first use
    if (m_debug_mode) {
        setenv("DEBUG", "1", 1);
    }

    read_environment();

    if (m_rom_path.empty()) {
        std::cerr << "Error: no ROM file given\n";
        std::cerr << "Use --help for usage information.\n";
        return false;
    }

    if (m_headless_mode && m_headless_frames == 0) {
        m_headless_frames = 600;
    }

    m_config.load(m_config_path.empty()
        ? std::filesystem::path(EmulatorConfiguration::DEFAULT_CONFIG_PATH)
        : std::filesystem::path(m_config_path));

    CoreConfig core_config;
    m_config.apply_to(core_config);
    m_plugin = create_emulator_plugin(core_config);

    std::string bios_path = m_bios_override.empty()
        ? m_config.get_bios_path().string()
        : m_bios_override;
    if (!bios_path.empty() && !load_bios(bios_path)) {
        // Fall back to the direct cartridge boot
        std::cerr << "Continuing without BIOS" << std::endl;
    }

    if (!load_rom(m_rom_path)) {
        return false;
    }

    if (!m_headless_mode) {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "Failed to initialize SDL: " << SDL_GetError() << std::endl;
            return false;
        }
        m_sdl_initialized = true;
        if (!create_window()) {
            return false;
        }
        build_key_bindings();
        std::cout << "supergba initialized successfully" << std::endl;
    }

    m_running = true;
    return true;
}

bool Application::read_file(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "Failed to open file: " << path << std::endl;
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        std::cerr << "Failed to read file: " << path << std::endl;
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        std::cerr << "Failed to read file: " << path << std::endl;
        return false;
    }
    return true;
}

bool Application::load_bios(const std::string& path) {
    std::vector<uint8_t> data;
    if (!read_file(path, data)) {
        return false;
    }
    if (!m_plugin->load_bios(data.data(), data.size())) {
        return false;
    }
    std::cout << "Loaded BIOS: " << path << std::endl;
    return true;
}

bool Application::load_rom(const std::string& path) {
    std::cout << "Loading ROM: " << path << std::endl;

    std::vector<uint8_t> data;
    if (!read_file(path, data)) {
        return false;
    }

    if (!m_plugin->load_rom(data.data(), data.size())) {
        std::cerr << "Failed to load ROM: " << path << std::endl;
        return false;
    }

    if (m_window) {
        SDL_SetWindowTitle(m_window, ("supergba - " + path).c_str());
    }
    return true;
}

bool Application::create_window() {
    EmulatorInfo info = m_plugin->get_info();
    int scale = m_config.get_window_scale();

    m_window = SDL_CreateWindow("supergba",
                                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                info.screen_width * scale, info.screen_height * scale,
                                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!m_window) {
        std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
        return false;
    }

    m_renderer = SDL_CreateRenderer(m_window, -1,
                                    SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!m_renderer) {
        // Software fallback for machines without a GPU driver
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!m_renderer) {
        std::cerr << "Failed to create renderer: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_RenderSetLogicalSize(m_renderer, info.screen_width, info.screen_height);

    // Framebuffer words are 0xAABBGGRR, i.e. R,G,B,A bytes in memory
    m_texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_ABGR8888,
                                  SDL_TEXTUREACCESS_STREAMING,
                                  info.screen_width, info.screen_height);
    if (!m_texture) {
        std::cerr << "Failed to create texture: " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_SetWindowTitle(m_window, ("supergba - " + m_rom_path).c_str());
    return true;
}

void Application::destroy_window() {
    if (m_texture) {
        SDL_DestroyTexture(m_texture);
        m_texture = nullptr;
    }
    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

void Application::build_key_bindings() {
    m_key_bindings.clear();

    for (const auto& button : BUTTON_NAMES) {
        auto it = m_config.get_key_map().find(button.name);
        if (it == m_config.get_key_map().end()) {
            continue;
        }

        SDL_Keycode key = SDL_GetKeyFromName(it->second.c_str());
        if (key == SDLK_UNKNOWN) {
            std::cerr << "Unknown key name '" << it->second << "' for button "
                      << button.name << std::endl;
            continue;
        }
        m_key_bindings.emplace_back(SDL_GetScancodeFromKey(key), button.mask);
    }
}

void Application::run() {
    if (!m_running) return;

    if (m_headless_mode) {
        run_headless();
        return;
    }

    double target_fps = m_plugin->get_info().native_fps;
    double frequency = static_cast<double>(SDL_GetPerformanceFrequency());
    double target_frame_time = 1.0 / target_fps;

    while (m_running && !m_quit_requested) {
        uint64_t frame_start = SDL_GetPerformanceCounter();

        process_events();
        if (m_quit_requested) break;

        m_plugin->run_frame(poll_input());

        if (m_screenshot_at_frame > 0 &&
            m_plugin->get_frame_count() == static_cast<uint64_t>(m_screenshot_at_frame)) {
            save_screenshot(m_screenshot_output_path);
        }

        render();

        // Sleep most of the remaining frame, then spin for accuracy
        double frame_time = static_cast<double>(SDL_GetPerformanceCounter() - frame_start) / frequency;
        if (frame_time < target_frame_time) {
            double sleep_time = (target_frame_time - frame_time) * 1000.0;
            if (sleep_time > 2.0) {
                SDL_Delay(static_cast<uint32_t>(sleep_time - 1.0));
            }
            while (true) {
                double elapsed = static_cast<double>(SDL_GetPerformanceCounter() - frame_start) / frequency;
                if (elapsed >= target_frame_time) break;
            }
        }
    }

    if (m_screenshot_at_frame == -2) {
        save_screenshot(m_screenshot_output_path);
    }
}

void Application::run_headless() {
    InputState empty_input{};
    int frames_run = 0;

    while (!m_quit_requested && frames_run < m_headless_frames) {
        m_plugin->run_frame(empty_input);
        frames_run++;

        if (m_screenshot_at_frame > 0 && frames_run == m_screenshot_at_frame) {
            std::string path = m_screenshot_output_path.empty()
                ? ("screenshot_frame_" + std::to_string(frames_run) + ".png")
                : m_screenshot_output_path;
            save_screenshot(path);
        }
    }

    if (m_screenshot_at_frame == -2) {
        std::string path = m_screenshot_output_path.empty()
            ? std::string("screenshot_final.png")
            : m_screenshot_output_path;
        save_screenshot(path);
    }

    DebugState state = m_plugin->get_debug_state();
    std::cerr << "Headless mode: Ran " << frames_run << " frames, PC=0x"
              << std::hex << std::setw(8) << std::setfill('0') << state.pc
              << std::dec << "\n";
}

void Application::process_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                m_quit_requested = true;
                break;

            case SDL_WINDOWEVENT:
                if (event.window.event == SDL_WINDOWEVENT_CLOSE) {
                    m_quit_requested = true;
                }
                break;

            case SDL_KEYDOWN:
                if (event.key.repeat) break;
                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        m_quit_requested = true;
                        break;
                    case SDLK_F12:
                        save_screenshot();
                        break;
                    default:
                        break;
                }
                break;

            default:
                break;
        }
    }
}

InputState Application::poll_input() const {
    InputState input;
    const Uint8* keys = SDL_GetKeyboardState(nullptr);
    for (const auto& [scancode, mask] : m_key_bindings) {
        if (keys[scancode]) {
            input.buttons |= mask;
        }
    }
    return input;
}

void Application::render() {
    FrameBuffer fb = m_plugin->get_framebuffer();
    if (fb.pixels) {
        SDL_UpdateTexture(m_texture, nullptr, fb.pixels,
                          fb.width * static_cast<int>(sizeof(uint32_t)));
    }

    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
    SDL_RenderClear(m_renderer);
    SDL_RenderCopy(m_renderer, m_texture, nullptr, nullptr);
    SDL_RenderPresent(m_renderer);

    if (m_debug_mode && m_plugin->get_frame_count() % 15 == 0) {
        update_title();
    }
}

void Application::update_title() {
    DebugState state = m_plugin->get_debug_state();

    std::ostringstream title;
    title << "supergba - PC:" << std::hex << std::uppercase << std::setfill('0')
          << std::setw(8) << state.pc
          << " CPSR:" << std::setw(8) << state.cpsr
          << std::dec << " VCOUNT:" << state.vcount
          << " Frame:" << m_plugin->get_frame_count();
    SDL_SetWindowTitle(m_window, title.str().c_str());
}

bool Application::save_screenshot(const std::string& path) {
    if (!m_plugin || !m_plugin->is_rom_loaded()) {
        std::cerr << "[Screenshot] No ROM loaded\n";
        return false;
    }

    FrameBuffer fb = m_plugin->get_framebuffer();
    if (!fb.pixels || fb.width <= 0 || fb.height <= 0) {
        std::cerr << "[Screenshot] No framebuffer available\n";
        return false;
    }

    std::filesystem::path output_path;
    if (path.empty()) {
        output_path = m_config.get_screenshot_directory() / Screenshot::generate_filename();
    } else {
        output_path = path;
    }

    return Screenshot::save_png(output_path, fb.pixels, fb.width, fb.height);
}

void Application::shutdown() {
    // Keep a first-run config around so the key map can be edited
    if (m_running && !m_headless_mode &&
        !std::filesystem::exists(m_config.get_config_path())) {
        m_config.save();
    }

    m_plugin.reset();
    destroy_window();

    if (m_sdl_initialized) {
        SDL_Quit();
        m_sdl_initialized = false;
        std::cout << "supergba shutdown complete" << std::endl;
    }
    m_running = false;
}

} // namespace sgba
