#pragma once

#include "emulator_config.hpp"
#include "sgba/emulator_plugin.hpp"

#include <SDL.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sgba {

// Host application: command line, configuration, SDL window and the frame loop
class Application {
public:
    Application();
    ~Application();

    // Returns false on fatal errors. --help and --version succeed but leave
    // the application not running.
    bool initialize(int argc, char* argv[]);
    void run();
    void shutdown();

    bool is_running() const { return m_running; }

    bool load_rom(const std::string& path);

    // Empty path writes a timestamped file into the screenshot directory
    bool save_screenshot(const std::string& path = "");

private:
    bool parse_command_line(int argc, char* argv[], std::string& rom_path);
    void print_usage(const char* program_name);
    void print_version();
    void read_environment();

    bool load_bios(const std::string& path);
    static bool read_file(const std::string& path, std::vector<uint8_t>& data);

    bool create_window();
    void destroy_window();
    void build_key_bindings();

    void run_headless();
    void process_events();
    InputState poll_input() const;
    void render();
    void update_title();

    std::unique_ptr<IEmulatorPlugin> m_plugin;
    EmulatorConfiguration m_config;
    std::string m_config_path;
    std::string m_bios_override;
    std::string m_rom_path;

    // SDL objects (null in headless mode)
    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    SDL_Texture* m_texture = nullptr;

    // Scancode -> button mask
    std::vector<std::pair<SDL_Scancode, uint32_t>> m_key_bindings;

    // State
    bool m_running = false;
    bool m_sdl_initialized = false;
    bool m_quit_requested = false;
    bool m_debug_mode = false;
    bool m_headless_mode = false;
    int m_headless_frames = 0;

    // Screenshot
    int m_screenshot_at_frame = -1;        // -1 disabled, -2 at exit
    std::string m_screenshot_output_path;
};

} // namespace sgba
