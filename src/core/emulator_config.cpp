#include "emulator_config.hpp"
#include "sgba/emulator_plugin.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

namespace sgba {

namespace fs = std::filesystem;

EmulatorConfiguration::EmulatorConfiguration()
    : m_config_path(DEFAULT_CONFIG_PATH) {
    reset_to_defaults();
    m_modified = false;
}

void EmulatorConfiguration::reset_to_defaults() {
    CoreConfig core;

    m_bios_path.clear();
    m_screenshot_directory = DEFAULT_SCREENSHOT_DIR;
    m_window_scale = DEFAULT_WINDOW_SCALE;
    m_cycles_per_frame = core.cycles_per_frame;
    m_max_instructions_per_frame = core.max_instructions_per_frame;

    m_key_map = {
        {"A", "X"},
        {"B", "Z"},
        {"Select", "Backspace"},
        {"Start", "Return"},
        {"Right", "Right"},
        {"Left", "Left"},
        {"Up", "Up"},
        {"Down", "Down"},
        {"R", "S"},
        {"L", "A"},
    };
    m_modified = true;
}

bool EmulatorConfiguration::load(const fs::path& config_path) {
    if (!config_path.empty()) {
        m_config_path = config_path;
    }
    return load();
}

bool EmulatorConfiguration::load() {
    if (!fs::exists(m_config_path)) {
        std::cout << "Config not found, using defaults" << std::endl;
        return true;
    }

    try {
        std::ifstream file(m_config_path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config: " << m_config_path << std::endl;
            return false;
        }

        nlohmann::json json;
        file >> json;

        if (!json.is_object()) {
            std::cerr << "Config is not a JSON object: " << m_config_path << std::endl;
            reset_to_defaults();
            return false;
        }

        if (json.contains("bios_path") && json["bios_path"].is_string()) {
            m_bios_path = json["bios_path"].get<std::string>();
        }
        if (json.contains("screenshot_directory") && json["screenshot_directory"].is_string()) {
            m_screenshot_directory = json["screenshot_directory"].get<std::string>();
        }
        if (json.contains("window_scale") && json["window_scale"].is_number_integer()) {
            set_window_scale(json["window_scale"].get<int>());
        }
        if (json.contains("cycles_per_frame") && json["cycles_per_frame"].is_number_integer()) {
            int cycles = json["cycles_per_frame"].get<int>();
            if (cycles > 0) m_cycles_per_frame = cycles;
        }
        if (json.contains("max_instructions_per_frame") &&
            json["max_instructions_per_frame"].is_number_integer()) {
            int limit = json["max_instructions_per_frame"].get<int>();
            if (limit > 0) m_max_instructions_per_frame = limit;
        }
        if (json.contains("key_map") && json["key_map"].is_object()) {
            for (const auto& [button, key] : json["key_map"].items()) {
                if (key.is_string()) {
                    m_key_map[button] = key.get<std::string>();
                }
            }
        }

        m_modified = false;
        std::cout << "Loaded configuration from: " << m_config_path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        reset_to_defaults();
        return false;
    }
}

bool EmulatorConfiguration::save(const fs::path& config_path) const {
    try {
        nlohmann::json json;

        json["bios_path"] = m_bios_path.string();
        json["screenshot_directory"] = m_screenshot_directory.string();
        json["window_scale"] = m_window_scale;
        json["cycles_per_frame"] = m_cycles_per_frame;
        json["max_instructions_per_frame"] = m_max_instructions_per_frame;
        json["key_map"] = m_key_map;

        if (config_path.has_parent_path()) {
            fs::create_directories(config_path.parent_path());
        }

        std::ofstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config for writing: " << config_path << std::endl;
            return false;
        }

        file << json.dump(4);
        std::cout << "Saved configuration to: " << config_path << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error saving config: " << e.what() << std::endl;
        return false;
    }
}

bool EmulatorConfiguration::save() const {
    return save(m_config_path);
}

void EmulatorConfiguration::set_bios_path(const fs::path& path) {
    m_bios_path = path;
    m_modified = true;
}

void EmulatorConfiguration::set_screenshot_directory(const fs::path& path) {
    m_screenshot_directory = path;
    m_modified = true;
}

void EmulatorConfiguration::set_window_scale(int scale) {
    if (scale < 1) scale = 1;
    if (scale > MAX_WINDOW_SCALE) scale = MAX_WINDOW_SCALE;
    m_window_scale = scale;
    m_modified = true;
}

void EmulatorConfiguration::set_key(const std::string& button, const std::string& key_name) {
    m_key_map[button] = key_name;
    m_modified = true;
}

void EmulatorConfiguration::apply_to(CoreConfig& config) const {
    config.cycles_per_frame = m_cycles_per_frame;
    config.max_instructions_per_frame = m_max_instructions_per_frame;
}

} // namespace sgba
