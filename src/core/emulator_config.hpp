#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace sgba {

struct CoreConfig;

// Host configuration for supergba.
// Persists the BIOS location, screenshot directory, window scale, the
// keyboard map and the per-frame budgets to a JSON file.
class EmulatorConfiguration {
public:
    EmulatorConfiguration();
    ~EmulatorConfiguration() = default;

    // Load configuration from file (empty path uses the current config path).
    // A missing file keeps the defaults and succeeds; an unreadable or
    // malformed one keeps the defaults and fails.
    bool load(const std::filesystem::path& config_path);
    bool load();

    // Save configuration to file (empty path uses the current config path)
    bool save(const std::filesystem::path& config_path) const;
    bool save() const;

    void reset_to_defaults();

    std::filesystem::path get_config_path() const { return m_config_path; }

    std::filesystem::path get_bios_path() const { return m_bios_path; }
    void set_bios_path(const std::filesystem::path& path);

    std::filesystem::path get_screenshot_directory() const { return m_screenshot_directory; }
    void set_screenshot_directory(const std::filesystem::path& path);

    int get_window_scale() const { return m_window_scale; }
    void set_window_scale(int scale);

    // Button name ("A", "Start", "Up", ...) -> SDL key name ("X", "Return", ...)
    const std::map<std::string, std::string>& get_key_map() const { return m_key_map; }
    void set_key(const std::string& button, const std::string& key_name);

    int get_cycles_per_frame() const { return m_cycles_per_frame; }
    int get_max_instructions_per_frame() const { return m_max_instructions_per_frame; }

    // Copy the frame budgets into a core configuration
    void apply_to(CoreConfig& config) const;

    bool is_modified() const { return m_modified; }

    static constexpr const char* DEFAULT_CONFIG_PATH = "config/supergba.json";
    static constexpr const char* DEFAULT_SCREENSHOT_DIR = "screenshots";
    static constexpr int DEFAULT_WINDOW_SCALE = 3;
    static constexpr int MAX_WINDOW_SCALE = 8;

private:
    std::filesystem::path m_config_path;

    std::filesystem::path m_bios_path;
    std::filesystem::path m_screenshot_directory;
    int m_window_scale = DEFAULT_WINDOW_SCALE;
    std::map<std::string, std::string> m_key_map;
    int m_cycles_per_frame = 0;
    int m_max_instructions_per_frame = 0;

    bool m_modified = false;
};

} // namespace sgba
