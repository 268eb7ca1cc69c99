#pragma once
#include <string>

// Persistent user preferences, one small file per value under the settings
// directory ($HOME/.tabdeck by default).
class AppSettings {
public:
    static AppSettings& getInstance();
    explicit AppSettings(const std::string& directory);

    // Panel
    bool panel_enabled = true;
    int panel_columns = 24;

    // Window
    int font_size = 14;
    int window_w = 1024;
    int window_h = 640;
    bool dynamic_title = true;

    const std::string& directory() const { return config_dir; }

    void setPanelColumns(int columns);
    void setPanelEnabled(bool enabled);
    bool saveSettings();
    void loadSettings();

private:
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

    std::string config_dir;
};

std::string default_settings_directory();
