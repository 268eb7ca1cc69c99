#include "app_settings.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/types.h>

std::string default_settings_directory() {
    const char* home = getenv("HOME");
    if (!home) return std::string();
    return std::string(home) + "/.tabdeck";
}

AppSettings& AppSettings::getInstance() {
    static AppSettings instance(default_settings_directory());
    return instance;
}

AppSettings::AppSettings(const std::string& directory) : config_dir(directory) {}

static bool write_int(const std::string& path, int value) {
    FILE* fp = fopen(path.c_str(), "w");
    if (!fp) {
        spdlog::warn("Cannot write {}: {}", path, strerror(errno));
        return false;
    }
    fprintf(fp, "%d", value);
    fclose(fp);
    return true;
}

static bool read_int(const std::string& path, int* value) {
    FILE* fp = fopen(path.c_str(), "r");
    if (!fp) return false;

    int parsed;
    bool ok = fscanf(fp, "%d", &parsed) == 1;
    fclose(fp);
    if (ok) *value = parsed;
    return ok;
}

void AppSettings::setPanelColumns(int columns) {
    if (columns < 1 || columns == panel_columns) return;
    panel_columns = columns;
    saveSettings();
}

void AppSettings::setPanelEnabled(bool enabled) {
    if (enabled == panel_enabled) return;
    panel_enabled = enabled;
    saveSettings();
}

bool AppSettings::saveSettings() {
    if (config_dir.empty()) return false;

    if (mkdir(config_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        spdlog::warn("Cannot create settings directory {}: {}", config_dir, strerror(errno));
        return false;
    }

    bool ok = write_int(config_dir + "/panel_enabled", panel_enabled ? 1 : 0);
    ok = write_int(config_dir + "/panel_columns", panel_columns) && ok;
    ok = write_int(config_dir + "/font_size", font_size) && ok;
    ok = write_int(config_dir + "/window_w", window_w) && ok;
    ok = write_int(config_dir + "/window_h", window_h) && ok;
    ok = write_int(config_dir + "/dynamic_title", dynamic_title ? 1 : 0) && ok;
    return ok;
}

void AppSettings::loadSettings() {
    if (config_dir.empty()) return;

    int value;
    if (read_int(config_dir + "/panel_enabled", &value)) {
        panel_enabled = value != 0;
    }
    if (read_int(config_dir + "/panel_columns", &value) && value > 0) {
        panel_columns = value;
    }
    if (read_int(config_dir + "/font_size", &value) && value > 0) {
        font_size = value;
    }
    if (read_int(config_dir + "/window_w", &value) && value > 0) {
        window_w = value;
    }
    if (read_int(config_dir + "/window_h", &value) && value > 0) {
        window_h = value;
    }
    if (read_int(config_dir + "/dynamic_title", &value)) {
        dynamic_title = value != 0;
    }
    spdlog::debug("Loaded settings from {}", config_dir);
}
