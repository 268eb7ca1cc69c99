#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

using Clock = std::chrono::steady_clock;

// A tab counts as "active" while its last output is younger than this window.
const std::chrono::milliseconds TAB_ACTIVITY_ACTIVE_WINDOW(3000);
// How often the host redraws while some tab is active.
const std::chrono::milliseconds TAB_ACTIVITY_TICK_INTERVAL(500);

// Versioned reference to a tab slot. A handle whose generation no longer
// matches its slot is stale and never resolves.
struct TabHandle {
    uint32_t slot_index = 0;
    uint32_t generation = 0;

    TabHandle() = default;
    TabHandle(uint32_t index, uint32_t gen) : slot_index(index), generation(gen) {}

    bool operator==(const TabHandle& other) const {
        return slot_index == other.slot_index && generation == other.generation;
    }
    bool operator!=(const TabHandle& other) const { return !(*this == other); }
};

std::string to_string(TabHandle handle);

struct TabKind {
    enum Type { TERMINAL, WEB };

    Type type = TERMINAL;
    std::string url;

    static TabKind terminal() { return TabKind(); }
    static TabKind web(const std::string& url);

    bool is_web() const { return type == WEB; }

    bool operator==(const TabKind& other) const {
        return type == other.type && url == other.url;
    }
    bool operator!=(const TabKind& other) const { return !(*this == other); }
};

struct TabActivity {
    std::optional<Clock::time_point> last_output;
    bool has_unseen_output = false;

    void note_output(Clock::time_point now, bool seen);
    void mark_seen();
    bool is_active(Clock::time_point now) const;

    bool operator==(const TabActivity& other) const {
        return last_output == other.last_output && has_unseen_output == other.has_unseen_output;
    }
    bool operator!=(const TabActivity& other) const { return !(*this == other); }
};

struct Tab {
    TabHandle handle;
    std::string title;
    std::optional<std::string> custom_title;
    std::string program_name;
    TabKind kind;
    TabActivity activity;

    Tab() = default;
    Tab(TabKind k, const std::string& t) : title(t), kind(std::move(k)) {}

    // Label shown in the panel: custom title, then the title for web tabs,
    // then the foreground program name, then the raw title.
    std::string panel_title() const;
};
