#include "tab.hpp"

std::string to_string(TabHandle handle) {
    return std::to_string(handle.slot_index) + ":" + std::to_string(handle.generation);
}

TabKind TabKind::web(const std::string& url) {
    TabKind kind;
    kind.type = WEB;
    kind.url = url;
    return kind;
}

void TabActivity::note_output(Clock::time_point now, bool seen) {
    last_output = now;
    has_unseen_output = !seen;
}

void TabActivity::mark_seen() {
    has_unseen_output = false;
}

bool TabActivity::is_active(Clock::time_point now) const {
    if (!last_output) return false;
    // A timestamp from the future still counts as fresh output.
    if (now < *last_output) return true;
    return now - *last_output <= TAB_ACTIVITY_ACTIVE_WINDOW;
}

std::string Tab::panel_title() const {
    if (custom_title) {
        return *custom_title;
    }

    if (kind.is_web() || program_name.empty()) {
        return title;
    }

    return program_name;
}
