#pragma once
#include "tab_controller.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ControlError {
    enum Code { NOT_FOUND, INVALID_REQUEST };

    Code code = NOT_FOUND;
    std::string message;
};

// Either a value or the error that prevented producing it.
template <typename T>
struct ControlResult {
    std::optional<T> value;
    std::optional<ControlError> error;

    bool ok() const { return !error.has_value(); }

    static ControlResult success(T result) {
        ControlResult out;
        out.value = std::move(result);
        return out;
    }
    static ControlResult failure(ControlError::Code code, const std::string& message) {
        ControlResult out;
        out.error = ControlError{code, message};
        return out;
    }
};

struct ControlTabActivity {
    bool has_unseen_output = false;
    std::optional<uint64_t> last_output_ms_ago;
};

struct ControlTabState {
    TabHandle tab;
    size_t group_id = 0;
    size_t index = 0;
    bool is_active = false;
    std::string title;
    std::optional<std::string> custom_title;
    std::string program_name;
    TabKind kind;
    std::optional<ControlTabActivity> activity;  // absent for web tabs
};

struct ControlTabGroup {
    size_t id = 0;
    std::optional<std::string> name;
    std::vector<ControlTabState> tabs;
};

struct ControlPanelState {
    bool enabled = false;
    int columns = 0;
};

// Request surface for external tools (scripting, a control socket). Translates
// requests into controller calls and reports failures as ControlError codes.
class ControlApi {
public:
    explicit ControlApi(TabController& controller, AppSettings& settings);

    std::vector<ControlTabGroup> list_groups(Clock::time_point now) const;
    ControlResult<ControlTabState> tab_state(TabHandle handle, Clock::time_point now) const;
    ControlResult<TabKind> tab_kind(TabHandle handle) const;

    ControlResult<TabHandle> create_tab(const TabKind& kind, const std::string& title);
    // Requests that take an optional tab act on the active tab when it is absent.

    // The value is true when the window has no tabs left.
    ControlResult<bool> close_tab(std::optional<TabHandle> handle);
    // The value is false when there was no closed tab to reopen.
    ControlResult<bool> restore_closed_tab();
    ControlResult<TabHandle> select_tab(const TabSelection& selection);
    // Succeeds whenever the tab exists, even if nothing had to move.
    ControlResult<bool> move_tab(TabHandle handle, std::optional<size_t> target_group_id,
                                 std::optional<size_t> target_index);
    ControlResult<bool> set_tab_title(std::optional<TabHandle> handle,
                                      const std::optional<std::string>& title);
    ControlResult<bool> set_web_url(std::optional<TabHandle> handle, const std::string& url);
    ControlResult<bool> set_group_name(size_t group_id, const std::optional<std::string>& name);

    ControlPanelState panel_state() const;
    ControlResult<bool> set_panel(std::optional<bool> enabled, std::optional<int> columns);

private:
    ControlResult<TabHandle> resolve_tab(std::optional<TabHandle> handle) const;
    std::optional<ControlTabState> describe_tab(TabHandle handle, size_t group_id, size_t index,
                                                Clock::time_point now) const;

    TabController& controller;
    AppSettings& settings;
};
