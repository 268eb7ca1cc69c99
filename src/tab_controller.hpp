#pragma once
#include "app_settings.hpp"
#include "panel_interaction.hpp"
#include "tab_registry.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct TabSelection {
    enum Type { ACTIVE, NEXT, PREVIOUS, LAST, INDEX, BY_ID };

    Type type = ACTIVE;
    size_t index = 0;  // INDEX
    TabHandle tab;     // BY_ID

    static TabSelection active() { return TabSelection(); }
    static TabSelection next();
    static TabSelection previous();
    static TabSelection last();
    static TabSelection at(size_t index);
    static TabSelection by_id(TabHandle handle);
};

// Owns one window's tab registry and panel. Every registry mutation goes
// through here so the panel projection and window title stay in sync.
class TabController {
public:
    explicit TabController(AppSettings& settings);

    std::function<void()> on_redraw;
    std::function<void(CursorKind)> on_cursor;
    std::function<void(const std::string&)> on_window_title;
    std::function<void(const Tab&)> on_tab_closed;
    std::function<void()> on_layout_changed;

    TabRegistry& registry() { return tabs; }
    const TabRegistry& registry() const { return tabs; }
    const TabPanel& panel() const { return tab_panel; }

    // Tabs
    TabHandle create_tab(const TabKind& kind, const std::string& title);
    bool set_active_tab(TabHandle handle);
    // Returns true when the window has no tabs left. Closed web tabs are
    // remembered so restore_closed_tab() can reopen them, newest first.
    bool close_tab(TabHandle handle);
    std::optional<TabHandle> restore_closed_tab();
    size_t closed_tab_count() const { return closed_tabs.size(); }
    bool handle_select(const TabSelection& selection);

    bool note_terminal_output(TabHandle handle, Clock::time_point now);
    bool update_tab_title(TabHandle handle, const std::string& title);
    bool update_program_name(TabHandle handle, const std::string& program_name);
    // Points a web tab at a new URL; the URL also becomes its title.
    bool set_web_url(TabHandle handle, const std::string& url);

    // Renames trim the name; an empty name clears the custom label.
    bool rename_tab(TabHandle handle, const std::optional<std::string>& name);
    bool rename_group(size_t group_id, const std::optional<std::string>& name);
    bool begin_tab_rename(TabHandle handle);
    bool begin_group_rename(size_t group_id);
    bool begin_active_tab_rename();

    void handle_command(const PanelCommand& command);

    // Layout
    void set_viewport(float width, float height, float cell_width, float cell_height,
                      float padding_x, float padding_y);
    void set_panel_enabled(bool enabled);
    void set_panel_columns(int columns);
    void set_panel_width_px(float width);

    // Input forwarding; each returns whether the panel consumed the event.
    bool pointer_moved(PanelPoint position);
    bool pointer_button(PointerButton button, ButtonState state);
    bool key_input(const PanelKeyEvent& event);
    bool ime_commit(const std::string& text);

    // Activity tick; true while some terminal tab is still producing output.
    bool tick(Clock::time_point now);

    void refresh_panel();
    std::string window_title() const;

private:
    void apply_update(const PanelUpdate& update);
    void apply_edit_outcome(const EditOutcome& outcome);
    void relayout();
    void redraw();

    static const size_t MAX_CLOSED_TABS = 10;

    AppSettings& settings;
    TabRegistry tabs;
    TabPanel tab_panel;
    std::vector<TabKind> closed_tabs;

    float viewport_width = 0.0f;
    float viewport_height = 0.0f;
    float cell_width = 0.0f;
    float cell_height = 0.0f;
    float padding_x = 0.0f;
    float padding_y = 0.0f;
};

std::string trim_whitespace(const std::string& text);
