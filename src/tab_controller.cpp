#include "tab_controller.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

static const char* APP_TITLE = "tabdeck";

TabSelection TabSelection::next() {
    TabSelection selection;
    selection.type = NEXT;
    return selection;
}

TabSelection TabSelection::previous() {
    TabSelection selection;
    selection.type = PREVIOUS;
    return selection;
}

TabSelection TabSelection::last() {
    TabSelection selection;
    selection.type = LAST;
    return selection;
}

TabSelection TabSelection::at(size_t index) {
    TabSelection selection;
    selection.type = INDEX;
    selection.index = index;
    return selection;
}

TabSelection TabSelection::by_id(TabHandle handle) {
    TabSelection selection;
    selection.type = BY_ID;
    selection.tab = handle;
    return selection;
}

std::string trim_whitespace(const std::string& text) {
    const char* blanks = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(blanks);
    if (start == std::string::npos) return std::string();
    size_t end = text.find_last_not_of(blanks);
    return text.substr(start, end - start + 1);
}

TabController::TabController(AppSettings& app_settings) : settings(app_settings) {
    tab_panel.set_enabled(settings.panel_enabled);
}

TabHandle TabController::create_tab(const TabKind& kind, const std::string& title) {
    TabHandle handle = tabs.open_tab(kind, title);
    tabs.set_active(handle);
    tab_panel.cancel_edit();
    spdlog::debug("Created {} tab {}", kind.is_web() ? "web" : "terminal", to_string(handle));
    refresh_panel();
    return handle;
}

bool TabController::set_active_tab(TabHandle handle) {
    if (!tabs.contains(handle)) {
        spdlog::warn("Cannot activate unknown tab {}", to_string(handle));
        return false;
    }

    tab_panel.cancel_edit();
    bool changed = tabs.set_active(handle);
    refresh_panel();
    return changed;
}

bool TabController::close_tab(TabHandle handle) {
    std::optional<Tab> removed = tabs.remove_tab(handle);
    if (!removed) {
        spdlog::warn("Cannot close unknown tab {}", to_string(handle));
        return tabs.tab_count() == 0;
    }

    if (removed->kind.is_web()) {
        closed_tabs.push_back(removed->kind);
        if (closed_tabs.size() > MAX_CLOSED_TABS) closed_tabs.erase(closed_tabs.begin());
    }

    if (on_tab_closed) on_tab_closed(*removed);

    std::optional<TabHandle> next = tabs.active_id();
    if (next) tabs.set_active(*next);

    refresh_panel();
    return tabs.tab_count() == 0;
}

std::optional<TabHandle> TabController::restore_closed_tab() {
    if (closed_tabs.empty()) return std::nullopt;

    TabKind kind = closed_tabs.back();
    closed_tabs.pop_back();
    spdlog::debug("Restoring closed tab {}", kind.url);
    return create_tab(kind, kind.url);
}

bool TabController::handle_select(const TabSelection& selection) {
    std::optional<TabHandle> target;
    switch (selection.type) {
        case TabSelection::ACTIVE: return tabs.active_id().has_value();
        case TabSelection::NEXT: target = tabs.select_next(); break;
        case TabSelection::PREVIOUS: target = tabs.select_previous(); break;
        case TabSelection::LAST: target = tabs.select_last(); break;
        case TabSelection::INDEX: target = tabs.select_by_index(selection.index); break;
        case TabSelection::BY_ID:
            if (tabs.contains(selection.tab)) target = selection.tab;
            break;
    }

    if (!target) return false;
    set_active_tab(*target);
    return true;
}

bool TabController::note_terminal_output(TabHandle handle, Clock::time_point now) {
    if (!tabs.note_output(handle, now)) return false;
    refresh_panel();
    return true;
}

bool TabController::update_tab_title(TabHandle handle, const std::string& title) {
    if (!tabs.set_title(handle, title)) return false;
    refresh_panel();
    return true;
}

bool TabController::update_program_name(TabHandle handle, const std::string& program_name) {
    if (!tabs.set_program_name(handle, program_name)) return false;
    refresh_panel();
    return true;
}

bool TabController::set_web_url(TabHandle handle, const std::string& url) {
    if (!tabs.set_web_url(handle, url)) return false;
    tabs.set_title(handle, url);
    refresh_panel();
    return true;
}

bool TabController::rename_tab(TabHandle handle, const std::optional<std::string>& name) {
    std::optional<std::string> title;
    if (name) {
        std::string trimmed = trim_whitespace(*name);
        if (!trimmed.empty()) title = trimmed;
    }

    if (!tabs.set_custom_title(handle, title)) return false;
    spdlog::debug("Renamed tab {} to '{}'", to_string(handle), title.value_or(""));
    refresh_panel();
    return true;
}

bool TabController::rename_group(size_t group_id, const std::optional<std::string>& name) {
    std::optional<std::string> label;
    if (name) {
        std::string trimmed = trim_whitespace(*name);
        // Typing the default label back in is the same as clearing the name.
        if (!trimmed.empty() && trimmed != default_group_label(group_id)) label = trimmed;
    }

    if (!tabs.set_group_name(group_id, label)) return false;
    spdlog::debug("Renamed group {} to '{}'", group_id, label.value_or(""));
    refresh_panel();
    return true;
}

bool TabController::begin_tab_rename(TabHandle handle) {
    const Tab* tab = tabs.get(handle);
    if (!tab) return false;

    if (!tab_panel.begin_edit_tab(handle, tab->panel_title())) return false;
    redraw();
    return true;
}

bool TabController::begin_group_rename(size_t group_id) {
    const std::vector<TabGroup>& groups = tabs.groups();
    auto it = std::find_if(groups.begin(), groups.end(),
        [group_id](const TabGroup& group) { return group.id == group_id; });
    if (it == groups.end()) return false;

    std::string current = it->name && !it->name->empty() ? *it->name : default_group_label(group_id);
    if (!tab_panel.begin_edit_group(group_id, current)) return false;
    redraw();
    return true;
}

bool TabController::begin_active_tab_rename() {
    std::optional<TabHandle> active = tabs.active_id();
    return active && begin_tab_rename(*active);
}

void TabController::handle_command(const PanelCommand& command) {
    if (const auto* focus = std::get_if<FocusTabCommand>(&command)) {
        set_active_tab(focus->tab);
    } else if (const auto* close_cmd = std::get_if<CloseTabCommand>(&command)) {
        close_tab(close_cmd->tab);
    } else if (const auto* move_cmd = std::get_if<MoveTabCommand>(&command)) {
        if (tabs.move_tab(move_cmd->tab, move_cmd->target_group_id, move_cmd->target_index)) {
            refresh_panel();
        }
    } else if (const auto* group_cmd = std::get_if<MoveGroupCommand>(&command)) {
        if (tabs.move_group(group_cmd->group_id, group_cmd->target_index)) {
            refresh_panel();
        }
    } else if (const auto* rename_cmd = std::get_if<RenameTabCommand>(&command)) {
        begin_tab_rename(rename_cmd->tab);
    } else if (const auto* rename_group_cmd = std::get_if<RenameGroupCommand>(&command)) {
        begin_group_rename(rename_group_cmd->group_id);
    }
}

void TabController::set_viewport(float width, float height, float cell_w, float cell_h,
                                  float pad_x, float pad_y) {
    viewport_width = width;
    viewport_height = height;
    cell_width = cell_w;
    cell_height = cell_h;
    padding_x = pad_x;
    padding_y = pad_y;
    relayout();
}

void TabController::set_panel_enabled(bool enabled) {
    settings.setPanelEnabled(enabled);
    tab_panel.set_enabled(enabled);
    relayout();
}

void TabController::set_panel_width_px(float width) {
    if (cell_width <= 0.0f) return;

    set_panel_columns(std::max(1, static_cast<int>(std::lround(width / cell_width))));
}

void TabController::set_panel_columns(int columns) {
    if (columns < 1 || columns == settings.panel_columns) return;

    spdlog::debug("Panel width set to {} columns", columns);
    settings.setPanelColumns(columns);
    relayout();
}

void TabController::relayout() {
    PanelDimensions dimensions = compute_panel_dimensions(
        settings.panel_enabled, static_cast<size_t>(std::max(settings.panel_columns, 0)),
        cell_width, viewport_width, padding_x);
    tab_panel.set_dimensions(dimensions);

    PanelMetrics metrics;
    metrics.cell_width = cell_width;
    metrics.row_height = panel_row_height(cell_width, cell_height);
    metrics.padding_y = padding_y;
    metrics.height = viewport_height;
    tab_panel.set_metrics(metrics);

    if (on_layout_changed) on_layout_changed();
    redraw();
}

bool TabController::pointer_moved(PanelPoint position) {
    PanelUpdate update = tab_panel.pointer_moved(position);
    apply_update(update);
    return update.capture;
}

bool TabController::pointer_button(PointerButton button, ButtonState state) {
    PanelUpdate update = tab_panel.pointer_button(button, state);
    apply_update(update);
    return update.capture;
}

bool TabController::key_input(const PanelKeyEvent& event) {
    if (!tab_panel.is_editing()) return false;
    apply_edit_outcome(tab_panel.handle_key(event));
    return true;
}

bool TabController::ime_commit(const std::string& text) {
    if (!tab_panel.is_editing()) return false;
    apply_edit_outcome(tab_panel.handle_ime_commit(text));
    return true;
}

bool TabController::tick(Clock::time_point now) {
    if (!tabs.has_active_output(now)) return false;
    redraw();
    return true;
}

void TabController::refresh_panel() {
    tab_panel.set_groups(tabs.panel_groups(), tabs.preview_group_id());
    if (on_window_title) on_window_title(window_title());
    redraw();
}

std::string TabController::window_title() const {
    if (!settings.dynamic_title) return APP_TITLE;

    const Tab* active = tabs.active_tab();
    if (!active) return APP_TITLE;

    std::string label = active->panel_title();
    return label.empty() ? std::string(APP_TITLE) : label;
}

void TabController::apply_update(const PanelUpdate& update) {
    if (update.cursor && on_cursor) on_cursor(*update.cursor);
    if (update.resize_width) set_panel_width_px(*update.resize_width);
    if (update.command) handle_command(*update.command);
    if (update.needs_redraw) redraw();
}

void TabController::apply_edit_outcome(const EditOutcome& outcome) {
    switch (outcome.type) {
        case EditOutcome::EDIT_NONE:
            return;
        case EditOutcome::EDIT_CHANGED:
        case EditOutcome::EDIT_CANCELLED:
            redraw();
            return;
        case EditOutcome::EDIT_COMMIT:
            if (outcome.target.type == EditTarget::TAB) {
                rename_tab(outcome.target.tab, outcome.text);
            } else {
                rename_group(outcome.target.group_id, outcome.text);
            }
            redraw();
            return;
    }
}

void TabController::redraw() {
    if (on_redraw) on_redraw();
}
