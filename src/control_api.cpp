#include "control_api.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static ControlTabActivity describe_activity(const TabActivity& activity, Clock::time_point now) {
    ControlTabActivity result;
    result.has_unseen_output = activity.has_unseen_output;
    if (activity.last_output) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - *activity.last_output);
        result.last_output_ms_ago = static_cast<uint64_t>(std::max<int64_t>(age.count(), 0));
    }
    return result;
}

ControlApi::ControlApi(TabController& tab_controller, AppSettings& app_settings)
    : controller(tab_controller), settings(app_settings) {}

std::optional<ControlTabState> ControlApi::describe_tab(TabHandle handle, size_t group_id,
                                                        size_t index,
                                                        Clock::time_point now) const {
    const TabRegistry& tabs = controller.registry();
    const Tab* tab = tabs.get(handle);
    if (!tab) return std::nullopt;

    ControlTabState state;
    state.tab = handle;
    state.group_id = group_id;
    state.index = index;
    state.is_active = tabs.active_id() == handle;
    state.title = tab->title;
    state.custom_title = tab->custom_title;
    state.program_name = tab->program_name;
    state.kind = tab->kind;
    if (!tab->kind.is_web()) {
        state.activity = describe_activity(tab->activity, now);
    }
    return state;
}

std::vector<ControlTabGroup> ControlApi::list_groups(Clock::time_point now) const {
    std::vector<ControlTabGroup> result;
    for (const TabGroup& group : controller.registry().groups()) {
        ControlTabGroup entry;
        entry.id = group.id;
        entry.name = group.name;
        for (size_t index = 0; index < group.tabs.size(); ++index) {
            std::optional<ControlTabState> state = describe_tab(group.tabs[index], group.id, index, now);
            if (state) entry.tabs.push_back(std::move(*state));
        }
        result.push_back(std::move(entry));
    }
    return result;
}

ControlResult<ControlTabState> ControlApi::tab_state(TabHandle handle, Clock::time_point now) const {
    std::optional<std::pair<size_t, size_t>> location = controller.registry().group_for_tab(handle);
    std::optional<ControlTabState> state;
    if (location) state = describe_tab(handle, location->first, location->second, now);
    if (!state) return ControlResult<ControlTabState>::failure(ControlError::NOT_FOUND, "Tab not found");
    return ControlResult<ControlTabState>::success(std::move(*state));
}

ControlResult<TabKind> ControlApi::tab_kind(TabHandle handle) const {
    const Tab* tab = controller.registry().get(handle);
    if (!tab) return ControlResult<TabKind>::failure(ControlError::NOT_FOUND, "Tab not found");
    return ControlResult<TabKind>::success(tab->kind);
}

ControlResult<TabHandle> ControlApi::create_tab(const TabKind& kind, const std::string& title) {
    if (kind.is_web() && kind.url.empty()) {
        return ControlResult<TabHandle>::failure(ControlError::INVALID_REQUEST,
                                                 "Web tabs need a URL");
    }
    return ControlResult<TabHandle>::success(controller.create_tab(kind, title));
}

ControlResult<TabHandle> ControlApi::resolve_tab(std::optional<TabHandle> handle) const {
    const TabRegistry& tabs = controller.registry();
    if (!handle) {
        std::optional<TabHandle> active = tabs.active_id();
        if (!active) return ControlResult<TabHandle>::failure(ControlError::NOT_FOUND, "No active tab");
        return ControlResult<TabHandle>::success(*active);
    }
    if (!tabs.contains(*handle)) {
        return ControlResult<TabHandle>::failure(ControlError::NOT_FOUND, "Tab not found");
    }
    return ControlResult<TabHandle>::success(*handle);
}

ControlResult<bool> ControlApi::close_tab(std::optional<TabHandle> handle) {
    ControlResult<TabHandle> tab = resolve_tab(handle);
    if (!tab.ok()) return ControlResult<bool>::failure(tab.error->code, tab.error->message);
    return ControlResult<bool>::success(controller.close_tab(*tab.value));
}

ControlResult<bool> ControlApi::restore_closed_tab() {
    return ControlResult<bool>::success(controller.restore_closed_tab().has_value());
}

ControlResult<TabHandle> ControlApi::select_tab(const TabSelection& selection) {
    const TabRegistry& tabs = controller.registry();
    std::optional<TabHandle> target;
    switch (selection.type) {
        case TabSelection::ACTIVE: target = tabs.active_id(); break;
        case TabSelection::NEXT: target = tabs.select_next(); break;
        case TabSelection::PREVIOUS: target = tabs.select_previous(); break;
        case TabSelection::LAST: target = tabs.select_last(); break;
        case TabSelection::INDEX: target = tabs.select_by_index(selection.index); break;
        case TabSelection::BY_ID:
            if (tabs.contains(selection.tab)) target = selection.tab;
            break;
    }

    if (!target) return ControlResult<TabHandle>::failure(ControlError::NOT_FOUND, "Tab not found");

    if (selection.type != TabSelection::ACTIVE) controller.set_active_tab(*target);
    return ControlResult<TabHandle>::success(*target);
}

ControlResult<bool> ControlApi::move_tab(TabHandle handle, std::optional<size_t> target_group_id,
                                         std::optional<size_t> target_index) {
    if (!controller.registry().contains(handle)) {
        return ControlResult<bool>::failure(ControlError::NOT_FOUND, "Tab not found");
    }

    controller.handle_command(MoveTabCommand{handle, target_group_id, target_index});
    return ControlResult<bool>::success(true);
}

ControlResult<bool> ControlApi::set_tab_title(std::optional<TabHandle> handle,
                                              const std::optional<std::string>& title) {
    ControlResult<TabHandle> tab = resolve_tab(handle);
    if (!tab.ok()) return ControlResult<bool>::failure(tab.error->code, tab.error->message);
    return ControlResult<bool>::success(controller.rename_tab(*tab.value, title));
}

ControlResult<bool> ControlApi::set_web_url(std::optional<TabHandle> handle, const std::string& url) {
    ControlResult<TabHandle> tab = resolve_tab(handle);
    if (!tab.ok()) return ControlResult<bool>::failure(tab.error->code, tab.error->message);

    if (!controller.registry().get(*tab.value)->kind.is_web()) {
        return ControlResult<bool>::failure(ControlError::INVALID_REQUEST, "Not a web tab");
    }
    if (url.empty()) {
        return ControlResult<bool>::failure(ControlError::INVALID_REQUEST, "Web tabs need a URL");
    }
    return ControlResult<bool>::success(controller.set_web_url(*tab.value, url));
}

ControlResult<bool> ControlApi::set_group_name(size_t group_id,
                                               const std::optional<std::string>& name) {
    const std::vector<TabGroup>& groups = controller.registry().groups();
    bool exists = std::any_of(groups.begin(), groups.end(),
        [group_id](const TabGroup& group) { return group.id == group_id; });
    if (!exists) {
        return ControlResult<bool>::failure(ControlError::NOT_FOUND, "Group not found");
    }
    return ControlResult<bool>::success(controller.rename_group(group_id, name));
}

ControlPanelState ControlApi::panel_state() const {
    ControlPanelState state;
    state.enabled = settings.panel_enabled;
    state.columns = settings.panel_columns;
    return state;
}

ControlResult<bool> ControlApi::set_panel(std::optional<bool> enabled, std::optional<int> columns) {
    if (!enabled && !columns) {
        return ControlResult<bool>::failure(ControlError::INVALID_REQUEST,
                                            "No tab panel options provided");
    }
    if (columns && *columns < 1) {
        return ControlResult<bool>::failure(ControlError::INVALID_REQUEST,
                                            "Panel width must be at least one column");
    }

    if (enabled) controller.set_panel_enabled(*enabled);
    if (columns) controller.set_panel_columns(*columns);
    spdlog::debug("Panel updated over control request");
    return ControlResult<bool>::success(true);
}
