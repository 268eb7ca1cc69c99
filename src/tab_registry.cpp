#include "tab_registry.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::string default_group_label(size_t group_id) {
    return "group " + std::to_string(group_id);
}

TabHandle TabRegistry::allocate() {
    return store.allocate();
}

void TabRegistry::insert_tab(TabHandle handle, Tab tab) {
    if (!store.insert(handle, std::move(tab))) {
        return;
    }

    if (group_index.empty()) {
        group_index.create_group();
    }

    // New tabs join the group of the active tab.
    size_t target = 0;
    if (active) {
        std::optional<TabLocation> location = group_index.locate(*active);
        if (location) target = location->group_index;
    }

    TabGroup& group = group_index.group_at(target);
    if (std::find(group.tabs.begin(), group.tabs.end(), handle) == group.tabs.end()) {
        group.tabs.push_back(handle);
    }

    if (!active) {
        active = handle;
    }

    spdlog::debug("Inserted tab {} into group {}", to_string(handle), group.id);
}

TabHandle TabRegistry::open_tab(TabKind kind, const std::string& title) {
    TabHandle handle = allocate();
    insert_tab(handle, Tab(std::move(kind), title));
    return handle;
}

std::optional<Tab> TabRegistry::remove_tab(TabHandle handle) {
    std::optional<Tab> removed = store.remove(handle);
    if (!removed) return std::nullopt;

    group_index.erase_tab(handle);
    group_index.prune_empty_groups();

    if (active == handle) {
        std::vector<TabHandle> tabs = ordered_tabs();
        if (tabs.empty()) {
            active.reset();
        } else {
            active = tabs.front();
        }
    }

    spdlog::debug("Removed tab {}", to_string(handle));
    return removed;
}

const Tab* TabRegistry::active_tab() const {
    return active ? store.get(*active) : nullptr;
}

bool TabRegistry::set_active(TabHandle handle) {
    Tab* tab = store.get(handle);
    if (!tab) return false;

    tab->activity.mark_seen();
    if (active == handle) return false;

    active = handle;
    return true;
}

bool TabRegistry::move_tab(TabHandle handle, std::optional<size_t> target_group_id,
                           std::optional<size_t> target_index) {
    if (!store.get(handle)) return false;

    std::optional<TabLocation> origin = group_index.locate(handle);
    if (!origin) return false;

    // Nothing to reorder inside a group holding only this tab.
    if (target_group_id == origin->group_id && origin->group_len <= 1) {
        return false;
    }

    group_index.erase_tab(handle);
    group_index.prune_empty_groups();

    std::optional<size_t> destination;
    if (target_group_id) {
        destination = group_index.index_of(*target_group_id);
    }
    if (!destination) {
        group_index.create_group();
        destination = group_index.size() - 1;
    }

    TabGroup& group = group_index.group_at(*destination);
    if (group.id == origin->group_id && target_index && *target_index > origin->tab_index) {
        // Removing the tab already shifted every later slot down by one.
        target_index = *target_index - 1;
    }

    size_t insert_index = std::min(target_index.value_or(group.tabs.size()), group.tabs.size());
    group.tabs.insert(group.tabs.begin() + insert_index, handle);

    spdlog::debug("Moved tab {} to group {} at {}", to_string(handle), group.id, insert_index);
    return true;
}

bool TabRegistry::move_group(size_t group_id, size_t target_index) {
    return group_index.move_group(group_id, target_index);
}

bool TabRegistry::set_title(TabHandle handle, const std::string& title) {
    Tab* tab = store.get(handle);
    if (!tab || tab->title == title) return false;

    tab->title = title;
    return true;
}

bool TabRegistry::set_custom_title(TabHandle handle, const std::optional<std::string>& title) {
    Tab* tab = store.get(handle);
    if (!tab || tab->custom_title == title) return false;

    tab->custom_title = title;
    return true;
}

bool TabRegistry::set_group_name(size_t group_id, const std::optional<std::string>& name) {
    TabGroup* group = group_index.find(group_id);
    if (!group || group->name == name) return false;

    group->name = name;
    return true;
}

bool TabRegistry::set_program_name(TabHandle handle, const std::string& program_name) {
    Tab* tab = store.get(handle);
    if (!tab || tab->program_name == program_name) return false;

    tab->program_name = program_name;
    return true;
}

bool TabRegistry::set_web_url(TabHandle handle, const std::string& url) {
    Tab* tab = store.get(handle);
    if (!tab || !tab->kind.is_web() || tab->kind.url == url) return false;

    tab->kind.url = url;
    return true;
}

std::optional<std::string> TabRegistry::custom_title(TabHandle handle) const {
    const Tab* tab = store.get(handle);
    if (!tab) return std::nullopt;
    return tab->custom_title;
}

std::optional<std::string> TabRegistry::tab_label(TabHandle handle) const {
    const Tab* tab = store.get(handle);
    if (!tab) return std::nullopt;
    return tab->panel_title();
}

std::optional<std::string> TabRegistry::group_name(size_t group_id) const {
    const TabGroup* group = group_index.find(group_id);
    if (!group) return std::nullopt;
    return group->name;
}

std::optional<std::pair<size_t, size_t>> TabRegistry::group_for_tab(TabHandle handle) const {
    std::optional<TabLocation> location = group_index.locate(handle);
    if (!location) return std::nullopt;
    return std::make_pair(location->group_id, location->tab_index);
}

bool TabRegistry::note_output(TabHandle handle, Clock::time_point now) {
    Tab* tab = store.get(handle);
    if (!tab || tab->kind.is_web()) return false;

    tab->activity.note_output(now, active == handle);
    return true;
}

bool TabRegistry::has_active_output(Clock::time_point now) const {
    for (const Tab* tab : store.get_all_tabs()) {
        if (!tab->kind.is_web() && tab->activity.is_active(now)) {
            return true;
        }
    }
    return false;
}

std::vector<PanelGroup> TabRegistry::panel_groups() const {
    std::vector<PanelGroup> result;
    result.reserve(group_index.size());

    for (const TabGroup& group : group_index.groups()) {
        PanelGroup panel_group;
        panel_group.id = group.id;
        panel_group.label = group.name && !group.name->empty() ? *group.name
                                                               : default_group_label(group.id);

        for (TabHandle handle : group.tabs) {
            const Tab* tab = store.get(handle);
            if (!tab) continue;

            PanelTab panel_tab;
            panel_tab.handle = handle;
            panel_tab.title = tab->panel_title();
            panel_tab.is_active = active == handle;
            panel_tab.kind = tab->kind;
            if (!tab->kind.is_web()) {
                panel_tab.activity = tab->activity;
            }
            panel_group.tabs.push_back(std::move(panel_tab));
        }

        result.push_back(std::move(panel_group));
    }

    return result;
}

std::vector<TabHandle> TabRegistry::ordered_tabs() const {
    std::vector<TabHandle> tabs;
    for (TabHandle handle : group_index.ordered_handles()) {
        if (store.get(handle)) tabs.push_back(handle);
    }
    return tabs;
}

std::optional<TabHandle> TabRegistry::select_by_index(size_t index) const {
    std::vector<TabHandle> tabs = ordered_tabs();
    if (index >= tabs.size()) return std::nullopt;
    return tabs[index];
}

std::optional<TabHandle> TabRegistry::select_next() const {
    if (!active) return std::nullopt;

    std::vector<TabHandle> tabs = ordered_tabs();
    auto it = std::find(tabs.begin(), tabs.end(), *active);
    if (it == tabs.end()) return std::nullopt;

    size_t pos = static_cast<size_t>(it - tabs.begin());
    return tabs[(pos + 1) % tabs.size()];
}

std::optional<TabHandle> TabRegistry::select_previous() const {
    if (!active) return std::nullopt;

    std::vector<TabHandle> tabs = ordered_tabs();
    auto it = std::find(tabs.begin(), tabs.end(), *active);
    if (it == tabs.end()) return std::nullopt;

    size_t pos = static_cast<size_t>(it - tabs.begin());
    return tabs[pos == 0 ? tabs.size() - 1 : pos - 1];
}

std::optional<TabHandle> TabRegistry::select_last() const {
    std::vector<TabHandle> tabs = ordered_tabs();
    if (tabs.empty()) return std::nullopt;
    return tabs.back();
}
