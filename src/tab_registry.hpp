#pragma once
#include "group_index.hpp"
#include "panel_model.hpp"
#include "tab_store.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Canonical tab state for one window: the slot arena, the group order and the
// active tab. Every operation tolerates stale handles and unknown group ids by
// returning false / nullopt / nullptr.
class TabRegistry {
public:
    // Tab lifecycle
    TabHandle allocate();
    void insert_tab(TabHandle handle, Tab tab);
    TabHandle open_tab(TabKind kind, const std::string& title);
    std::optional<Tab> remove_tab(TabHandle handle);

    Tab* get(TabHandle handle) { return store.get(handle); }
    const Tab* get(TabHandle handle) const { return store.get(handle); }
    bool contains(TabHandle handle) const { return store.get(handle) != nullptr; }
    size_t tab_count() const { return store.size(); }

    // Active tab
    std::optional<TabHandle> active_id() const { return active; }
    const Tab* active_tab() const;
    bool set_active(TabHandle handle);

    // Ordering
    bool move_tab(TabHandle handle, std::optional<size_t> target_group_id,
                  std::optional<size_t> target_index);
    bool move_group(size_t group_id, size_t target_index);

    // Labels; each setter reports whether the stored value changed.
    bool set_title(TabHandle handle, const std::string& title);
    bool set_custom_title(TabHandle handle, const std::optional<std::string>& title);
    bool set_group_name(size_t group_id, const std::optional<std::string>& name);
    bool set_program_name(TabHandle handle, const std::string& program_name);
    // Web tabs only; false for terminal tabs.
    bool set_web_url(TabHandle handle, const std::string& url);

    std::optional<std::string> custom_title(TabHandle handle) const;
    std::optional<std::string> tab_label(TabHandle handle) const;
    std::optional<std::string> group_name(size_t group_id) const;
    std::optional<std::pair<size_t, size_t>> group_for_tab(TabHandle handle) const;

    // Activity
    bool note_output(TabHandle handle, Clock::time_point now);
    bool has_active_output(Clock::time_point now) const;

    // Projection and derived order
    const std::vector<TabGroup>& groups() const { return group_index.groups(); }
    std::vector<PanelGroup> panel_groups() const;
    size_t preview_group_id() const { return group_index.preview_group_id(); }
    std::vector<TabHandle> ordered_tabs() const;

    std::optional<TabHandle> select_by_index(size_t index) const;
    std::optional<TabHandle> select_next() const;
    std::optional<TabHandle> select_previous() const;
    std::optional<TabHandle> select_last() const;

private:
    TabStore store;
    GroupIndex group_index;
    std::optional<TabHandle> active;
};

std::string default_group_label(size_t group_id);
