#include "group_index.hpp"
#include <algorithm>

TabGroup& GroupIndex::create_group() {
    TabGroup group;
    group.id = next_group_id++;
    group_list.push_back(std::move(group));
    return group_list.back();
}

TabGroup* GroupIndex::find(size_t group_id) {
    auto it = std::find_if(group_list.begin(), group_list.end(),
        [group_id](const TabGroup& group) { return group.id == group_id; });
    return it != group_list.end() ? &*it : nullptr;
}

const TabGroup* GroupIndex::find(size_t group_id) const {
    auto it = std::find_if(group_list.begin(), group_list.end(),
        [group_id](const TabGroup& group) { return group.id == group_id; });
    return it != group_list.end() ? &*it : nullptr;
}

std::optional<size_t> GroupIndex::index_of(size_t group_id) const {
    for (size_t i = 0; i < group_list.size(); ++i) {
        if (group_list[i].id == group_id) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<TabLocation> GroupIndex::locate(TabHandle handle) const {
    for (size_t i = 0; i < group_list.size(); ++i) {
        const std::vector<TabHandle>& tabs = group_list[i].tabs;
        auto it = std::find(tabs.begin(), tabs.end(), handle);
        if (it != tabs.end()) {
            TabLocation location;
            location.group_index = i;
            location.group_id = group_list[i].id;
            location.tab_index = static_cast<size_t>(it - tabs.begin());
            location.group_len = tabs.size();
            return location;
        }
    }
    return std::nullopt;
}

bool GroupIndex::erase_tab(TabHandle handle) {
    bool erased = false;
    for (TabGroup& group : group_list) {
        auto it = std::remove(group.tabs.begin(), group.tabs.end(), handle);
        if (it != group.tabs.end()) {
            group.tabs.erase(it, group.tabs.end());
            erased = true;
        }
    }
    return erased;
}

void GroupIndex::prune_empty_groups() {
    group_list.erase(std::remove_if(group_list.begin(), group_list.end(),
        [](const TabGroup& group) { return group.tabs.empty(); }), group_list.end());
}

bool GroupIndex::move_group(size_t group_id, size_t target_index) {
    std::optional<size_t> from = index_of(group_id);
    if (!from) return false;

    size_t target = std::min(target_index, group_list.size());
    // Removing the group first shifts every later slot down by one.
    size_t insert_index = target > *from ? target - 1 : target;
    if (insert_index == *from) return false;

    TabGroup group = std::move(group_list[*from]);
    group_list.erase(group_list.begin() + *from);
    group_list.insert(group_list.begin() + insert_index, std::move(group));
    return true;
}

std::vector<TabHandle> GroupIndex::ordered_handles() const {
    std::vector<TabHandle> handles;
    for (const TabGroup& group : group_list) {
        handles.insert(handles.end(), group.tabs.begin(), group.tabs.end());
    }
    return handles;
}
