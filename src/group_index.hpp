#pragma once
#include "tab.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct TabGroup {
    size_t id = 0;
    std::optional<std::string> name;
    std::vector<TabHandle> tabs;
};

// Where a tab currently sits inside the group list.
struct TabLocation {
    size_t group_index = 0;
    size_t group_id = 0;
    size_t tab_index = 0;
    size_t group_len = 0;
};

// Ordered groups of ordered tab handles. Panel order and tab-cycle order are
// both derived from this list. Group ids come from a counter that never goes
// backwards, so an id always names the same group for its whole lifetime.
class GroupIndex {
public:
    const std::vector<TabGroup>& groups() const { return group_list; }
    bool empty() const { return group_list.empty(); }
    size_t size() const { return group_list.size(); }

    TabGroup& create_group();
    TabGroup& group_at(size_t index) { return group_list[index]; }
    const TabGroup& group_at(size_t index) const { return group_list[index]; }

    TabGroup* find(size_t group_id);
    const TabGroup* find(size_t group_id) const;
    std::optional<size_t> index_of(size_t group_id) const;
    std::optional<TabLocation> locate(TabHandle handle) const;

    bool erase_tab(TabHandle handle);
    void prune_empty_groups();
    bool move_group(size_t group_id, size_t target_index);

    std::vector<TabHandle> ordered_handles() const;
    size_t preview_group_id() const { return next_group_id; }

private:
    std::vector<TabGroup> group_list;
    size_t next_group_id = 1;
};
