#pragma once
#include "tab.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Read-only snapshot of one tab, shaped for drawing and hit-testing.
struct PanelTab {
    TabHandle handle;
    std::string title;
    bool is_active = false;
    TabKind kind;
    std::optional<TabActivity> activity;  // absent for web tabs

    bool operator==(const PanelTab& other) const {
        return handle == other.handle && title == other.title && is_active == other.is_active &&
               kind == other.kind && activity == other.activity;
    }
    bool operator!=(const PanelTab& other) const { return !(*this == other); }
};

struct PanelGroup {
    size_t id = 0;
    std::string label;
    std::vector<PanelTab> tabs;

    bool operator==(const PanelGroup& other) const {
        return id == other.id && label == other.label && tabs == other.tabs;
    }
    bool operator!=(const PanelGroup& other) const { return !(*this == other); }
};

struct FocusTabCommand {
    TabHandle tab;
};

struct CloseTabCommand {
    TabHandle tab;
};

// An absent group id means "put the tab into a new group".
struct MoveTabCommand {
    TabHandle tab;
    std::optional<size_t> target_group_id;
    std::optional<size_t> target_index;
};

struct MoveGroupCommand {
    size_t group_id = 0;
    size_t target_index = 0;
};

struct RenameTabCommand {
    TabHandle tab;
};

struct RenameGroupCommand {
    size_t group_id = 0;
};

using PanelCommand = std::variant<FocusTabCommand, CloseTabCommand, MoveTabCommand,
                                  MoveGroupCommand, RenameTabCommand, RenameGroupCommand>;
