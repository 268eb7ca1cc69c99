#pragma once
#include "panel_model.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Columns that must stay available to the terminal next to the panel.
const size_t MIN_TERMINAL_COLUMNS = 2;

enum RenderStyle { STYLE_NORMAL, STYLE_GHOST };

struct PanelItem {
    enum Kind { GROUP_HEADER, TAB, GHOST_GROUP_HEADER };

    size_t line = 0;
    Kind kind = GROUP_HEADER;
    size_t group_index = 0;  // GROUP_HEADER
    PanelTab tab;            // TAB
    std::string label;       // GHOST_GROUP_HEADER
    RenderStyle style = STYLE_NORMAL;

    static PanelItem group_header(size_t line, size_t group_index);
    static PanelItem tab_row(size_t line, const PanelTab& tab, RenderStyle style = STYLE_NORMAL);
    static PanelItem ghost_group_header(size_t line, const std::string& label);
};

struct DropTarget {
    size_t group_index = 0;
    size_t group_id = 0;
    size_t index = 0;

    bool operator==(const DropTarget& other) const {
        return group_index == other.group_index && group_id == other.group_id &&
               index == other.index;
    }
    bool operator!=(const DropTarget& other) const { return !(*this == other); }
};

struct PanelTabPosition {
    PanelTab tab;
    size_t group_index = 0;
    size_t tab_index = 0;
};

// Pixel geometry of the panel's rows.
struct PanelMetrics {
    float cell_width = 0.0f;
    float row_height = 0.0f;
    float padding_y = 0.0f;
    float height = 0.0f;

    size_t max_lines() const;
    // Row under a y coordinate; none above the top padding or when rows are degenerate.
    std::optional<size_t> line_at(double y) const;
};

struct PanelDimensions {
    size_t columns = 0;
    float width = 0.0f;
    float max_width = 0.0f;
};

float panel_row_height(float cell_width, float cell_height);
PanelDimensions compute_panel_dimensions(bool enabled, size_t requested_columns, float cell_width,
                                         float viewport_width, float padding_x);

std::vector<PanelItem> build_panel_layout(const std::vector<PanelGroup>& groups, size_t max_lines);

std::optional<DropTarget> compute_drop_target(const std::vector<PanelGroup>& groups,
                                              size_t max_lines, size_t line);

std::vector<PanelItem> build_preview_layout(const std::vector<PanelGroup>& groups,
                                            size_t max_lines,
                                            const PanelTabPosition& dragged,
                                            const DropTarget& target);

std::vector<PanelItem> build_new_group_preview_layout(const std::vector<PanelGroup>& groups,
                                                      size_t max_lines,
                                                      const PanelTab& dragged,
                                                      size_t new_group_id);

std::optional<PanelTabPosition> find_panel_tab(const std::vector<PanelGroup>& groups,
                                               TabHandle handle);

const PanelItem* item_at_line(const std::vector<PanelItem>& items, size_t line);
