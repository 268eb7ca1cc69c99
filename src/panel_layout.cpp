#include "panel_layout.hpp"
#include <algorithm>
#include <cmath>

PanelItem PanelItem::group_header(size_t line, size_t group_index) {
    PanelItem item;
    item.line = line;
    item.kind = GROUP_HEADER;
    item.group_index = group_index;
    return item;
}

PanelItem PanelItem::tab_row(size_t line, const PanelTab& tab, RenderStyle style) {
    PanelItem item;
    item.line = line;
    item.kind = TAB;
    item.tab = tab;
    item.style = style;
    return item;
}

PanelItem PanelItem::ghost_group_header(size_t line, const std::string& label) {
    PanelItem item;
    item.line = line;
    item.kind = GHOST_GROUP_HEADER;
    item.label = label;
    item.style = STYLE_GHOST;
    return item;
}

size_t PanelMetrics::max_lines() const {
    if (row_height <= 0.0f) return 0;

    float usable = height - 2.0f * padding_y;
    if (usable <= 0.0f) return 0;
    return static_cast<size_t>(std::floor(usable / row_height));
}

std::optional<size_t> PanelMetrics::line_at(double y) const {
    if (row_height <= 0.0f || y < padding_y) return std::nullopt;
    return static_cast<size_t>(std::floor((y - padding_y) / row_height));
}

float panel_row_height(float cell_width, float cell_height) {
    // Rows are tall enough for a favicon two cells wide, plus breathing room.
    const float icon_scale = 2.0f;
    const float row_padding = 4.0f;
    float min_height = std::ceil(cell_width * icon_scale);
    return std::max(cell_height, min_height) + row_padding;
}

PanelDimensions compute_panel_dimensions(bool enabled, size_t requested_columns, float cell_width,
                                         float viewport_width, float padding_x) {
    PanelDimensions dimensions;
    if (!enabled || cell_width <= 0.0f) return dimensions;

    long available = static_cast<long>(std::floor((viewport_width - 2.0f * padding_x) / cell_width));
    long max_columns = std::max(available - static_cast<long>(MIN_TERMINAL_COLUMNS), 0L);
    if (max_columns == 0) return dimensions;

    size_t columns = std::min(requested_columns, static_cast<size_t>(max_columns));
    if (columns == 0) return dimensions;

    dimensions.columns = columns;
    dimensions.width = static_cast<float>(columns) * cell_width;
    dimensions.max_width = static_cast<float>(max_columns) * cell_width;
    return dimensions;
}

std::vector<PanelItem> build_panel_layout(const std::vector<PanelGroup>& groups, size_t max_lines) {
    std::vector<PanelItem> items;
    size_t line = 0;

    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        if (line >= max_lines) break;

        items.push_back(PanelItem::group_header(line, group_index));
        ++line;

        for (const PanelTab& tab : groups[group_index].tabs) {
            if (line >= max_lines) break;

            items.push_back(PanelItem::tab_row(line, tab));
            ++line;
        }

        // Blank separator before the next group.
        if (line < max_lines) ++line;
    }

    return items;
}

std::optional<DropTarget> compute_drop_target(const std::vector<PanelGroup>& groups,
                                              size_t max_lines, size_t line) {
    if (max_lines == 0) return std::nullopt;
    if (line >= max_lines) line = max_lines - 1;

    size_t current_line = 0;

    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        if (current_line >= max_lines) break;

        const PanelGroup& group = groups[group_index];
        size_t header_line = current_line;
        size_t remaining = max_lines > header_line + 1 ? max_lines - (header_line + 1) : 0;
        size_t visible_tabs = std::min(group.tabs.size(), remaining);
        size_t tabs_start = header_line + 1;
        size_t tabs_end = header_line + visible_tabs;
        size_t group_end = visible_tabs < remaining ? tabs_end + 1 : tabs_end;

        if (line >= header_line && line <= group_end) {
            DropTarget target;
            target.group_index = group_index;
            target.group_id = group.id;
            if (line == header_line) {
                target.index = 0;
            } else if (visible_tabs > 0 && line >= tabs_start && line <= tabs_end) {
                target.index = line - tabs_start;
            } else {
                target.index = visible_tabs;
            }
            return target;
        }

        current_line = group_end + 1;
    }

    return std::nullopt;
}

std::vector<PanelItem> build_preview_layout(const std::vector<PanelGroup>& groups,
                                            size_t max_lines,
                                            const PanelTabPosition& dragged,
                                            const DropTarget& target) {
    std::vector<PanelItem> items;
    size_t line = 0;

    // Same shift as TabRegistry::move_tab: the dragged row no longer occupies
    // a slot in front of the target.
    size_t target_index = target.index;
    if (target.group_index == dragged.group_index && target.index > dragged.tab_index) {
        target_index -= 1;
    }

    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        if (line >= max_lines) break;

        const PanelGroup& group = groups[group_index];
        bool insert_here = group_index == target.group_index;
        bool is_origin = group_index == dragged.group_index;

        // The origin group disappears once its only tab is dragged elsewhere.
        if (is_origin && !insert_here && group.tabs.size() == 1) continue;

        items.push_back(PanelItem::group_header(line, group_index));
        ++line;
        if (line >= max_lines) break;

        size_t max_index = group.tabs.size() - (is_origin ? 1 : 0);
        size_t clamped_index = std::min(target_index, max_index);
        bool inserted = false;
        size_t visible_tabs = 0;

        for (const PanelTab& tab : group.tabs) {
            if (line >= max_lines) break;
            if (tab.handle == dragged.tab.handle) continue;

            if (insert_here && !inserted && visible_tabs == clamped_index) {
                items.push_back(PanelItem::tab_row(line, dragged.tab, STYLE_GHOST));
                ++line;
                inserted = true;
                if (line >= max_lines) break;
            }

            items.push_back(PanelItem::tab_row(line, tab));
            ++line;
            ++visible_tabs;
        }

        if (line >= max_lines) break;

        if (insert_here && !inserted && visible_tabs == clamped_index) {
            items.push_back(PanelItem::tab_row(line, dragged.tab, STYLE_GHOST));
            ++line;
        }

        if (line < max_lines) ++line;
    }

    return items;
}

std::vector<PanelItem> build_new_group_preview_layout(const std::vector<PanelGroup>& groups,
                                                      size_t max_lines,
                                                      const PanelTab& dragged,
                                                      size_t new_group_id) {
    std::vector<PanelItem> items;
    size_t line = 0;

    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        if (line >= max_lines) break;

        const PanelGroup& group = groups[group_index];
        bool has_other_tabs = std::any_of(group.tabs.begin(), group.tabs.end(),
            [&dragged](const PanelTab& tab) { return tab.handle != dragged.handle; });
        if (!has_other_tabs) continue;

        items.push_back(PanelItem::group_header(line, group_index));
        ++line;

        for (const PanelTab& tab : group.tabs) {
            if (line >= max_lines) break;
            if (tab.handle == dragged.handle) continue;

            items.push_back(PanelItem::tab_row(line, tab));
            ++line;
        }

        if (line < max_lines) ++line;
    }

    if (line < max_lines) {
        items.push_back(PanelItem::ghost_group_header(line, std::to_string(new_group_id)));
        ++line;
    }

    if (line < max_lines) {
        items.push_back(PanelItem::tab_row(line, dragged, STYLE_GHOST));
    }

    return items;
}

std::optional<PanelTabPosition> find_panel_tab(const std::vector<PanelGroup>& groups,
                                               TabHandle handle) {
    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        const std::vector<PanelTab>& tabs = groups[group_index].tabs;
        for (size_t tab_index = 0; tab_index < tabs.size(); ++tab_index) {
            if (tabs[tab_index].handle == handle) {
                PanelTabPosition position;
                position.tab = tabs[tab_index];
                position.group_index = group_index;
                position.tab_index = tab_index;
                return position;
            }
        }
    }
    return std::nullopt;
}

const PanelItem* item_at_line(const std::vector<PanelItem>& items, size_t line) {
    auto it = std::find_if(items.begin(), items.end(),
        [line](const PanelItem& item) { return item.line == line; });
    return it != items.end() ? &*it : nullptr;
}
