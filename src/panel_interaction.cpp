#include "panel_interaction.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <utility>

EditTarget EditTarget::for_tab(TabHandle handle) {
    EditTarget target;
    target.type = TAB;
    target.tab = handle;
    return target;
}

EditTarget EditTarget::for_group(size_t group_id) {
    EditTarget target;
    target.type = GROUP;
    target.group_id = group_id;
    return target;
}

void TabPanel::set_dimensions(const PanelDimensions& dimensions) {
    width_cols = dimensions.columns;
    width_px = dimensions.width;
    max_width_px = dimensions.max_width;
}

bool TabPanel::set_groups(std::vector<PanelGroup> groups, size_t next_group_id) {
    bool changed = panel_groups != groups || new_group_id != next_group_id;
    panel_groups = std::move(groups);
    new_group_id = next_group_id;
    validate_mode();
    return changed;
}

// Drops per-tab state whose tab or group is no longer part of the projection.
void TabPanel::validate_mode() {
    auto tab_exists = [this](TabHandle handle) {
        return find_panel_tab(panel_groups, handle).has_value();
    };

    if (auto* editing = std::get_if<EditingMode>(&mode)) {
        bool valid;
        if (editing->target.type == EditTarget::TAB) {
            valid = tab_exists(editing->target.tab);
        } else {
            size_t id = editing->target.group_id;
            valid = std::any_of(panel_groups.begin(), panel_groups.end(),
                [id](const PanelGroup& group) { return group.id == id; });
        }
        if (!valid) {
            spdlog::debug("Dropping inline edit, target no longer exists");
            mode = IdleMode{};
        }
    } else if (auto* hovering = std::get_if<HoveringMode>(&mode)) {
        if (!tab_exists(hovering->tab)) mode = IdleMode{};
    } else if (auto* pressed = std::get_if<PressedMode>(&mode)) {
        if (!tab_exists(pressed->tab)) mode = IdleMode{};
    } else if (auto* dragging = std::get_if<DraggingMode>(&mode)) {
        if (!tab_exists(dragging->tab)) mode = IdleMode{};
    }
}

bool TabPanel::is_editing() const {
    return std::holds_alternative<EditingMode>(mode);
}

bool TabPanel::begin_edit_tab(TabHandle handle, const std::string& title) {
    return begin_edit(EditTarget::for_tab(handle), title);
}

bool TabPanel::begin_edit_group(size_t group_id, const std::string& name) {
    return begin_edit(EditTarget::for_group(group_id), name);
}

bool TabPanel::begin_edit(const EditTarget& target, const std::string& text) {
    EditingMode next{target, TextEdit(text)};
    if (auto* editing = std::get_if<EditingMode>(&mode)) {
        if (editing->target == next.target && editing->edit == next.edit) return false;
    }
    mode = std::move(next);
    return true;
}

bool TabPanel::cancel_edit() {
    if (!is_editing()) return false;
    mode = IdleMode{};
    return true;
}

std::optional<EditTarget> TabPanel::edit_target() const {
    if (auto* editing = std::get_if<EditingMode>(&mode)) return editing->target;
    return std::nullopt;
}

const TextEdit* TabPanel::edit() const {
    if (auto* editing = std::get_if<EditingMode>(&mode)) return &editing->edit;
    return nullptr;
}

EditOutcome TabPanel::handle_key(const PanelKeyEvent& event) {
    EditOutcome outcome;
    auto* editing = std::get_if<EditingMode>(&mode);
    if (!editing || !event.pressed) return outcome;

    bool changed = false;
    switch (event.key) {
        case KEY_ESCAPE:
            mode = IdleMode{};
            outcome.type = EditOutcome::EDIT_CANCELLED;
            return outcome;
        case KEY_ENTER:
            outcome.type = EditOutcome::EDIT_COMMIT;
            outcome.target = editing->target;
            outcome.text = editing->edit.text();
            mode = IdleMode{};
            return outcome;
        case KEY_BACKSPACE: changed = editing->edit.backspace(); break;
        case KEY_DELETE: changed = editing->edit.delete_forward(); break;
        case KEY_LEFT: changed = editing->edit.move_left(); break;
        case KEY_RIGHT: changed = editing->edit.move_right(); break;
        case KEY_HOME: changed = editing->edit.move_home(); break;
        case KEY_END: changed = editing->edit.move_end(); break;
        case KEY_TAB: break;
        case KEY_OTHER: changed = editing->edit.insert_text(event.text); break;
    }

    if (changed) outcome.type = EditOutcome::EDIT_CHANGED;
    return outcome;
}

EditOutcome TabPanel::handle_ime_commit(const std::string& text) {
    EditOutcome outcome;
    auto* editing = std::get_if<EditingMode>(&mode);
    if (editing && editing->edit.insert_text(text)) outcome.type = EditOutcome::EDIT_CHANGED;
    return outcome;
}

PanelUpdate TabPanel::pointer_moved(PanelPoint position) {
    last_pointer = position;
    PanelUpdate update;
    if (!is_enabled()) return update;

    if (auto* resizing = std::get_if<ResizingMode>(&mode)) {
        update.capture = true;
        update.needs_redraw = true;
        update.cursor = CURSOR_EW_RESIZE;
        update.resize_width = clamp_width(position.x + resizing->offset);
        return update;
    }

    bool drag_active = std::holds_alternative<PressedMode>(mode) ||
                       std::holds_alternative<DraggingMode>(mode);
    bool resize_hit = !drag_active && is_on_resize_handle(position);

    if (!should_capture(position) && !resize_hit) {
        if (std::holds_alternative<HoveringMode>(mode)) {
            mode = IdleMode{};
            update.needs_redraw = true;
        }
        return update;
    }

    std::optional<PanelHit> hit;
    if (!resize_hit) hit = hit_test(position);

    std::optional<TabHandle> next_hover;
    if (hit && hit->kind == PanelHit::HIT_TAB) next_hover = hit->tab;

    if (auto* pressed = std::get_if<PressedMode>(&mode)) {
        pressed->hover = next_hover;
        double dx = position.x - pressed->start.x;
        double dy = position.y - pressed->start.y;
        if (std::sqrt(dx * dx + dy * dy) > DRAG_THRESHOLD_PX) {
            DraggingMode dragging{pressed->tab, compute_drop_target(position)};
            mode = dragging;
        }
        update.needs_redraw = true;
    } else if (auto* dragging = std::get_if<DraggingMode>(&mode)) {
        std::optional<DropTarget> target = compute_drop_target(position);
        update.needs_redraw = target != dragging->drop_target;
        dragging->drop_target = target;
    } else if (!is_editing()) {
        std::optional<TabHandle> previous = hover_tab();
        if (next_hover) {
            mode = HoveringMode{*next_hover};
        } else {
            mode = IdleMode{};
        }
        update.needs_redraw = previous != next_hover;
    }

    update.capture = true;
    if (resize_hit) {
        update.cursor = CURSOR_EW_RESIZE;
    } else if (next_hover) {
        update.cursor = CURSOR_POINTER;
    } else {
        update.cursor = CURSOR_DEFAULT;
    }
    return update;
}

PanelUpdate TabPanel::pointer_button(PointerButton button, ButtonState state) {
    PanelUpdate update;
    if (!last_pointer || !should_capture(last_pointer)) return update;

    PanelPoint position = *last_pointer;
    update.capture = true;

    // Hover is not tracked while editing, so take it from the press position.
    if (state == BUTTON_PRESSED && is_editing()) {
        std::optional<PanelHit> hit = hit_test(position);
        if (hit && hit->kind == PanelHit::HIT_TAB) {
            mode = HoveringMode{hit->tab};
        } else {
            mode = IdleMode{};
        }
        update.needs_redraw = true;
    }

    if (button == BUTTON_RIGHT) {
        if (state == BUTTON_RELEASED) {
            std::optional<PanelHit> hit = hit_test(position);
            if (hit && hit->kind == PanelHit::HIT_TAB) {
                update.command = RenameTabCommand{hit->tab};
            } else if (hit && hit->group_index < panel_groups.size()) {
                update.command = RenameGroupCommand{panel_groups[hit->group_index].id};
            }
            update.needs_redraw = update.needs_redraw || update.command.has_value();
        }
        return update;
    }

    if (button != BUTTON_LEFT) return update;

    bool idle_like = std::holds_alternative<IdleMode>(mode) ||
                     std::holds_alternative<HoveringMode>(mode);

    if (state == BUTTON_PRESSED) {
        if (!idle_like) return update;

        if (is_on_resize_handle(position)) {
            mode = ResizingMode{width_px - position.x};
            update.needs_redraw = true;
            return update;
        }

        std::optional<PanelHit> hit = hit_test(position);
        if (hit && hit->kind == PanelHit::HIT_TAB && !is_close_hit(position)) {
            mode = PressedMode{hit->tab, position, hover_tab()};
            update.needs_redraw = true;
        }
        return update;
    }

    if (is_resizing()) {
        mode = IdleMode{};
        update.needs_redraw = true;
        return update;
    }

    std::optional<PanelHit> hit = hit_test(position);

    if (auto* pressed = std::get_if<PressedMode>(&mode)) {
        update.command = click_command(hit, position, pressed->hover);
        settle_after_release(hit);
        update.needs_redraw = true;
    } else if (auto* dragging = std::get_if<DraggingMode>(&mode)) {
        TabHandle tab = dragging->tab;
        std::optional<DropTarget> target = compute_drop_target(position);
        if (target) {
            update.command = MoveTabCommand{tab, target->group_id, target->index};
        } else if (is_inside_panel(position)) {
            update.command = MoveTabCommand{tab, std::nullopt, std::nullopt};
        }
        settle_after_release(hit);
        update.needs_redraw = true;
    } else if (idle_like) {
        update.command = click_command(hit, position, hover_tab());
        update.needs_redraw = update.needs_redraw || update.command.has_value();
    }

    return update;
}

void TabPanel::settle_after_release(const std::optional<PanelHit>& hit) {
    if (hit && hit->kind == PanelHit::HIT_TAB) {
        mode = HoveringMode{hit->tab};
    } else {
        mode = IdleMode{};
    }
}

bool TabPanel::should_capture(std::optional<PanelPoint> position) const {
    if (!is_enabled()) return false;
    if (std::holds_alternative<PressedMode>(mode) || std::holds_alternative<DraggingMode>(mode) ||
        std::holds_alternative<ResizingMode>(mode)) {
        return true;
    }
    if (!position) return false;
    return is_inside_panel(*position) || is_on_resize_handle(*position);
}

std::vector<PanelItem> TabPanel::layout() const {
    return build_panel_layout(panel_groups, panel_metrics.max_lines());
}

std::vector<PanelItem> TabPanel::render_layout() const {
    const auto* dragging = std::get_if<DraggingMode>(&mode);
    if (!dragging) return layout();

    std::optional<PanelTabPosition> dragged = find_panel_tab(panel_groups, dragging->tab);
    if (!dragged) return layout();

    size_t max_lines = panel_metrics.max_lines();
    if (dragging->drop_target) {
        return build_preview_layout(panel_groups, max_lines, *dragged, *dragging->drop_target);
    }
    if (last_pointer && is_inside_panel(*last_pointer)) {
        return build_new_group_preview_layout(panel_groups, max_lines, dragged->tab,
                                              preview_group_id());
    }
    return layout();
}

std::optional<size_t> TabPanel::drag_ghost_line(const std::vector<PanelItem>& items) const {
    const auto* dragging = std::get_if<DraggingMode>(&mode);
    if (!dragging || !last_pointer) return std::nullopt;
    if (!find_panel_tab(panel_groups, dragging->tab)) return std::nullopt;

    size_t max_lines = panel_metrics.max_lines();
    if (max_lines == 0) return std::nullopt;

    size_t line = panel_metrics.line_at(last_pointer->y).value_or(0);
    line = std::min(line, max_lines - 1);

    const PanelItem* item = item_at_line(items, line);
    if (!item || item->kind != PanelItem::TAB) return std::nullopt;
    return line;
}

std::optional<TabHandle> TabPanel::hover_tab() const {
    if (const auto* hovering = std::get_if<HoveringMode>(&mode)) return hovering->tab;
    if (const auto* pressed = std::get_if<PressedMode>(&mode)) return pressed->hover;
    return std::nullopt;
}

std::optional<TabHandle> TabPanel::dragged_tab() const {
    if (const auto* dragging = std::get_if<DraggingMode>(&mode)) return dragging->tab;
    return std::nullopt;
}

std::optional<DropTarget> TabPanel::drop_target() const {
    if (const auto* dragging = std::get_if<DraggingMode>(&mode)) return dragging->drop_target;
    return std::nullopt;
}

std::optional<TabPanel::PanelHit> TabPanel::hit_test(PanelPoint position) const {
    if (!is_inside_panel(position)) return std::nullopt;

    std::optional<size_t> line = panel_metrics.line_at(position.y);
    if (!line) return std::nullopt;

    std::vector<PanelItem> items = layout();
    const PanelItem* item = item_at_line(items, *line);
    if (!item) return std::nullopt;

    PanelHit hit;
    switch (item->kind) {
        case PanelItem::GROUP_HEADER:
            hit.kind = PanelHit::HIT_GROUP;
            hit.group_index = item->group_index;
            return hit;
        case PanelItem::TAB:
            hit.kind = PanelHit::HIT_TAB;
            hit.tab = item->tab.handle;
            return hit;
        case PanelItem::GHOST_GROUP_HEADER:
            break;
    }
    return std::nullopt;
}

std::optional<DropTarget> TabPanel::compute_drop_target(PanelPoint position) const {
    if (!is_inside_panel(position)) return std::nullopt;

    std::optional<size_t> line = panel_metrics.line_at(position.y);
    if (!line) return std::nullopt;

    return ::compute_drop_target(panel_groups, panel_metrics.max_lines(), *line);
}

std::optional<PanelCommand> TabPanel::click_command(const std::optional<PanelHit>& hit,
                                                    PanelPoint position,
                                                    std::optional<TabHandle> hover) const {
    if (!hit || hit->kind != PanelHit::HIT_TAB) return std::nullopt;

    if (is_close_hit(position) && hover == hit->tab) return PanelCommand(CloseTabCommand{hit->tab});
    return PanelCommand(FocusTabCommand{hit->tab});
}

// The close glyph sits in the last panel column, and only when the panel is
// wide enough to leave room for a title.
bool TabPanel::is_close_hit(PanelPoint position) const {
    if (width_cols == 0 || panel_metrics.cell_width <= 0.0f) return false;

    size_t close_col = width_cols - 1;
    if (close_col <= 1 || position.x < 0.0) return false;

    size_t col = static_cast<size_t>(std::floor(position.x / panel_metrics.cell_width));
    return col == close_col;
}

bool TabPanel::is_inside_panel(PanelPoint position) const {
    return position.x >= 0.0 && position.x < width_px;
}

bool TabPanel::is_on_resize_handle(PanelPoint position) const {
    if (!is_enabled()) return false;

    double left = std::max(0.0, static_cast<double>(width_px) - RESIZE_HANDLE_WIDTH_PX);
    double right = static_cast<double>(width_px) + RESIZE_HANDLE_WIDTH_PX;
    return position.x >= left && position.x <= right;
}

float TabPanel::clamp_width(double width) const {
    double clamped = std::max(0.0, width);
    double min_width = panel_metrics.cell_width;
    double max_width = max_width_px;
    if (min_width > 0.0 && max_width >= min_width) {
        clamped = std::min(std::max(clamped, min_width), max_width);
    }
    return static_cast<float>(clamped);
}

size_t TabPanel::preview_group_id() const {
    if (new_group_id != 0) return new_group_id;

    size_t max_id = 0;
    for (const PanelGroup& group : panel_groups) max_id = std::max(max_id, group.id);
    return max_id + 1;
}
