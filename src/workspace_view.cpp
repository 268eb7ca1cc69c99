#include "workspace_view.hpp"
#include "colors.hpp"
#include <FL/Fl_Window.H>
#include <algorithm>
#include <cmath>

WorkspaceView::WorkspaceView(int X, int Y, int W, int H, TabController& tab_controller)
    : Fl_Widget(X, Y, W, H), controller(tab_controller) {
    box(FL_FLAT_BOX);
    color(Colors::rgb(Colors::CONTENT_BG));

    controller.on_redraw = [this]() { redraw(); };
    controller.on_cursor = [this](CursorKind kind) { set_cursor_kind(kind); };
}

void WorkspaceView::set_font_size(int size) {
    font_size = size;
    update_viewport();
}

// Cell size follows the monospace font, like the terminal grid would.
void WorkspaceView::update_viewport() {
    fl_font(FL_COURIER, font_size);
    cell_w = std::max(1, static_cast<int>(std::ceil(fl_width("M"))));
    cell_h = std::max(1, fl_height());
    controller.set_viewport(static_cast<float>(w()), static_cast<float>(h()),
                            static_cast<float>(cell_w), static_cast<float>(cell_h),
                            static_cast<float>(PADDING_X), static_cast<float>(PADDING_Y));
}

void WorkspaceView::resize(int X, int Y, int W, int H) {
    Fl_Widget::resize(X, Y, W, H);
    update_viewport();
}

void WorkspaceView::set_cursor_kind(CursorKind kind) {
    Fl_Window* win = window();
    if (!win) return;

    switch (kind) {
        case CURSOR_POINTER: win->cursor(FL_CURSOR_HAND); break;
        case CURSOR_EW_RESIZE: win->cursor(FL_CURSOR_WE); break;
        case CURSOR_DEFAULT: win->cursor(FL_CURSOR_DEFAULT); break;
    }
}

PanelPoint WorkspaceView::local_point() const {
    return PanelPoint(Fl::event_x() - x(), Fl::event_y() - y());
}

int WorkspaceView::line_y(size_t line) const {
    const PanelMetrics& metrics = controller.panel().metrics();
    return y() + static_cast<int>(metrics.padding_y + line * metrics.row_height);
}

std::string WorkspaceView::group_label(const PanelItem& item) const {
    const TabPanel& panel = controller.panel();
    if (item.kind == PanelItem::GHOST_GROUP_HEADER) return "group " + item.label;
    if (item.group_index >= panel.groups().size()) return std::string();

    const PanelGroup& group = panel.groups()[item.group_index];
    std::optional<EditTarget> target = panel.edit_target();
    if (target && target->type == EditTarget::GROUP && target->group_id == group.id) {
        return panel.edit()->render_with_cursor();
    }
    return group.label;
}

std::string WorkspaceView::tab_title(const PanelItem& item) const {
    const TabPanel& panel = controller.panel();
    std::optional<EditTarget> target = panel.edit_target();
    if (target && target->type == EditTarget::TAB && target->tab == item.tab.handle) {
        return panel.edit()->render_with_cursor();
    }
    return item.tab.title;
}

void WorkspaceView::draw() {
    fl_push_clip(x(), y(), w(), h());
    draw_content();
    if (controller.panel().is_enabled()) draw_panel();
    fl_pop_clip();
}

void WorkspaceView::draw_content() {
    int panel_w = controller.panel().is_enabled() ? static_cast<int>(controller.panel().width()) : 0;
    int cx = x() + panel_w;
    int cw = w() - panel_w;

    fl_color(Colors::rgb(Colors::CONTENT_BG));
    fl_rectf(cx, y(), cw, h());

    const Tab* active = controller.registry().active_tab();
    std::string line1 = active ? active->panel_title() : std::string("No tabs open");
    std::string line2;
    if (active) line2 = active->kind.is_web() ? active->kind.url : std::string("terminal");

    fl_font(FL_HELVETICA, font_size + 2);
    fl_color(Colors::rgb(active ? Colors::TEXT_PRIMARY : Colors::TEXT_DISABLED));
    fl_draw(line1.c_str(), cx, y() + h() / 2 - fl_height(), cw, fl_height(), FL_ALIGN_CENTER);

    if (!line2.empty()) {
        fl_font(FL_HELVETICA, font_size);
        fl_color(Colors::rgb(Colors::TEXT_DISABLED));
        fl_draw(line2.c_str(), cx, y() + h() / 2 + 4, cw, fl_height(), FL_ALIGN_CENTER);
    }
}

void WorkspaceView::draw_panel() {
    const TabPanel& panel = controller.panel();
    int panel_w = static_cast<int>(panel.width());

    fl_color(Colors::rgb(Colors::PANEL_BG));
    fl_rectf(x(), y(), panel_w, h());

    // Right edge doubles as the resize handle.
    fl_color(Colors::rgb(panel.is_resizing() ? Colors::ACCENT_BLUE : Colors::BORDER));
    fl_line_style(FL_SOLID, panel.is_resizing() ? 2 : 1);
    fl_line(x() + panel_w - 1, y(), x() + panel_w - 1, y() + h());
    fl_line_style(FL_SOLID, 1);

    std::vector<PanelItem> items = panel.render_layout();
    std::optional<size_t> ghost_line = panel.drag_ghost_line(items);

    fl_push_clip(x(), y(), panel_w - 1, h());
    for (const PanelItem& item : items) {
        draw_item(item, ghost_line == item.line);
    }
    fl_pop_clip();
}

void WorkspaceView::draw_item(const PanelItem& item, bool ghost_outline) {
    const TabPanel& panel = controller.panel();
    const PanelMetrics& metrics = panel.metrics();
    int row_y = line_y(item.line);
    int row_h = static_cast<int>(metrics.row_height);
    int panel_w = static_cast<int>(panel.width());
    bool ghost = item.style == STYLE_GHOST;

    fl_font(FL_COURIER, font_size);
    int baseline = row_y + (row_h + fl_height()) / 2 - fl_descent();

    if (item.kind != PanelItem::TAB) {
        const unsigned char* fg = Colors::TEXT_SECONDARY;
        fl_color(ghost ? Colors::blend(fg, Colors::PANEL_BG, 0.5f) : Colors::rgb(fg));
        fl_font(FL_COURIER_BOLD, font_size);
        std::string label = group_label(item);
        fl_draw(label.c_str(), x() + PADDING_X, baseline);
        return;
    }

    const PanelTab& tab = item.tab;
    std::optional<TabHandle> hover = panel.hover_tab();
    bool hovered = hover && *hover == tab.handle;

    if (tab.is_active || hovered) {
        const unsigned char* bg = tab.is_active ? Colors::ACTIVE_TAB_BG : Colors::HOVER_BG;
        fl_color(ghost ? Colors::blend(bg, Colors::PANEL_BG, 0.5f) : Colors::rgb(bg));
        fl_rectf(x(), row_y, panel_w - 1, row_h);
    }
    if (tab.is_active) {
        fl_color(Colors::rgb(Colors::ACCENT_BLUE));
        fl_rectf(x(), row_y, 2, row_h);
    }

    // Column 0: web marker or output indicator.
    int dot_x = x() + (cell_w - DOT_SIZE) / 2 + 2;
    int dot_y = row_y + (row_h - DOT_SIZE) / 2;
    if (tab.kind.is_web()) {
        fl_color(Colors::rgb(Colors::ACCENT_CYAN));
        fl_arc(dot_x, dot_y, DOT_SIZE, DOT_SIZE, 0, 360);
    } else if (tab.activity) {
        if (tab.activity->is_active(Clock::now())) {
            fl_color(Colors::rgb(Colors::OUTPUT_ACTIVE));
            fl_pie(dot_x, dot_y, DOT_SIZE, DOT_SIZE, 0, 360);
        } else if (tab.activity->has_unseen_output) {
            fl_color(Colors::rgb(Colors::OUTPUT_UNSEEN));
            fl_pie(dot_x, dot_y, DOT_SIZE, DOT_SIZE, 0, 360);
        }
    }

    size_t columns = panel.columns();
    bool has_close = columns > 2;
    int title_cols = static_cast<int>(columns) - (has_close ? 2 : 1);
    int text_x = x() + cell_w;

    const unsigned char* fg = tab.is_active ? Colors::TEXT_PRIMARY : Colors::TEXT_SECONDARY;
    fl_color(ghost ? Colors::blend(fg, Colors::PANEL_BG, 0.5f) : Colors::rgb(fg));
    std::string title = tab_title(item);
    fl_push_clip(text_x, row_y, std::max(0, title_cols * cell_w), row_h);
    fl_draw(title.c_str(), text_x, baseline);
    fl_pop_clip();

    if (has_close && (hovered || tab.is_active) && !ghost) {
        int close_x = x() + static_cast<int>((columns - 1) * cell_w);
        fl_color(Colors::rgb(hovered ? Colors::CLOSE_HOVER : Colors::TEXT_DISABLED));
        fl_draw("x", close_x, baseline);
    }

    if (ghost_outline) {
        fl_color(Colors::rgb(Colors::ACCENT_BLUE));
        fl_rect(x() + 1, row_y, panel_w - 3, row_h);
    }
}

int WorkspaceView::handle(int e) {
    switch (e) {
    case FL_ENTER:
    case FL_MOVE:
    case FL_DRAG:
        controller.pointer_moved(local_point());
        return 1;

    case FL_LEAVE:
        controller.pointer_moved(PanelPoint(-1.0, -1.0));
        set_cursor_kind(CURSOR_DEFAULT);
        return 1;

    case FL_PUSH:
        take_focus();
        controller.pointer_moved(local_point());
        controller.pointer_button(map_button(Fl::event_button()), BUTTON_PRESSED);
        return 1;

    case FL_RELEASE:
        controller.pointer_moved(local_point());
        controller.pointer_button(map_button(Fl::event_button()), BUTTON_RELEASED);
        return 1;

    case FL_FOCUS:
    case FL_UNFOCUS:
        return 1;

    case FL_KEYBOARD: {
        if (controller.panel().is_editing() && (Fl::event_state() & FL_COMMAND) &&
            Fl::event_key() == 'v') {
            Fl::paste(*this, 1);
            return 1;
        }
        PanelKeyEvent event;
        event.key = map_key(Fl::event_key());
        if (Fl::event_text()) event.text = Fl::event_text();
        return controller.key_input(event) ? 1 : 0;
    }

    // Clipboard text requested above while renaming.
    case FL_PASTE:
        return controller.ime_commit(Fl::event_text() ? Fl::event_text() : "") ? 1 : 0;
    }
    return Fl_Widget::handle(e);
}

PanelKey WorkspaceView::map_key(int key) {
    switch (key) {
        case FL_Escape: return KEY_ESCAPE;
        case FL_Enter:
        case FL_KP_Enter: return KEY_ENTER;
        case FL_BackSpace: return KEY_BACKSPACE;
        case FL_Delete: return KEY_DELETE;
        case FL_Left: return KEY_LEFT;
        case FL_Right: return KEY_RIGHT;
        case FL_Home: return KEY_HOME;
        case FL_End: return KEY_END;
        case FL_Tab: return KEY_TAB;
        default: return KEY_OTHER;
    }
}

PointerButton WorkspaceView::map_button(int button) {
    switch (button) {
        case FL_RIGHT_MOUSE: return BUTTON_RIGHT;
        case FL_MIDDLE_MOUSE: return BUTTON_MIDDLE;
        default: return BUTTON_LEFT;
    }
}
