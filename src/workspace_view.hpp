#pragma once
#include "tab_controller.hpp"
#include <FL/Fl.H>
#include <FL/Fl_Widget.H>
#include <FL/fl_draw.H>
#include <string>

// Window body: the tab panel on the left and a placeholder for the active
// tab's content on the right. Translates FLTK events into panel input.
class WorkspaceView : public Fl_Widget {
public:
    WorkspaceView(int X, int Y, int W, int H, TabController& controller);

    void draw() override;
    int handle(int e) override;
    void resize(int X, int Y, int W, int H) override;

    void set_font_size(int size);
    void update_viewport();

private:
    TabController& controller;
    int font_size = 14;
    int cell_w = 8;
    int cell_h = 16;

    static const int PADDING_X = 4;
    static const int PADDING_Y = 6;
    static const int DOT_SIZE = 6;

    void draw_panel();
    void draw_item(const PanelItem& item, bool ghost_outline);
    void draw_content();
    void set_cursor_kind(CursorKind kind);

    PanelPoint local_point() const;
    int line_y(size_t line) const;
    std::string group_label(const PanelItem& item) const;
    std::string tab_title(const PanelItem& item) const;

    static PanelKey map_key(int key);
    static PointerButton map_button(int button);
};
