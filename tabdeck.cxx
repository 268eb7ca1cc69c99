#include <FL/Fl.H>
#include <FL/Fl_Double_Window.H>
#include <FL/Fl_Menu_Bar.H>
#include <FL/fl_ask.H>
#include <cstdio>
#include <cstring>
#include <spdlog/spdlog.h>
#include "src/app_settings.hpp"
#include "src/colors.hpp"
#include "src/control_api.hpp"
#include "src/log.hpp"
#include "src/tab_controller.hpp"
#include "src/workspace_view.hpp"

static Fl_Double_Window *win = nullptr;
static Fl_Menu_Bar      *menu = nullptr;
static WorkspaceView    *view = nullptr;
static TabController    *controller = nullptr;
static ControlApi       *control = nullptr;
static bool              verbose = false;
static int               terminal_count = 0;

static const int MENU_H = 25;

class TabdeckWindow : public Fl_Double_Window {
public:
    TabdeckWindow(int W, int H, const char* L = 0)
        : Fl_Double_Window(W, H, L) {}

    void resize(int X, int Y, int W, int H) override {
        Fl_Double_Window::resize(X, Y, W, H);
        if (menu && view) {
            menu->size(W, MENU_H);
            view->resize(0, MENU_H, W, H - MENU_H);
        }
    }
};

static void new_terminal_cb(Fl_Widget*, void*) {
    char title[64];
    snprintf(title, sizeof(title), "shell %d", ++terminal_count);
    controller->create_tab(TabKind::terminal(), title);
}

static void new_web_cb(Fl_Widget*, void*) {
    const char* url = fl_input("Open URL in a new tab:", "https://");
    if (!url) return;

    ControlResult<TabHandle> result = control->create_tab(TabKind::web(url), url);
    if (!result.ok()) fl_alert("Cannot open tab: %s", result.error->message.c_str());
}

static void restore_closed_tab_cb(Fl_Widget*, void*) {
    ControlResult<bool> result = control->restore_closed_tab();
    if (result.ok() && !*result.value) fl_message("No closed web tabs to reopen.");
}

static void set_web_url_cb(Fl_Widget*, void*) {
    const Tab* active = controller->registry().active_tab();
    if (!active || !active->kind.is_web()) {
        fl_alert("The active tab is not a web tab.");
        return;
    }

    const char* url = fl_input("Open URL in this tab:", active->kind.url.c_str());
    if (!url) return;

    ControlResult<bool> result = control->set_web_url(std::nullopt, url);
    if (!result.ok()) fl_alert("Cannot open URL: %s", result.error->message.c_str());
}

static void quit_cb(Fl_Widget*, void*) {
    AppSettings& settings = AppSettings::getInstance();
    settings.window_w = win->w();
    settings.window_h = win->h();
    if (!settings.saveSettings()) {
        spdlog::warn("Settings were not saved to {}", settings.directory());
    }
    win->hide();
}

static void close_tab_cb(Fl_Widget* w, void*) {
    std::optional<TabHandle> active = controller->registry().active_id();
    if (!active) return;
    if (controller->close_tab(*active)) quit_cb(w, nullptr);
}

static void next_tab_cb(Fl_Widget*, void*) {
    controller->handle_select(TabSelection::next());
}

static void previous_tab_cb(Fl_Widget*, void*) {
    controller->handle_select(TabSelection::previous());
}

static void goto_tab_cb(Fl_Widget*, void* data) {
    long index = reinterpret_cast<long>(data);
    if (index < 0) {
        controller->handle_select(TabSelection::last());
    } else {
        controller->handle_select(TabSelection::at(static_cast<size_t>(index)));
    }
}

static void rename_tab_cb(Fl_Widget*, void*) {
    if (controller->begin_active_tab_rename()) view->take_focus();
}

static void rename_group_cb(Fl_Widget*, void*) {
    std::optional<TabHandle> active = controller->registry().active_id();
    if (!active) return;

    std::optional<std::pair<size_t, size_t>> location = controller->registry().group_for_tab(*active);
    if (location && controller->begin_group_rename(location->first)) view->take_focus();
}

static void move_to_new_group_cb(Fl_Widget*, void*) {
    std::optional<TabHandle> active = controller->registry().active_id();
    if (!active) return;

    ControlResult<bool> result = control->move_tab(*active, std::nullopt, std::nullopt);
    if (!result.ok()) fl_alert("Cannot move tab: %s", result.error->message.c_str());
}

// Stand-in for PTY traffic: every terminal tab reports fresh output.
static void simulate_output_cb(Fl_Widget*, void*) {
    Clock::time_point now = Clock::now();
    for (TabHandle handle : controller->registry().ordered_tabs()) {
        controller->note_terminal_output(handle, now);
    }
}

static void toggle_panel_cb(Fl_Widget*, void*) {
    controller->set_panel_enabled(!AppSettings::getInstance().panel_enabled);
}

static void toggle_dynamic_title_cb(Fl_Widget*, void*) {
    AppSettings& settings = AppSettings::getInstance();
    settings.dynamic_title = !settings.dynamic_title;
    settings.saveSettings();
    controller->refresh_panel();
}

static void font_bigger_cb(Fl_Widget*, void*) {
    AppSettings& settings = AppSettings::getInstance();
    settings.font_size += 1;
    settings.saveSettings();
    view->set_font_size(settings.font_size);
}

static void font_smaller_cb(Fl_Widget*, void*) {
    AppSettings& settings = AppSettings::getInstance();
    if (settings.font_size <= 6) return;
    settings.font_size -= 1;
    settings.saveSettings();
    view->set_font_size(settings.font_size);
}

static void activity_tick_cb(void*) {
    controller->tick(Clock::now());
    double interval = TAB_ACTIVITY_TICK_INTERVAL.count() / 1000.0;
    Fl::repeat_timeout(interval, activity_tick_cb);
}

static int parse_arg(int, char** argv, int& i) {
    if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
        verbose = true;
        i++;
        return 1;
    }
    return 0;
}

int main(int argc, char **argv) {
    int arg_index = 1;
    if (Fl::args(argc, argv, arg_index, parse_arg) < argc) {
        fprintf(stderr, "usage: %s [--verbose] [fltk options]\n%s", argv[0], Fl::help);
        return 1;
    }

    init_logging(verbose);

    AppSettings& settings = AppSettings::getInstance();
    settings.loadSettings();

    Fl::get_system_colors();
    Fl::set_font(FL_COURIER, "Monospace");
    Fl::scheme("gtk+");

    controller = new TabController(settings);
    control = new ControlApi(*controller, settings);

    win = new TabdeckWindow(settings.window_w, settings.window_h, "tabdeck");
    win->callback(quit_cb);
    win->color(Colors::rgb(Colors::WINDOW_BG));

    menu = new Fl_Menu_Bar(0, 0, win->w(), MENU_H);
    menu->add("&Tab/New Terminal", FL_COMMAND + 't', new_terminal_cb);
    menu->add("&Tab/New Web Tab...", FL_COMMAND + FL_SHIFT + 't', new_web_cb);
    menu->add("&Tab/Open URL in Tab...", FL_COMMAND + 'l', set_web_url_cb);
    menu->add("&Tab/Close", FL_COMMAND + 'w', close_tab_cb);
    menu->add("&Tab/Reopen Closed Tab", FL_COMMAND + FL_SHIFT + 'r', restore_closed_tab_cb,
              nullptr, FL_MENU_DIVIDER);
    menu->add("&Tab/Next", FL_COMMAND + ']', next_tab_cb);
    menu->add("&Tab/Previous", FL_COMMAND + '[', previous_tab_cb);
    for (long i = 0; i < 8; ++i) {
        char label[32];
        snprintf(label, sizeof(label), "&Tab/Go To/Tab %ld", i + 1);
        menu->add(label, FL_COMMAND + static_cast<int>('1' + i), goto_tab_cb,
                  reinterpret_cast<void*>(i));
    }
    menu->add("&Tab/Go To/Last Tab", FL_COMMAND + '9', goto_tab_cb, reinterpret_cast<void*>(-1L),
              FL_MENU_DIVIDER);
    menu->add("&Tab/Rename Tab", FL_F + 2, rename_tab_cb);
    menu->add("&Tab/Rename Group", FL_SHIFT + FL_F + 2, rename_group_cb);
    menu->add("&Tab/Move to New Group", 0, move_to_new_group_cb, nullptr, FL_MENU_DIVIDER);
    menu->add("&Tab/Simulate Output", 0, simulate_output_cb, nullptr, FL_MENU_DIVIDER);
    menu->add("&Tab/Quit", FL_COMMAND + 'q', quit_cb);
    menu->add("&View/Tab Panel", FL_COMMAND + 'b', toggle_panel_cb);
    menu->add("&View/Window Title Follows Tab", 0, toggle_dynamic_title_cb, nullptr,
              FL_MENU_DIVIDER);
    menu->add("&View/Bigger Font", FL_COMMAND + '=', font_bigger_cb);
    menu->add("&View/Smaller Font", FL_COMMAND + '-', font_smaller_cb);

    view = new WorkspaceView(0, MENU_H, win->w(), win->h() - MENU_H, *controller);

    controller->on_window_title = [](const std::string& title) {
        if (win) win->copy_label(title.c_str());
    };
    controller->on_tab_closed = [](const Tab& tab) {
        spdlog::info("Closed tab '{}'", tab.panel_title());
    };

    win->resizable(view);
    win->end();
    win->show();

    view->set_font_size(settings.font_size);
    new_terminal_cb(nullptr, nullptr);

    Fl::add_timeout(TAB_ACTIVITY_TICK_INTERVAL.count() / 1000.0, activity_tick_cb);
    spdlog::debug("Settings directory {}", settings.directory());

    int result = Fl::run();
    delete control;
    delete controller;
    return result;
}
