#pragma once
#include "panel_layout.hpp"
#include "panel_model.hpp"
#include "text_edit.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Pointer travel that separates click-to-focus from drag-to-reorder.
const double DRAG_THRESHOLD_PX = 4.0;
// Half-width of the grab zone around the panel's right edge.
const double RESIZE_HANDLE_WIDTH_PX = 6.0;

struct PanelPoint {
    double x = 0.0;
    double y = 0.0;

    PanelPoint() = default;
    PanelPoint(double px, double py) : x(px), y(py) {}
};

enum PointerButton { BUTTON_LEFT, BUTTON_MIDDLE, BUTTON_RIGHT };
enum ButtonState { BUTTON_PRESSED, BUTTON_RELEASED };
enum CursorKind { CURSOR_DEFAULT, CURSOR_POINTER, CURSOR_EW_RESIZE };

enum PanelKey {
    KEY_OTHER,
    KEY_ESCAPE,
    KEY_ENTER,
    KEY_BACKSPACE,
    KEY_DELETE,
    KEY_LEFT,
    KEY_RIGHT,
    KEY_HOME,
    KEY_END,
    KEY_TAB,
};

struct PanelKeyEvent {
    PanelKey key = KEY_OTHER;
    std::string text;
    bool pressed = true;
};

struct EditTarget {
    enum Type { TAB, GROUP };

    Type type = TAB;
    TabHandle tab;
    size_t group_id = 0;

    static EditTarget for_tab(TabHandle handle);
    static EditTarget for_group(size_t group_id);

    bool operator==(const EditTarget& other) const {
        if (type != other.type) return false;
        return type == TAB ? tab == other.tab : group_id == other.group_id;
    }
    bool operator!=(const EditTarget& other) const { return !(*this == other); }
};

struct EditOutcome {
    enum Type { EDIT_NONE, EDIT_CHANGED, EDIT_COMMIT, EDIT_CANCELLED };

    Type type = EDIT_NONE;
    EditTarget target;  // EDIT_COMMIT
    std::string text;   // EDIT_COMMIT
};

// What the host should do with the input event that produced this update.
struct PanelUpdate {
    bool capture = false;
    bool needs_redraw = false;
    std::optional<CursorKind> cursor;
    std::optional<float> resize_width;
    std::optional<PanelCommand> command;
};

// Interaction modes. Exactly one is current, so combinations such as
// dragging while editing cannot be expressed.
struct IdleMode {};

struct HoveringMode {
    TabHandle tab;
};

struct PressedMode {
    TabHandle tab;
    PanelPoint start;
    std::optional<TabHandle> hover;
};

struct DraggingMode {
    TabHandle tab;
    std::optional<DropTarget> drop_target;
};

struct ResizingMode {
    double offset = 0.0;
};

struct EditingMode {
    EditTarget target;
    TextEdit edit;
};

using InteractionMode =
    std::variant<IdleMode, HoveringMode, PressedMode, DraggingMode, ResizingMode, EditingMode>;

// Pointer and keyboard state machine for the tab panel. Consumes host input,
// keeps transient UI state and emits PanelCommands for the registry owner.
class TabPanel {
public:
    void set_enabled(bool enabled) { panel_enabled = enabled; }
    bool is_enabled() const { return panel_enabled && width_cols > 0; }

    void set_dimensions(const PanelDimensions& dimensions);
    float width() const { return width_px; }
    size_t columns() const { return width_cols; }

    void set_metrics(const PanelMetrics& metrics) { panel_metrics = metrics; }
    const PanelMetrics& metrics() const { return panel_metrics; }

    // Returns true when the projection or the next group id changed.
    bool set_groups(std::vector<PanelGroup> groups, size_t new_group_id);
    const std::vector<PanelGroup>& groups() const { return panel_groups; }

    // Inline rename
    bool is_editing() const;
    bool begin_edit_tab(TabHandle handle, const std::string& title);
    bool begin_edit_group(size_t group_id, const std::string& name);
    bool cancel_edit();
    EditOutcome handle_key(const PanelKeyEvent& event);
    EditOutcome handle_ime_commit(const std::string& text);
    std::optional<EditTarget> edit_target() const;
    const TextEdit* edit() const;

    // Pointer input
    PanelUpdate pointer_moved(PanelPoint position);
    PanelUpdate pointer_button(PointerButton button, ButtonState state);
    bool should_capture(std::optional<PanelPoint> position) const;
    bool should_capture_last() const { return should_capture(last_pointer); }

    // Drawing support
    std::vector<PanelItem> layout() const;
    std::vector<PanelItem> render_layout() const;
    std::optional<size_t> drag_ghost_line(const std::vector<PanelItem>& items) const;
    std::optional<TabHandle> hover_tab() const;
    std::optional<TabHandle> dragged_tab() const;
    std::optional<DropTarget> drop_target() const;
    bool is_dragging() const { return std::holds_alternative<DraggingMode>(mode); }
    bool is_resizing() const { return std::holds_alternative<ResizingMode>(mode); }
    const InteractionMode& current_mode() const { return mode; }

private:
    struct PanelHit {
        enum Kind { HIT_GROUP, HIT_TAB };

        Kind kind = HIT_GROUP;
        size_t group_index = 0;
        TabHandle tab;
    };

    bool begin_edit(const EditTarget& target, const std::string& text);
    void validate_mode();
    void settle_after_release(const std::optional<PanelHit>& hit);

    std::optional<PanelHit> hit_test(PanelPoint position) const;
    std::optional<DropTarget> compute_drop_target(PanelPoint position) const;
    std::optional<PanelCommand> click_command(const std::optional<PanelHit>& hit,
                                              PanelPoint position,
                                              std::optional<TabHandle> hover) const;
    bool is_close_hit(PanelPoint position) const;
    bool is_inside_panel(PanelPoint position) const;
    bool is_on_resize_handle(PanelPoint position) const;
    float clamp_width(double width) const;
    size_t preview_group_id() const;

    bool panel_enabled = false;
    size_t width_cols = 0;
    float width_px = 0.0f;
    float max_width_px = 0.0f;
    PanelMetrics panel_metrics;
    std::vector<PanelGroup> panel_groups;
    size_t new_group_id = 0;
    InteractionMode mode;
    std::optional<PanelPoint> last_pointer;
};
