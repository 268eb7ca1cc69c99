#include "panel_interaction.hpp"
#include <gtest/gtest.h>

namespace {

const TabHandle TAB_A(0, 0);
const TabHandle TAB_B(1, 0);
const TabHandle TAB_C(2, 0);

PanelTab make_tab(TabHandle handle, const std::string& title) {
    PanelTab tab;
    tab.handle = handle;
    tab.title = title;
    return tab;
}

// Twenty 10px columns (200px wide), 20px rows without padding: line n spans
// y in [20n, 20n + 20).
class TabPanelTest : public ::testing::Test {
protected:
    TabPanel panel;

    void SetUp() override {
        panel.set_enabled(true);

        PanelDimensions dimensions;
        dimensions.columns = 20;
        dimensions.width = 200.0f;
        dimensions.max_width = 400.0f;
        panel.set_dimensions(dimensions);

        PanelMetrics metrics;
        metrics.cell_width = 10.0f;
        metrics.row_height = 20.0f;
        metrics.padding_y = 0.0f;
        metrics.height = 400.0f;
        panel.set_metrics(metrics);

        PanelGroup group;
        group.id = 1;
        group.label = "group 1";
        group.tabs = {make_tab(TAB_A, "a"), make_tab(TAB_B, "b"), make_tab(TAB_C, "c")};
        panel.set_groups({group}, 2);
    }

    static double line_y(size_t line) { return line * 20.0 + 10.0; }
};

template <typename T>
const T* command_as(const PanelUpdate& update) {
    if (!update.command) return nullptr;
    return std::get_if<T>(&*update.command);
}

}  // namespace

TEST_F(TabPanelTest, HoverTracksTabUnderPointer) {
    PanelUpdate update = panel.pointer_moved(PanelPoint(50, line_y(1)));
    EXPECT_TRUE(update.capture);
    EXPECT_TRUE(update.needs_redraw);
    EXPECT_EQ(update.cursor, CURSOR_POINTER);
    EXPECT_EQ(panel.hover_tab(), TAB_A);

    update = panel.pointer_moved(PanelPoint(60, line_y(1)));
    EXPECT_FALSE(update.needs_redraw);

    update = panel.pointer_moved(PanelPoint(50, line_y(0)));
    EXPECT_EQ(update.cursor, CURSOR_DEFAULT);
    EXPECT_FALSE(panel.hover_tab().has_value());
}

TEST_F(TabPanelTest, PointerOutsidePanelIsNotCaptured) {
    panel.pointer_moved(PanelPoint(50, line_y(2)));
    PanelUpdate update = panel.pointer_moved(PanelPoint(300, line_y(2)));

    EXPECT_FALSE(update.capture);
    EXPECT_TRUE(update.needs_redraw);
    EXPECT_FALSE(panel.hover_tab().has_value());
    EXPECT_FALSE(panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED).capture);
}

TEST_F(TabPanelTest, DisabledPanelIgnoresInput) {
    panel.set_enabled(false);
    EXPECT_FALSE(panel.pointer_moved(PanelPoint(50, line_y(1))).capture);
    EXPECT_FALSE(panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED).capture);
}

TEST_F(TabPanelTest, ClickFocusesTab) {
    panel.pointer_moved(PanelPoint(50, line_y(2)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);

    const FocusTabCommand* focus = command_as<FocusTabCommand>(update);
    ASSERT_NE(focus, nullptr);
    EXPECT_EQ(focus->tab, TAB_B);
    EXPECT_EQ(panel.hover_tab(), TAB_B);
}

TEST_F(TabPanelTest, FourPixelsOfTravelIsStillAClick) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);

    panel.pointer_moved(PanelPoint(54, line_y(1)));
    EXPECT_FALSE(panel.is_dragging());

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    EXPECT_NE(command_as<FocusTabCommand>(update), nullptr);
}

TEST_F(TabPanelTest, FivePixelsOfTravelStartsDrag) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);

    panel.pointer_moved(PanelPoint(55, line_y(1)));
    EXPECT_TRUE(panel.is_dragging());
    EXPECT_EQ(panel.dragged_tab(), TAB_A);
}

TEST_F(TabPanelTest, DiagonalTravelUsesEuclideanDistance) {
    panel.pointer_moved(PanelPoint(50, 30));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);

    panel.pointer_moved(PanelPoint(52, 33));
    EXPECT_FALSE(panel.is_dragging());
    panel.pointer_moved(PanelPoint(53, 34));
    EXPECT_TRUE(panel.is_dragging());
}

TEST_F(TabPanelTest, DropOnTabRowEmitsMove) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    panel.pointer_moved(PanelPoint(50, line_y(3)));

    ASSERT_TRUE(panel.drop_target().has_value());
    EXPECT_EQ(panel.drop_target()->index, 2u);

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    const MoveTabCommand* move = command_as<MoveTabCommand>(update);
    ASSERT_NE(move, nullptr);
    EXPECT_EQ(move->tab, TAB_A);
    EXPECT_EQ(move->target_group_id, size_t(1));
    EXPECT_EQ(move->target_index, size_t(2));
    EXPECT_FALSE(panel.is_dragging());
}

TEST_F(TabPanelTest, DropOnTrailingBlankAppends) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    panel.pointer_moved(PanelPoint(50, line_y(4)));

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    const MoveTabCommand* move = command_as<MoveTabCommand>(update);
    ASSERT_NE(move, nullptr);
    EXPECT_EQ(move->target_index, size_t(3));
}

TEST_F(TabPanelTest, DropBelowGroupsRequestsNewGroup) {
    panel.pointer_moved(PanelPoint(50, line_y(3)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    panel.pointer_moved(PanelPoint(50, line_y(10)));

    EXPECT_FALSE(panel.drop_target().has_value());
    std::vector<PanelItem> preview = panel.render_layout();
    ASSERT_FALSE(preview.empty());
    EXPECT_EQ(preview[preview.size() - 2].kind, PanelItem::GHOST_GROUP_HEADER);
    EXPECT_EQ(preview[preview.size() - 2].label, "2");

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    const MoveTabCommand* move = command_as<MoveTabCommand>(update);
    ASSERT_NE(move, nullptr);
    EXPECT_EQ(move->tab, TAB_C);
    EXPECT_FALSE(move->target_group_id.has_value());
    EXPECT_FALSE(move->target_index.has_value());
}

TEST_F(TabPanelTest, DropOutsidePanelDoesNothing) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    PanelUpdate update = panel.pointer_moved(PanelPoint(300, line_y(2)));
    EXPECT_TRUE(update.capture);

    update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    EXPECT_TRUE(update.capture);
    EXPECT_FALSE(update.command.has_value());
    EXPECT_FALSE(panel.is_dragging());
}

TEST_F(TabPanelTest, DragPreviewShowsGhostRow) {
    panel.pointer_moved(PanelPoint(50, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    panel.pointer_moved(PanelPoint(50, line_y(3)));

    std::vector<PanelItem> preview = panel.render_layout();
    ASSERT_EQ(preview.size(), 4u);
    EXPECT_EQ(preview[1].tab.handle, TAB_B);
    EXPECT_EQ(preview[2].tab.handle, TAB_A);
    EXPECT_EQ(preview[2].style, STYLE_GHOST);
    EXPECT_EQ(panel.drag_ghost_line(preview), size_t(3));
}

TEST_F(TabPanelTest, CloseColumnClosesHoveredTab) {
    // Column 19 spans x in [190, 200); the resize grab starts at 194.
    panel.pointer_moved(PanelPoint(191, line_y(2)));
    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    EXPECT_TRUE(update.capture);

    update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    const CloseTabCommand* close = command_as<CloseTabCommand>(update);
    ASSERT_NE(close, nullptr);
    EXPECT_EQ(close->tab, TAB_B);
}

TEST_F(TabPanelTest, NarrowPanelHasNoCloseColumn) {
    PanelDimensions dimensions;
    dimensions.columns = 2;
    dimensions.width = 20.0f;
    dimensions.max_width = 400.0f;
    panel.set_dimensions(dimensions);

    panel.pointer_moved(PanelPoint(11, line_y(1)));
    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    EXPECT_EQ(command_as<CloseTabCommand>(update), nullptr);
}

TEST_F(TabPanelTest, RightClickRequestsRename) {
    panel.pointer_moved(PanelPoint(50, line_y(3)));
    PanelUpdate update = panel.pointer_button(BUTTON_RIGHT, BUTTON_PRESSED);
    EXPECT_TRUE(update.capture);
    EXPECT_FALSE(update.command.has_value());

    update = panel.pointer_button(BUTTON_RIGHT, BUTTON_RELEASED);
    const RenameTabCommand* rename = command_as<RenameTabCommand>(update);
    ASSERT_NE(rename, nullptr);
    EXPECT_EQ(rename->tab, TAB_C);

    panel.pointer_moved(PanelPoint(50, line_y(0)));
    update = panel.pointer_button(BUTTON_RIGHT, BUTTON_RELEASED);
    const RenameGroupCommand* rename_group = command_as<RenameGroupCommand>(update);
    ASSERT_NE(rename_group, nullptr);
    EXPECT_EQ(rename_group->group_id, 1u);
}

TEST_F(TabPanelTest, ResizeFollowsPointerWithGrabOffset) {
    PanelUpdate update = panel.pointer_moved(PanelPoint(194, line_y(1)));
    EXPECT_EQ(update.cursor, CURSOR_EW_RESIZE);

    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    EXPECT_TRUE(panel.is_resizing());

    update = panel.pointer_moved(PanelPoint(300, line_y(1)));
    ASSERT_TRUE(update.resize_width.has_value());
    EXPECT_FLOAT_EQ(*update.resize_width, 306.0f);

    update = panel.pointer_moved(PanelPoint(900, line_y(1)));
    EXPECT_FLOAT_EQ(*update.resize_width, 400.0f);

    update = panel.pointer_moved(PanelPoint(-50, line_y(1)));
    EXPECT_FLOAT_EQ(*update.resize_width, 10.0f);

    panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    EXPECT_FALSE(panel.is_resizing());
}

TEST_F(TabPanelTest, EditCommitCarriesTypedText) {
    ASSERT_TRUE(panel.begin_edit_tab(TAB_A, "old"));
    EXPECT_FALSE(panel.begin_edit_tab(TAB_A, "old"));

    PanelKeyEvent typed;
    typed.text = "X";
    EXPECT_EQ(panel.handle_key(typed).type, EditOutcome::EDIT_CHANGED);
    EXPECT_EQ(panel.edit()->text(), "oldX");

    PanelKeyEvent enter;
    enter.key = KEY_ENTER;
    EditOutcome outcome = panel.handle_key(enter);
    EXPECT_EQ(outcome.type, EditOutcome::EDIT_COMMIT);
    EXPECT_EQ(outcome.target, EditTarget::for_tab(TAB_A));
    EXPECT_EQ(outcome.text, "oldX");
    EXPECT_FALSE(panel.is_editing());
}

TEST_F(TabPanelTest, EscapeCancelsEdit) {
    panel.begin_edit_group(1, "group 1");

    PanelKeyEvent release;
    release.key = KEY_ESCAPE;
    release.pressed = false;
    EXPECT_EQ(panel.handle_key(release).type, EditOutcome::EDIT_NONE);

    PanelKeyEvent escape;
    escape.key = KEY_ESCAPE;
    EXPECT_EQ(panel.handle_key(escape).type, EditOutcome::EDIT_CANCELLED);
    EXPECT_FALSE(panel.is_editing());
}

TEST_F(TabPanelTest, KeysAreIgnoredWhenNotEditing) {
    PanelKeyEvent typed;
    typed.text = "x";
    EXPECT_EQ(panel.handle_key(typed).type, EditOutcome::EDIT_NONE);
    EXPECT_EQ(panel.handle_ime_commit("x").type, EditOutcome::EDIT_NONE);
}

TEST_F(TabPanelTest, ImeCommitInsertsText) {
    panel.begin_edit_tab(TAB_B, "");
    EXPECT_EQ(panel.handle_ime_commit("\xE6\x97\xA5").type, EditOutcome::EDIT_CHANGED);
    EXPECT_EQ(panel.edit()->cursor(), 1u);
}

TEST_F(TabPanelTest, PressCancelsEditBeforeHandlingClick) {
    panel.begin_edit_tab(TAB_A, "a");
    panel.pointer_moved(PanelPoint(50, line_y(2)));
    EXPECT_TRUE(panel.is_editing());

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    EXPECT_TRUE(update.needs_redraw);
    EXPECT_FALSE(panel.is_editing());

    update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    EXPECT_NE(command_as<FocusTabCommand>(update), nullptr);
}

TEST_F(TabPanelTest, CloseColumnWorksWhileEditingAnotherTab) {
    panel.begin_edit_tab(TAB_B, "b");
    panel.pointer_moved(PanelPoint(192, line_y(1)));

    panel.pointer_button(BUTTON_LEFT, BUTTON_PRESSED);
    EXPECT_FALSE(panel.is_editing());
    EXPECT_EQ(panel.hover_tab(), TAB_A);

    PanelUpdate update = panel.pointer_button(BUTTON_LEFT, BUTTON_RELEASED);
    const CloseTabCommand* close = command_as<CloseTabCommand>(update);
    ASSERT_NE(close, nullptr);
    EXPECT_EQ(close->tab, TAB_A);
}

TEST_F(TabPanelTest, EditOfRemovedTabIsDropped) {
    panel.begin_edit_tab(TAB_C, "c");

    PanelGroup group;
    group.id = 1;
    group.label = "group 1";
    group.tabs = {make_tab(TAB_A, "a")};
    EXPECT_TRUE(panel.set_groups({group}, 2));

    EXPECT_FALSE(panel.is_editing());
    EXPECT_FALSE(panel.set_groups({group}, 2));
}
