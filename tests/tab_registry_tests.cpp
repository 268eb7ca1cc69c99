#include "tab_registry.hpp"
#include <gtest/gtest.h>

class TabRegistryTest : public ::testing::Test {
protected:
    TabRegistry registry;

    TabHandle open(const std::string& title) {
        return registry.open_tab(TabKind::terminal(), title);
    }

    std::vector<TabHandle> group_tabs(size_t group_index) const {
        return registry.groups()[group_index].tabs;
    }
};

TEST_F(TabRegistryTest, FirstTabCreatesGroupAndBecomesActive) {
    TabHandle a = open("a");

    ASSERT_EQ(registry.groups().size(), 1u);
    EXPECT_EQ(registry.groups()[0].id, 1u);
    EXPECT_EQ(group_tabs(0), std::vector<TabHandle>{a});
    EXPECT_EQ(registry.active_id(), a);
}

TEST_F(TabRegistryTest, NewTabsJoinTheActiveGroup) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    ASSERT_TRUE(registry.move_tab(b, std::nullopt, std::nullopt));
    registry.set_active(b);

    TabHandle c = open("c");
    ASSERT_EQ(registry.groups().size(), 2u);
    EXPECT_EQ(group_tabs(0), std::vector<TabHandle>{a});
    EXPECT_EQ(group_tabs(1), (std::vector<TabHandle>{b, c}));
}

TEST_F(TabRegistryTest, RemovingLastTabPrunesItsGroup) {
    open("a");
    TabHandle b = open("b");
    registry.move_tab(b, std::nullopt, std::nullopt);
    ASSERT_EQ(registry.groups().size(), 2u);

    ASSERT_TRUE(registry.remove_tab(b).has_value());
    EXPECT_EQ(registry.groups().size(), 1u);
    for (const TabGroup& group : registry.groups()) {
        EXPECT_FALSE(group.tabs.empty());
    }
}

TEST_F(TabRegistryTest, RemovingActiveTabActivatesFirstRemaining) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    registry.set_active(b);

    registry.remove_tab(b);
    EXPECT_EQ(registry.active_id(), a);

    registry.remove_tab(a);
    EXPECT_FALSE(registry.active_id().has_value());
    EXPECT_TRUE(registry.groups().empty());
}

TEST_F(TabRegistryTest, StaleHandlesAreRejectedEverywhere) {
    TabHandle a = open("a");
    open("b");
    registry.remove_tab(a);

    EXPECT_FALSE(registry.contains(a));
    EXPECT_FALSE(registry.set_active(a));
    EXPECT_FALSE(registry.move_tab(a, std::nullopt, std::nullopt));
    EXPECT_FALSE(registry.set_title(a, "x"));
    EXPECT_FALSE(registry.set_custom_title(a, std::string("x")));
    EXPECT_FALSE(registry.note_output(a, Clock::now()));
    EXPECT_FALSE(registry.tab_label(a).has_value());
    EXPECT_FALSE(registry.group_for_tab(a).has_value());
    EXPECT_FALSE(registry.remove_tab(a).has_value());
}

TEST_F(TabRegistryTest, MoveWithinGroupUsesPreMoveSlots) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    TabHandle c = open("c");
    TabHandle d = open("d");

    ASSERT_TRUE(registry.move_tab(a, size_t(1), size_t(3)));
    EXPECT_EQ(group_tabs(0), (std::vector<TabHandle>{b, c, a, d}));

    ASSERT_TRUE(registry.move_tab(a, size_t(1), size_t(0)));
    ASSERT_TRUE(registry.move_tab(a, size_t(1), size_t(2)));
    EXPECT_EQ(group_tabs(0), (std::vector<TabHandle>{b, a, c, d}));

    ASSERT_TRUE(registry.move_tab(c, size_t(1), std::nullopt));
    EXPECT_EQ(group_tabs(0), (std::vector<TabHandle>{b, a, d, c}));
}

TEST_F(TabRegistryTest, MoveToOwnPositionIsIdempotent) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    TabHandle c = open("c");

    EXPECT_TRUE(registry.move_tab(b, size_t(1), size_t(1)));
    EXPECT_EQ(group_tabs(0), (std::vector<TabHandle>{a, b, c}));
    EXPECT_TRUE(registry.move_tab(b, size_t(1), size_t(2)));
    EXPECT_EQ(group_tabs(0), (std::vector<TabHandle>{a, b, c}));
}

TEST_F(TabRegistryTest, MoveSoleTabIntoOwnGroupIsRejected) {
    open("a");
    TabHandle b = open("b");
    registry.move_tab(b, std::nullopt, std::nullopt);
    size_t group_id = registry.groups()[1].id;

    EXPECT_FALSE(registry.move_tab(b, group_id, size_t(0)));
    EXPECT_EQ(registry.groups().size(), 2u);
}

TEST_F(TabRegistryTest, MoveAcrossGroupsClampsIndex) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    TabHandle c = open("c");
    registry.move_tab(c, std::nullopt, std::nullopt);
    size_t second = registry.groups()[1].id;

    ASSERT_TRUE(registry.move_tab(a, second, size_t(99)));
    EXPECT_EQ(group_tabs(0), std::vector<TabHandle>{b});
    EXPECT_EQ(group_tabs(1), (std::vector<TabHandle>{c, a}));
}

TEST_F(TabRegistryTest, MoveToUnknownGroupCreatesOne) {
    open("a");
    TabHandle b = open("b");

    ASSERT_TRUE(registry.move_tab(b, size_t(42), size_t(0)));
    ASSERT_EQ(registry.groups().size(), 2u);
    EXPECT_EQ(registry.groups()[1].id, 2u);
    EXPECT_EQ(group_tabs(1), std::vector<TabHandle>{b});
}

TEST_F(TabRegistryTest, GroupIdsAreNeverReused) {
    open("a");
    TabHandle b = open("b");
    registry.move_tab(b, std::nullopt, std::nullopt);
    EXPECT_EQ(registry.groups()[1].id, 2u);

    registry.remove_tab(b);
    EXPECT_EQ(registry.preview_group_id(), 3u);

    TabHandle c = open("c");
    registry.move_tab(c, std::nullopt, std::nullopt);
    EXPECT_EQ(registry.groups()[1].id, 3u);
}

TEST_F(TabRegistryTest, OrderedTabsFollowGroupOrder) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    TabHandle c = open("c");
    registry.move_tab(a, std::nullopt, std::nullopt);

    EXPECT_EQ(registry.ordered_tabs(), (std::vector<TabHandle>{b, c, a}));

    ASSERT_TRUE(registry.move_group(2, 0));
    EXPECT_EQ(registry.ordered_tabs(), (std::vector<TabHandle>{a, b, c}));
    EXPECT_FALSE(registry.move_group(2, 0));
    EXPECT_FALSE(registry.move_group(7, 0));
}

TEST_F(TabRegistryTest, SelectionWrapsAround) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    TabHandle c = open("c");

    registry.set_active(c);
    EXPECT_EQ(registry.select_next(), a);
    registry.set_active(a);
    EXPECT_EQ(registry.select_previous(), c);
    EXPECT_EQ(registry.select_by_index(1), b);
    EXPECT_FALSE(registry.select_by_index(3).has_value());
    EXPECT_EQ(registry.select_last(), c);
}

TEST_F(TabRegistryTest, SetActiveMarksOutputSeen) {
    TabHandle a = open("a");
    TabHandle b = open("b");
    Clock::time_point now = Clock::now();

    registry.note_output(b, now);
    EXPECT_TRUE(registry.get(b)->activity.has_unseen_output);
    registry.note_output(a, now);
    EXPECT_FALSE(registry.get(a)->activity.has_unseen_output);

    EXPECT_TRUE(registry.set_active(b));
    EXPECT_FALSE(registry.get(b)->activity.has_unseen_output);
    EXPECT_FALSE(registry.set_active(b));
}

TEST_F(TabRegistryTest, WebTabsIgnoreOutput) {
    open("a");
    TabHandle web = registry.open_tab(TabKind::web("https://example.com"), "Example");

    EXPECT_FALSE(registry.note_output(web, Clock::now()));
    EXPECT_FALSE(registry.has_active_output(Clock::now()));
}

TEST_F(TabRegistryTest, ActivityExpiresAfterWindow) {
    TabHandle a = open("a");
    Clock::time_point now = Clock::now();
    registry.note_output(a, now);

    EXPECT_TRUE(registry.has_active_output(now + std::chrono::milliseconds(3000)));
    EXPECT_FALSE(registry.has_active_output(now + std::chrono::milliseconds(3001)));
}

TEST_F(TabRegistryTest, PanelGroupsProjectLabels) {
    TabHandle a = open("a");
    TabHandle web = registry.open_tab(TabKind::web("https://example.com"), "Example");
    registry.set_program_name(a, "vim");

    std::vector<PanelGroup> groups = registry.panel_groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].label, "group 1");
    ASSERT_EQ(groups[0].tabs.size(), 2u);
    EXPECT_EQ(groups[0].tabs[0].title, "vim");
    EXPECT_TRUE(groups[0].tabs[0].is_active);
    EXPECT_TRUE(groups[0].tabs[0].activity.has_value());
    EXPECT_EQ(groups[0].tabs[1].handle, web);
    EXPECT_FALSE(groups[0].tabs[1].activity.has_value());

    registry.set_group_name(1, std::string("work"));
    registry.set_custom_title(a, std::string("editor"));
    groups = registry.panel_groups();
    EXPECT_EQ(groups[0].label, "work");
    EXPECT_EQ(groups[0].tabs[0].title, "editor");
}

TEST_F(TabRegistryTest, SettersReportChanges) {
    TabHandle a = open("a");

    EXPECT_TRUE(registry.set_title(a, "b"));
    EXPECT_FALSE(registry.set_title(a, "b"));
    EXPECT_TRUE(registry.set_group_name(1, std::string("x")));
    EXPECT_FALSE(registry.set_group_name(1, std::string("x")));
    EXPECT_FALSE(registry.set_group_name(9, std::string("x")));
    EXPECT_FALSE(registry.set_custom_title(a, std::nullopt));
}

TEST_F(TabRegistryTest, WebUrlOnlyChangesWebTabs) {
    TabHandle shell = open("shell");
    TabHandle site = registry.open_tab(TabKind::web("https://a.example"), "a");

    EXPECT_FALSE(registry.set_web_url(shell, "https://b.example"));
    EXPECT_EQ(registry.get(shell)->kind, TabKind::terminal());

    EXPECT_TRUE(registry.set_web_url(site, "https://b.example"));
    EXPECT_FALSE(registry.set_web_url(site, "https://b.example"));
    EXPECT_EQ(registry.get(site)->kind.url, "https://b.example");

    registry.remove_tab(site);
    EXPECT_FALSE(registry.set_web_url(site, "https://c.example"));
}

TEST_F(TabRegistryTest, GroupForTabReportsIdAndIndex) {
    open("a");
    TabHandle b = open("b");

    std::optional<std::pair<size_t, size_t>> location = registry.group_for_tab(b);
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->first, 1u);
    EXPECT_EQ(location->second, 1u);
}
