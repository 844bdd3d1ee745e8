/**
 * @file test_core_model.cpp
 * @brief Unit tests for property accessors, scope predicates and time handling
 */

#include <gtest/gtest.h>
#include <core/properties.hpp>
#include <core/scope.hpp>
#include <utils/unicode.hpp>
#include "test_fixtures.hpp"

using namespace Cerebrum;
using namespace Cerebrum::test_support;

TEST(TimeTest, IsoRoundTrip) {
    TimePoint tp = at("2024-02-01T00:00:00Z");

    EXPECT_EQ(to_iso_string(tp), "2024-02-01T00:00:00.000Z");
    EXPECT_EQ(at("2024-02-01"), tp);
    EXPECT_EQ(at("2024-02-01T02:00:00+02:00"), tp);
    EXPECT_EQ(to_iso_string(at("2024-02-01T10:20:30.250Z")), "2024-02-01T10:20:30.250Z");
}

TEST(TimeTest, MalformedTimestampsAreRejected) {
    EXPECT_FALSE(parse_iso_time("").has_value());
    EXPECT_FALSE(parse_iso_time("yesterday").has_value());
    EXPECT_FALSE(parse_iso_time("2024-13-01").has_value());
    EXPECT_FALSE(parse_iso_time("2024-02-01T00:00:00Zjunk").has_value());
}

TEST(PropertiesTest, StringAccessorsTrimAndSkipBlanks) {
    PropertyBag bag = {{"a", "  x  "}, {"b", "   "}, {"c", 42}, {"d", nullptr}};

    EXPECT_EQ(props::string_at(bag, "a"), "x");
    EXPECT_FALSE(props::string_at(bag, "b").has_value());
    EXPECT_FALSE(props::string_at(bag, "c").has_value());
    EXPECT_FALSE(props::string_at(bag, "d").has_value());
    EXPECT_EQ(props::text_at(bag, "c"), "42");
    EXPECT_EQ(props::first_string(bag, {"b", "missing", "a"}), "x");
}

TEST(PropertiesTest, NumbersAndFlags) {
    PropertyBag bag = {{"n", 3.5}, {"s", "7"}, {"bad", "7x"}, {"yes", true}, {"str", "true"}};

    EXPECT_DOUBLE_EQ(*props::number_at(bag, "n"), 3.5);
    EXPECT_DOUBLE_EQ(*props::number_at(bag, "s"), 7.0);
    EXPECT_FALSE(props::number_at(bag, "bad").has_value());
    EXPECT_TRUE(props::flag_at(bag, "yes"));
    EXPECT_FALSE(props::flag_at(bag, "str"));
}

TEST(PropertiesTest, EntityViewFallbacks) {
    Entity e = make_entity("w1", EntityTypes::kWorkItem, "t1", "scope-project",
                           {{"sourceProjectKey", "P9"}, {"sourceUrl", "https://x/w1"}});

    EntityView view(e);
    EXPECT_EQ(view.project_key(), "P9");
    EXPECT_EQ(view.tenant_id(), "t1");
    EXPECT_EQ(view.url(), "https://x/w1");
    EXPECT_EQ(view.title(), "w1");
    EXPECT_FALSE(view.is_secured());

    e.properties["isSecured"] = true;
    EXPECT_TRUE(EntityView(e).is_secured());
}

TEST(PropertiesTest, ClusterViewDefaults) {
    Entity c = make_entity("cluster:1", EntityTypes::kCluster, "t1", "p1", {{"size", "3"}});
    ClusterView view(c);

    EXPECT_EQ(view.cluster_kind(), "unknown");
    EXPECT_DOUBLE_EQ(*view.size(), 3.0);
    EXPECT_TRUE(view.seed_node_ids().empty());
}

TEST(ScopeTest, StrictProjectMembership) {
    Entity scoped = make_entity("a", EntityTypes::kWorkItem, "t1", "p1");
    Entity declared = make_entity("b", EntityTypes::kWorkItem, "t1", "", {{"projectKey", "p1"}});
    Entity anonymous = make_entity("c", EntityTypes::kWorkItem, "t1", "");

    EXPECT_TRUE(belongs_to_project(scoped, "p1"));
    EXPECT_TRUE(belongs_to_project(declared, "p1"));
    EXPECT_FALSE(belongs_to_project(anonymous, "p1"));
    EXPECT_FALSE(belongs_to_project(scoped, "p2"));
}

TEST(ScopeTest, LenientScopeOnlyRejectsContradictions) {
    Entity anonymous = make_entity("c", EntityTypes::kWorkItem, "", "");
    Entity foreign = make_entity("d", EntityTypes::kWorkItem, "t1", "", {{"projectKey", "p2"}});
    Entity other_tenant = make_entity("e", EntityTypes::kWorkItem, "t1", "p1", {{"tenantId", "t2"}});

    EXPECT_TRUE(matches_scope(anonymous, "t1", "p1"));
    EXPECT_FALSE(matches_scope(foreign, "t1", "p1"));
    EXPECT_FALSE(matches_scope(other_tenant, "t1", "p1"));
    EXPECT_TRUE(matches_tenant(foreign, "t1"));
}

TEST(ScopeTest, WindowsAndRecency) {
    Entity older = work_item("old", "t1", "p1", "x", "2024-01-10T00:00:00Z");
    Entity newer = work_item("new", "t1", "p1", "y", "2024-02-10T00:00:00Z");
    Entity undated = work_item("undated", "t1", "p1", "z");

    TimeWindow window;
    window.start = at("2024-02-01T00:00:00Z");
    window.end = at("2024-02-28T00:00:00Z");

    EXPECT_FALSE(within_window(older, window));
    EXPECT_TRUE(within_window(newer, window));
    EXPECT_TRUE(within_window(undated, window));
    EXPECT_TRUE(within_window(older, TimeWindow{}));

    EXPECT_TRUE(more_recent(newer, older));
    EXPECT_FALSE(more_recent(older, newer));
    EXPECT_TRUE(more_recent(older, undated));
    EXPECT_FALSE(more_recent(undated, older));

    EXPECT_EQ(window.key(), "2024-02-01T00:00:00.000Z|2024-02-28T00:00:00.000Z");
    EXPECT_EQ(TimeWindow{}.key(), "|");
}

TEST(UnicodeTest, TruncationNeverSplitsCodePoints) {
    std::string text = "h\xC3\xA9llo \xE2\x82\xAC";  // "héllo €"

    EXPECT_EQ(utf8_length(text), 7u);
    EXPECT_EQ(utf8_truncate(text, 2), "h\xC3\xA9");
    EXPECT_EQ(utf8_truncate(text, 100), text);
    EXPECT_EQ(utf8_truncate(text, 0), "");
    EXPECT_EQ(trim("  \tabc \n"), "abc");
}

TEST(EdgeIdentityTest, StableIdsFromLogicalKey) {
    EXPECT_EQ(edge_logical_key("IN_CLUSTER", "a", "c"), "IN_CLUSTER|a|c");
    EXPECT_EQ(edge_id_for("IN_CLUSTER", "a", "c"), edge_id_for("IN_CLUSTER", "a", "c"));
    EXPECT_NE(edge_id_for("IN_CLUSTER", "a", "c"), edge_id_for("IN_CLUSTER", "c", "a"));
    EXPECT_EQ(entity_kind_of(EntityTypes::kDocItem), EntityKind::Doc);
    EXPECT_EQ(entity_kind_of("cdm.work.item.v2"), EntityKind::Other);
}
