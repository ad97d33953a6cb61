#include <gtest/gtest.h>
#include <memory>

#include "workspace/document.hpp"
#include "workspace/item_pane.hpp"

using namespace tabswitch;

namespace
{

std::shared_ptr<Document> doc(const char* path)
{
    return std::make_shared<Document>(path);
}

}   // namespace

// ─── Adding / activating ─────────────────────────────────────────────────────

TEST(ItemPane, EmptyPaneHasNoActiveIndex)
{
    ItemPane p(1);
    EXPECT_EQ(p.item_count(), 0u);
    EXPECT_FALSE(p.active_index().has_value());
    EXPECT_EQ(p.active_item(), nullptr);
}

TEST(ItemPane, AddActivatesByDefault)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.add_item(doc("b"));
    EXPECT_EQ(p.active_index(), 1u);
}

TEST(ItemPane, AddWithoutActivateKeepsActive)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.add_item(doc("b"), false);
    EXPECT_EQ(p.active_index(), 0u);
    EXPECT_EQ(p.last_activation(p.item_at(1).get()), 0u);
}

TEST(ItemPane, AddingSameItemTwiceReusesIt)
{
    ItemPane p(1);
    auto     a = doc("a");
    EXPECT_EQ(p.add_item(a), 0u);
    p.add_item(doc("b"));
    EXPECT_EQ(p.add_item(a), 0u);
    EXPECT_EQ(p.item_count(), 2u);
    EXPECT_EQ(p.active_index(), 0u);
}

TEST(ItemPane, PermanentActivationStamps)
{
    ItemPane p(1);
    auto     a = doc("a");
    auto     b = doc("b");
    p.add_item(a);
    p.add_item(b);
    EXPECT_GT(p.last_activation(b.get()), p.last_activation(a.get()));

    p.activate_item(0, true, false);
    EXPECT_GT(p.last_activation(a.get()), p.last_activation(b.get()));
}

TEST(ItemPane, PreviewActivationDoesNotStamp)
{
    ItemPane p(1);
    auto     a = doc("a");
    auto     b = doc("b");
    p.add_item(a);
    p.add_item(b);
    uint64_t before = p.last_activation(a.get());

    p.activate_item(0, false, false);
    EXPECT_EQ(p.active_index(), 0u);
    EXPECT_EQ(p.last_activation(a.get()), before);
}

TEST(ItemPane, ActivateOutOfRangeIgnored)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.activate_item(5, true, true);
    EXPECT_EQ(p.active_index(), 0u);
}

TEST(ItemPane, FocusRequestCallsBack)
{
    ItemPane p(7);
    PaneId   focused = INVALID_PANE_ID;
    p.set_on_focus_requested([&](PaneId id) { focused = id; });
    p.add_item(doc("a"));
    EXPECT_EQ(focused, INVALID_PANE_ID);

    p.activate_item(0, true, true);
    EXPECT_EQ(focused, 7u);
}

TEST(ItemPane, SharedClockOrdersAcrossPanes)
{
    auto     clock = std::make_shared<ActivationClock>();
    ItemPane left(1, clock);
    ItemPane right(2, clock);
    auto     a = doc("a");
    auto     b = doc("b");
    left.add_item(a);
    right.add_item(b);
    EXPECT_GT(right.last_activation(b.get()), left.last_activation(a.get()));
}

// ─── Closing ─────────────────────────────────────────────────────────────────

TEST(ItemPane, CloseBeforeActiveShiftsActive)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.add_item(doc("b"));
    p.add_item(doc("c"));   // active = 2
    p.close_item(0);
    EXPECT_EQ(p.active_index(), 1u);
    EXPECT_EQ(p.active_item()->tab_label(0), "c");
}

TEST(ItemPane, CloseActiveLastMovesToNewLast)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.add_item(doc("b"));
    p.close_item(1);
    EXPECT_EQ(p.active_index(), 0u);
}

TEST(ItemPane, CloseActiveMiddleKeepsPosition)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.add_item(doc("b"));
    p.add_item(doc("c"));
    p.activate_item(1, true, false);
    p.close_item(1);
    EXPECT_EQ(p.active_index(), 1u);
    EXPECT_EQ(p.active_item()->tab_label(0), "c");
}

TEST(ItemPane, CloseLastItemEmptiesPane)
{
    ItemPane p(1);
    p.add_item(doc("a"));
    p.close_item(0);
    EXPECT_EQ(p.item_count(), 0u);
    EXPECT_FALSE(p.active_index().has_value());
}

TEST(ItemPane, CloseByIdentity)
{
    ItemPane p(1);
    auto     a = doc("a");
    p.add_item(a);
    EXPECT_TRUE(p.close(a.get()));
    EXPECT_FALSE(p.close(a.get()));
}

TEST(ItemPane, CloseClearsHistoryAndPreview)
{
    ItemPane p(1);
    auto     a = doc("a");
    p.add_item(a);
    p.add_item(doc("b"));
    p.set_preview_item(a.get());
    EXPECT_TRUE(p.is_preview_item(a.get()));

    p.close(a.get());
    EXPECT_FALSE(p.is_preview_item(a.get()));
    EXPECT_EQ(p.last_activation(a.get()), 0u);
}

TEST(ItemPane, PreviewIgnoredForForeignItem)
{
    ItemPane p(1);
    auto     stranger = doc("x");
    p.add_item(doc("a"));
    p.set_preview_item(stranger.get());
    EXPECT_FALSE(p.is_preview_item(stranger.get()));
}

TEST(ItemPane, IndexForItem)
{
    ItemPane p(1);
    auto     a = doc("a");
    auto     b = doc("b");
    p.add_item(a);
    p.add_item(b);
    EXPECT_EQ(p.index_for_item(b.get()), 1u);
    EXPECT_FALSE(p.index_for_item(nullptr).has_value());
}
