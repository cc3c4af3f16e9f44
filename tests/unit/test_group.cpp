#include <gtest/gtest.h>
#include <stagehand/actor.hpp>
#include <stagehand/group.hpp>
#include <stdexcept>
#include <vector>

using namespace stagehand;

TEST(ActorGroup, StartsEmpty)
{
    ActorGroup g;
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.size(), 0u);
    EXPECT_EQ(g.begin(), g.end());
}

TEST(ActorGroup, AddSingleAndMany)
{
    Actor a, b, c, d;

    ActorGroup g;
    g.add(a);
    EXPECT_EQ(g.size(), 1u);

    g.add(b, c);
    EXPECT_EQ(g.size(), 3u);

    std::vector<Actor*> more = {&d};
    g.add(more);
    EXPECT_EQ(g.size(), 4u);

    EXPECT_EQ(&g[0], &a);
    EXPECT_EQ(&g[3], &d);
    EXPECT_TRUE(g.contains(c));
}

TEST(ActorGroup, IterationKeepsInsertionOrder)
{
    Actor      a("a"), b("b"), c("c");
    ActorGroup g;
    g.add(c, a, b);

    std::vector<std::string> names;
    for (const Actor* actor : g)
    {
        names.push_back(actor->name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"c", "a", "b"}));
}

TEST(ActorGroup, CopiesShareStorage)
{
    Actor a, b;

    ActorGroup original;
    ActorGroup alias = original;
    EXPECT_TRUE(alias.shares_storage_with(original));

    original.add(a);
    alias.add(b);

    EXPECT_EQ(original.size(), 2u);
    EXPECT_EQ(alias.size(), 2u);
    EXPECT_TRUE(original.contains(b));
}

TEST(ActorGroup, SeparateGroupsAreIndependent)
{
    Actor      a;
    ActorGroup g1, g2;
    g1.add(a);

    EXPECT_FALSE(g1.shares_storage_with(g2));
    EXPECT_EQ(g2.size(), 0u);
    EXPECT_FALSE(g2.contains(a));
}

TEST(ActorGroup, NullActorRejected)
{
    Actor               a;
    std::vector<Actor*> bad = {&a, nullptr};

    ActorGroup g;
    EXPECT_THROW(g.add(bad), std::invalid_argument);
    EXPECT_TRUE(g.empty());
}
