#include <gtest/gtest.h>
#include "websink/ClientRegistry.hpp"
#include "fakes.hpp"

using namespace websink;
using namespace websink::test;

TEST(ClientRegistryTest, AddFindRemove) {
    ClientRegistry registry;
    auto a = connectedSession("a");
    auto b = connectedSession("b");

    EXPECT_TRUE(registry.add(a.session));
    EXPECT_TRUE(registry.add(b.session));
    EXPECT_FALSE(registry.add(a.session));
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find("a"), a.session);
    EXPECT_EQ(registry.find("zzz"), nullptr);

    EXPECT_EQ(registry.remove("a"), a.session);
    EXPECT_EQ(registry.remove("a"), nullptr);
    EXPECT_EQ(registry.size(), 1u);

    a.session->close("done");
    b.session->close("done");
}

TEST(ClientRegistryTest, RemoveByInstanceIgnoresAReplacement) {
    ClientRegistry registry;
    auto first = connectedSession("same");
    auto second = connectedSession("same");

    ASSERT_TRUE(registry.add(first.session));
    EXPECT_FALSE(registry.remove(second.session));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.remove(first.session));
    EXPECT_EQ(registry.size(), 0u);

    first.session->close("done");
    second.session->close("done");
}

TEST(ClientRegistryTest, SnapshotOutlivesRemoval) {
    ClientRegistry registry;
    auto a = connectedSession("a");
    registry.add(a.session);

    auto snap = registry.snapshot();
    registry.remove("a");
    a.session.reset();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0]->id(), "a");
    snap[0]->close("done");
}

TEST(ClientRegistryTest, CloseAllClosesAndEmpties) {
    ClientRegistry registry;
    auto a = connectedSession("a");
    auto b = connectedSession("b");
    registry.add(a.session);
    registry.add(b.session);

    registry.closeAll("shutdown");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(a.session->state(), SessionState::Closed);
    EXPECT_EQ(b.session->closeReason(), "shutdown");
    EXPECT_EQ(a.control->closes(), 1);
}
