#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "permission/bounded_channel.hpp"
#include "permission/permission.hpp"
#include "permission/response_router.hpp"

using namespace converse;

TEST(BoundedChannelTest, FifoOrder) {
  BoundedChannel<int> channel(4);
  EXPECT_TRUE(channel.send(1));
  EXPECT_TRUE(channel.send(2));
  EXPECT_EQ(channel.size(), 2u);
  EXPECT_EQ(channel.receive(), 1);
  EXPECT_EQ(channel.try_receive(), 2);
  EXPECT_FALSE(channel.try_receive().has_value());
}

TEST(BoundedChannelTest, TrySendFailsWhenFull) {
  BoundedChannel<int> channel(2);
  EXPECT_TRUE(channel.try_send(1));
  EXPECT_TRUE(channel.try_send(2));
  EXPECT_FALSE(channel.try_send(3));
  EXPECT_EQ(channel.capacity(), 2u);
}

TEST(BoundedChannelTest, SendBlocksUntilSpace) {
  BoundedChannel<int> channel(1);
  ASSERT_TRUE(channel.send(1));

  std::atomic<bool> sent{false};
  std::thread sender([&] {
    channel.send(2);
    sent = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(sent.load());

  EXPECT_EQ(channel.receive(), 1);
  sender.join();
  EXPECT_TRUE(sent.load());
  EXPECT_EQ(channel.receive(), 2);
}

TEST(BoundedChannelTest, CloseWakesReceiversAndRejectsSenders) {
  BoundedChannel<int> channel(1);
  std::optional<int> received = 42;

  std::thread receiver([&] { received = channel.receive(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.close();
  receiver.join();

  EXPECT_FALSE(received.has_value());
  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.send(1));
}

TEST(BoundedChannelTest, ReceiveForTimesOut) {
  BoundedChannel<int> channel(1);
  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.receive_for(std::chrono::milliseconds(30)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(25));
}

TEST(ResponseRouterTest, StashesResponsesForOtherIds) {
  ResponseRouter<PermissionConfirmation> router(8);
  router.send("b", PermissionConfirmation{Permission::DenyOnce});
  router.send("a", PermissionConfirmation{Permission::AllowOnce});

  auto abort = std::make_shared<std::atomic<bool>>(false);
  auto a = router.wait("a", abort);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->permission, Permission::AllowOnce);

  auto b = router.wait("b", abort);
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->permission, Permission::DenyOnce);
}

TEST(ResponseRouterTest, WaitsForLateResponse) {
  ResponseRouter<PermissionConfirmation> router(8);
  std::thread responder([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    router.send("req", PermissionConfirmation{Permission::AlwaysAllow});
  });

  auto decision = router.wait("req", nullptr);
  responder.join();
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->permission, Permission::AlwaysAllow);
}

TEST(ResponseRouterTest, AbortStopsWaiting) {
  ResponseRouter<PermissionConfirmation> router(8);
  auto abort = std::make_shared<std::atomic<bool>>(false);

  std::thread canceller([abort] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    abort->store(true);
  });

  auto decision = router.wait("never", abort);
  canceller.join();
  EXPECT_FALSE(decision.has_value());
}

TEST(ResponseRouterTest, CloseEndsWait) {
  ResponseRouter<int> router(2);
  std::thread closer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    router.close();
  });

  EXPECT_FALSE(router.wait("x", nullptr).has_value());
  closer.join();
  EXPECT_FALSE(router.send("x", 1));
}

TEST(ResponseRouterTest, DiscardedIdsDropLateResponses) {
  ResponseRouter<int> router(8);
  router.send("old", 1);
  router.send("x", 2);
  auto abort = std::make_shared<std::atomic<bool>>(false);
  ASSERT_EQ(router.wait("x", abort), 2);
  EXPECT_EQ(router.stashed(), 1u);

  // Already stashed
  router.discard("old");
  EXPECT_EQ(router.stashed(), 0u);

  // Arrives after the reader went away, then the id is reused
  router.discard("gone");
  router.send("gone", 3);
  router.send("gone", 4);
  EXPECT_EQ(router.wait("gone", abort), 4);
  EXPECT_EQ(router.stashed(), 0u);
}

TEST(ResponseRouterTest, StashKeepsNewestResponses) {
  ResponseRouter<int> router(8, 2);
  router.send("a", 1);
  router.send("b", 2);
  router.send("c", 3);
  router.send("d", 4);

  auto abort = std::make_shared<std::atomic<bool>>(false);
  ASSERT_EQ(router.wait("d", abort), 4);
  EXPECT_EQ(router.stashed(), 2u);
  EXPECT_EQ(router.wait("b", abort), 2);
  EXPECT_EQ(router.wait("c", abort), 3);

  abort->store(true);
  EXPECT_FALSE(router.wait("a", abort).has_value());
}

TEST(PermissionStoreTest, RemembersLevels) {
  PermissionStore store;
  EXPECT_FALSE(store.get("dev__shell").has_value());
  store.set("dev__shell", PermissionLevel::AlwaysAllow);
  EXPECT_EQ(store.get("dev__shell"), PermissionLevel::AlwaysAllow);
  store.clear();
  EXPECT_FALSE(store.get("dev__shell").has_value());
}
