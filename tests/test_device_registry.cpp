// Tests for host-side device tracking.
#include "syncplay/syncplay.h"

#include <gtest/gtest.h>

#include <thread>

TEST(DeviceRegistryTest, RepeatedContactCreatesOneDevice) {
  syncplay::DeviceRegistry registry;
  std::vector<syncplay::DeviceEvent> events;
  registry.SetEventCallback([&](const syncplay::DeviceEvent& event) {
    events.push_back(event);
  });

  const auto first = registry.RecordContact("192.168.1.20");
  const auto second = registry.RecordContact("192.168.1.20");

  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(first.display_name, "Device-1");
  EXPECT_EQ(second.display_name, "Device-1");
  EXPECT_EQ(second.state, syncplay::DeviceState::kAwaitingPayload);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, syncplay::DeviceEventType::kConnected);
  EXPECT_EQ(events[0].device.address, "192.168.1.20");
}

TEST(DeviceRegistryTest, GeneratedNamesFollowArrivalOrder) {
  syncplay::DeviceRegistry registry;
  registry.RecordContact("10.0.0.5");
  registry.RecordContact("10.0.0.6");

  const auto devices = registry.Snapshot();
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].display_name, "Device-1");
  EXPECT_EQ(devices[1].display_name, "Device-2");
}

TEST(DeviceRegistryTest, ReadyAfterContactRenamesAndEmitsReady) {
  syncplay::DeviceRegistry registry;
  std::vector<syncplay::DeviceEvent> events;
  registry.SetEventCallback([&](const syncplay::DeviceEvent& event) {
    events.push_back(event);
  });

  registry.RecordContact("10.0.0.5");
  const auto device = registry.MarkReady("10.0.0.5", "Kitchen");

  EXPECT_EQ(device.display_name, "Kitchen");
  EXPECT_EQ(device.state, syncplay::DeviceState::kReady);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, syncplay::DeviceEventType::kConnected);
  EXPECT_EQ(events[1].type, syncplay::DeviceEventType::kReady);
  EXPECT_EQ(events[1].device.display_name, "Kitchen");
}

TEST(DeviceRegistryTest, ReadyWithoutContactEmitsConnectedThenReady) {
  syncplay::DeviceRegistry registry;
  std::vector<syncplay::DeviceEvent> events;
  registry.SetEventCallback([&](const syncplay::DeviceEvent& event) {
    events.push_back(event);
  });

  registry.MarkReady("10.0.0.9", "Porch");

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].type, syncplay::DeviceEventType::kConnected);
  EXPECT_EQ(events[1].type, syncplay::DeviceEventType::kReady);
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(registry.ReadyCount(), 1u);
}

TEST(DeviceRegistryTest, EmptyReadyNameKeepsExistingName) {
  syncplay::DeviceRegistry registry;
  registry.RecordContact("10.0.0.5");
  const auto device = registry.MarkReady("10.0.0.5", "");
  EXPECT_EQ(device.display_name, "Device-1");

  const auto unseen = registry.MarkReady("10.0.0.6", "");
  EXPECT_EQ(unseen.display_name, "Device-2");
}

TEST(DeviceRegistryTest, ReadyStateNeverRegresses) {
  syncplay::DeviceRegistry registry;
  registry.MarkReady("10.0.0.5", "Kitchen");
  const auto device = registry.RecordContact("10.0.0.5");
  EXPECT_EQ(device.state, syncplay::DeviceState::kReady);
  EXPECT_EQ(device.display_name, "Kitchen");
}

TEST(DeviceRegistryTest, AllReadyRequiresAtLeastOneDevice) {
  syncplay::DeviceRegistry registry;
  EXPECT_FALSE(registry.AllReady());

  registry.RecordContact("10.0.0.5");
  registry.RecordContact("10.0.0.6");
  EXPECT_FALSE(registry.AllReady());

  registry.MarkReady("10.0.0.5", "A");
  EXPECT_FALSE(registry.AllReady());
  registry.MarkReady("10.0.0.6", "B");
  EXPECT_TRUE(registry.AllReady());

  registry.Clear();
  EXPECT_EQ(registry.Size(), 0u);
  EXPECT_FALSE(registry.AllReady());
}

TEST(DeviceRegistryTest, CallbackMayQueryRegistry) {
  syncplay::DeviceRegistry registry;
  size_t seen_size = 0;
  registry.SetEventCallback([&](const syncplay::DeviceEvent&) {
    seen_size = registry.Size();
  });
  registry.RecordContact("10.0.0.5");
  EXPECT_EQ(seen_size, 1u);
}

TEST(DeviceRegistryTest, ConcurrentContactsFromSameAddressCreateOneDevice) {
  syncplay::DeviceRegistry registry;
  std::atomic<int> connected{0};
  registry.SetEventCallback([&](const syncplay::DeviceEvent& event) {
    if (event.type == syncplay::DeviceEventType::kConnected) {
      connected.fetch_add(1);
    }
  });

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&registry, t]() {
      for (int i = 0; i < 200; ++i) {
        if ((i + t) % 2 == 0) {
          registry.RecordContact("10.0.0.5");
        } else {
          registry.MarkReady("10.0.0.5", "Shared");
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(connected.load(), 1);
  EXPECT_TRUE(registry.AllReady());
}
