// Tests for byte-exact relaying between device and client connections.
#include "loopback.h"

#include <gtest/gtest.h>

#include <thread>

using namespace loopback;

using RelayDataTest = RelayTest;

TEST_F(RelayDataTest, DeviceBytesReachClientInOrder) {
  Fd device;
  Fd client;
  Pair(&device, &client);

  const std::vector<uint8_t> payload = Pattern(5 * zappa::kRelayBufferSize + 123, 7);
  ASSERT_TRUE(SendAll(device.get(), payload));
  auto received = ReadExactly(client.get(), payload.size(), kIoTimeoutMs);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, payload);
  EXPECT_TRUE(WaitFor([&]() { return Session().bytes_to_client == payload.size(); }));
  EXPECT_EQ(Session().bytes_to_device, 0u);
}

TEST_F(RelayDataTest, ClientBytesReachDeviceInOrder) {
  Fd device;
  Fd client;
  Pair(&device, &client);

  const std::vector<uint8_t> payload = Pattern(3 * zappa::kRelayBufferSize + 1, 42);
  ASSERT_TRUE(SendAll(client.get(), payload));
  auto received = ReadExactly(device.get(), payload.size(), kIoTimeoutMs);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, payload);
  EXPECT_TRUE(WaitFor([&]() {
    return gateway_->GetMetrics().bytes_to_device == payload.size();
  }));
}

TEST_F(RelayDataTest, DirectionsRelayIndependently) {
  Fd device;
  Fd client;
  Pair(&device, &client);

  const std::vector<uint8_t> downstream = Pattern(64 * 1024, 1);
  const std::vector<uint8_t> upstream = Pattern(48 * 1024, 2);

  std::thread device_writer([&]() { SendAll(device.get(), downstream); });
  std::thread client_writer([&]() { SendAll(client.get(), upstream); });
  auto at_client = ReadExactly(client.get(), downstream.size(), kIoTimeoutMs);
  auto at_device = ReadExactly(device.get(), upstream.size(), kIoTimeoutMs);
  device_writer.join();
  client_writer.join();

  ASSERT_TRUE(at_client.has_value());
  ASSERT_TRUE(at_device.has_value());
  EXPECT_EQ(*at_client, downstream);
  EXPECT_EQ(*at_device, upstream);
}

TEST_F(RelayDataTest, PendingBytesDeliveredBeforeClose) {
  Fd device;
  Fd client;
  Pair(&device, &client);

  const std::vector<uint8_t> payload = Bytes("last words");
  ASSERT_TRUE(SendAll(device.get(), payload));
  auto received = ReadExactly(client.get(), payload.size(), kIoTimeoutMs);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, payload);

  device.Reset();
  EXPECT_TRUE(WaitForClose(client.get(), kIoTimeoutMs));
}
