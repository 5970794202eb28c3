#include <chrono>
#include <cstdint>
#include <stop_token>
#include <vector>
#include <gtest/gtest.h>
#include "kducer/common/errors.hpp"
#include "kducer/transport/memory_transport.hpp"

using kducer::Cancelled;
using kducer::MemoryTransport;
using kducer::TransportError;

namespace {

constexpr std::chrono::milliseconds kTimeout{10};

}  // namespace

TEST(MemoryTransport, StartsDisconnected) {
  MemoryTransport transport;
  EXPECT_FALSE(transport.IsConnected());
  uint8_t buffer[4] = {0};
  EXPECT_EQ(transport.Read(buffer), -1);
  EXPECT_EQ(transport.Write(std::vector<uint8_t>{1}), -1);
}

TEST(MemoryTransport, ConnectAndClose) {
  MemoryTransport transport;
  transport.Connect(kTimeout, {});
  EXPECT_TRUE(transport.IsConnected());
  transport.Close();
  EXPECT_FALSE(transport.IsConnected());
}

TEST(MemoryTransport, RefusedConnect) {
  MemoryTransport transport;
  transport.SetRefuseConnect(true);
  EXPECT_THROW(transport.Connect(kTimeout, {}), TransportError);
  EXPECT_FALSE(transport.IsConnected());
}

TEST(MemoryTransport, CancelledConnect) {
  MemoryTransport transport;
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(transport.Connect(kTimeout, source.get_token()), Cancelled);
}

TEST(MemoryTransport, ReadPartialThenPeerClose) {
  MemoryTransport transport;
  transport.Connect(kTimeout, {});
  transport.SetReadData(std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05});

  uint8_t buffer[3] = {0};
  EXPECT_EQ(transport.Read(buffer), 3);
  EXPECT_EQ(buffer[0], 0x01);
  EXPECT_EQ(buffer[2], 0x03);
  EXPECT_EQ(transport.AvailableBytes(), 2U);

  EXPECT_EQ(transport.Read(buffer), 2);
  EXPECT_EQ(buffer[0], 0x04);
  EXPECT_EQ(transport.Read(buffer), 0);
}

TEST(MemoryTransport, AppendAndReset) {
  MemoryTransport transport;
  transport.Connect(kTimeout, {});
  transport.SetReadData(std::vector<uint8_t>{0x01});
  transport.AppendReadData(std::vector<uint8_t>{0x02});

  const auto all = transport.ReceiveAll(2);
  EXPECT_EQ(all, (std::vector<uint8_t>{0x01, 0x02}));

  transport.ResetReadPosition();
  EXPECT_EQ(transport.AvailableBytes(), 2U);
}

TEST(MemoryTransport, CapturesWrites) {
  MemoryTransport transport;
  transport.Connect(kTimeout, {});
  transport.SendAll(std::vector<uint8_t>{0xAA, 0xBB});
  transport.SendAll(std::vector<uint8_t>{0xCC});

  const auto written = transport.GetWrittenData();
  EXPECT_EQ(std::vector<uint8_t>(written.begin(), written.end()), (std::vector<uint8_t>{0xAA, 0xBB, 0xCC}));

  transport.ClearWriteBuffer();
  EXPECT_TRUE(transport.GetWrittenData().empty());
}

TEST(MemoryTransport, ReceiveAllThrowsOnShortStream) {
  MemoryTransport transport;
  transport.Connect(kTimeout, {});
  transport.SetReadData(std::vector<uint8_t>{0x01, 0x02});
  EXPECT_THROW(static_cast<void>(transport.ReceiveAll(3)), TransportError);
}

TEST(MemoryTransport, SendAllThrowsWhenDisconnected) {
  MemoryTransport transport;
  EXPECT_THROW(transport.SendAll(std::vector<uint8_t>{0x01}), TransportError);
}
