/**
 * @copyright Copyright The DevMgr Contributors
 * @brief Platform 总线枚举测试
 */

#include "platform_bus.hpp"

#include <gtest/gtest.h>

#include <string>

#include "fakes/fake_backends.hpp"

namespace {

constexpr size_t kMax = devmgr::config::kMaxDescriptorsPerBus;

class PlatformBusTest : public ::testing::Test {
 protected:
  fakes::FakePlatformFirmware firmware_;
  PlatformBus bus_{firmware_};
  RawDeviceDescriptor out_[kMax]{};
};

TEST_F(PlatformBusTest, EmptyFirmware) {
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 0U);
}

// 测试没有 compatible 的节点被跳过但仍占用序号
TEST_F(PlatformBusTest, IndexCountsSkippedNodes) {
  firmware_.AddNode({"cpus", "", 0, 0, 0});
  firmware_.AddNode({"ethernet@10000000", "snps,dwmac-4.20a", 0x10000000,
                     0x2000, 40});
  firmware_.AddNode({"memory@80000000", "", 0x80000000, 0x8000000, 0});
  firmware_.AddNode({"sata@10010000", "generic-ahci", 0x10010000, 0x1000, 41});

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 2U);

  EXPECT_EQ(out_[0].id, DeviceId::Platform(1));
  const auto& eth = std::get<PlatformIdentity>(out_[0].identity);
  EXPECT_STREQ(eth.compatible.c_str(), "snps,dwmac-4.20a");
  EXPECT_EQ(eth.mmio_base, 0x10000000U);
  EXPECT_EQ(eth.mmio_size, 0x2000U);
  EXPECT_EQ(eth.irq, 40U);
  EXPECT_EQ(Classify(out_[0]), DeviceClass::kNetworkEthernet);

  EXPECT_EQ(out_[1].id, DeviceId::Platform(3));
  EXPECT_EQ(Classify(out_[1]), DeviceClass::kStorageAta);
}

TEST_F(PlatformBusTest, LongCompatibleTruncated) {
  std::string compatible(200, 'x');
  firmware_.AddNode({"odd", compatible, 0, 0, 0});

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  const auto& platform = std::get<PlatformIdentity>(out_[0].identity);
  EXPECT_EQ(platform.compatible.size(), platform.compatible.capacity());
}

TEST_F(PlatformBusTest, FirmwareErrorPropagates) {
  firmware_.AddNode({"uart@9000000", "arm,pl011", 0x9000000, 0x1000, 33});
  firmware_.FailWith(ErrorCode::kMalformedResponse);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

// 测试缓冲区满时只写入 max 项，返回值仍是节点总数
TEST_F(PlatformBusTest, ReportsTotalBeyondBufferCapacity) {
  for (int i = 0; i < 5; ++i) {
    firmware_.AddNode({"uart", "arm,pl011", 0, 0, 0});
  }
  auto found = bus_.Enumerate(out_, 3);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 5U);
  EXPECT_EQ(out_[2].id, DeviceId::Platform(2));
  EXPECT_EQ(out_[3].id, RawDeviceDescriptor{}.id);
}

}  // namespace
