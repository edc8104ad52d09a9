/**
 * @copyright Copyright The DevMgr Contributors
 * @brief PCI 总线枚举测试
 */

#include "pci_bus.hpp"

#include <gtest/gtest.h>

#include "fakes/fake_backends.hpp"

namespace {

using Function = fakes::FakePciConfigSpace::Function;

constexpr size_t kMax = devmgr::config::kMaxDescriptorsPerBus;

class PciBusTest : public ::testing::Test {
 protected:
  fakes::FakePciConfigSpace config_{2};
  PciBus bus_{config_};
  RawDeviceDescriptor out_[kMax]{};
};

TEST_F(PciBusTest, EmptyBusYieldsNoDevices) {
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 0U);
}

TEST_F(PciBusTest, AbsentConfigSpace) {
  config_.SetPresent(false);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kBusNotPresent);
  EXPECT_EQ(config_.GetReads(), 0U);
}

// 测试单功能设备与解析出的头部字段
TEST_F(PciBusTest, SingleFunctionDevice) {
  config_.Set(0, 3, 0,
              Function{.vendor_id = 0x8086,
                       .device_id = 0x100E,
                       .class_code = 0x02,
                       .subclass = 0x00,
                       .prog_if = 0x00,
                       .revision = 0x03,
                       .header_type = 0x00,
                       .interrupt_pin = 1});
  // 未置多功能位时功能 1 即使存在也不应被探测
  config_.Set(0, 3, 1, Function{.vendor_id = 0x8086, .class_code = 0x02});

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(out_[0].id, DeviceId::Pci(0, 3, 0));

  const auto& pci = std::get<PciIdentity>(out_[0].identity);
  EXPECT_EQ(pci.vendor_id, 0x8086);
  EXPECT_EQ(pci.device_id, 0x100E);
  EXPECT_EQ(pci.class_code, 0x02);
  EXPECT_EQ(pci.revision, 0x03);
  EXPECT_EQ(pci.interrupt_pin, 1);
  EXPECT_FALSE(config_.WasProbed(0, 3, 1));
}

// 测试多功能设备：header bit 7 打开功能 1..7 的探测
TEST_F(PciBusTest, MultiFunctionDevice) {
  config_.Set(0, 31, 0,
              Function{.vendor_id = 0x8086,
                       .class_code = 0x06,
                       .subclass = 0x01,
                       .header_type = 0x80});
  config_.Set(0, 31, 2, Function{.vendor_id = 0x8086,
                                 .class_code = 0x01,
                                 .subclass = 0x06,
                                 .interrupt_pin = 1});
  config_.Set(0, 31, 3, Function{.vendor_id = 0x8086,
                                 .class_code = 0x0C,
                                 .subclass = 0x05});

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 3U);
  EXPECT_EQ(out_[0].id, DeviceId::Pci(0, 31, 0));
  EXPECT_EQ(out_[1].id, DeviceId::Pci(0, 31, 2));
  EXPECT_EQ(out_[2].id, DeviceId::Pci(0, 31, 3));
  EXPECT_TRUE(config_.WasProbed(0, 31, 7));
}

// 测试 vendor 0xFFFF 短路：空槽位只读取 vendor 寄存器
TEST_F(PciBusTest, EmptySlotShortCircuits) {
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  // 2 条总线 × 32 个槽位，每个槽位只读一次
  EXPECT_EQ(config_.GetReads(), 2U * 32U);
  EXPECT_FALSE(config_.WasProbed(0, 0, 1));
}

TEST_F(PciBusTest, WalksEveryBus) {
  config_.Set(1, 0, 0, Function{.vendor_id = 0x1B36, .class_code = 0x02});
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(out_[0].id, DeviceId::Pci(1, 0, 0));
}

// 测试桥设备被分类但不向下游递归
TEST_F(PciBusTest, BridgeIsNotDescended) {
  config_.Set(0, 1, 0, Function{.vendor_id = 0x8086,
                                .class_code = 0x06,
                                .subclass = 0x04,
                                .header_type = 0x01});
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(Classify(out_[0]), DeviceClass::kBridge);
}

TEST_F(PciBusTest, MalformedHeaderRejected) {
  config_.Set(0, 2, 0,
              Function{.vendor_id = 0x8086, .class_code = 0x02,
                       .header_type = 0x05});
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(PciBusTest, MalformedInterruptPinRejected) {
  config_.Set(0, 2, 0,
              Function{.vendor_id = 0x8086, .class_code = 0x02,
                       .interrupt_pin = 9});
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(PciBusTest, ReadErrorPropagates) {
  config_.FailReadsWith(ErrorCode::kProbeTimeout);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kProbeTimeout);
}

// 测试缓冲区满后继续探测：只写入 max 项，返回功能总数
TEST_F(PciBusTest, ReportsTotalBeyondBufferCapacity) {
  for (uint8_t slot = 0; slot < 4; ++slot) {
    config_.Set(0, slot, 0, Function{.vendor_id = 0x8086, .class_code = 0x02});
  }
  config_.Set(0, 3, 0,
              Function{.vendor_id = 0x8086, .class_code = 0x02,
                       .header_type = 0x80});
  config_.Set(0, 3, 1, Function{.vendor_id = 0x8086, .class_code = 0x02});

  RawDeviceDescriptor out[3]{};
  auto found = bus_.Enumerate(out, 2);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 5U);
  EXPECT_EQ(out[0].id, DeviceId::Pci(0, 0, 0));
  EXPECT_EQ(out[1].id, DeviceId::Pci(0, 1, 0));
  EXPECT_EQ(out[2].id, RawDeviceDescriptor{}.id);
}

// 测试 max 为 0 时不写入任何项，只计数
TEST_F(PciBusTest, CountsWithoutBuffer) {
  config_.Set(0, 7, 0, Function{.vendor_id = 0x10EC, .class_code = 0x02});
  auto found = bus_.Enumerate(nullptr, 0);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 1U);
}

// 测试重复枚举结果一致
TEST_F(PciBusTest, EnumerationIsIdempotent) {
  config_.Set(0, 3, 0, Function{.vendor_id = 0x8086, .class_code = 0x02});
  config_.Set(0, 5, 0, Function{.vendor_id = 0x8086, .class_code = 0x03});

  RawDeviceDescriptor second[kMax]{};
  auto first_found = bus_.Enumerate(out_, kMax);
  auto second_found = bus_.Enumerate(second, kMax);
  ASSERT_TRUE(first_found.has_value());
  ASSERT_TRUE(second_found.has_value());
  ASSERT_EQ(*first_found, *second_found);
  for (size_t i = 0; i < *first_found; ++i) {
    EXPECT_EQ(out_[i].id, second[i].id);
    EXPECT_TRUE(IdentityMatches(out_[i], second[i]));
    EXPECT_TRUE(AuxiliaryMatches(out_[i], second[i]));
  }
}

}  // namespace
