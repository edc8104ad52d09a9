/**
 * @copyright Copyright The DevMgr Contributors
 * @brief Bluetooth 总线枚举测试
 */

#include "bluetooth_bus.hpp"

#include <gtest/gtest.h>

#include "fakes/fake_backends.hpp"

namespace {

constexpr size_t kMax = devmgr::config::kMaxDescriptorsPerBus;

constexpr uint8_t kLocalAddr[6] = {0x00, 0x1A, 0x7D, 0x00, 0x00, 0x01};
constexpr uint8_t kHeadsetAddr[6] = {0x00, 0x1A, 0x7D, 0xDA, 0x71, 0x13};
constexpr uint8_t kCameraAddr[6] = {0x00, 0x1A, 0x7D, 0xDA, 0x71, 0x14};

class BluetoothBusTest : public ::testing::Test {
 protected:
  void SetUp() override { transport_.SetLocal(kLocalAddr, 0x00010C); }

  fakes::FakeHciTransport transport_;
  BluetoothBus bus_{transport_, 1500};
  RawDeviceDescriptor out_[kMax]{};
};

TEST_F(BluetoothBusTest, AbsentController) {
  transport_.SetPresent(false);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kBusNotPresent);
}

// 测试本机控制器总是第一条，且被识别为适配器
TEST_F(BluetoothBusTest, LocalControllerFirst) {
  transport_.AddRemote(kHeadsetAddr, 0x240404, -55);
  transport_.AddRemote(kCameraAddr, 0x000430);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 3U);

  EXPECT_EQ(out_[0].id, DeviceId::Bluetooth(kLocalAddr));
  EXPECT_TRUE(std::get<BluetoothIdentity>(out_[0].identity).local_controller);
  EXPECT_EQ(Classify(out_[0]), DeviceClass::kBluetoothAdapter);

  EXPECT_EQ(out_[1].id, DeviceId::Bluetooth(kHeadsetAddr));
  const auto& headset = std::get<BluetoothIdentity>(out_[1].identity);
  EXPECT_FALSE(headset.local_controller);
  EXPECT_EQ(headset.class_of_device, 0x240404U);
  EXPECT_EQ(headset.rssi, -55);
  EXPECT_EQ(Classify(out_[1]), DeviceClass::kAudioAdapter);

  EXPECT_EQ(Classify(out_[2]), DeviceClass::kVideoAdapter);
}

TEST_F(BluetoothBusTest, PassesTimeoutBudget) {
  ASSERT_TRUE(bus_.Enumerate(out_, kMax).has_value());
  EXPECT_EQ(transport_.GetLastTimeout(), 1500U);
}

// 测试同一 BD_ADDR 的多次应答只保留第一条
TEST_F(BluetoothBusTest, DuplicateAddressesCollapsed) {
  transport_.AddRemote(kHeadsetAddr, 0x240404, -55);
  transport_.AddRemote(kHeadsetAddr, 0x240404, -70);
  transport_.AddRemote(kLocalAddr, 0x00010C);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 2U);
  EXPECT_EQ(std::get<BluetoothIdentity>(out_[1].identity).rssi, -55);
}

TEST_F(BluetoothBusTest, InquiryTimeout) {
  transport_.FailInquiryWith(ErrorCode::kProbeTimeout);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kProbeTimeout);
}

TEST_F(BluetoothBusTest, ClassOfDeviceOutOfRange) {
  transport_.AddRemote(kHeadsetAddr, 0x1240404);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(BluetoothBusTest, LocalClassOfDeviceOutOfRange) {
  transport_.SetLocal(kLocalAddr, 0x01000000);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

// 测试传输层报告的结果数超过缓冲区时视为格式错误
TEST_F(BluetoothBusTest, ReportedCountExceedsBuffer) {
  transport_.ReportCount(kMax + 1);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

// 测试缓冲区满后仍统计去重后的设备总数
TEST_F(BluetoothBusTest, ReportsTotalBeyondBufferCapacity) {
  transport_.AddRemote(kHeadsetAddr, 0x240404);
  transport_.AddRemote(kHeadsetAddr, 0x240404, -70);
  transport_.AddRemote(kCameraAddr, 0x000430);

  RawDeviceDescriptor out[3]{};
  auto found = bus_.Enumerate(out, 2);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 3U);
  EXPECT_EQ(out[0].id, DeviceId::Bluetooth(kLocalAddr));
  EXPECT_EQ(out[1].id, DeviceId::Bluetooth(kHeadsetAddr));
  EXPECT_EQ(out[2].id, RawDeviceDescriptor{}.id);

  found = bus_.Enumerate(nullptr, 0);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 3U);
}

}  // namespace
