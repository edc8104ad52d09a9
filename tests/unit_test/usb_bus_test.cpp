/**
 * @copyright Copyright The DevMgr Contributors
 * @brief USB 总线枚举测试
 */

#include "usb_bus.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>

#include "fakes/fake_backends.hpp"

namespace {

constexpr size_t kMax = devmgr::config::kMaxDescriptorsPerBus;

class UsbBusTest : public ::testing::Test {
 protected:
  fakes::FakeUsbHostController controller_{1, 4};
  UsbBus bus_{controller_};
  RawDeviceDescriptor out_[kMax]{};
};

TEST_F(UsbBusTest, AbsentController) {
  controller_.SetPresent(false);
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kBusNotPresent);
}

TEST_F(UsbBusTest, NoConnectedPorts) {
  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 0U);
}

// 测试设备描述符与首个接口描述符的解析
TEST_F(UsbBusTest, ParsesDeviceAndInterface) {
  controller_.Attach(2, 0x0781, 0x5567, 0x00, 0x08, 0x06, 0x50,
                     UsbSpeed::kSuper, 0x0126);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(out_[0].id, DeviceId::Usb(1, 2));

  const auto& usb = std::get<UsbIdentity>(out_[0].identity);
  EXPECT_EQ(usb.vendor_id, 0x0781);
  EXPECT_EQ(usb.product_id, 0x5567);
  EXPECT_EQ(usb.bcd_device, 0x0126);
  EXPECT_EQ(usb.device_class, 0x00);
  EXPECT_EQ(usb.interface_class, 0x08);
  EXPECT_EQ(usb.interface_subclass, 0x06);
  EXPECT_EQ(usb.interface_protocol, 0x50);
  EXPECT_EQ(usb.speed, UsbSpeed::kSuper);
  EXPECT_EQ(Classify(out_[0]), DeviceClass::kStorageUsb);
}

// 测试未连接端口被跳过，端口顺序保持
TEST_F(UsbBusTest, SkipsDisconnectedPorts) {
  controller_.Attach(1, 0x0BDA, 0x8152, 0x00, 0x02, 0x06);
  controller_.Attach(4, 0x0A12, 0x0001, 0xE0, 0xE0, 0x01, 0x01);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 2U);
  EXPECT_EQ(out_[0].id, DeviceId::Usb(1, 1));
  EXPECT_EQ(out_[1].id, DeviceId::Usb(1, 4));

  controller_.Detach(1);
  found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(out_[0].id, DeviceId::Usb(1, 4));
}

// 测试接口描述符之前夹带其他描述符时仍能找到接口
TEST_F(UsbBusTest, SkipsNonInterfaceDescriptors) {
  controller_.Attach(1, 0x046D, 0x0825, 0xEF, 0x0E, 0x01);
  auto& config = controller_.GetPort(1).configuration;
  // 在配置描述符之后插入一个 8 字节的 IAD (type 0x0B)
  const uint8_t iad[] = {8, 0x0B, 0, 2, 0x0E, 0x03, 0x00, 0};
  config.insert(config.begin() + 9, std::begin(iad), std::end(iad));
  config[2] = static_cast<uint8_t>(config.size());

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  EXPECT_EQ(std::get<UsbIdentity>(out_[0].identity).interface_class, 0x0E);
}

TEST_F(UsbBusTest, BadDeviceDescriptorLength) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.GetPort(1).device[0] = 12;

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(UsbBusTest, ShortDeviceDescriptor) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.GetPort(1).device.resize(8);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(UsbBusTest, BadConfigurationType) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.GetPort(1).configuration[1] = usb_desc::kInterface;

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

// 测试描述符链中 bLength 为 0 时报告格式错误而不是死循环
TEST_F(UsbBusTest, BrokenDescriptorChain) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.GetPort(1).configuration[9] = 0;

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(UsbBusTest, ChainOverrunsTotalLength) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.GetPort(1).configuration[9] = 30;

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kMalformedResponse);
}

TEST_F(UsbBusTest, TimeoutPropagates) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  controller_.SetTimeout(true);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::kProbeTimeout);
}

// 测试缓冲区满时只写入 max 项，返回值仍是已连接设备总数
TEST_F(UsbBusTest, ReportsTotalBeyondBufferCapacity) {
  for (uint8_t port = 1; port <= 4; ++port) {
    controller_.Attach(port, 0x0781, port, 0x00, 0x08);
  }
  RawDeviceDescriptor out[4]{};
  auto found = bus_.Enumerate(out, 3);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, 4U);
  EXPECT_EQ(out[2].id, DeviceId::Usb(1, 3));
  EXPECT_EQ(out[3].id, RawDeviceDescriptor{}.id);
}

// 测试后端报告的长度超过缓冲区时，描述符链只在缓冲区内解析
TEST_F(UsbBusTest, ReportedConfigLengthClampedToBuffer) {
  controller_.Attach(1, 0x0781, 0x5567, 0x00, 0x08);
  auto& configuration = controller_.GetPort(1).configuration;
  // 配置描述符声明 1024 字节，后接一个 247 字节的类特定描述符，
  // 两者恰好填满 256 字节的读取缓冲区
  configuration.assign(256, 0);
  const uint8_t header[] = {9, usb_desc::kConfiguration, 0x00, 0x04, 1, 1, 0,
                            0x80, 50};
  std::copy(std::begin(header), std::end(header), configuration.begin());
  configuration[9] = 247;
  configuration[10] = 0x24;
  controller_.ReportConfigLength(1024);

  auto found = bus_.Enumerate(out_, kMax);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(*found, 1U);
  const auto& usb = std::get<UsbIdentity>(out_[0].identity);
  EXPECT_EQ(usb.vendor_id, 0x0781);
  EXPECT_EQ(usb.interface_class, 0x00);
}

}  // namespace
