/**
 * @copyright Copyright The DevMgr Contributors
 * @brief 驱动注册表测试
 */

#include "driver_registry.hpp"

#include <gtest/gtest.h>

#include "fakes/fake_drivers.hpp"
#include "fakes/synthetic_bus.hpp"

namespace {

TEST(DriverRegistryTest, RegisterAndFind) {
  DriverRegistry registry;
  fakes::FakeEthernetDriver ethernet;
  fakes::FakeAtaDriver ata;

  ASSERT_TRUE(registry.Register(ethernet).has_value());
  ASSERT_TRUE(registry.Register(ata).has_value());
  EXPECT_EQ(registry.Count(), 2U);

  auto entry = registry.FindDriver(DeviceClass::kNetworkEthernet);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->descriptor->device_class, DeviceClass::kNetworkEthernet);
  EXPECT_TRUE(entry->create.is_valid());

  EXPECT_FALSE(registry.FindDriver(DeviceClass::kBridge).has_value());
}

// 测试工厂委托调用到注册的驱动实例
TEST(DriverRegistryTest, FactoryDispatchesToInstance) {
  DriverRegistry registry;
  fakes::FakeEthernetDriver ethernet;
  ASSERT_TRUE(registry.Register(ethernet).has_value());

  auto descriptor = fakes::MakePci(0, 3, 0, 0x8086, 0x100E, 0x02, 0x00);
  ResourceGrant grant{};
  grant.handle = 7;

  auto entry = registry.FindDriver(DeviceClass::kNetworkEthernet);
  ASSERT_TRUE(entry.has_value());
  auto device = entry->create(descriptor, grant);
  ASSERT_TRUE(device.has_value());
  ASSERT_TRUE(*device);
  EXPECT_EQ((*device)->GetId(), descriptor.id);
  EXPECT_EQ((*device)->GetClass(), DeviceClass::kNetworkEthernet);

  EXPECT_EQ(ethernet.probe.created.load(), 1U);
  ASSERT_EQ(ethernet.probe.grants.size(), 1U);
  EXPECT_EQ(ethernet.probe.grants[0].handle, 7U);
}

TEST(DriverRegistryTest, DuplicateClassRejected) {
  DriverRegistry registry;
  fakes::FakeWifiDriver first;
  fakes::FakeWifiDriver second;

  ASSERT_TRUE(registry.Register(first).has_value());
  auto result = registry.Register(second);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kDriverAlreadyRegistered);
  EXPECT_EQ(registry.Count(), 1U);
}

}  // namespace
