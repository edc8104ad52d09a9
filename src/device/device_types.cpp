/**
 * @copyright Copyright The DevMgr Contributors
 */

#include "device_types.hpp"

auto BusFamilyName(BusFamily family) -> const char* {
  switch (family) {
    case BusFamily::kPci:
      return "pci";
    case BusFamily::kUsb:
      return "usb";
    case BusFamily::kBluetooth:
      return "bluetooth";
    case BusFamily::kPlatform:
      return "platform";
  }
  return "unknown";
}

auto DeviceClassName(DeviceClass device_class) -> const char* {
  switch (device_class) {
    case DeviceClass::kNetworkEthernet:
      return "NetworkEthernet";
    case DeviceClass::kNetworkWifi:
      return "NetworkWifi";
    case DeviceClass::kStorageUsb:
      return "StorageUsb";
    case DeviceClass::kStorageAta:
      return "StorageAta";
    case DeviceClass::kBluetoothAdapter:
      return "BluetoothAdapter";
    case DeviceClass::kAudioAdapter:
      return "AudioAdapter";
    case DeviceClass::kVideoAdapter:
      return "VideoAdapter";
    case DeviceClass::kBridge:
      return "Bridge";
    case DeviceClass::kUnknown:
      return "Unknown";
  }
  return "Unknown";
}

auto DeviceClassPrefix(DeviceClass device_class) -> const char* {
  switch (device_class) {
    case DeviceClass::kNetworkEthernet:
      return "eth";
    case DeviceClass::kNetworkWifi:
      return "wlan";
    case DeviceClass::kStorageUsb:
      return "usb";
    case DeviceClass::kStorageAta:
      return "ata";
    case DeviceClass::kBluetoothAdapter:
      return "hci";
    case DeviceClass::kAudioAdapter:
      return "snd";
    case DeviceClass::kVideoAdapter:
      return "video";
    case DeviceClass::kBridge:
      return "bridge";
    case DeviceClass::kUnknown:
      return "dev";
  }
  return "dev";
}

auto DeviceStateName(DeviceState state) -> const char* {
  switch (state) {
    case DeviceState::kDiscovered:
      return "Discovered";
    case DeviceState::kResourceReserved:
      return "ResourceReserved";
    case DeviceState::kInitializing:
      return "Initializing";
    case DeviceState::kReady:
      return "Ready";
    case DeviceState::kFailed:
      return "Failed";
    case DeviceState::kRemoving:
      return "Removing";
    case DeviceState::kDestroyed:
      return "Destroyed";
  }
  return "Invalid";
}
