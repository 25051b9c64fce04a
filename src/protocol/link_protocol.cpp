#include "protocol/link_protocol.h"

namespace meshlink {

const char* device_type_name(DeviceType type) {
  switch (type) {
    case DeviceType::COMPANION:
      return "COMPANION";
    case DeviceType::REPEATER:
      return "REPEATER";
    case DeviceType::ROOM_SERVER:
      return "ROOM_SERVER";
    case DeviceType::UNKNOWN:
      break;
  }
  return "UNKNOWN";
}

DeviceType device_type_from_wire(int value) {
  switch (value) {
    case 1:
      return DeviceType::COMPANION;
    case 2:
      return DeviceType::REPEATER;
    case 3:
      return DeviceType::ROOM_SERVER;
    default:
      return DeviceType::UNKNOWN;
  }
}

}  // namespace meshlink
