#include "state/DeviceStateCache.h"

#include "protocol/link_protocol.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace meshlink {
namespace {

constexpr const char* kTag = "Cache";

}  // namespace

DeviceStateCache::DeviceStateCache() : _local_node(), _contacts(), _messages() {}

bool DeviceStateCache::renameLocalNode(etl::string_view name) {
  if (!_local_node.has_value()) {
    return false;
  }
  assign_bounded(_local_node.value().name, name);
  return true;
}

void DeviceStateCache::replaceContacts(const ContactList& contacts) {
  _contacts.clear();
  for (ContactList::const_iterator it = contacts.begin(); it != contacts.end(); ++it) {
    _contacts[it->public_key] = *it;
  }
  MESHLINK_LOG_DEBUG(kTag, "Contact table replaced (%u entries)",
                     static_cast<unsigned>(_contacts.size()));
}

const Contact* DeviceStateCache::findContact(etl::string_view public_key) const {
  PublicKeyHex key;
  if (!assign_bounded(key, public_key)) {
    return nullptr;
  }
  ContactTable::const_iterator it = _contacts.find(key);
  return it == _contacts.end() ? nullptr : &it->second;
}

void DeviceStateCache::contacts(ContactList& out) const {
  out.clear();
  for (ContactTable::const_iterator it = _contacts.begin(); it != _contacts.end(); ++it) {
    out.push_back(it->second);
  }
}

void DeviceStateCache::appendMessage(const Message& message) {
  if (_messages.full()) {
    MESHLINK_LOG_DEBUG(kTag, "History full, evicting %s", _messages.front().id.c_str());
    _messages.pop();
  }
  _messages.push(message);
}

void DeviceStateCache::recentMessages(size_t limit, MessageList& out) const {
  out.clear();
  const size_t count = limit < _messages.size() ? limit : _messages.size();
  const size_t skip = _messages.size() - count;
  for (size_t i = skip; i < _messages.size(); ++i) {
    out.push_back(_messages[i]);
  }
}

void DeviceStateCache::allNodes(NodeList& out) const {
  out.clear();
  if (_local_node.has_value()) {
    out.push_back(_local_node.value());
  }
  for (ContactTable::const_iterator it = _contacts.begin(); it != _contacts.end(); ++it) {
    if (out.full()) {
      break;
    }
    const Contact& contact = it->second;
    Node node;
    node.public_key = contact.public_key;
    if (!contact.adv_name.empty()) {
      node.name = contact.adv_name;
    } else if (!contact.name.empty()) {
      node.name = contact.name;
    } else {
      node.name = protocol::kUnknownNodeName;
    }
    node.device_type = contact.adv_type;
    node.last_heard_ms = contact.last_seen_ms;
    node.rssi = contact.rssi;
    node.snr = contact.snr;
    node.position = contact.position;
    out.push_back(node);
  }
}

void DeviceStateCache::clear() {
  _local_node.reset();
  _contacts.clear();
  _messages.clear();
}

}  // namespace meshlink
