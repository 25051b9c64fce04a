/**
 * @file DeviceStateCache.h
 * @brief In-memory view of the attached node, its contacts and traffic.
 *
 * The local node is replaced wholesale on refresh. The contact table is
 * replaced atomically, so contacts the device stops reporting disappear.
 * Message history is a bounded FIFO: the oldest entry is evicted on overflow.
 */
#ifndef MESHLINK_STATE_DEVICE_STATE_CACHE_H
#define MESHLINK_STATE_DEVICE_STATE_CACHE_H

#include <stddef.h>

#include <etl/circular_buffer.h>
#include <etl/map.h>
#include <etl/optional.h>

#include "meshlink_config.h"
#include "state/mesh_types.h"

namespace meshlink {

class DeviceStateCache {
 public:
  static constexpr size_t kMessageCapacity = MESHLINK_MAX_MESSAGE_HISTORY;
  static constexpr size_t kContactCapacity = MESHLINK_MAX_CONTACTS;

  DeviceStateCache();

  const Node* localNode() const { return _local_node.has_value() ? &_local_node.value() : nullptr; }
  void setLocalNode(const Node& node) { _local_node = node; }
  bool renameLocalNode(etl::string_view name);

  void replaceContacts(const ContactList& contacts);
  size_t contactCount() const { return _contacts.size(); }
  const Contact* findContact(etl::string_view public_key) const;
  void contacts(ContactList& out) const;

  void appendMessage(const Message& message);
  size_t messageCount() const { return _messages.size(); }

  // The newest @p limit messages, oldest first.
  void recentMessages(size_t limit, MessageList& out) const;

  // Local node first, then one entry per contact.
  void allNodes(NodeList& out) const;

  void clear();

 private:
  using ContactTable = etl::map<PublicKeyHex, Contact, kContactCapacity>;

  etl::optional<Node> _local_node;
  ContactTable _contacts;
  etl::circular_buffer<Message, kMessageCapacity> _messages;
};

}  // namespace meshlink

#endif  // MESHLINK_STATE_DEVICE_STATE_CACHE_H
