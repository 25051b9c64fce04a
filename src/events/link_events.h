/**
 * @file link_events.h
 * @brief Typed event surface of a device link.
 *
 * The event set is closed: connected(Node), disconnected(), message(Message)
 * and the lower-level serial_data(line). Events are routed through an ETL
 * message_router to every registered ILinkObserver in registration order.
 * Payload references are only valid for the duration of the callback.
 */
#ifndef MESHLINK_EVENTS_LINK_EVENTS_H
#define MESHLINK_EVENTS_LINK_EVENTS_H

#include <etl/message.h>
#include <etl/message_router.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "meshlink_config.h"
#include "state/mesh_types.h"

namespace meshlink {
namespace events {

enum MessageId : etl::message_id_t {
  MSG_CONNECTED = 0,
  MSG_DISCONNECTED = 1,
  MSG_MESSAGE = 2,
  MSG_SERIAL_LINE = 3
};

struct EvConnected : public etl::message<MSG_CONNECTED> {
  const Node& node;
  explicit EvConnected(const Node& n) : node(n) {}
};

struct EvDisconnected : public etl::message<MSG_DISCONNECTED> {};

struct EvMessage : public etl::message<MSG_MESSAGE> {
  const Message& message;
  explicit EvMessage(const Message& m) : message(m) {}
};

struct EvSerialLine : public etl::message<MSG_SERIAL_LINE> {
  etl::string_view line;
  explicit EvSerialLine(etl::string_view l) : line(l) {}
};

}  // namespace events

class ILinkObserver {
 public:
  virtual ~ILinkObserver() {}
  virtual void onConnected(const Node& node) { (void)node; }
  virtual void onDisconnected() {}
  virtual void onMessage(const Message& message) { (void)message; }
  virtual void onSerialLine(etl::string_view line) { (void)line; }
};

class EventRouter
    : public etl::message_router<EventRouter, events::EvConnected, events::EvDisconnected,
                                 events::EvMessage, events::EvSerialLine> {
 public:
  static constexpr etl::message_router_id_t kRouterId = 2;

  EventRouter() : message_router(kRouterId), _observers() {}

  bool subscribe(ILinkObserver& observer);
  bool unsubscribe(ILinkObserver& observer);
  size_t observerCount() const { return _observers.size(); }

  void on_receive(const events::EvConnected& msg);
  void on_receive(const events::EvDisconnected& msg);
  void on_receive(const events::EvMessage& msg);
  void on_receive(const events::EvSerialLine& msg);
  void on_receive_unknown(const etl::imessage&) {}

 private:
  using ObserverList = etl::vector<ILinkObserver*, MESHLINK_MAX_OBSERVERS>;

  ObserverList _observers;
};

}  // namespace meshlink

#endif  // MESHLINK_EVENTS_LINK_EVENTS_H
