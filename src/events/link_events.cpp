#include "events/link_events.h"

#include "util/log.h"

namespace meshlink {

bool EventRouter::subscribe(ILinkObserver& observer) {
  for (size_t i = 0; i < _observers.size(); ++i) {
    if (_observers[i] == &observer) {
      return true;
    }
  }
  if (_observers.full()) {
    MESHLINK_LOG_ERROR("MeshCore", "Observer table full (%u)",
                       static_cast<unsigned>(_observers.max_size()));
    return false;
  }
  _observers.push_back(&observer);
  return true;
}

bool EventRouter::unsubscribe(ILinkObserver& observer) {
  for (ObserverList::iterator it = _observers.begin(); it != _observers.end(); ++it) {
    if (*it == &observer) {
      _observers.erase(it);
      return true;
    }
  }
  return false;
}

// Each handler walks a snapshot so observers may unsubscribe from a callback.

void EventRouter::on_receive(const events::EvConnected& msg) {
  const ObserverList snapshot(_observers);
  for (size_t i = 0; i < snapshot.size(); ++i) {
    snapshot[i]->onConnected(msg.node);
  }
}

void EventRouter::on_receive(const events::EvDisconnected&) {
  const ObserverList snapshot(_observers);
  for (size_t i = 0; i < snapshot.size(); ++i) {
    snapshot[i]->onDisconnected();
  }
}

void EventRouter::on_receive(const events::EvMessage& msg) {
  const ObserverList snapshot(_observers);
  for (size_t i = 0; i < snapshot.size(); ++i) {
    snapshot[i]->onMessage(msg.message);
  }
}

void EventRouter::on_receive(const events::EvSerialLine& msg) {
  const ObserverList snapshot(_observers);
  for (size_t i = 0; i < snapshot.size(); ++i) {
    snapshot[i]->onSerialLine(msg.line);
  }
}

}  // namespace meshlink
