/**
 * @file CommandCorrelator.h
 * @brief Correlation of asynchronous replies with the commands that caused them.
 *
 * dispatch() mints an id and parks the caller's PendingReply under it. The
 * entry leaves the table before the reply is settled, so each PendingReply is
 * settled at most once no matter which of resolve(), reject(), rejectAll(),
 * tick() or the waiter's own destructor gets there first.
 *
 * Both transports use it: BridgeProcess keys it by the JSON "id" field,
 * SerialTransport by its single outstanding CLI command.
 */
#ifndef MESHLINK_CORRELATOR_COMMAND_CORRELATOR_H
#define MESHLINK_CORRELATOR_COMMAND_CORRELATOR_H

#include <stddef.h>
#include <stdint.h>

#include <etl/string.h>
#include <etl/utility.h>
#include <etl/vector.h>

#include "link_error.h"
#include "meshlink_config.h"
#include "util/Clock.h"

namespace meshlink {

template <typename T, size_t CAPACITY>
class CommandCorrelator;

template <typename T>
class PendingReply {
 public:
  enum class State : uint8_t { IDLE, PENDING, RESOLVED, REJECTED };

  PendingReply() : _value(), _error(), _state(State::IDLE), _id(0), _forget(nullptr), _owner(nullptr) {}

  ~PendingReply() { abandon(); }

  PendingReply(const PendingReply&) = delete;
  PendingReply& operator=(const PendingReply&) = delete;

  State state() const { return _state; }
  bool pending() const { return _state == State::PENDING; }
  bool settled() const { return _state == State::RESOLVED || _state == State::REJECTED; }
  bool ok() const { return _state == State::RESOLVED; }
  uint32_t id() const { return _id; }

  T& value() { return _value; }
  const T& value() const { return _value; }
  const Error& error() const { return _error; }

  // Withdraws a still-pending reply from its correlator.
  void abandon() {
    if (_state == State::PENDING && _owner != nullptr && _forget != nullptr) {
      _forget(_owner, _id);
    }
    _detach();
    if (_state == State::PENDING) {
      _state = State::IDLE;
    }
  }

 private:
  template <typename U, size_t CAPACITY>
  friend class CommandCorrelator;

  using ForgetFn = void (*)(void*, uint32_t);

  void _bind(void* owner, ForgetFn forget, uint32_t id) {
    _state = State::PENDING;
    _owner = owner;
    _forget = forget;
    _id = id;
  }

  void _detach() {
    _owner = nullptr;
    _forget = nullptr;
  }

  void _resolve(T&& value) {
    _detach();
    _value = etl::move(value);
    _state = State::RESOLVED;
  }

  void _reject(const Error& error) {
    _detach();
    _error = error;
    _state = State::REJECTED;
  }

  T _value;
  Error _error;
  State _state;
  uint32_t _id;
  ForgetFn _forget;
  void* _owner;
};

template <typename T, size_t CAPACITY = MESHLINK_MAX_PENDING_COMMANDS>
class CommandCorrelator {
 public:
  static constexpr size_t kCommandNameMax = 48;

  explicit CommandCorrelator(const Clock& clock)
      : _clock(clock), _entries(), _next_id(1), _timeouts(0) {}

  ~CommandCorrelator() {
    for (size_t i = 0; i < _entries.size(); ++i) {
      _entries[i].reply->_detach();
      _entries[i].reply->_state = PendingReply<T>::State::IDLE;
    }
  }

  CommandCorrelator(const CommandCorrelator&) = delete;
  CommandCorrelator& operator=(const CommandCorrelator&) = delete;

  /**
   * @brief Register @p reply under a fresh id.
   * @return The id to embed in the request, or BUSY when the table is full.
   */
  Result<uint32_t> dispatch(const char* command, uint32_t timeout_ms, PendingReply<T>& reply) {
    if (reply.pending()) {
      reply.abandon();
    }
    if (_entries.full()) {
      return make_error(Error::format(ErrorCode::BUSY, "Too many pending commands (%u)",
                                      static_cast<unsigned>(CAPACITY)));
    }

    const uint32_t id = _mintId();
    Entry entry;
    entry.id = id;
    entry.command.assign(command, command + _boundedLength(command));
    entry.deadline = _clock.millis() + timeout_ms;
    entry.reply = &reply;
    _entries.push_back(entry);
    reply._bind(this, &CommandCorrelator::_forgetThunk, id);
    return id;
  }

  // Settles the entry for @p id. Unknown ids (late or duplicate) are ignored.
  bool resolve(uint32_t id, T&& value) {
    PendingReply<T>* reply = _take(id);
    if (reply == nullptr) {
      return false;
    }
    reply->_resolve(etl::move(value));
    return true;
  }

  bool reject(uint32_t id, const Error& error) {
    PendingReply<T>* reply = _take(id);
    if (reply == nullptr) {
      return false;
    }
    reply->_reject(error);
    return true;
  }

  size_t rejectAll(const Error& error) {
    size_t count = 0;
    while (!_entries.empty()) {
      PendingReply<T>* reply = _entries.back().reply;
      _entries.pop_back();
      reply->_reject(error);
      ++count;
    }
    return count;
  }

  /**
   * @brief Expire every entry whose deadline has passed.
   * @return Number of entries rejected with PROTOCOL_TIMEOUT.
   */
  size_t tick() {
    const uint32_t now = _clock.millis();
    size_t expired = 0;
    size_t i = 0;
    while (i < _entries.size()) {
      if (millis_until(_entries[i].deadline, now) > 0) {
        ++i;
        continue;
      }
      const Entry entry = _entries[i];
      _entries.erase(_entries.begin() + i);
      entry.reply->_reject(Error::format(ErrorCode::PROTOCOL_TIMEOUT, "Command timeout: %s",
                                         entry.command.c_str()));
      ++_timeouts;
      ++expired;
    }
    return expired;
  }

  // Milliseconds until the earliest deadline, or -1 with nothing pending.
  int32_t nextDeadlineIn() const {
    if (_entries.empty()) {
      return -1;
    }
    const uint32_t now = _clock.millis();
    int32_t best = millis_until(_entries[0].deadline, now);
    for (size_t i = 1; i < _entries.size(); ++i) {
      const int32_t remaining = millis_until(_entries[i].deadline, now);
      if (remaining < best) {
        best = remaining;
      }
    }
    return best < 0 ? 0 : best;
  }

  // Drops the entry without settling; the reply returns to IDLE.
  bool forget(uint32_t id) {
    PendingReply<T>* reply = _take(id);
    if (reply == nullptr) {
      return false;
    }
    reply->_detach();
    reply->_state = PendingReply<T>::State::IDLE;
    return true;
  }

  bool contains(uint32_t id) const { return _find(id) < _entries.size(); }
  size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }
  uint32_t timeouts() const { return _timeouts; }

 private:
  struct Entry {
    uint32_t id;
    etl::string<kCommandNameMax> command;
    uint32_t deadline;
    PendingReply<T>* reply;
  };

  static size_t _boundedLength(const char* s) {
    size_t n = 0;
    while (s[n] != '\0' && n < kCommandNameMax) {
      ++n;
    }
    return n;
  }

  static void _forgetThunk(void* self, uint32_t id) {
    static_cast<CommandCorrelator*>(self)->_take(id);
  }

  uint32_t _mintId() {
    uint32_t id = _next_id++;
    if (_next_id == 0) {
      _next_id = 1;
    }
    return id;
  }

  size_t _find(uint32_t id) const {
    for (size_t i = 0; i < _entries.size(); ++i) {
      if (_entries[i].id == id) {
        return i;
      }
    }
    return _entries.size();
  }

  PendingReply<T>* _take(uint32_t id) {
    const size_t index = _find(id);
    if (index >= _entries.size()) {
      return nullptr;
    }
    PendingReply<T>* reply = _entries[index].reply;
    _entries.erase(_entries.begin() + index);
    return reply;
  }

  const Clock& _clock;
  etl::vector<Entry, CAPACITY> _entries;
  uint32_t _next_id;
  uint32_t _timeouts;
};

}  // namespace meshlink

#endif  // MESHLINK_CORRELATOR_COMMAND_CORRELATOR_H
