#ifndef __TS_SHARE_SOCKET__
#define __TS_SHARE_SOCKET__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Minimal message socket used by the share controllers.
 *
 * Implementations deliver whole binary messages and report lifecycle events
 * through the registered callbacks. Callbacks may run on any thread.
 */
class ShareSocket {
 public:
  enum class State { CONNECTING, OPEN, CLOSING, CLOSED };

  typedef function<void()> OpenHandler;
  typedef function<void(const string&)> MessageHandler;
  typedef function<void(int, const string&)> CloseHandler;
  typedef function<void(const string&)> ErrorHandler;

  virtual ~ShareSocket() {}

  /** @brief Starts connecting. Completion is reported through onOpen. */
  virtual void open() = 0;

  virtual State getState() const = 0;

  bool isOpen() const { return getState() == State::OPEN; }

  /**
   * @brief Queues one binary message.
   * @return false if the socket is not open; nothing is queued in that case.
   */
  virtual bool send(const string& message) = 0;

  /** @brief Starts a graceful close handshake with the given close code. */
  virtual void close(int code = NORMAL_CLOSURE) = 0;

  /** @brief Drops the connection immediately without a handshake. */
  virtual void terminate() = 0;

  void setOnOpen(OpenHandler handler) {
    lock_guard<recursive_mutex> guard(handlerMutex);
    onOpen = handler;
  }
  void setOnMessage(MessageHandler handler) {
    lock_guard<recursive_mutex> guard(handlerMutex);
    onMessage = handler;
  }
  void setOnClose(CloseHandler handler) {
    lock_guard<recursive_mutex> guard(handlerMutex);
    onClose = handler;
  }
  void setOnError(ErrorHandler handler) {
    lock_guard<recursive_mutex> guard(handlerMutex);
    onError = handler;
  }

  /**
   * @brief Detaches every callback. Events arriving afterwards are dropped,
   * which lets an owner tear down without hearing its own close.
   */
  void clearHandlers() {
    lock_guard<recursive_mutex> guard(handlerMutex);
    onOpen = nullptr;
    onMessage = nullptr;
    onClose = nullptr;
    onError = nullptr;
  }

 protected:
  void fireOpen() {
    OpenHandler handler;
    {
      lock_guard<recursive_mutex> guard(handlerMutex);
      handler = onOpen;
    }
    if (handler) handler();
  }
  void fireMessage(const string& message) {
    MessageHandler handler;
    {
      lock_guard<recursive_mutex> guard(handlerMutex);
      handler = onMessage;
    }
    if (handler) handler(message);
  }
  void fireClose(int code, const string& reason) {
    CloseHandler handler;
    {
      lock_guard<recursive_mutex> guard(handlerMutex);
      handler = onClose;
    }
    if (handler) handler(code, reason);
  }
  void fireError(const string& error) {
    ErrorHandler handler;
    {
      lock_guard<recursive_mutex> guard(handlerMutex);
      handler = onError;
    }
    if (handler) handler(error);
  }

  recursive_mutex handlerMutex;
  OpenHandler onOpen;
  MessageHandler onMessage;
  CloseHandler onClose;
  ErrorHandler onError;
};

/**
 * @brief Creates sockets for a fully built ws:// or wss:// url.
 */
class ShareSocketFactory {
 public:
  virtual ~ShareSocketFactory() {}
  virtual shared_ptr<ShareSocket> create(const string& url) = 0;
};
}  // namespace ts

#endif  // __TS_SHARE_SOCKET__
