#ifndef __TS_WEBSOCKET_SHARE_SOCKET__
#define __TS_WEBSOCKET_SHARE_SOCKET__

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "Headers.hpp"
#include "ShareSocket.hpp"

namespace ts {
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace asio = boost::asio;

/**
 * @brief ShareSocket over a real WebSocket (ws:// or wss://).
 *
 * All Beast operations run on a private io thread; public calls post work to
 * it. A drop without a close handshake is reported as ABNORMAL_CLOSURE.
 * Instances must be owned by a shared_ptr (see WebSocketShareSocketFactory).
 */
class WebSocketShareSocket
    : public ShareSocket,
      public enable_shared_from_this<WebSocketShareSocket> {
 public:
  explicit WebSocketShareSocket(const string& _url);
  virtual ~WebSocketShareSocket();

  virtual void open();
  virtual State getState() const { return state; }
  virtual bool send(const string& message);
  virtual void close(int code = NORMAL_CLOSURE);
  virtual void terminate();

 protected:
  typedef websocket::stream<beast::tcp_stream> PlainStream;
  typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> TlsStream;

  template <typename Fn>
  void withStream(Fn fn) {
    if (tlsStream) {
      fn(*tlsStream);
    } else {
      fn(*plainStream);
    }
  }

  void onResolve(beast::error_code ec,
                 asio::ip::tcp::resolver::results_type results);
  void onConnect(beast::error_code ec);
  void startWebSocketHandshake();
  void onHandshake(beast::error_code ec);
  void doRead();
  void onRead(beast::error_code ec);
  void doWrite();
  void onWrite(beast::error_code ec);
  void fail(const string& what, beast::error_code ec);
  void finish(int code, const string& reason);

  string url;
  bool secure;
  string host;
  string port;
  string target;

  asio::io_context ioContext;
  asio::executor_work_guard<asio::io_context::executor_type> workGuard;
  asio::ssl::context sslContext;
  asio::ip::tcp::resolver resolver;
  unique_ptr<PlainStream> plainStream;
  unique_ptr<TlsStream> tlsStream;
  beast::flat_buffer readBuffer;
  deque<string> writeQueue;
  bool closeReported;
  std::thread ioThread;
  atomic<State> state;
};

class WebSocketShareSocketFactory : public ShareSocketFactory {
 public:
  virtual shared_ptr<ShareSocket> create(const string& url) {
    return make_shared<WebSocketShareSocket>(url);
  }
};
}  // namespace ts

#endif  // __TS_WEBSOCKET_SHARE_SOCKET__
