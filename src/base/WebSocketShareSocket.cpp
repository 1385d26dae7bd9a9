#include "WebSocketShareSocket.hpp"

namespace ts {
namespace {
// Splits ws[s]://host[:port]/path?query into its parts.
bool parseWebSocketUrl(const string& url, bool* secure, string* host,
                       string* port, string* target) {
  string rest;
  if (url.rfind("wss://", 0) == 0) {
    *secure = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    *secure = false;
    rest = url.substr(5);
  } else {
    return false;
  }
  size_t pathStart = rest.find_first_of("/?");
  string authority = rest.substr(0, pathStart);
  *target = pathStart == string::npos ? "/" : rest.substr(pathStart);
  if (!target->empty() && (*target)[0] == '?') {
    *target = "/" + *target;
  }
  size_t colon = authority.rfind(':');
  if (colon != string::npos && authority.find(']', colon) == string::npos) {
    *host = authority.substr(0, colon);
    *port = authority.substr(colon + 1);
  } else {
    *host = authority;
    *port = *secure ? "443" : "80";
  }
  return !host->empty();
}
}  // namespace

WebSocketShareSocket::WebSocketShareSocket(const string& _url)
    : url(_url),
      secure(false),
      workGuard(asio::make_work_guard(ioContext)),
      sslContext(asio::ssl::context::tls_client),
      resolver(ioContext),
      closeReported(false),
      state(State::CLOSED) {}

WebSocketShareSocket::~WebSocketShareSocket() {
  clearHandlers();
  workGuard.reset();
  ioContext.stop();
  if (ioThread.joinable()) {
    if (ioThread.get_id() == std::this_thread::get_id()) {
      ioThread.detach();
    } else {
      ioThread.join();
    }
  }
}

void WebSocketShareSocket::open() {
  if (ioThread.joinable()) {
    STFATAL << "Tried to open a websocket twice";
  }
  state = State::CONNECTING;
  if (!parseWebSocketUrl(url, &secure, &host, &port, &target)) {
    LOG(ERROR) << "Invalid websocket url: " << url;
    state = State::CLOSED;
    fireError("Invalid websocket url");
    fireClose(ABNORMAL_CLOSURE, "Invalid websocket url");
    return;
  }

  if (secure) {
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(asio::ssl::verify_peer);
    tlsStream.reset(new TlsStream(asio::make_strand(ioContext), sslContext));
  } else {
    plainStream.reset(new PlainStream(asio::make_strand(ioContext)));
  }

  auto self = shared_from_this();
  resolver.async_resolve(
      host, port,
      [self](beast::error_code ec,
             asio::ip::tcp::resolver::results_type results) {
        self->onResolve(ec, results);
      });
  ioThread = std::thread([self]() {
    self->ioContext.run();
    VLOG(1) << "Websocket io thread finished for " << self->host;
  });
}

void WebSocketShareSocket::onResolve(
    beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
  if (ec) {
    return fail("resolve", ec);
  }
  auto self = shared_from_this();
  withStream([&](auto& ws) {
    beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws).async_connect(
        results,
        [self](beast::error_code ec,
               asio::ip::tcp::resolver::results_type::endpoint_type) {
          self->onConnect(ec);
        });
  });
}

void WebSocketShareSocket::onConnect(beast::error_code ec) {
  if (ec) {
    return fail("connect", ec);
  }
  if (!tlsStream) {
    startWebSocketHandshake();
    return;
  }
  if (!SSL_set_tlsext_host_name(tlsStream->next_layer().native_handle(),
                                host.c_str())) {
    beast::error_code sniError(static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category());
    return fail("sni", sniError);
  }
  tlsStream->next_layer().set_verify_callback(
      asio::ssl::host_name_verification(host));
  auto self = shared_from_this();
  tlsStream->next_layer().async_handshake(
      asio::ssl::stream_base::client, [self](beast::error_code ec) {
        if (ec) {
          return self->fail("tls handshake", ec);
        }
        self->startWebSocketHandshake();
      });
}

void WebSocketShareSocket::startWebSocketHandshake() {
  auto self = shared_from_this();
  withStream([&](auto& ws) {
    // The websocket layer has its own keepalive settings.
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.binary(true);
    string hostHeader = host + ":" + port;
    ws.async_handshake(hostHeader, target, [self](beast::error_code ec) {
      self->onHandshake(ec);
    });
  });
}

void WebSocketShareSocket::onHandshake(beast::error_code ec) {
  if (ec) {
    return fail("websocket handshake", ec);
  }
  if (state != State::CONNECTING) {
    // close() or terminate() raced with the handshake
    return;
  }
  state = State::OPEN;
  VLOG(1) << "Websocket open: " << host << target.substr(0, target.find('?'));
  fireOpen();
  doRead();
}

void WebSocketShareSocket::doRead() {
  auto self = shared_from_this();
  withStream([&](auto& ws) {
    ws.async_read(readBuffer, [self](beast::error_code ec, size_t) {
      self->onRead(ec);
    });
  });
}

void WebSocketShareSocket::onRead(beast::error_code ec) {
  if (ec == websocket::error::closed) {
    int code = NORMAL_CLOSURE;
    string reason;
    withStream([&](auto& ws) {
      code = ws.reason().code;
      reason = string(ws.reason().reason.c_str());
    });
    return finish(code, reason);
  }
  if (ec) {
    return fail("read", ec);
  }
  string message = beast::buffers_to_string(readBuffer.data());
  readBuffer.consume(readBuffer.size());
  fireMessage(message);
  if (!closeReported) {
    doRead();
  }
}

bool WebSocketShareSocket::send(const string& message) {
  if (state != State::OPEN) {
    return false;
  }
  auto self = shared_from_this();
  asio::post(ioContext, [self, message]() {
    if (self->state != State::OPEN) {
      return;
    }
    self->writeQueue.push_back(message);
    if (self->writeQueue.size() == 1) {
      self->doWrite();
    }
  });
  return true;
}

void WebSocketShareSocket::doWrite() {
  auto self = shared_from_this();
  withStream([&](auto& ws) {
    ws.async_write(asio::buffer(writeQueue.front()),
                   [self](beast::error_code ec, size_t) {
                     self->onWrite(ec);
                   });
  });
}

void WebSocketShareSocket::onWrite(beast::error_code ec) {
  if (ec) {
    return fail("write", ec);
  }
  writeQueue.pop_front();
  if (!writeQueue.empty() && state == State::OPEN) {
    doWrite();
  }
}

void WebSocketShareSocket::close(int code) {
  State current = state;
  if (current == State::CLOSED || current == State::CLOSING) {
    return;
  }
  if (current == State::CONNECTING) {
    terminate();
    return;
  }
  state = State::CLOSING;
  auto self = shared_from_this();
  asio::post(ioContext, [self, code]() {
    self->withStream([&](auto& ws) {
      websocket::close_reason reason(
          static_cast<websocket::close_code>(code));
      ws.async_close(reason, [self, code](beast::error_code ec) {
        if (ec) {
          LOG(WARNING) << "Websocket close handshake failed: "
                       << ec.message();
          self->finish(ABNORMAL_CLOSURE, ec.message());
          return;
        }
        // The pending read completes with websocket::error::closed
        // once the peer echoes the close frame.
        VLOG(1) << "Websocket close sent with code " << code;
      });
    });
  });
}

void WebSocketShareSocket::terminate() {
  if (state == State::CLOSED) {
    return;
  }
  state = State::CLOSING;
  auto self = shared_from_this();
  asio::post(ioContext, [self]() {
    self->resolver.cancel();
    self->withStream([&](auto& ws) {
      beast::error_code ignored;
      beast::get_lowest_layer(ws).socket().shutdown(
          asio::ip::tcp::socket::shutdown_both, ignored);
      beast::get_lowest_layer(ws).close();
    });
    self->finish(ABNORMAL_CLOSURE, "terminated");
  });
}

void WebSocketShareSocket::fail(const string& what, beast::error_code ec) {
  if (closeReported) {
    return;
  }
  LOG(WARNING) << "Websocket " << what << " failed for " << host << ": "
               << ec.message();
  fireError(what + ": " + ec.message());
  finish(ABNORMAL_CLOSURE, ec.message());
}

void WebSocketShareSocket::finish(int code, const string& reason) {
  if (closeReported) {
    return;
  }
  closeReported = true;
  state = State::CLOSED;
  writeQueue.clear();
  workGuard.reset();
  fireClose(code, reason);
}
}  // namespace ts
