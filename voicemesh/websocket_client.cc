/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include "websocket_client.h"

#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <thread>

#include "api/units/time_delta.h"

#include "options.h"
#include "signaling_events.h"

namespace {

enum Opcode : unsigned char {
  kContinuation = 0x0,
  kText = 0x1,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA,
};

constexpr int kIdleReadDelayMs = 50;
constexpr int kBusyReadDelayMs = 5;
constexpr int kMaxWriteStalls = 200;
constexpr size_t kKeyBytes = 16;

void LogTlsFailure(const char* what) {
  unsigned long code = ERR_get_error();
  char reason[256] = {0};
  if (code)
    ERR_error_string_n(code, reason, sizeof(reason));
  APP_LOG(AS_ERROR) << "TLS: " << what << (code ? ": " : "") << reason;
}

void FillRandom(unsigned char* out, size_t size) {
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    // Entropy pool unavailable.
    for (size_t i = 0; i < size; ++i)
      out[i] = static_cast<unsigned char>(::random() & 0xFF);
  }
}

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

// Header length and payload length of the frame at |data|, or false while
// the header itself is incomplete.
bool ReadFrameHeader(const std::string& data, size_t at, size_t* header, uint64_t* length) {
  if (data.size() < at + 2)
    return false;
  const unsigned char len7 = static_cast<unsigned char>(data[at + 1]) & 0x7F;
  size_t ext = len7 == 126 ? 2 : (len7 == 127 ? 8 : 0);
  if (data.size() < at + 2 + ext)
    return false;
  uint64_t value = len7;
  if (ext) {
    value = 0;
    for (size_t i = 0; i < ext; ++i)
      value = (value << 8) | static_cast<unsigned char>(data[at + 2 + i]);
  }
  const bool masked = (static_cast<unsigned char>(data[at + 1]) & 0x80) != 0;
  *header = 2 + ext + (masked ? 4 : 0);
  *length = value;
  return true;
}

}  // namespace

WebSocketClient::WebSocketClient()
    : fd_(-1),
      tls_ctx_(nullptr),
      tls_(nullptr),
      listening_(false),
      open_(false),
      reading_(false),
      reconnect_scheduled_(false),
      allow_reconnect_(true),
      generation_(0),
      network_thread_(nullptr) {
  OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

WebSocketClient::~WebSocketClient() {
  allow_reconnect_ = false;
  disconnect();
}

bool WebSocketClient::connect(const Config& config) {
  config_ = config;
  APP_LOG(AS_INFO) << "WebSocket connect " << (config_.use_ssl ? "wss://" : "ws://")
                   << config_.host << ":" << config_.port << config_.path;

  std::lock_guard<std::mutex> lock(io_mutex_);
  bool ok = open_tcp() && (!config_.use_ssl || start_tls()) && upgrade();
  if (ok) {
    int flags = fcntl(fd_, F_GETFL, 0);
    ok = flags >= 0 && fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == 0;
    if (!ok)
      APP_LOG(AS_ERROR) << "fcntl(O_NONBLOCK): " << strerror(errno);
  }
  if (!ok) {
    close_socket();
    return false;
  }
  open_ = true;
  return true;
}

void WebSocketClient::disconnect() {
  if (open_.exchange(false)) {
    // Best effort, the relay may already be gone.
    write_frame(kClose, std::string(), "close");
  }
  stop_listening();
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    message_callback_ = nullptr;
  }
  std::lock_guard<std::mutex> lock(io_mutex_);
  close_socket();
}

bool WebSocketClient::send_message(const std::string& message) {
  if (!open_.load()) {
    APP_LOG(AS_WARNING) << "WebSocket send while closed, dropped";
    return false;
  }
  APP_LOG(AS_VERBOSE) << "ws> " << message.substr(0, 100)
                      << (message.size() > 100 ? "..." : "");
  return write_frame(kText, message, "text");
}

void WebSocketClient::set_message_callback(MessageCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void WebSocketClient::set_reconnect_callback(ReconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  reconnect_callback_ = std::move(callback);
}

void WebSocketClient::start_listening() {
  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (!network_thread_) {
    APP_LOG(AS_ERROR) << "WebSocket listener needs a network thread";
    return;
  }
  if (listening_.exchange(true))
    return;

  const int generation = ++generation_;
  APP_LOG(AS_INFO) << "WebSocket listening (generation " << generation << ")";
  schedule_read(generation, 0);
  schedule_ping(generation);
}

void WebSocketClient::stop_listening() {
  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (!listening_.exchange(false))
    return;
  ++generation_;
  APP_LOG(AS_INFO) << "WebSocket listener stopped";

  // Wait out a read in flight on the network thread before the caller
  // frees the socket.
  if (network_thread_ && !network_thread_->IsCurrent()) {
    while (reading_.load())
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

std::string WebSocketClient::generate_websocket_key() {
  unsigned char nonce[kKeyBytes];
  FillRandom(nonce, sizeof(nonce));
  return base64_encode(std::string(reinterpret_cast<const char*>(nonce), sizeof(nonce)));
}

std::string WebSocketClient::base64_encode(const std::string& in) {
  if (in.empty())
    return std::string();
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                      reinterpret_cast<const unsigned char*>(in.data()),
                                      static_cast<int>(in.size()));
  out.resize(written > 0 ? written : 0);
  return out;
}

std::vector<unsigned char> WebSocketClient::build_frame(unsigned char opcode,
                                                        const std::string& payload,
                                                        bool mask) {
  const uint64_t size = payload.size();
  std::vector<unsigned char> frame;
  frame.reserve(14 + payload.size());
  frame.push_back(0x80 | (opcode & 0x0F));

  const unsigned char mask_flag = mask ? 0x80 : 0;
  if (size < 126) {
    frame.push_back(mask_flag | static_cast<unsigned char>(size));
  } else {
    const int bytes = size <= 0xFFFF ? 2 : 8;
    frame.push_back(mask_flag | (bytes == 2 ? 126 : 127));
    for (int i = bytes - 1; i >= 0; --i)
      frame.push_back(static_cast<unsigned char>(size >> (8 * i)));
  }

  unsigned char key[4] = {0, 0, 0, 0};
  if (mask) {
    FillRandom(key, sizeof(key));
    frame.insert(frame.end(), key, key + 4);
  }
  for (size_t i = 0; i < payload.size(); ++i)
    frame.push_back(static_cast<unsigned char>(payload[i]) ^ key[i & 3]);
  return frame;
}

void WebSocketClient::parse_frames(std::string& buffer,
                                   std::vector<std::string>& messages,
                                   std::vector<std::string>& pings) {
  std::string fragments;
  bool in_fragment = false;
  size_t committed = 0;
  size_t at = 0;

  size_t header = 0;
  uint64_t length = 0;
  while (ReadFrameHeader(buffer, at, &header, &length) &&
         buffer.size() - at >= header + length) {
    const unsigned char head = static_cast<unsigned char>(buffer[at]);
    const bool fin = (head & 0x80) != 0;
    const unsigned char opcode = head & 0x0F;
    const bool masked = (static_cast<unsigned char>(buffer[at + 1]) & 0x80) != 0;

    std::string payload = buffer.substr(at + header, length);
    if (masked) {
      const size_t key_at = at + header - 4;
      for (size_t i = 0; i < payload.size(); ++i)
        payload[i] ^= buffer[key_at + (i & 3)];
    }
    at += header + length;

    switch (opcode) {
      case kText:
        if (fin) {
          messages.push_back(std::move(payload));
        } else {
          fragments = std::move(payload);
          in_fragment = true;
        }
        break;
      case kContinuation:
        if (!in_fragment) {
          APP_LOG(AS_WARNING) << "WebSocket continuation without a first frame";
          break;
        }
        fragments += payload;
        if (fin) {
          messages.push_back(std::move(fragments));
          fragments.clear();
          in_fragment = false;
        }
        break;
      case kPing:
        pings.push_back(std::move(payload));
        break;
      case kClose:
        APP_LOG(AS_INFO) << "WebSocket close frame from relay";
        messages.push_back(Msg::kDisconnected);
        break;
      case kPong:
        break;
      default:
        APP_LOG(AS_WARNING) << "WebSocket opcode " << static_cast<int>(opcode) << " ignored";
        break;
    }

    // Keep the bytes of an unfinished fragmented message for the next pass.
    if (!in_fragment)
      committed = at;
  }

  buffer.erase(0, committed);
}

bool WebSocketClient::open_tcp() {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* found = nullptr;
  const int rc = getaddrinfo(config_.host.c_str(), config_.port.c_str(), &hints, &found);
  if (rc != 0) {
    APP_LOG(AS_ERROR) << "Resolve " << config_.host << ": " << gai_strerror(rc);
    return false;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(found);

  for (addrinfo* ai = addresses.get(); ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0)
      continue;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      APP_LOG(AS_INFO) << "TCP up to " << config_.host << ":" << config_.port;
      return true;
    }
    ::close(fd);
  }
  APP_LOG(AS_ERROR) << "TCP connect to " << config_.host << ":" << config_.port
                    << " failed: " << strerror(errno);
  return false;
}

bool WebSocketClient::start_tls() {
  tls_ctx_ = SSL_CTX_new(TLS_client_method());
  if (!tls_ctx_) {
    LogTlsFailure("SSL_CTX_new");
    return false;
  }
  // Relays commonly run with self-signed certificates.
  SSL_CTX_set_verify(tls_ctx_, SSL_VERIFY_NONE, nullptr);
  SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);

  tls_ = SSL_new(tls_ctx_);
  if (!tls_ || SSL_set_fd(tls_, fd_) != 1) {
    LogTlsFailure("SSL_new");
    return false;
  }
  if (SSL_set_tlsext_host_name(tls_, config_.host.c_str()) != 1)
    LogTlsFailure("SNI");

  const int rc = SSL_connect(tls_);
  if (rc <= 0) {
    APP_LOG(AS_ERROR) << "TLS handshake error " << SSL_get_error(tls_, rc);
    LogTlsFailure("SSL_connect");
    return false;
  }
  // The socket turns non-blocking once the upgrade is done.
  SSL_set_mode(tls_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
  APP_LOG(AS_INFO) << "TLS up, " << SSL_get_version(tls_) << " " << SSL_get_cipher(tls_);
  return true;
}

bool WebSocketClient::upgrade() {
  std::string request = "GET " + (config_.path.empty() ? std::string("/") : config_.path) +
                        " HTTP/1.1\r\n";
  request += "Host: " + config_.host + ":" + config_.port + "\r\n";
  request += "Upgrade: websocket\r\n";
  request += "Connection: Upgrade\r\n";
  request += "Sec-WebSocket-Key: " + generate_websocket_key() + "\r\n";
  request += "Sec-WebSocket-Version: 13\r\n";
  request += "User-Agent: voicemesh/1.0\r\n\r\n";

  if (io_write(reinterpret_cast<const unsigned char*>(request.data()),
               static_cast<int>(request.size())) != static_cast<int>(request.size())) {
    APP_LOG(AS_ERROR) << "WebSocket upgrade request not sent";
    return false;
  }

  std::string response;
  if (!read_upgrade_response(response))
    return false;

  const size_t head_end = response.find("\r\n\r\n");
  const std::string status_line = response.substr(0, response.find("\r\n"));
  if (status_line.find(" 101") == std::string::npos) {
    APP_LOG(AS_ERROR) << "WebSocket upgrade refused: " << status_line;
    return false;
  }

  // Frames may arrive in the same read as the 101 response.
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_ = response.substr(head_end + 4);
  }
  APP_LOG(AS_INFO) << "WebSocket upgraded";
  return true;
}

bool WebSocketClient::read_upgrade_response(std::string& response) {
  timeval tv;
  tv.tv_sec = config_.timeout_ms / 1000;
  tv.tv_usec = (config_.timeout_ms % 1000) * 1000;
  if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
    APP_LOG(AS_WARNING) << "SO_RCVTIMEO: " << strerror(errno);

  char chunk[2048];
  while (response.find("\r\n\r\n") == std::string::npos) {
    const int got = io_read(chunk, sizeof(chunk));
    if (got <= 0) {
      APP_LOG(AS_ERROR) << "WebSocket upgrade response timed out or failed";
      return false;
    }
    response.append(chunk, got);
  }
  return true;
}

int WebSocketClient::io_write(const unsigned char* data, int size) {
  if (tls_) {
    const int n = SSL_write(tls_, data, size);
    if (n > 0)
      return n;
    const int err = SSL_get_error(tls_, n);
    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
      return 0;
    LogTlsFailure("SSL_write");
    return -1;
  }
  const ssize_t n = ::send(fd_, data, size, MSG_NOSIGNAL);
  if (n >= 0)
    return static_cast<int>(n);
  if (errno == EAGAIN || errno == EWOULDBLOCK)
    return 0;
  APP_LOG(AS_ERROR) << "send: " << strerror(errno);
  return -1;
}

int WebSocketClient::io_read(char* data, int size) {
  if (tls_) {
    const int n = SSL_read(tls_, data, size);
    if (n > 0)
      return n;
    const int err = SSL_get_error(tls_, n);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
      return 0;
    if (err != SSL_ERROR_ZERO_RETURN)
      LogTlsFailure("SSL_read");
    return -1;
  }
  const ssize_t n = ::recv(fd_, data, size, 0);
  if (n > 0)
    return static_cast<int>(n);
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
    return 0;
  APP_LOG(AS_ERROR) << "recv: " << (n == 0 ? "closed by relay" : strerror(errno));
  return -1;
}

bool WebSocketClient::write_frame(unsigned char opcode, const std::string& payload,
                                  const char* what) {
  const std::vector<unsigned char> frame = build_frame(opcode, payload, true);

  std::lock_guard<std::mutex> lock(io_mutex_);
  if (fd_ < 0) {
    APP_LOG(AS_WARNING) << "WebSocket " << what << " frame dropped, socket closed";
    return false;
  }

  size_t sent = 0;
  int stalls = 0;
  while (sent < frame.size()) {
    const int n = io_write(frame.data() + sent, static_cast<int>(frame.size() - sent));
    if (n < 0)
      return false;
    if (n == 0) {
      if (++stalls > kMaxWriteStalls) {
        APP_LOG(AS_ERROR) << "WebSocket " << what << " frame dropped, socket stalled";
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

void WebSocketClient::schedule_ping(int generation) {
  network_thread_->PostDelayedTask(
      [this, generation]() {
        if (generation != generation_.load())
          return;
        if (open_.load())
          write_frame(kPing, std::string(), "ping");
        schedule_ping(generation);
      },
      webrtc::TimeDelta::Millis(config_.ping_interval_ms));
}

void WebSocketClient::schedule_read(int generation, int delay_ms) {
  network_thread_->PostDelayedTask([this, generation]() { read_once(generation); },
                                   webrtc::TimeDelta::Millis(delay_ms));
}

void WebSocketClient::deliver(const std::string& message) {
  MessageCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = message_callback_;
  }
  if (callback && !message.empty())
    callback(message);
}

void WebSocketClient::read_once(int generation) {
  if (generation != generation_.load() || reading_.exchange(true))
    return;

  bool lost = false;
  bool any = false;
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    char chunk[8192];
    for (;;) {
      const int n = fd_ < 0 ? -1 : io_read(chunk, sizeof(chunk));
      if (n == 0)
        break;
      if (n < 0) {
        lost = true;
        break;
      }
      std::lock_guard<std::mutex> inbox_lock(inbox_mutex_);
      inbox_.append(chunk, n);
      any = true;
    }
  }

  std::vector<std::string> messages;
  std::vector<std::string> pings;
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    parse_frames(inbox_, messages, pings);
  }
  for (const std::string& ping : pings)
    write_frame(kPong, ping, "pong");

  for (const std::string& message : messages) {
    if (message == Msg::kDisconnected) {
      lost = true;
      break;
    }
    deliver(message);
  }
  reading_ = false;

  if (lost) {
    on_lost();
    return;
  }
  schedule_read(generation, any ? kBusyReadDelayMs : kIdleReadDelayMs);
}

void WebSocketClient::on_lost() {
  listening_ = false;
  ++generation_;
  if (open_.exchange(false))
    deliver(Msg::kDisconnected);
  schedule_reconnect();
}

void WebSocketClient::schedule_reconnect() {
  if (!allow_reconnect_.load() || reconnect_scheduled_.exchange(true))
    return;
  APP_LOG(AS_INFO) << "WebSocket reconnect in " << config_.reconnect_interval_ms << "ms";
  network_thread_->PostDelayedTask([this]() { reconnect(); },
                                   webrtc::TimeDelta::Millis(config_.reconnect_interval_ms));
}

void WebSocketClient::reconnect() {
  reconnect_scheduled_ = false;
  if (!allow_reconnect_.load())
    return;
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    close_socket();
  }

  if (!connect(config_)) {
    schedule_reconnect();
    return;
  }
  APP_LOG(AS_INFO) << "WebSocket reconnected";
  start_listening();

  ReconnectCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = reconnect_callback_;
  }
  if (callback)
    callback();
}

// Callers hold io_mutex_.
void WebSocketClient::close_socket() {
  if (tls_) {
    SSL_free(tls_);
    tls_ = nullptr;
  }
  if (tls_ctx_) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}
