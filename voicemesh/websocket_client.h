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

#pragma once

#include <openssl/ssl.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "rtc_base/thread.h"

// Minimal RFC 6455 client over a raw TCP (optionally TLS) socket. All socket
// reads, pings and reconnects run on the network thread set with
// set_network_thread().
class WebSocketClient {
public:
    struct Config {
        std::string host;
        std::string port;
        std::string path = "/";
        bool use_ssl = false;
        int timeout_ms = 10000;
        int ping_interval_ms = 10000;
        int reconnect_interval_ms = 2000;
    };

    using MessageCallback = std::function<void(const std::string&)>;
    using ReconnectCallback = std::function<void()>;

    WebSocketClient();
    ~WebSocketClient();

    // TCP connect, TLS and the HTTP upgrade. Blocks up to timeout_ms.
    bool connect(const Config& config);
    void disconnect();

    bool send_message(const std::string& message);

    // Text frames, and "DISCONNECTED" when the socket drops.
    void set_message_callback(MessageCallback callback);
    // Runs on the network thread after a successful automatic reconnect.
    void set_reconnect_callback(ReconnectCallback callback);
    void set_allow_reconnect(bool allow) { allow_reconnect_ = allow; }

    void start_listening();
    void stop_listening();

    void set_network_thread(rtc::Thread* thread) { network_thread_ = thread; }

    static std::string generate_websocket_key();
    static std::string base64_encode(const std::string& in);

    // Frames |payload| as a single FIN frame of |opcode|, masked when |mask|
    // is set.
    static std::vector<unsigned char> build_frame(unsigned char opcode,
                                                  const std::string& payload,
                                                  bool mask);

    // Pulls complete frames out of |buffer|. Text payloads land in
    // |messages|, ping payloads in |pings|, a close frame yields
    // "DISCONNECTED". Consumed bytes are erased from |buffer|.
    static void parse_frames(std::string& buffer,
                             std::vector<std::string>& messages,
                             std::vector<std::string>& pings);

private:
    // Socket state, guarded by io_mutex_.
    int fd_;
    SSL_CTX* tls_ctx_;
    SSL* tls_;

    std::atomic<bool> listening_;
    std::atomic<bool> open_;
    std::atomic<bool> reading_;
    std::atomic<bool> reconnect_scheduled_;
    std::atomic<bool> allow_reconnect_;
    // Bumped on every start/stop; read and ping chains of an older
    // generation stop on their next turn.
    std::atomic<int> generation_;

    Config config_;
    rtc::Thread* network_thread_;

    std::string inbox_;
    std::mutex inbox_mutex_;
    std::mutex callback_mutex_;
    MessageCallback message_callback_;
    ReconnectCallback reconnect_callback_;

    std::mutex io_mutex_;
    std::mutex listen_mutex_;

    bool open_tcp();
    bool start_tls();
    bool upgrade();
    bool read_upgrade_response(std::string& response);

    // Raw byte I/O over TCP or TLS. Return bytes moved, 0 on would-block and
    // -1 on failure.
    int io_write(const unsigned char* data, int size);
    int io_read(char* data, int size);

    bool write_frame(unsigned char opcode, const std::string& payload, const char* what);
    void schedule_ping(int generation);
    void schedule_read(int generation, int delay_ms);

    void read_once(int generation);
    void on_lost();
    void schedule_reconnect();
    void reconnect();
    void deliver(const std::string& message);

    void close_socket();
};
