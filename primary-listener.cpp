#include "primary-listener.h"
#include "phone-number.h"
#include "settings.h"
#include <iostream>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <poll.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

static const size_t kMaxPayloadBytes = 1024;

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;

        if (i + extra >= bytes.size()) return false;

        // Second-byte ranges that exclude overlong forms, surrogates and code points above U+10FFFF
        if (extra > 0) {
            unsigned char second = static_cast<unsigned char>(bytes[i + 1]);
            unsigned char low = 0x80, high = 0xBF;
            if (c == 0xE0) low = 0xA0;
            else if (c == 0xED) high = 0x9F;
            else if (c == 0xF0) low = 0x90;
            else if (c == 0xF4) high = 0x8F;
            if (second < low || second > high) return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

PrimaryListener::PrimaryListener(const std::string& socket_path,
                                 SettingsSnapshot& settings,
                                 std::shared_ptr<CallDispatcher> dispatcher)
    : socket_path_(socket_path),
      settings_(settings),
      dispatcher_(std::move(dispatcher)),
      server_socket_(-1),
      wake_pipe_{-1, -1},
      running_(false),
      handled_uris_(0) {}

PrimaryListener::~PrimaryListener() {
    stop();
}

bool PrimaryListener::start() {
    if (running_.load()) return true;

    struct sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        std::cout << "❌ Socket path too long: " << socket_path_ << std::endl;
        return false;
    }

    server_socket_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        std::cout << "❌ Failed to create listener socket: " << strerror(errno) << std::endl;
        return false;
    }

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    // No unlink here: an existing socket belongs to whoever won the race
    if (bind(server_socket_, (struct sockaddr*)&addr, sizeof(addr)) != 0) {
        std::cout << "⚠️ Could not bind " << socket_path_ << ": " << strerror(errno)
                  << " (another instance owns it)" << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 8) != 0) {
        std::cout << "❌ Failed to listen on " << socket_path_ << ": " << strerror(errno) << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        ::unlink(socket_path_.c_str());
        return false;
    }

    if (pipe(wake_pipe_) != 0) {
        std::cout << "❌ Failed to create wake pipe: " << strerror(errno) << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        ::unlink(socket_path_.c_str());
        return false;
    }

    running_.store(true);
    listener_thread_ = std::thread(&PrimaryListener::listener_loop, this);

    std::cout << "📮 Listening for forwarded URIs at " << socket_path_ << std::endl;
    return true;
}

void PrimaryListener::stop() {
    if (!listener_thread_.joinable()) return;

    running_.store(false);
    char wake = 'x';
    if (write(wake_pipe_[1], &wake, 1) < 0) {
        std::cout << "⚠️ Failed to wake listener: " << strerror(errno) << std::endl;
    }
    listener_thread_.join();

    close(wake_pipe_[0]);
    close(wake_pipe_[1]);
    wake_pipe_[0] = wake_pipe_[1] = -1;

    if (server_socket_ >= 0) {
        close(server_socket_);
        server_socket_ = -1;
        ::unlink(socket_path_.c_str());
    }
    std::cout << "📮 Listener stopped" << std::endl;
}

void PrimaryListener::listener_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_socket_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cout << "❌ Listener poll failed: " << strerror(errno) << std::endl;
            break;
        }
        if (fds[1].revents != 0) break;
        if ((fds[0].revents & POLLIN) == 0) continue;

        int client_socket = accept(server_socket_, nullptr, nullptr);
        if (client_socket < 0) {
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            std::cout << "❌ Listener accept failed, stopping: " << strerror(errno) << std::endl;
            break;
        }

        handle_connection(client_socket);
        close(client_socket);
    }
    running_.store(false);
}

void PrimaryListener::handle_connection(int client_socket) {
    // A peer that connects and never writes must not stall the loop
    struct timeval timeout;
    timeout.tv_sec = 1;
    timeout.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string payload;
    char buffer[kMaxPayloadBytes];
    while (payload.size() < kMaxPayloadBytes) {
        ssize_t n = recv(client_socket, buffer, kMaxPayloadBytes - payload.size(), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (payload.empty()) {
                std::cout << "⚠️ Failed to read forwarded payload: " << strerror(errno) << std::endl;
                return;
            }
            break;
        }
        if (n == 0) break;
        payload.append(buffer, static_cast<size_t>(n));
    }

    if (payload.empty()) return;
    if (!is_valid_utf8(payload)) {
        std::cout << "⚠️ Dropping forwarded payload that is not UTF-8" << std::endl;
        return;
    }
    handle_payload(payload);
}

void PrimaryListener::handle_payload(const std::string& payload) {
    if (!is_tel_uri(payload)) {
        // Liveness probe or unknown message
        return;
    }

    std::string number = normalize_tel_uri(payload);
    std::cout << "📮 Received " << payload << " (number " << number << ")" << std::endl;
    if (number.empty()) {
        std::cout << "⚠️ Forwarded URI carries no number, ignoring" << std::endl;
        return;
    }
    handled_uris_.fetch_add(1);

    std::shared_ptr<const Settings> settings = settings_.get();
    if (settings->is_configured()) {
        std::cout << "📞 Calling " << number << " without showing the form" << std::endl;
        CallRequest request = CallRequest::from(*settings, number);
        // Posted ahead of the completion so the status never runs backwards
        if (on_call_start_) on_call_start_(request);
        dispatcher_->dispatch_async(request, on_call_complete_);
    } else if (on_needs_configuration_) {
        on_needs_configuration_(payload);
    } else {
        std::cout << "⚠️ Settings incomplete and no form available for " << payload << std::endl;
    }
}
