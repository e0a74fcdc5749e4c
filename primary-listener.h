#pragma once

#include "call-dispatcher.h"
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <functional>
#include <utility>

class SettingsSnapshot;

// Accept loop owned by the primary instance. Each connection carries one
// UTF-8 payload; "tel:" payloads are calls, anything else (liveness probes)
// is dropped. Nothing is ever written back to the peer.
class PrimaryListener {
public:
    using UriHandler = std::function<void(const std::string& uri)>;
    using CallStartHandler = std::function<void(const CallRequest& request)>;

    PrimaryListener(const std::string& socket_path,
                    SettingsSnapshot& settings,
                    std::shared_ptr<CallDispatcher> dispatcher);
    ~PrimaryListener();

    // Receives URIs that need interactive configuration
    void set_configuration_handler(UriHandler handler) { on_needs_configuration_ = std::move(handler); }
    // Told about each silent call before its request goes out
    void set_call_start_handler(CallStartHandler handler) { on_call_start_ = std::move(handler); }
    // Receives outcomes of calls dispatched silently from the listener
    void set_completion_handler(CallDispatcher::Completion handler) { on_call_complete_ = std::move(handler); }

    // Binds and starts the loop. false if the socket could not be bound,
    // which only means this process will not receive forwarded URIs.
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Number of payloads routed as calls, for diagnostics
    int handled_uris() const { return handled_uris_.load(); }

    // Routing step, exposed for the accept loop and tests
    void handle_payload(const std::string& payload);

private:
    std::string socket_path_;
    SettingsSnapshot& settings_;
    std::shared_ptr<CallDispatcher> dispatcher_;
    UriHandler on_needs_configuration_;
    CallStartHandler on_call_start_;
    CallDispatcher::Completion on_call_complete_;

    int server_socket_;
    int wake_pipe_[2];
    std::atomic<bool> running_;
    std::atomic<int> handled_uris_;
    std::thread listener_thread_;

    void listener_loop();
    void handle_connection(int client_socket);
};

// True if the bytes form valid UTF-8
bool is_valid_utf8(const std::string& bytes);
