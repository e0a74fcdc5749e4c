#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>

// Single-instance coordination over a per-user Unix-domain socket.
//
// The process that holds the listener on the socket is the primary.
// Any later invocation connects, writes its "tel:" URI and exits; the
// primary never answers, so a successful write is the acknowledgement.

enum class Role { Primary, Secondary };

const char* role_name(Role role);

enum class ForwardResult {
    Forwarded,              // first write to the primary succeeded
    ForwardedAfterSpawn,    // primary was started by us and accepted the retry
    Failed                  // caller continues as its own primary
};

// $XDG_RUNTIME_DIR/click-to-call.sock, falling back to $TMPDIR then /tmp
std::string default_socket_path();

// Payload of the liveness probe; never starts with "tel:"
std::string make_ping_message();

class InstanceCoordinator {
public:
    // Starts a new background primary; returns false if it could not be launched
    using Spawner = std::function<bool()>;

    explicit InstanceCoordinator(const std::string& socket_path);

    // Secondary iff something accepts a connection and a probe write on the
    // socket. A socket file nobody listens on is stale and removed.
    Role determine_role();

    // Connects and writes the raw URI; true iff the whole payload was written
    bool forward_uri(const std::string& uri);

    // forward_uri, and on failure spawn a primary, wait, and retry once
    ForwardResult forward_or_spawn(const std::string& uri, const Spawner& spawner,
                                   std::chrono::milliseconds wait = std::chrono::milliseconds(1000));

    const std::string& socket_path() const { return socket_path_; }

    // Re-executes this binary with --background plus the given arguments
    static bool spawn_background_instance(const std::vector<std::string>& extra_args);

private:
    std::string socket_path_;

    int connect_socket();
    static bool write_all(int fd, const std::string& payload);
};
