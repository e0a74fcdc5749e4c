#include "instance-coordinator.h"
#include "process-spawn.h"
#include <iostream>
#include <thread>
#include <filesystem>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

const char* role_name(Role role) {
    return role == Role::Primary ? "primary" : "secondary";
}

std::string default_socket_path() {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && *runtime_dir) {
        return std::string(runtime_dir) + "/click-to-call.sock";
    }
    const char* tmp_dir = std::getenv("TMPDIR");
    if (tmp_dir && *tmp_dir) {
        return std::string(tmp_dir) + "/click-to-call.sock";
    }
    return "/tmp/click-to-call.sock";
}

std::string make_ping_message() {
    return "ping-" + std::to_string(static_cast<long long>(std::time(nullptr)));
}

InstanceCoordinator::InstanceCoordinator(const std::string& socket_path)
    : socket_path_(socket_path) {}

int InstanceCoordinator::connect_socket() {
    struct sockaddr_un addr{};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        std::cout << "⚠️ Socket path too long: " << socket_path_ << std::endl;
        return -1;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

bool InstanceCoordinator::write_all(int fd, const std::string& payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

Role InstanceCoordinator::determine_role() {
    struct stat st;
    if (lstat(socket_path_.c_str(), &st) != 0) {
        std::cout << "🔎 No socket at " << socket_path_ << ", becoming primary" << std::endl;
        return Role::Primary;
    }

    int fd = connect_socket();
    if (fd >= 0) {
        bool alive = write_all(fd, make_ping_message());
        close(fd);
        if (alive) {
            std::cout << "🔎 Primary instance is alive at " << socket_path_ << std::endl;
            return Role::Secondary;
        }
    }

    // Nobody listening: stale socket left by a crashed primary
    if (unlink(socket_path_.c_str()) == 0) {
        std::cout << "🧹 Removed stale socket " << socket_path_ << std::endl;
    } else if (errno != ENOENT) {
        std::cout << "⚠️ Could not remove stale socket " << socket_path_ << ": " << strerror(errno) << std::endl;
    }
    return Role::Primary;
}

bool InstanceCoordinator::forward_uri(const std::string& uri) {
    int fd = connect_socket();
    if (fd < 0) {
        std::cout << "📮 Primary not reachable at " << socket_path_ << std::endl;
        return false;
    }
    bool ok = write_all(fd, uri);
    close(fd);
    if (ok) {
        std::cout << "📮 Forwarded " << uri << " to primary instance" << std::endl;
    } else {
        std::cout << "📮 Write to primary failed: " << strerror(errno) << std::endl;
    }
    return ok;
}

ForwardResult InstanceCoordinator::forward_or_spawn(const std::string& uri, const Spawner& spawner,
                                                    std::chrono::milliseconds wait) {
    if (forward_uri(uri)) {
        return ForwardResult::Forwarded;
    }

    if (!spawner || !spawner()) {
        std::cout << "⚠️ Could not start a background instance, handling " << uri << " locally" << std::endl;
        return ForwardResult::Failed;
    }

    std::cout << "⏳ Waiting " << wait.count() << "ms for background instance" << std::endl;
    std::this_thread::sleep_for(wait);

    if (forward_uri(uri)) {
        return ForwardResult::ForwardedAfterSpawn;
    }

    // The spawned instance may still come up later; both then run side by side
    std::cout << "⚠️ Background instance did not come up in time, handling " << uri << " locally" << std::endl;
    return ForwardResult::Failed;
}

bool InstanceCoordinator::spawn_background_instance(const std::vector<std::string>& extra_args) {
    std::error_code ec;
    std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        std::cout << "❌ Cannot locate own executable: " << ec.message() << std::endl;
        return false;
    }

    std::vector<std::string> args;
    args.push_back("--background");
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    pid_t pid;
    if (!spawn_process(exe.string(), args, pid, /*search_path=*/false)) {
        return false;
    }
    // The child keeps running after we exit; reap it only if we outlive it
    reap_in_background(pid);
    std::cout << "🚀 Started background instance (PID " << pid << ")" << std::endl;
    return true;
}
