#include "process-spawn.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect_true(const std::string& label, bool condition) {
    if (condition) {
        std::cout << "✅ " << label << "\n";
    } else {
        std::cout << "❌ " << label << "\n";
        g_failures++;
    }
}

// Stand-in primary on a Unix socket; keeps every payload it reads
class FakePrimary {
public:
    explicit FakePrimary(const std::string& path) : path_(path) {
        fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
        bind(fd_, (struct sockaddr*)&addr, sizeof(addr));
        listen(fd_, 8);
        running_ = true;
        thread_ = std::thread([this]() { loop(); });
    }

    ~FakePrimary() {
        running_ = false;
        shutdown(fd_, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        close(fd_);
        unlink(path_.c_str());
    }

    std::vector<std::string> payloads() {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_;
    }

private:
    std::string path_;
    int fd_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> payloads_;

    void loop() {
        while (running_) {
            int client = accept(fd_, nullptr, nullptr);
            if (client < 0) break;
            std::string payload;
            char buffer[256];
            ssize_t n;
            while ((n = recv(client, buffer, sizeof(buffer), 0)) > 0) {
                payload.append(buffer, static_cast<size_t>(n));
            }
            close(client);
            std::lock_guard<std::mutex> lock(mutex_);
            payloads_.push_back(payload);
        }
    }
};

// Non-blocking TCP listener standing in for the PBX; counts connection attempts
class IdlePbx {
public:
    IdlePbx() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, (struct sockaddr*)&addr, sizeof(addr));
        listen(fd_, 4);
        fcntl(fd_, F_SETFL, fcntl(fd_, F_GETFL, 0) | O_NONBLOCK);
        socklen_t len = sizeof(addr);
        getsockname(fd_, (struct sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);
    }
    ~IdlePbx() { close(fd_); }

    int port() const { return port_; }

    bool was_contacted() {
        int client = accept(fd_, nullptr, nullptr);
        if (client < 0) return false;
        close(client);
        return true;
    }

private:
    int fd_;
    int port_ = 0;
};

static int unused_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, (struct sockaddr*)&addr, sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, (struct sockaddr*)&addr, &len);
    int port = ntohs(addr.sin_port);
    close(fd);
    return port;
}

static bool port_is_free(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    bool available = bind(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0;
    close(fd);
    return available;
}

static std::string make_temp_dir() {
    std::string templ = (fs::temp_directory_path() / "ctc-second-XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        std::cerr << "❌ mkdtemp failed\n";
        std::exit(1);
    }
    return std::string(buf.data());
}

// Runs the binary to completion; -1 if it had to be killed or did not exit normally
static int run_binary(const std::string& binary, const std::vector<std::string>& args) {
    pid_t pid;
    if (!spawn_process(binary, args, pid, /*search_path=*/false)) return -1;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) return -1;
        if (std::chrono::steady_clock::now() > deadline) {
            std::cout << "⚠️ " << binary << " did not exit, killing it\n";
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static std::vector<std::string> with_prefix(const std::vector<std::string>& payloads, const std::string& prefix) {
    std::vector<std::string> matching;
    for (const auto& p : payloads) {
        if (p.rfind(prefix, 0) == 0) matching.push_back(p);
    }
    return matching;
}

// The fake primary records payloads on its accept thread; give it time to catch up
static std::vector<std::string> settle(FakePrimary& primary, size_t expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    std::vector<std::string> payloads = primary.payloads();
    while (payloads.size() < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        payloads = primary.payloads();
    }
    return payloads;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " PATH_TO_CLICK_TO_CALL\n";
        return 1;
    }
    const std::string binary = argv[1];
    std::cout << "=== Secondary instance hand-off ===\n";

    std::string dir = make_temp_dir();
    std::string socket_path = dir + "/click-to-call.sock";
    std::string config_path = dir + "/preferences.json";
    std::string db_path = dir + "/history.db";
    int form_port = unused_port();

    // Configured settings pointing at a PBX that must never be contacted
    IdlePbx pbx;
    {
        std::ofstream out(config_path);
        out << R"({"domain": "http://127.0.0.1:)" << pbx.port()
            << R"(", "extension": "100", "key": "abc", "auto_answer": false})";
    }

    std::vector<std::string> common = {
        "--socket", socket_path, "--config", config_path, "--db", db_path,
        "--port", std::to_string(form_port), "--no-notify"
    };

    {
        std::cout << "\n--- forward a tel: URI ---\n";
        FakePrimary primary(socket_path);
        std::vector<std::string> args = common;
        args.push_back("tel:5551234567");

        int exit_code = run_binary(binary, args);
        expect_true("secondary exits with 0", exit_code == 0);

        std::vector<std::string> payloads = settle(primary, 2);
        std::vector<std::string> calls = with_prefix(payloads, "tel:");
        expect_true("exactly one URI forwarded", calls.size() == 1);
        expect_true("payload is the raw argument", !calls.empty() && calls[0] == "tel:5551234567");
        expect_true("liveness probe sent first", !payloads.empty() && payloads[0].rfind("ping-", 0) == 0);
        expect_true("no call placed by the secondary", !pbx.was_contacted());
        expect_true("form port never held", port_is_free(form_port));
        expect_true("call history never opened", !fs::exists(db_path));
        expect_true("socket still belongs to the primary", fs::exists(socket_path));
    }

    {
        std::cout << "\n--- second launch without a URI ---\n";
        FakePrimary primary(socket_path);
        int exit_code = run_binary(binary, common);
        expect_true("secondary without URI exits with 0", exit_code == 0);

        std::vector<std::string> payloads = settle(primary, 1);
        expect_true("only the liveness probe was written",
                    payloads.size() == 1 && with_prefix(payloads, "tel:").empty());
        expect_true("call history never opened", !fs::exists(db_path));
    }

    std::cout << "\n--- command line ---\n";
    expect_true("--help exits with 0", run_binary(binary, {"--help"}) == 0);
    expect_true("unknown flag exits with 1", run_binary(binary, {"--bogus"}) == 1);
    expect_true("invalid port exits with 1", run_binary(binary, {"--port", "70000"}) == 1);
    expect_true("invalid forward policy exits with 1", run_binary(binary, {"--on-forward", "sometimes"}) == 1);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures > 0) {
        std::cout << "\n❌ " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "\n✅ All secondary hand-off checks passed\n";
    return 0;
}
