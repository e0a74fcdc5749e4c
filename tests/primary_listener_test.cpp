#include "primary-listener.h"
#include "instance-coordinator.h"
#include "http-client.h"
#include "platform-notifier.h"
#include "settings.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
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

class CountingTransport : public HttpTransport {
public:
    HttpResult get(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
        HttpResult result;
        result.ok = true;
        result.status_code = 200;
        return result;
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.size();
    }

private:
    std::mutex mutex_;
    std::vector<std::string> urls_;
};

// Collects everything the listener hands back to the owning context
struct Sink {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> config_uris;
    std::vector<std::string> started_numbers;
    std::vector<std::string> completed_numbers;
    // Order of start and completion events, "start:<n>" / "done:<n>"
    std::vector<std::string> events;

    bool wait_for(size_t configs, size_t completions) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [&]() {
            return config_uris.size() >= configs && completed_numbers.size() >= completions;
        });
    }
};

static std::string make_temp_dir() {
    std::string templ = (fs::temp_directory_path() / "ctc-listen-XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        std::cerr << "❌ mkdtemp failed\n";
        std::exit(1);
    }
    return std::string(buf.data());
}

static Settings configured_settings() {
    Settings s;
    s.domain = "pbx.example.com";
    s.extension = "100";
    s.key = "abc";
    return s;
}

static void wire(PrimaryListener& listener, const std::shared_ptr<Sink>& sink) {
    listener.set_configuration_handler([sink](const std::string& uri) {
        std::lock_guard<std::mutex> lock(sink->mutex);
        sink->config_uris.push_back(uri);
        sink->cv.notify_all();
    });
    listener.set_call_start_handler([sink](const CallRequest& request) {
        std::lock_guard<std::mutex> lock(sink->mutex);
        sink->started_numbers.push_back(request.phone_number);
        sink->events.push_back("start:" + request.phone_number);
    });
    listener.set_completion_handler([sink](const CallRequest& request, const CallOutcome&) {
        std::lock_guard<std::mutex> lock(sink->mutex);
        sink->completed_numbers.push_back(request.phone_number);
        sink->events.push_back("done:" + request.phone_number);
        sink->cv.notify_all();
    });
}

static void test_routing(const std::string& dir) {
    std::cout << "\n--- payload routing ---\n";
    auto transport = std::make_shared<CountingTransport>();
    auto dispatcher = std::make_shared<CallDispatcher>(transport, std::make_shared<NullNotifier>());
    auto sink = std::make_shared<Sink>();
    SettingsSnapshot snapshot;

    PrimaryListener listener(dir + "/routing.sock", snapshot, dispatcher);
    wire(listener, sink);

    listener.handle_payload("ping-1700000000");
    expect_true("ping ignored", listener.handled_uris() == 0 && transport->count() == 0);

    listener.handle_payload("tel:+1 (555) 123-4567");
    expect_true("unconfigured URI goes to the form", sink->wait_for(1, 0));
    expect_true("no start reported without configuration", sink->started_numbers.empty());
    expect_true("form receives the raw URI", sink->config_uris[0] == "tel:+1 (555) 123-4567");
    expect_true("no request sent without configuration", transport->count() == 0);

    snapshot.publish(configured_settings());
    listener.handle_payload("tel:555-123-4567");
    expect_true("configured URI dispatched silently", sink->wait_for(1, 1));
    expect_true("exactly one GET", transport->count() == 1);
    expect_true("normalized number dispatched", sink->completed_numbers[0] == "5551234567");
    expect_true("start reported for the silent call",
                sink->started_numbers.size() == 1 && sink->started_numbers[0] == "5551234567");
    expect_true("start reported before completion", sink->events.size() == 2 &&
                sink->events[0] == "start:5551234567" && sink->events[1] == "done:5551234567");
    expect_true("form not involved", sink->config_uris.size() == 1);
    expect_true("two URIs handled", listener.handled_uris() == 2);
}

static void test_socket_round_trip(const std::string& dir) {
    std::cout << "\n--- forwarded over the socket ---\n";
    std::string path = dir + "/live.sock";
    auto transport = std::make_shared<CountingTransport>();
    auto dispatcher = std::make_shared<CallDispatcher>(transport, std::make_shared<NullNotifier>());
    auto sink = std::make_shared<Sink>();
    SettingsSnapshot snapshot;
    snapshot.publish(configured_settings());

    PrimaryListener listener(path, snapshot, dispatcher);
    wire(listener, sink);
    expect_true("listener starts", listener.start());
    expect_true("listener running", listener.is_running());

    PrimaryListener rival(path, snapshot, dispatcher);
    expect_true("second bind on the same path fails", !rival.start());

    InstanceCoordinator coordinator(path);
    expect_true("coordinator sees a live primary", coordinator.determine_role() == Role::Secondary);
    expect_true("forward accepted", coordinator.forward_uri("tel:5551234567"));
    expect_true("forwarded URI dispatched", sink->wait_for(0, 1));
    expect_true("probe did not dispatch", transport->count() == 1 && listener.handled_uris() == 1);

    // Connect and write nothing: the loop must keep serving others
    int idle = socket(AF_UNIX, SOCK_STREAM, 0);
    struct sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    connect(idle, (struct sockaddr*)&addr, sizeof(addr));
    expect_true("forward behind an idle peer accepted", coordinator.forward_uri("tel:5550000"));
    expect_true("forward behind an idle peer dispatched", sink->wait_for(0, 2));
    close(idle);

    listener.stop();
    expect_true("listener stopped", !listener.is_running());
    expect_true("socket removed on stop", !fs::exists(path));
    expect_true("stopped primary is gone", coordinator.determine_role() == Role::Primary);
}

static void test_utf8() {
    std::cout << "\n--- UTF-8 validation ---\n";
    expect_true("ascii valid", is_valid_utf8("tel:5551234567"));
    expect_true("two-byte sequence valid", is_valid_utf8("tel:\xC3\xA9"));
    expect_true("four-byte sequence valid", is_valid_utf8("\xF0\x9F\x93\x9E"));
    expect_true("truncated sequence invalid", !is_valid_utf8("tel:\xC3"));
    expect_true("stray continuation invalid", !is_valid_utf8("\x80"));
    expect_true("overlong lead invalid", !is_valid_utf8("\xC0\xAF"));
    expect_true("overlong three-byte form invalid", !is_valid_utf8("\xE0\x80\x80"));
    expect_true("UTF-16 surrogate invalid", !is_valid_utf8("\xED\xA0\x80"));
    expect_true("overlong four-byte form invalid", !is_valid_utf8("\xF0\x80\x80\x80"));
    expect_true("code point above U+10FFFF invalid", !is_valid_utf8("\xF4\x90\x80\x80"));
    expect_true("smallest three-byte form valid", is_valid_utf8("\xE0\xA0\x80"));
    expect_true("last code point before surrogates valid", is_valid_utf8("\xED\x9F\xBF"));
    expect_true("U+10FFFF valid", is_valid_utf8("\xF4\x8F\xBF\xBF"));
}

int main() {
    std::cout << "=== Primary listener ===\n";
    std::string dir = make_temp_dir();

    test_routing(dir);
    test_socket_round_trip(dir);
    test_utf8();

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures > 0) {
        std::cout << "\n❌ " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "\n✅ All primary listener checks passed\n";
    return 0;
}
