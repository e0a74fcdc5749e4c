#pragma once

#include "settings.h"
#include "call-dispatcher.h"
#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>

class Database;
class PlatformNotifier;

// FIFO of tasks executed serially on the thread that owns the session.
// post() is safe from any thread; drain() and run() belong to the owner.
class EventQueue {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Runs every task queued at the time of the call, returns how many ran
    size_t drain();

    // Processes tasks until stop() is called or keep_running turns false
    void run(const std::atomic<bool>& keep_running);
    void stop();

    // Blocks until at least one task is queued or the timeout expires
    bool wait_for_task(std::chrono::milliseconds timeout);

private:
    std::queue<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

// What the primary does when a forwarded URI cannot be called without
// user input: stay in the background or bring the form forward
enum class ForwardPolicy { Background, Activate };

bool parse_forward_policy(const std::string& text, ForwardPolicy& out);

// Owner of Settings and SessionState. Every non-post_ method must run on
// the EventQueue's thread; background work reaches it only via post_*.
class AppController : public std::enable_shared_from_this<AppController> {
public:
    AppController(std::shared_ptr<EventQueue> queue,
                  std::shared_ptr<CallDispatcher> dispatcher,
                  std::shared_ptr<PlatformNotifier> notifier,
                  PreferencesStore store,
                  SettingsSnapshot& snapshot,
                  Database* history = nullptr);

    void set_forward_policy(ForwardPolicy policy) { forward_policy_ = policy; }
    void set_ui_url(const std::string& url) { ui_url_ = url; }

    void load_settings();
    bool save_settings(const Settings& settings);

    const Settings& settings() const { return settings_; }
    const SessionState& session() const { return session_; }

    void set_phone_number(const std::string& phone_number);

    // Validates, snapshots a CallRequest and starts the attempt.
    // Returns false, with an error status, when a required field is empty.
    bool place_call();

    // Normalizes the URI; calls right away when configured, otherwise
    // asks for configuration according to the forward policy
    void process_tel_uri(const std::string& uri);

    // Status for a call started elsewhere, such as a forwarded URI
    void note_call_started(const CallRequest& request);
    void apply_call_result(const CallRequest& request, const CallOutcome& outcome);

    // Thread-safe entry points
    void post_tel_uri(const std::string& uri);
    void post_call_started(const CallRequest& request);
    void post_call_result(const CallRequest& request, const CallOutcome& outcome);

    EventQueue& queue() { return *queue_; }

private:
    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<CallDispatcher> dispatcher_;
    std::shared_ptr<PlatformNotifier> notifier_;
    PreferencesStore store_;
    SettingsSnapshot& snapshot_;
    Database* history_;

    Settings settings_;
    SessionState session_;
    ForwardPolicy forward_policy_ = ForwardPolicy::Background;
    std::string ui_url_;
};
