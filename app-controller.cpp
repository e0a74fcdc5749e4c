#include "app-controller.h"
#include "database.h"
#include "phone-number.h"
#include "platform-notifier.h"
#include <iostream>
#include <utility>

void EventQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

size_t EventQueue::drain() {
    std::queue<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(batch, tasks_);
    }
    size_t ran = 0;
    while (!batch.empty()) {
        Task task = std::move(batch.front());
        batch.pop();
        if (task) task();
        ++ran;
    }
    return ran;
}

void EventQueue::run(const std::atomic<bool>& keep_running) {
    while (keep_running.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Bounded wait so a signal-driven keep_running change is noticed
            cv_.wait_for(lock, std::chrono::milliseconds(100),
                         [this]() { return stopped_ || !tasks_.empty(); });
            if (stopped_) break;
        }
        drain();
    }
}

void EventQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::wait_for_task(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !tasks_.empty(); });
}

bool parse_forward_policy(const std::string& text, ForwardPolicy& out) {
    if (text == "background") {
        out = ForwardPolicy::Background;
        return true;
    }
    if (text == "activate") {
        out = ForwardPolicy::Activate;
        return true;
    }
    return false;
}

AppController::AppController(std::shared_ptr<EventQueue> queue,
                             std::shared_ptr<CallDispatcher> dispatcher,
                             std::shared_ptr<PlatformNotifier> notifier,
                             PreferencesStore store,
                             SettingsSnapshot& snapshot,
                             Database* history)
    : queue_(std::move(queue)),
      dispatcher_(std::move(dispatcher)),
      notifier_(std::move(notifier)),
      store_(std::move(store)),
      snapshot_(snapshot),
      history_(history) {}

void AppController::load_settings() {
    settings_ = store_.load();
    snapshot_.publish(settings_);
    std::cout << "📋 Settings loaded: domain='" << settings_.domain
              << "' extension='" << settings_.extension
              << "' auto_answer=" << (settings_.auto_answer ? "true" : "false") << std::endl;
}

bool AppController::save_settings(const Settings& settings) {
    settings_ = settings;
    snapshot_.publish(settings_);

    std::string error;
    if (!store_.save(settings_, &error)) {
        // The edited values stay active for this session even if the file write failed
        session_.status_message = "Error: could not save settings";
        return false;
    }
    session_.status_message = "Settings saved successfully!";
    return true;
}

void AppController::set_phone_number(const std::string& phone_number) {
    session_.phone_number = phone_number;
}

bool AppController::place_call() {
    if (settings_.domain.empty() || settings_.extension.empty() || session_.phone_number.empty()) {
        session_.status_message = "Error: Missing domain, extension or phone number";
        std::cout << "⚠️ Call not placed: missing domain, extension or phone number" << std::endl;
        return false;
    }

    CallRequest request = CallRequest::from(settings_, session_.phone_number);
    note_call_started(request);

    std::weak_ptr<AppController> weak_self = shared_from_this();
    dispatcher_->dispatch_async(request, [weak_self](const CallRequest& req, const CallOutcome& outcome) {
        if (auto self = weak_self.lock()) {
            self->post_call_result(req, outcome);
        }
    });
    return true;
}

void AppController::process_tel_uri(const std::string& uri) {
    if (!is_tel_uri(uri)) {
        std::cout << "⚠️ Ignoring non-tel URI: " << uri << std::endl;
        return;
    }

    std::string number = normalize_tel_uri(uri);
    std::cout << "📞 Processing tel: URI " << uri << " -> " << number << std::endl;
    session_.phone_number = number;

    if (settings_.is_configured()) {
        place_call();
        return;
    }

    session_.status_message = "Configuration required to call " + number;
    if (forward_policy_ == ForwardPolicy::Activate && !ui_url_.empty()) {
        notifier_->activate(ui_url_);
    } else {
        notifier_->notify("Click-To-Call", "Enter your PBX settings to call " + number);
    }
}

void AppController::note_call_started(const CallRequest& request) {
    session_.status_message = "Initiating call to " + request.phone_number + "...";
}

void AppController::apply_call_result(const CallRequest& request, const CallOutcome& outcome) {
    session_.status_message = describe_outcome(outcome, request.phone_number);
    if (history_) {
        history_->record_call(request, outcome, session_.status_message);
    }
}

void AppController::post_tel_uri(const std::string& uri) {
    std::weak_ptr<AppController> weak_self = shared_from_this();
    queue_->post([weak_self, uri]() {
        if (auto self = weak_self.lock()) self->process_tel_uri(uri);
    });
}

void AppController::post_call_started(const CallRequest& request) {
    std::weak_ptr<AppController> weak_self = shared_from_this();
    queue_->post([weak_self, request]() {
        if (auto self = weak_self.lock()) self->note_call_started(request);
    });
}

void AppController::post_call_result(const CallRequest& request, const CallOutcome& outcome) {
    std::weak_ptr<AppController> weak_self = shared_from_this();
    queue_->post([weak_self, request, outcome]() {
        if (auto self = weak_self.lock()) self->apply_call_result(request, outcome);
    });
}
