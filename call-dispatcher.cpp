#include "call-dispatcher.h"
#include "http-client.h"
#include "platform-notifier.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <thread>
#include <cctype>
#include <utility>

static const char kClickToCallPath[] = "/app/click_to_call/click_to_call.php";

static std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

CallRequest CallRequest::from(const Settings& settings, const std::string& phone_number) {
    CallRequest request;
    request.domain = settings.domain;
    request.extension = settings.extension;
    request.key = settings.key;
    request.auto_answer = settings.auto_answer;
    request.phone_number = phone_number;
    return request;
}

const char* outcome_kind_name(CallOutcome::Kind kind) {
    switch (kind) {
        case CallOutcome::Kind::Success: return "success";
        case CallOutcome::Kind::HttpError: return "http_error";
        case CallOutcome::Kind::NetworkError: return "network_error";
    }
    return "unknown";
}

std::string domain_with_scheme(const std::string& domain) {
    if (domain.rfind("http://", 0) == 0 || domain.rfind("https://", 0) == 0) {
        return domain;
    }
    return "https://" + domain;
}

std::string build_click_to_call_url(const CallRequest& request) {
    std::string base = domain_with_scheme(request.domain);
    while (!base.empty() && base.back() == '/') base.pop_back();

    const std::string n = url_encode(request.phone_number);

    std::ostringstream url;
    url << base << kClickToCallPath
        << "?src_cid_name=" << n
        << "&src_cid_number=" << n
        << "&dest_cid_name=" << n
        << "&dest_cid_number=" << n
        << "&src=" << n
        << "&dest=" << url_encode(request.extension)
        << "&auto_answer=" << (request.auto_answer ? "true" : "false")
        << "&rec="
        << "&ringback=us-ring"
        << "&key=" << url_encode(request.key);
    return url.str();
}

std::string describe_outcome(const CallOutcome& outcome, const std::string& phone_number) {
    switch (outcome.kind) {
        case CallOutcome::Kind::Success:
            return "Call initialized to " + phone_number;
        case CallOutcome::Kind::HttpError:
            return "Error: HTTP status " + std::to_string(outcome.status_code);
        case CallOutcome::Kind::NetworkError:
            return "Error: " + outcome.message;
    }
    return "Error: unknown outcome";
}

CallDispatcher::CallDispatcher(std::shared_ptr<HttpTransport> transport,
                               std::shared_ptr<PlatformNotifier> notifier)
    : transport_(std::move(transport)), notifier_(std::move(notifier)) {}

CallOutcome CallDispatcher::dispatch(const CallRequest& request) {
    return run(*transport_, *notifier_, request);
}

void CallDispatcher::dispatch_async(const CallRequest& request, Completion on_complete) {
    std::shared_ptr<HttpTransport> transport = transport_;
    std::shared_ptr<PlatformNotifier> notifier = notifier_;
    std::thread([transport, notifier, request, on_complete]() {
        CallOutcome outcome = run(*transport, *notifier, request);
        if (on_complete) on_complete(request, outcome);
    }).detach();
}

CallOutcome CallDispatcher::run(HttpTransport& transport, PlatformNotifier& notifier,
                                const CallRequest& request) {
    std::string url = build_click_to_call_url(request);

    std::string logged = url;
    size_t key_pos = logged.rfind("&key=");
    if (key_pos != std::string::npos && key_pos + 5 < logged.size()) {
        logged.replace(key_pos + 5, std::string::npos, "***");
    }
    std::cout << "📞 Dialing " << request.phone_number << " via " << logged << std::endl;

    HttpResult result = transport.get(url);

    CallOutcome outcome;
    if (!result.ok) {
        outcome.kind = CallOutcome::Kind::NetworkError;
        outcome.message = result.error.empty() ? std::string("request failed") : result.error;
        std::cout << "❌ Call to " << request.phone_number << " failed: " << outcome.message << std::endl;
    } else if (result.status_code >= 200 && result.status_code < 300) {
        outcome.kind = CallOutcome::Kind::Success;
        outcome.status_code = result.status_code;
        std::cout << "✅ Call initialized to " << request.phone_number << std::endl;
    } else {
        outcome.kind = CallOutcome::Kind::HttpError;
        outcome.status_code = result.status_code;
        std::cout << "❌ Call to " << request.phone_number << " rejected: HTTP status "
                  << result.status_code << std::endl;
    }

    notify_outcome(notifier, request, outcome);
    return outcome;
}

void CallDispatcher::notify_outcome(PlatformNotifier& notifier, const CallRequest& request,
                                    const CallOutcome& outcome) {
    const std::string& n = request.phone_number;
    switch (outcome.kind) {
        case CallOutcome::Kind::Success:
            notifier.notify("Call Initiated", "Calling " + n + "...");
            break;
        case CallOutcome::Kind::HttpError:
            notifier.notify("Call Failed", "Failed to call " + n + ": HTTP status " +
                             std::to_string(outcome.status_code));
            break;
        case CallOutcome::Kind::NetworkError:
            notifier.notify("Call Failed", "Failed to call " + n + ": " + outcome.message);
            break;
    }
}
