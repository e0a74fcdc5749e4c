#pragma once

#include "settings.h"
#include <string>
#include <functional>
#include <memory>

class HttpTransport;
class PlatformNotifier;

// Value snapshot taken when a call is triggered; later edits to the
// form do not affect an attempt already in flight
struct CallRequest {
    std::string domain;
    std::string extension;
    std::string key;
    std::string phone_number;
    bool auto_answer = false;

    static CallRequest from(const Settings& settings, const std::string& phone_number);
};

struct CallOutcome {
    enum class Kind { Success, HttpError, NetworkError };

    Kind kind = Kind::NetworkError;
    int status_code = 0;      // set for Success and HttpError
    std::string message;      // transport error text for NetworkError

    bool succeeded() const { return kind == Kind::Success; }
};

const char* outcome_kind_name(CallOutcome::Kind kind);

// "https://" is prepended unless the domain already names http:// or https://
std::string domain_with_scheme(const std::string& domain);

std::string build_click_to_call_url(const CallRequest& request);

// Status line text shown to the user for a completed attempt
std::string describe_outcome(const CallOutcome& outcome, const std::string& phone_number);

class CallDispatcher {
public:
    using Completion = std::function<void(const CallRequest&, const CallOutcome&)>;

    CallDispatcher(std::shared_ptr<HttpTransport> transport,
                   std::shared_ptr<PlatformNotifier> notifier);

    // Exactly one GET, no retry. Caller has already checked that
    // domain, extension and phone number are non-empty.
    CallOutcome dispatch(const CallRequest& request);

    // Runs the attempt on a detached worker that shares ownership of the
    // transport and notifier, so it may outlive this object. The completion
    // is invoked on that worker and must hand its result to the owning
    // context itself.
    void dispatch_async(const CallRequest& request, Completion on_complete);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<PlatformNotifier> notifier_;

    static CallOutcome run(HttpTransport& transport, PlatformNotifier& notifier,
                           const CallRequest& request);
    static void notify_outcome(PlatformNotifier& notifier, const CallRequest& request,
                               const CallOutcome& outcome);
};
