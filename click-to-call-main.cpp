#include "app-controller.h"
#include "call-dispatcher.h"
#include "database.h"
#include "http-client.h"
#include "instance-coordinator.h"
#include "phone-number.h"
#include "platform-notifier.h"
#include "primary-listener.h"
#include "settings.h"
#include "simple-http-api.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <cstdlib>

static std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    (void)signal;
    g_running.store(false);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [tel:NUMBER]\n"
              << "Options:\n"
              << "  --socket PATH                  Instance socket (default: " << default_socket_path() << ")\n"
              << "  --config PATH                  Preferences file (default: " << PreferencesStore::default_path() << ")\n"
              << "  --db PATH                      Call history database (default: " << Database::default_path() << ")\n"
              << "  --port PORT                    Local form port (default: 17710)\n"
              << "  --on-forward activate|background\n"
              << "                                 Bring the form forward when a forwarded number\n"
              << "                                 needs configuration (default: background)\n"
              << "  --background                   Start without opening the form\n"
              << "  --no-notify                    Disable desktop notifications\n"
              << "  --help                         Show this help message\n"
              << "\nClick-To-Call - dials tel: links through a PBX click-to-call endpoint\n";
}

int main(int argc, char* argv[]) {
    std::string socket_path = default_socket_path();
    std::string config_path = PreferencesStore::default_path();
    std::string db_path = Database::default_path();
    int ui_port = 17710;
    ForwardPolicy forward_policy = ForwardPolicy::Background;
    bool background = false;
    bool notifications = true;
    std::string tel_uri;

    // Overrides handed on to a background instance we may have to start
    std::vector<std::string> passthrough;
    auto pass_on = [&passthrough](const std::string& flag, const std::string& value) {
        passthrough.push_back(flag);
        passthrough.push_back(value);
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--socket" && i + 1 < argc) {
            socket_path = argv[++i];
            pass_on("--socket", socket_path);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            pass_on("--config", config_path);
        } else if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
            pass_on("--db", db_path);
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                ui_port = std::stoi(value);
            } catch (const std::exception&) {
                ui_port = 0;
            }
            if (ui_port < 1 || ui_port > 65535) {
                std::cerr << "❌ Invalid port: " << value << std::endl;
                return 1;
            }
            pass_on("--port", value);
        } else if (arg == "--on-forward" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_forward_policy(value, forward_policy)) {
                std::cerr << "❌ Invalid --on-forward value: " << value << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            pass_on("--on-forward", value);
        } else if (arg == "--background") {
            background = true;
        } else if (arg == "--no-notify") {
            notifications = false;
            passthrough.push_back(arg);
        } else if (is_tel_uri(arg)) {
            if (tel_uri.empty()) tel_uri = arg;
        } else {
            std::cerr << "❌ Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<PlatformNotifier> notifier;
    if (notifications) {
        notifier = std::make_shared<DesktopNotifier>();
    } else {
        notifier = std::make_shared<NullNotifier>();
    }
    const std::string ui_url = "http://127.0.0.1:" + std::to_string(ui_port) + "/";

    InstanceCoordinator coordinator(socket_path);
    Role role = coordinator.determine_role();
    std::cout << "📋 Role: " << role_name(role) << std::endl;

    if (role == Role::Secondary) {
        if (tel_uri.empty()) {
            std::cout << "🪟 Click-To-Call is already running" << std::endl;
            notifier->activate(ui_url);
            return 0;
        }

        ForwardResult forwarded = coordinator.forward_or_spawn(tel_uri, [&passthrough]() {
            return InstanceCoordinator::spawn_background_instance(passthrough);
        });
        if (forwarded != ForwardResult::Failed) {
            return 0;
        }
        std::cout << "⚠️ Continuing as an independent instance" << std::endl;
    }

    try {
        auto queue = std::make_shared<EventQueue>();
        SettingsSnapshot snapshot;

        Database history;
        bool history_ok = history.init(db_path);
        if (history_ok) {
            std::cout << "✅ Call history at " << db_path << std::endl;
        } else {
            std::cout << "⚠️ Call history disabled" << std::endl;
        }

        auto transport = std::make_shared<SimpleHttpClient>();
        auto dispatcher = std::make_shared<CallDispatcher>(transport, notifier);
        auto controller = std::make_shared<AppController>(queue, dispatcher, notifier,
                                                          PreferencesStore(config_path), snapshot,
                                                          history_ok ? &history : nullptr);
        controller->set_forward_policy(forward_policy);
        controller->set_ui_url(ui_url);
        controller->load_settings();

        PrimaryListener listener(socket_path, snapshot, dispatcher);
        std::weak_ptr<AppController> weak_controller = controller;
        listener.set_configuration_handler([weak_controller](const std::string& uri) {
            if (auto c = weak_controller.lock()) c->post_tel_uri(uri);
        });
        listener.set_call_start_handler([weak_controller](const CallRequest& request) {
            if (auto c = weak_controller.lock()) c->post_call_started(request);
        });
        listener.set_completion_handler([weak_controller](const CallRequest& request, const CallOutcome& outcome) {
            if (auto c = weak_controller.lock()) c->post_call_result(request, outcome);
        });
        if (!listener.start()) {
            std::cout << "⚠️ Not accepting forwarded URIs in this instance" << std::endl;
        }

        SimpleHttpServer form(ui_port, controller, history_ok ? &history : nullptr);
        bool form_ok = form.start();
        if (!form_ok) {
            std::cout << "⚠️ Form unavailable on port " << ui_port << std::endl;
        }

        if (!tel_uri.empty()) {
            controller->post_tel_uri(tel_uri);
            // Launched directly by a tel: link: the form is the only way to finish the call
            if (!background && form_ok && forward_policy == ForwardPolicy::Background &&
                !controller->settings().is_configured()) {
                notifier->activate(form.url());
            }
        } else if (!background && form_ok) {
            notifier->activate(form.url());
        }

        std::cout << "🚀 Click-To-Call running. Press Ctrl+C to stop." << std::endl;
        queue->run(g_running);

        std::cout << "🛑 Shutting down Click-To-Call..." << std::endl;
        listener.stop();
        form.stop();
        history.close();
    } catch (const std::exception& e) {
        std::cerr << "❌ Runtime error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "✅ Click-To-Call stopped cleanly" << std::endl;
    return 0;
}
