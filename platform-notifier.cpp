#include "platform-notifier.h"
#include "process-spawn.h"
#include <iostream>

bool DesktopNotifier::spawn_detached(const std::string& program, const std::vector<std::string>& args) {
    pid_t pid;
    if (!spawn_process(program, args, pid, /*search_path=*/true)) {
        return false;
    }
    reap_in_background(pid);
    return true;
}

void DesktopNotifier::notify(const std::string& title, const std::string& body) {
    std::cout << "🔔 " << title << ": " << body << std::endl;
    if (!spawn_detached("notify-send", {"--app-name=Click-To-Call", title, body})) {
        std::cout << "⚠️ Desktop notification unavailable" << std::endl;
    }
}

void DesktopNotifier::activate(const std::string& ui_url) {
    std::cout << "🪟 Opening Click-To-Call form at " << ui_url << std::endl;
    if (!spawn_detached("xdg-open", {ui_url})) {
        std::cout << "⚠️ Could not open " << ui_url << " in a browser" << std::endl;
    }
}
