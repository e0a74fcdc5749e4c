#pragma once

#include <string>
#include <vector>

// Desktop integration kept out of the call and IPC paths.
// Every method is best-effort and must not block the caller.
class PlatformNotifier {
public:
    virtual ~PlatformNotifier() = default;

    virtual void notify(const std::string& title, const std::string& body) = 0;

    // Bring the interactive form to the user's attention
    virtual void activate(const std::string& ui_url) = 0;
};

class NullNotifier : public PlatformNotifier {
public:
    void notify(const std::string&, const std::string&) override {}
    void activate(const std::string&) override {}
};

// Freedesktop implementation: notify-send for notifications, xdg-open for the form
class DesktopNotifier : public PlatformNotifier {
public:
    void notify(const std::string& title, const std::string& body) override;
    void activate(const std::string& ui_url) override;

private:
    static bool spawn_detached(const std::string& program, const std::vector<std::string>& args);
};
