#pragma once

#include <string>
#include <memory>
#include <mutex>

// Persisted click-to-call preferences
struct Settings {
    std::string domain;
    std::string extension;
    std::string key;          // Shared secret sent to the PBX
    bool auto_answer = false;

    bool is_configured() const { return !domain.empty() && !extension.empty(); }

    bool operator==(const Settings& other) const {
        return domain == other.domain && extension == other.extension &&
               key == other.key && auto_answer == other.auto_answer;
    }
    bool operator!=(const Settings& other) const { return !(*this == other); }
};

// Transient per-session values, never persisted
struct SessionState {
    std::string phone_number;
    std::string status_message;
};

class PreferencesStore {
public:
    PreferencesStore();
    explicit PreferencesStore(const std::string& path);

    // Never fails: absent or malformed file yields default Settings
    Settings load() const;
    bool save(const Settings& settings, std::string* error = nullptr) const;

    const std::string& path() const { return path_; }

    static std::string default_path();

private:
    std::string path_;
};

// Read-only view of the current Settings for background threads.
// Published by the UI-owning context after every load and save.
class SettingsSnapshot {
public:
    SettingsSnapshot() : current_(std::make_shared<const Settings>()) {}

    void publish(const Settings& settings);
    std::shared_ptr<const Settings> get() const;

private:
    std::shared_ptr<const Settings> current_;
    mutable std::mutex mutex_;
};
