#include "settings.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>

using json = nlohmann::json;

static std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

PreferencesStore::PreferencesStore() : path_(default_path()) {}

PreferencesStore::PreferencesStore(const std::string& path) : path_(path) {}

std::string PreferencesStore::default_path() {
    std::string base = env_or_empty("XDG_CONFIG_HOME");
    if (base.empty()) {
        std::string home = env_or_empty("HOME");
        base = home.empty() ? std::string(".") : home + "/.config";
    }
    return base + "/click-to-call/preferences.json";
}

Settings PreferencesStore::load() const {
    Settings settings;

    std::ifstream file(path_);
    if (!file.good()) {
        return settings;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        json j = json::parse(buffer.str());
        if (!j.is_object()) {
            std::cout << "⚠️ Preferences file is not a JSON object, using defaults: " << path_ << std::endl;
            return Settings();
        }
        settings.domain = j.value("domain", std::string());
        settings.extension = j.value("extension", std::string());
        settings.key = j.value("key", std::string());
        settings.auto_answer = j.value("auto_answer", false);
    } catch (const json::exception& e) {
        std::cout << "⚠️ Could not parse preferences " << path_ << ": " << e.what() << std::endl;
        return Settings();
    }

    return settings;
}

bool PreferencesStore::save(const Settings& settings, std::string* error) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        // An existing directory is fine; a real failure shows up on open below
    }

    json j = {
        {"domain", settings.domain},
        {"extension", settings.extension},
        {"key", settings.key},
        {"auto_answer", settings.auto_answer}
    };

    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            if (error) *error = "cannot open " + tmp_path + " for writing";
            std::cerr << "❌ Failed to save preferences: cannot open " << tmp_path << std::endl;
            return false;
        }
        out << j.dump(2);
        out.flush();
        if (!out) {
            if (error) *error = "write failed for " + tmp_path;
            std::cerr << "❌ Failed to save preferences: write failed for " << tmp_path << std::endl;
            return false;
        }
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        if (error) *error = ec.message();
        std::cerr << "❌ Failed to save preferences to " << path_ << ": " << ec.message() << std::endl;
        fs::remove(tmp_path, ec);
        return false;
    }

    std::cout << "✅ Preferences saved: " << path_ << std::endl;
    return true;
}

void SettingsSnapshot::publish(const Settings& settings) {
    auto next = std::make_shared<const Settings>(settings);
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = next;
}

std::shared_ptr<const Settings> SettingsSnapshot::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}
