#include "process-spawn.h"
#include <iostream>
#include <thread>
#include <cstring>
#include <cerrno>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

bool spawn_process(const std::string& program, const std::vector<std::string>& args,
                   pid_t& out_pid, bool search_path) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    int rc = search_path
        ? posix_spawnp(&out_pid, program.c_str(), &actions, nullptr, argv.data(), environ)
        : posix_spawn(&out_pid, program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        std::cout << "❌ Failed to spawn '" << program << "': " << strerror(rc) << std::endl;
        return false;
    }
    return true;
}

void reap_in_background(pid_t pid) {
    std::thread([pid]() {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }).detach();
}
