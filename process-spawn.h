#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

// posix_spawn wrapper; search_path selects posix_spawnp
bool spawn_process(const std::string& program, const std::vector<std::string>& args,
                   pid_t& out_pid, bool search_path);

// Reaps the child on a detached thread so it never lingers as a zombie
void reap_in_background(pid_t pid);
