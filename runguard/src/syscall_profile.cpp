#include "syscall_profile.hpp"
#include <algorithm>

using namespace std;

const vector<syscall_profile_info> &syscall_profiles() {
    static const vector<syscall_profile_info> profiles = {
        {"c_cpp", "whitelist for compiled C/C++ programs, read-only file access"},
        {"c_cpp_file_io", "c_cpp with files opened for writing"},
        {"general", "blacklist of network, process creation, kill and exec"},
        {"golang", "general with thread creation"},
        {"node", "same rules as golang, for node.js"}};
    return profiles;
}

bool is_known_syscall_profile(const string &name) {
    if (name.empty()) return true;
    auto &profiles = syscall_profiles();
    return any_of(profiles.begin(), profiles.end(), [&](const syscall_profile_info &info) {
        return name == info.name;
    });
}
