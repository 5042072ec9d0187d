#include "utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <algorithm>
#include <cstdlib>
#include <vector>

using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

string resolve_executable(const string &file) {
    if (file.find('/') != string::npos) return file;

    const char *path = getenv("PATH");
    if (!path) return file;

    string search_path = path;
    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        string candidate = (dir.empty() ? string(".") : dir) + "/" + file;
        if (access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return file;
}
