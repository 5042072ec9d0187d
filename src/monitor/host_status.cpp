#include "monitor/host_status.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace judged {
using namespace std;

cpu_times parse_proc_stat(const string &content) {
    istringstream fin(content);
    string label;
    if (!(fin >> label) || label != "cpu")
        throw runtime_error("malformed /proc/stat");
    // user nice system idle iowait irq softirq steal
    cpu_times times;
    uint64_t value;
    for (int i = 0; i < 8 && fin >> value; ++i) {
        times.total += value;
        if (i == 3 || i == 4) times.idle += value;
    }
    if (times.total == 0)
        throw runtime_error("malformed /proc/stat");
    return times;
}

double cpu_usage(const cpu_times &before, const cpu_times &after) {
    if (after.total <= before.total) return 0;
    double total = after.total - before.total;
    double idle = after.idle >= before.idle ? after.idle - before.idle : 0;
    return max(0.0, min(100.0, (total - idle) * 100.0 / total));
}

double parse_meminfo(const string &content) {
    istringstream fin(content);
    string key;
    uint64_t value, total = 0, available = 0;
    bool has_available = false;
    string line;
    while (getline(fin, line)) {
        istringstream ls(line);
        if (!(ls >> key >> value)) continue;
        if (key == "MemTotal:") total = value;
        if (key == "MemAvailable:") {
            available = value;
            has_available = true;
        }
    }
    if (total == 0 || !has_available)
        throw runtime_error("malformed /proc/meminfo");
    return (total - min(total, available)) * 100.0 / total;
}

nlohmann::json host_status::to_json() const {
    return {
        {"action", "pong"},
        {"hostname", hostname},
        {"cpu", cpu},
        {"cpu_core", cpu_core},
        {"memory", memory},
        {"version", version}};
}

static string get_hostname() {
    char name[256] = {};
    if (gethostname(name, sizeof(name) - 1) != 0) {
        LOG(WARNING) << "Unable to get hostname";
        return "";
    }
    return name;
}

host_status sample_host_status() {
    host_status status;
    status.hostname = get_hostname();
    status.cpu_core = static_cast<int>(sysconf(_SC_NPROCESSORS_ONLN));
    status.version = VERSION;

    cpu_times before = parse_proc_stat(read_file_content("/proc/stat"));
    this_thread::sleep_for(chrono::milliseconds(100));
    cpu_times after = parse_proc_stat(read_file_content("/proc/stat"));
    status.cpu = cpu_usage(before, after);
    status.memory = parse_meminfo(read_file_content("/proc/meminfo"));
    return status;
}

}  // namespace judged
