#include <stdexcept>
#include "gtest/gtest.h"
#include "monitor/host_status.hpp"

using namespace std;
using namespace judged;

TEST(HostStatusTest, ProcStatTest) {
    cpu_times times = parse_proc_stat(
        "cpu  100 0 50 800 50 0 0 0 0 0\n"
        "cpu0 50 0 25 400 25 0 0 0 0 0\n");
    EXPECT_EQ(times.total, 1000u);
    EXPECT_EQ(times.idle, 850u);

    EXPECT_THROW(parse_proc_stat("intr 1 2 3\n"), runtime_error);
    EXPECT_THROW(parse_proc_stat(""), runtime_error);
}

TEST(HostStatusTest, CpuUsageTest) {
    cpu_times before{800, 1000}, after{850, 1100};
    EXPECT_DOUBLE_EQ(cpu_usage(before, after), 50.0);
    EXPECT_DOUBLE_EQ(cpu_usage(before, before), 0.0);
}

TEST(HostStatusTest, MeminfoTest) {
    double usage = parse_meminfo(
        "MemTotal:       16000000 kB\n"
        "MemFree:         2000000 kB\n"
        "MemAvailable:    4000000 kB\n"
        "Buffers:          100000 kB\n");
    EXPECT_DOUBLE_EQ(usage, 75.0);

    EXPECT_THROW(parse_meminfo("MemTotal: 16000000 kB\n"), runtime_error);
}

TEST(HostStatusTest, SampleTest) {
    host_status status = sample_host_status();
    EXPECT_GT(status.cpu_core, 0);
    EXPECT_GE(status.cpu, 0.0);
    EXPECT_LE(status.cpu, 100.0);
    EXPECT_GE(status.memory, 0.0);
    EXPECT_LE(status.memory, 100.0);

    auto j = status.to_json();
    EXPECT_EQ(j.at("action"), "pong");
    EXPECT_EQ(j.at("cpu_core"), status.cpu_core);
    EXPECT_TRUE(j.at("version").is_string());
}
