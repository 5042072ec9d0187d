#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

/**
 * 所有测试共享 /tmp/judged-test 下的目录，测试开始前创建，运行目录在开始前清空
 */
class JudgedTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        judged::setup_test_environment();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    ::testing::AddGlobalTestEnvironment(new JudgedTestEnvironment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
