#include "common/status.hpp"
#include <boost/assign.hpp>
#include <map>

namespace judged {
using namespace std;

// clang-format off
static const map<result_code, const char *> result_string = boost::assign::map_list_of
    (result_code::WRONG_ANSWER, "Wrong Answer")
    (result_code::SUCCESS, "Success")
    (result_code::CPU_TIME_LIMIT_EXCEEDED, "CPU Time Limit Exceeded")
    (result_code::REAL_TIME_LIMIT_EXCEEDED, "Real Time Limit Exceeded")
    (result_code::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (result_code::RUNTIME_ERROR, "Runtime Error")
    (result_code::SYSTEM_ERROR, "System Error");

static const map<error_kind, const char *> error_string = boost::assign::map_list_of
    (error_kind::SUCCESS, "Success")
    (error_kind::INVALID_CONFIG, "Invalid Config")
    (error_kind::FORK_FAILED, "Fork Failed")
    (error_kind::WAIT_FAILED, "Wait Failed")
    (error_kind::ROOT_REQUIRED, "Root Required")
    (error_kind::LOAD_SECCOMP_FAILED, "Load Seccomp Failed")
    (error_kind::SETRLIMIT_FAILED, "Setrlimit Failed")
    (error_kind::DUP2_FAILED, "Dup2 Failed")
    (error_kind::SETUID_FAILED, "Setuid Failed")
    (error_kind::EXECVE_FAILED, "Execve Failed")
    (error_kind::SPJ_ERROR, "SPJ Error")
    (error_kind::SYSCALL_RESTRICTED, "Syscall Restricted")
    (error_kind::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (error_kind::ARTIFACT_MISSING, "Artifact Missing")
    (error_kind::SANDBOX_FAILED, "Sandbox Failed");
// clang-format on

const char *get_display_message(result_code code) {
    return result_string.at(code);
}

const char *get_display_message(error_kind kind) {
    return error_string.at(kind);
}

}  // namespace judged
