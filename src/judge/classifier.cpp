#include "judge/classifier.hpp"

namespace judged {
using namespace std;

optional<verdict> classify_execution(const raw_outcome &outcome) {
    // 超出限制的进程一般是被信号杀死的，因此限制要先于信号判断
    if (outcome.cpu_time_exceeded)
        return verdict{result_code::CPU_TIME_LIMIT_EXCEEDED, error_kind::SUCCESS};
    if (outcome.real_time_exceeded)
        return verdict{result_code::REAL_TIME_LIMIT_EXCEEDED, error_kind::SUCCESS};
    if (outcome.memory_exceeded)
        return verdict{result_code::MEMORY_LIMIT_EXCEEDED, error_kind::SUCCESS};

    if (outcome.output_truncated)
        return verdict{result_code::RUNTIME_ERROR, error_kind::OUTPUT_LIMIT_EXCEEDED};
    if (outcome.syscall_restricted)
        return verdict{result_code::RUNTIME_ERROR, error_kind::SYSCALL_RESTRICTED};
    if (outcome.signal != 0 || outcome.exit_code != 0)
        return verdict{result_code::RUNTIME_ERROR, error_kind::SUCCESS};

    if (outcome.engine_fault)
        return verdict{result_code::SYSTEM_ERROR, *outcome.engine_fault};
    return nullopt;
}

verdict classify(const raw_outcome &outcome, const string &expected, const string &actual, compare_mode mode) {
    if (auto v = classify_execution(outcome)) return *v;
    if (outputs_match(expected, actual, mode))
        return {result_code::SUCCESS, error_kind::SUCCESS};
    else
        return {result_code::WRONG_ANSWER, error_kind::SUCCESS};
}

verdict classify(const raw_outcome &outcome, spj_verdict spj) {
    if (auto v = classify_execution(outcome)) return *v;
    switch (spj) {
        case spj_verdict::ACCEPTED:
            return {result_code::SUCCESS, error_kind::SUCCESS};
        case spj_verdict::WRONG_ANSWER:
            return {result_code::WRONG_ANSWER, error_kind::SUCCESS};
        default:
            return {result_code::SYSTEM_ERROR, error_kind::SPJ_ERROR};
    }
}

spj_verdict to_spj_verdict(const raw_outcome &spj_outcome) {
    if (spj_outcome.engine_fault || spj_outcome.cpu_time_exceeded || spj_outcome.real_time_exceeded ||
        spj_outcome.memory_exceeded || spj_outcome.syscall_restricted || spj_outcome.output_truncated ||
        spj_outcome.signal != 0)
        return spj_verdict::ERROR;
    if (spj_outcome.exit_code == 0) return spj_verdict::ACCEPTED;
    if (spj_outcome.exit_code == 1) return spj_verdict::WRONG_ANSWER;
    return spj_verdict::ERROR;
}

string normalize_output(const string &output) {
    string result;
    result.reserve(output.size());
    size_t pos = 0;
    while (pos <= output.size()) {
        size_t end = output.find('\n', pos);
        if (end == string::npos) end = output.size();
        size_t last = end;
        while (last > pos && (output[last - 1] == ' ' || output[last - 1] == '\t' || output[last - 1] == '\r'))
            --last;
        result.append(output, pos, last - pos);
        result.push_back('\n');
        pos = end + 1;
    }
    // 删除文末空行
    while (!result.empty() && result.back() == '\n')
        result.pop_back();
    return result;
}

bool outputs_match(const string &expected, const string &actual, compare_mode mode) {
    if (mode == compare_mode::EXACT)
        return expected == actual;
    return normalize_output(expected) == normalize_output(actual);
}

}  // namespace judged
