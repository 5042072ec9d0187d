#include "judge/request.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace judged {
using namespace std;
using namespace nlohmann;

bool judge_request::uses_spj() const {
    return spj.has_value();
}

static string parse_source(const json &j) {
    if (!exists(j, "src") || !j.at("src").is_string())
        throw invalid_request("src must be a string");
    return j.at("src").get<string>();
}

static string parse_spj_version(const json &j) {
    json version = access_optional(j, "spj_version");
    if (version.is_number_integer())
        return to_string(version.get<int64_t>());
    if (!version.is_string())
        throw invalid_request("spj_version must be a string");
    return assert_safe_path(version.get<string>());
}

judge_request parse_judge_request(const json &j) {
    if (!j.is_object())
        throw invalid_request("request body must be a json object");

    judge_request req;
    req.src = parse_source(j);
    if (!exists(j, "language_config"))
        throw invalid_request("language_config is required");
    req.language = language_config::parse(j.at("language_config"));
    req.max_cpu_time = parse_limit(j, "max_cpu_time", MAX_CPU_TIME_CEILING);
    req.max_memory = parse_limit(j, "max_memory", MAX_MEMORY_CEILING);

    json output = access_optional(j, "output");
    if (output.is_boolean())
        req.output = output.get<bool>();
    else if (!output.is_null())
        throw invalid_request("output must be a boolean");

    // special judge
    bool has_version = exists(j, "spj_version"), has_config = exists(j, "spj_config");
    if (has_version != has_config)
        throw invalid_request("spj_version and spj_config must be provided together");
    if (has_version) {
        req.spj_version = parse_spj_version(j);
        req.spj = spj_config::parse(j.at("spj_config"));
    }
    if (exists(j, "spj_compile_config"))
        req.spj_compile = compile_config::parse(j.at("spj_compile_config"));
    if (exists(j, "spj_src")) {
        if (!req.spj)
            throw invalid_request("spj_src requires spj_version and spj_config");
        if (!req.spj_compile)
            throw invalid_request("spj_src requires spj_compile_config");
        if (!j.at("spj_src").is_string())
            throw invalid_request("spj_src must be a string");
        req.spj_src = j.at("spj_src").get<string>();
    }

    // 测试数据
    bool has_id = exists(j, "test_case_id"), has_inline = exists(j, "test_case");
    if (has_id == has_inline)
        throw invalid_request("exactly one of test_case_id and test_case must be provided");
    if (has_id) {
        if (!j.at("test_case_id").is_string())
            throw invalid_request("test_case_id must be a string");
        req.test_case_id = assert_safe_path(j.at("test_case_id").get<string>());
    } else {
        req.test_cases = parse_test_cases(j.at("test_case"), !req.uses_spj());
    }
    return req;
}

compile_spj_request parse_compile_spj_request(const json &j) {
    if (!j.is_object())
        throw invalid_request("request body must be a json object");
    compile_spj_request req;
    req.src = parse_source(j);
    if (!exists(j, "spj_version"))
        throw invalid_request("spj_version is required");
    req.spj_version = parse_spj_version(j);
    if (!exists(j, "spj_compile_config"))
        throw invalid_request("spj_compile_config is required");
    req.config = compile_config::parse(j.at("spj_compile_config"));
    return req;
}

}  // namespace judged
