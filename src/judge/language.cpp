#include "judge/language.hpp"
#include <algorithm>
#include <boost/algorithm/string/replace.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/token_functions.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "syscall_profile.hpp"

namespace judged {
using namespace std;
using namespace nlohmann;

const set<string> COMPILE_SLOTS = {"src_path", "exe_path", "exe_dir", "max_memory"};
const set<string> RUN_SLOTS = {"exe_path", "exe_dir", "max_memory"};
const set<string> SPJ_SLOTS = {"exe_path", "exe_dir", "max_memory", "in_file_path", "user_out_file_path", "answer_file_path"};

/**
 * @brief 遍历参数中的所有占位符
 * @param f 以占位符名称调用
 */
template <typename F>
static void for_each_placeholder(const string &arg, F &&f) {
    size_t pos = 0;
    while (pos < arg.size()) {
        size_t open = arg.find_first_of("{}", pos);
        if (open == string::npos) break;
        if (arg[open] == '}')
            throw invalid_request("unbalanced '}' in command argument: " + arg);
        size_t close = arg.find_first_of("{}", open + 1);
        if (close == string::npos || arg[close] == '{')
            throw invalid_request("unbalanced '{' in command argument: " + arg);
        f(arg.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
}

command_template command_template::parse(const string &command, const set<string> &slots) {
    command_template result;
    try {
        result.args = boost::program_options::split_unix(command);
    } catch (boost::escaped_list_error &e) {
        throw invalid_request("malformed command: " + string(e.what()));
    }
    result.args.erase(remove(result.args.begin(), result.args.end(), string()), result.args.end());
    if (result.args.empty())
        throw invalid_request("command is empty");
    for (auto &arg : result.args) {
        for_each_placeholder(arg, [&](const string &name) {
            if (!slots.count(name))
                throw invalid_request("unknown placeholder {" + name + "} in command: " + command);
        });
    }
    return result;
}

vector<string> command_template::substitute(const map<string, string> &values) const {
    vector<string> result;
    for (auto &arg : args) {
        string expanded;
        size_t pos = 0;
        while (pos < arg.size()) {
            size_t open = arg.find('{', pos);
            if (open == string::npos) break;
            size_t close = arg.find('}', open);
            string name = arg.substr(open + 1, close - open - 1);
            auto it = values.find(name);
            if (it == values.end())
                throw internal_error("no value for placeholder {" + name + "}");
            expanded += arg.substr(pos, open - pos);
            expanded += it->second;
            pos = close + 1;
        }
        expanded += arg.substr(min(pos, arg.size()));
        result.push_back(move(expanded));
    }
    return result;
}

const vector<string> &command_template::arguments() const {
    return args;
}

set<string> command_template::placeholders() const {
    set<string> result;
    for (auto &arg : args)
        for_each_placeholder(arg, [&](const string &name) { result.insert(name); });
    return result;
}

int64_t parse_limit(const json &j, const string &key, int64_t ceiling) {
    if (!exists(j, key))
        throw invalid_request(key + " is required");
    const json &value = j.at(key);
    if (!value.is_number_integer())
        throw invalid_request(key + " must be an integer");
    int64_t limit = value.get<int64_t>();
    if (limit <= 0)
        throw invalid_request(key + " must be positive");
    if (limit > ceiling)
        throw invalid_request(key + " exceeds the limit of this judge server " + to_string(ceiling));
    return limit;
}

static string parse_string(const json &j, const string &key) {
    if (!exists(j, key) || !j.at(key).is_string())
        throw invalid_request(key + " must be a string");
    return j.at(key).get<string>();
}

static string parse_seccomp_rule(const json &j) {
    if (!exists(j, "seccomp_rule")) return "";
    if (!j.at("seccomp_rule").is_string())
        throw invalid_request("seccomp_rule must be a string");
    string rule = j.at("seccomp_rule").get<string>();
    if (!is_known_syscall_profile(rule))
        throw invalid_request("unknown seccomp_rule " + rule);
    return rule;
}

/**
 * @brief 检查文件名是否安全，文件名中可以包含 {spj_version}
 */
static string parse_file_name(const json &j, const string &key) {
    string name = parse_string(j, key);
    assert_safe_path(expand_spj_version(name, "0"));
    return name;
}

compile_config compile_config::parse(const json &j) {
    if (!j.is_object())
        throw invalid_request("compile config must be an object");
    compile_config config;
    config.src_name = parse_file_name(j, "src_name");
    config.exe_name = parse_file_name(j, "exe_name");
    config.max_cpu_time = parse_limit(j, "max_cpu_time", MAX_COMPILE_CPU_TIME_CEILING);
    config.max_real_time = parse_limit(j, "max_real_time", MAX_COMPILE_REAL_TIME_CEILING);
    config.max_memory = parse_limit(j, "max_memory", MAX_COMPILE_MEMORY_CEILING);
    config.compile_command = command_template::parse(parse_string(j, "compile_command"), COMPILE_SLOTS);
    return config;
}

run_config run_config::parse(const json &j) {
    if (!j.is_object())
        throw invalid_request("run config must be an object");
    run_config config;
    config.command = command_template::parse(parse_string(j, "command"), RUN_SLOTS);
    config.seccomp_rule = parse_seccomp_rule(j);

    json env = access_optional(j, "env");
    if (!env.is_null()) {
        if (!env.is_array())
            throw invalid_request("env must be an array");
        for (auto &var : env) {
            if (!var.is_string() || var.get<string>().find('=') == string::npos)
                throw invalid_request("env must be a list of KEY=VALUE");
            config.env.push_back(var.get<string>());
        }
    }

    json check_only = access_optional(j, "memory_limit_check_only");
    if (check_only.is_boolean())
        config.memory_limit_check_only = check_only.get<bool>();
    else if (check_only.is_number_integer())
        config.memory_limit_check_only = check_only.get<int64_t>() != 0;
    else if (!check_only.is_null())
        throw invalid_request("memory_limit_check_only must be a boolean");

    if (exists(j, "exe_name"))
        config.exe_name = assert_safe_path(parse_string(j, "exe_name"));
    return config;
}

language_config language_config::parse(const json &j) {
    if (!j.is_object())
        throw invalid_request("language_config must be an object");
    language_config config;
    if (exists(j, "compile"))
        config.compile = compile_config::parse(j.at("compile"));
    if (!exists(j, "run"))
        throw invalid_request("language_config.run is required");
    config.run = run_config::parse(j.at("run"));
    return config;
}

spj_config spj_config::parse(const json &j) {
    if (!j.is_object())
        throw invalid_request("spj_config must be an object");
    spj_config config;
    config.exe_name = parse_file_name(j, "exe_name");
    config.command = command_template::parse(parse_string(j, "command"), SPJ_SLOTS);
    config.seccomp_rule = parse_seccomp_rule(j);
    return config;
}

string expand_spj_version(const string &name, const string &version) {
    return boost::algorithm::replace_all_copy(name, "{spj_version}", version);
}

}  // namespace judged
