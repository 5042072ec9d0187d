#include "judge/test_case.hpp"
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace judged {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static uint64_t parse_ordinal(const string &key) {
    try {
        return boost::lexical_cast<uint64_t>(key);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_request("test case id must be a number: " + key);
    }
}

static string read_test_case_file(const fs::path &dir, const json &file_name) {
    if (!file_name.is_string())
        throw invalid_request("malformed test case info in " + dir.string());
    fs::path path = dir / assert_safe_path(file_name.get<string>());
    if (!fs::is_regular_file(path))
        throw invalid_request("test case file does not exist: " + path.string());
    return read_file_content(path);
}

vector<test_case> load_test_cases(const fs::path &dir, bool require_output) {
    fs::path info_path = dir / "info";
    if (!fs::is_regular_file(info_path))
        throw invalid_request("test case does not exist: " + dir.filename().string());

    json info;
    try {
        info = json::parse(read_file_content(info_path));
    } catch (json::parse_error &e) {
        throw invalid_request("malformed test case info: " + string(e.what()));
    }
    if (!info.is_object() || !exists(info, "test_cases") || !info.at("test_cases").is_object())
        throw invalid_request("malformed test case info in " + dir.string());

    vector<pair<uint64_t, string>> keys;
    const json &cases = info.at("test_cases");
    for (auto it = cases.begin(); it != cases.end(); ++it)
        keys.emplace_back(parse_ordinal(it.key()), it.key());
    sort(keys.begin(), keys.end());

    vector<test_case> result;
    for (auto &[ordinal, key] : keys) {
        const json &item = cases.at(key);
        if (!item.is_object() || !exists(item, "input_name"))
            throw invalid_request("malformed test case " + key + " in " + dir.string());
        test_case tc;
        tc.id = key;
        tc.input = read_test_case_file(dir, item.at("input_name"));
        if (exists(item, "output_name"))
            tc.output = read_test_case_file(dir, item.at("output_name"));
        else if (require_output)
            throw invalid_request("test case " + key + " has no output");
        result.push_back(move(tc));
    }
    if (result.empty())
        throw invalid_request("test case set is empty");
    return result;
}

vector<test_case> parse_test_cases(const json &j, bool require_output) {
    if (!j.is_array() || j.empty())
        throw invalid_request("test_case must be a non-empty array");
    vector<test_case> result;
    for (size_t i = 0; i < j.size(); ++i) {
        const json &item = j[i];
        if (!item.is_object() || !exists(item, "input") || !item.at("input").is_string())
            throw invalid_request("test case " + to_string(i + 1) + " has no input");
        test_case tc;
        tc.id = to_string(i + 1);
        tc.input = item.at("input").get<string>();
        if (exists(item, "output")) {
            if (!item.at("output").is_string())
                throw invalid_request("test case " + to_string(i + 1) + " output must be a string");
            tc.output = item.at("output").get<string>();
        } else if (require_output) {
            throw invalid_request("test case " + to_string(i + 1) + " has no output");
        }
        result.push_back(move(tc));
    }
    return result;
}

}  // namespace judged
