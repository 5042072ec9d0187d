#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/system.hpp"
#include "config.hpp"

namespace judged {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_content(const fs::path &path, size_t limit) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == "." || subpath == ".." ||
        subpath.find('/') != string::npos || subpath.find('\0') != string::npos)
        throw invalid_request("path is not safe: " + subpath);
    return subpath;
}

fs::path make_unique_directory(const fs::path &parent) {
    static thread_local boost::uuids::random_generator generator;
    fs::path dir = parent / boost::uuids::to_string(generator());
    if (!fs::create_directories(dir))
        throw internal_error("directory already exists: " + dir.string());
    return dir;
}

void change_owner(const fs::path &path, const string &user, const string &group) {
    int uid = get_userid(user.c_str());
    int gid = get_groupid(group.c_str());
    if (uid < 0 || gid < 0)
        throw internal_error("unknown run user or group " + user + ":" + group);
    if (chown(path.c_str(), uid, gid) != 0)
        throw system_error(errno, system_category(), "unable to chown " + path.string());
}

fs::path make_owned_directory(const fs::path &path, const string &user, const string &group) {
    if (!fs::create_directory(path))
        throw internal_error("directory already exists: " + path.string());
    change_owner(path, user, group);
    return path;
}

void seal_directory(const fs::path &dir) {
    uid_t uid = geteuid();
    gid_t gid = getegid();
    auto seal = [&](const fs::path &path) {
        if (lchown(path.c_str(), uid, gid) != 0)
            throw system_error(errno, system_category(), "unable to chown " + path.string());
        // 符号链接没有自己的权限位
        if (fs::is_symlink(fs::symlink_status(path))) return;
        fs::permissions(path, fs::perms::group_write | fs::perms::others_write | fs::perms::set_uid | fs::perms::set_gid,
                        fs::perm_options::remove);
    };
    seal(dir);
    for (auto &entry : fs::recursive_directory_iterator(dir))
        seal(entry.path());
}

void remove_directory(const fs::path &dir) noexcept {
    if (DEBUG) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove " << dir << ": " << ec.message();
}

void clear_directory(const fs::path &dir) {
    for (auto &entry : fs::directory_iterator(dir))
        fs::remove_all(entry.path());
}

}  // namespace judged
