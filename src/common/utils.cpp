#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (is_executable_file(name)) return fs::absolute(name);
        return nullopt;
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate))
            return fs::absolute(candidate);
    }
    return nullopt;
}

string trim(const string &s) {
    return boost::algorithm::trim_copy(s);
}

string truncate_chars(const string &s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // UTF-8 的后续字节形如 10xxxxxx，不算作新字符
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}

string to_lower(const string &s) {
    return boost::algorithm::to_lower_copy(s);
}

double round2(double x) {
    return std::round(x * 100.0) / 100.0;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return duration<chrono::duration<double, milli>>().count();
}

}  // namespace grader
