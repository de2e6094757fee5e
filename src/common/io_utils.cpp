#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string());
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

/**
 * @brief 计算从 i 开始的 UTF-8 字符的字节数
 * @return 字节数，若不是合法的 UTF-8 字符返回 0
 */
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = s[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i + 1 < s.size() && ((unsigned char)s[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; ++j) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= s.size() || ((unsigned char)s[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.size();) {
        size_t len = utf8_sequence_length(string, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

string utf8_sanitize(const string &s) {
    if (utf8_check_is_valid(s)) return s;
    string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
            result += "\xEF\xBF\xBD";
            ++i;
        } else {
            result.append(s, i, len);
            i += len;
        }
    }
    return result;
}

scoped_temp_file::scoped_temp_file(const fs::path &dir, const string &suffix) : valid(true) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : dir;
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    file = base / ("grader-" + uuid + suffix);
}

scoped_temp_file::scoped_temp_file(scoped_temp_file &&other) : valid(false) {
    *this = move(other);
}

scoped_temp_file::~scoped_temp_file() {
    release();
}

scoped_temp_file &scoped_temp_file::operator=(scoped_temp_file &&other) {
    swap(valid, other.valid);
    swap(file, other.file);
    return *this;
}

const fs::path &scoped_temp_file::path() const {
    return file;
}

void scoped_temp_file::write(const string &content) const {
    ofstream fout(file, ios::out | ios::trunc | ios::binary);
    if (!fout)
        throw launch_error("unable to create temporary file " + file.string());
    fout << content;
    fout.close();
    if (!fout)
        throw launch_error("unable to write temporary file " + file.string());
}

void scoped_temp_file::release() {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove(file, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove temporary file " << file << ": " << ec.message();
}

}  // namespace grader
