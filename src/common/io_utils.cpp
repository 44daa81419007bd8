#include "common/io_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace codegrade {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout << content;
    if (!fout.flush())
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath[0] == '/' || subpath == ".." ||
        subpath.find("../") != string::npos || subpath.find("/..") != string::npos)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace codegrade
