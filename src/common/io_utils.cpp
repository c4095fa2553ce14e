#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace codebench {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::out | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout << content;
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

vector<fs::path> list_visible_entries(const fs::path &dir) {
    vector<fs::path> entries;
    if (!fs::is_directory(dir))
        return entries;
    for (auto &entry : fs::directory_iterator(dir)) {
        string name = entry.path().filename().string();
        if (!name.empty() && name[0] != '.')
            entries.push_back(entry.path());
    }
    sort(entries.begin(), entries.end());
    return entries;
}

scoped_temp_directory::scoped_temp_directory() {
    valid = false;
}

scoped_temp_directory::scoped_temp_directory(const fs::path &parent, const string &prefix) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = parent / (prefix + uuid);
    fs::create_directories(dir);
    valid = true;
}

scoped_temp_directory::scoped_temp_directory(scoped_temp_directory &&other) : valid(false) {
    *this = move(other);
}

scoped_temp_directory::~scoped_temp_directory() {
    release();
}

scoped_temp_directory &scoped_temp_directory::operator=(scoped_temp_directory &&other) {
    swap(dir, other.dir);
    swap(valid, other.valid);
    return *this;
}

const fs::path &scoped_temp_directory::path() const {
    return dir;
}

void scoped_temp_directory::keep() {
    if (valid) LOG(INFO) << "Keeping temporary directory " << dir;
    valid = false;
}

void scoped_temp_directory::release() {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "Failed to remove temporary directory " << dir << ": " << ec.message();
}

}  // namespace codebench
