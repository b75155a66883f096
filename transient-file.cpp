#include "transient-file.h"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>

TransientFile::TransientFile(const std::string& directory, const std::string& suffix) {
    std::string dir = directory.empty() ? default_directory() : directory;
    std::string tmpl = dir + "/speech-XXXXXX" + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        std::cout << "❌ Failed to create transient file in " << dir << ": " << strerror(errno) << std::endl;
        return;
    }
    ::close(fd);
    path_ = buf.data();
}

TransientFile::~TransientFile() {
    if (path_.empty()) return;
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        std::cout << "⚠️ Failed to remove transient file " << path_ << ": " << strerror(errno) << std::endl;
    }
}

bool TransientFile::write_all(const std::vector<uint8_t>& data) {
    if (path_.empty()) return false;
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

bool TransientFile::read_all(std::vector<uint8_t>& data) const {
    if (path_.empty()) return false;
    std::ifstream in(path_, std::ios::binary | std::ios::ate);
    if (!in) return false;
    std::streamsize size = in.tellg();
    if (size < 0) return false;
    data.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), size)) {
        data.clear();
        return false;
    }
    return true;
}

std::string TransientFile::default_directory() {
    const char* tmp = std::getenv("TMPDIR");
    if (tmp && *tmp) return tmp;
    return "/tmp";
}
