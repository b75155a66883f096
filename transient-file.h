#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Uniquely named scratch file that is removed when the object goes out of scope,
// on every exit path. Used for synthesis output and uploaded voice samples.
class TransientFile {
public:
    explicit TransientFile(const std::string& directory = "", const std::string& suffix = ".wav");
    ~TransientFile();

    TransientFile(const TransientFile&) = delete;
    TransientFile& operator=(const TransientFile&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

    bool write_all(const std::vector<uint8_t>& data);
    bool read_all(std::vector<uint8_t>& data) const;

    static std::string default_directory();

private:
    std::string path_;
};
