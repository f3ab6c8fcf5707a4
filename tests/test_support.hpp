// Scratch directories and fake tool scripts for the toolchain tests.

#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "process_runner.hpp"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <sys/stat.h>

inline std::string make_temp_dir() {
    char pattern[] = "/tmp/ota_packer_test_XXXXXX";
    char* dir = mkdtemp(pattern);
    assert(dir != nullptr);
    return dir;
}

inline void remove_tree(const std::string& dir) {
    ProcessRunner runner;
    ProcessResult r = runner.run({"rm", "-rf", dir});
    (void)r;
}

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    assert(out.is_open());
    out << text;
}

inline void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    assert(out.is_open());
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<uint8_t> read_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    assert(in.is_open());
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_script(const std::string& path, const std::string& body) {
    write_text(path, "#!/bin/sh\n" + body);
    int rc = chmod(path.c_str(), 0755);
    (void)rc;
    assert(rc == 0);
}

inline bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

#endif // TEST_SUPPORT_HPP
