#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

// Temporary directory (honours TMPDIR)
inline std::string get_temp_dir() {
    const char* tmp = std::getenv("TMPDIR");
    if (tmp) return std::string(tmp);
    return "/tmp";
}

inline std::string join_path(const std::string& a, const std::string& b) {
    return a + "/" + b;
}

// Unique per process so parallel ctest runs do not collide
inline std::string make_test_dir(const std::string& name) {
    return join_path(get_temp_dir(), "xload_" + name + "_" + std::to_string(::getpid()));
}

inline bool remove_directory(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return !ec;
}

inline bool create_directory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
}

#endif // TEST_UTILS_H_
