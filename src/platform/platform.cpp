#include "platform.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string current_user() {
    const char* user = std::getenv("USER");
    if (user && *user) return user;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) return pw->pw_name;
    return "";
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
