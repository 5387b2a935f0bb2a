#include "platform.hpp"
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string host_name() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    std::string name(buf);
    auto dot = name.find('.');
    if (dot != std::string::npos) name.erase(dot);
    return name;
}

std::string process_id() {
    return std::to_string(static_cast<long>(getpid()));
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
