#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Short host name of this machine, "localhost" if it cannot be read.
std::string host_name();

// Process id as a string, used in claim tokens.
std::string process_id();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
