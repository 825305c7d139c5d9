#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, else the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Login name of the current user (USER, else the passwd entry). Empty if unknown.
std::string current_user();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
