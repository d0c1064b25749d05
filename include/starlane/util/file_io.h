#pragma once

#include <string>

namespace starlane {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
// Goes through a temporary sibling file + rename so a crash never leaves a
// truncated export behind.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace starlane
