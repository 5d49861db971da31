#pragma once

#include <functional>
#include <string>

// Reads `key = value` lines; `#` starts a comment, blank and malformed lines are skipped.
// Keys and values arrive trimmed. Returns false if the file cannot be opened.
bool read_ini(const std::string& path,
              const std::function<void(const std::string& key, const std::string& value, int line)>& fn);
