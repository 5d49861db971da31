#pragma once

#include "input_system.hpp"

#include <string>

// Loads a simple key=value .ini for input bindings. Lines starting with # are comments.
// Unknown keys and key names are skipped; `out` keeps its defaults for those.
bool load_input_bindings_from_ini(const std::string& path, InputBindings& out);
