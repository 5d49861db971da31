#include "luamgr.hpp"

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <sol/sol.hpp>
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

LuaManager::LuaManager() {}

LuaManager::~LuaManager() {
    if (S) {
        delete S;
        S = nullptr;
    }
}

bool LuaManager::available() const { return S != nullptr; }

void LuaManager::clear() {
    defs_.weapons.clear();
    defs_.throwables.clear();
    defs_.levels.clear();
}

bool LuaManager::init() {
    if (S)
        return true;
    S = new sol::state();
    S->open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table);
    return register_api();
}

bool LuaManager::register_api() {
    register_weapon_api();
    register_level_api();
    return true;
}

bool LuaManager::run_file(const std::string& path) {
    if (!S && !init())
        return false;
    sol::protected_function_result r = S->safe_script_file(path, sol::script_pass_on_error);
    if (!r.valid()) {
        sol::error e = r;
        std::fprintf(stderr, "[lua] error in %s: %s\n", path.c_str(), e.what());
        return false;
    }
    return true;
}

bool LuaManager::run_string(const std::string& code, const std::string& chunk_name) {
    if (!S && !init())
        return false;
    sol::protected_function_result r = S->safe_script(code, sol::script_pass_on_error, chunk_name);
    if (!r.valid()) {
        sol::error e = r;
        std::fprintf(stderr, "[lua] error in %s: %s\n", chunk_name.c_str(), e.what());
        return false;
    }
    return true;
}

bool LuaManager::load_scripts(const std::string& root) {
    clear();
    std::error_code ec;
    fs::path sdir = fs::path(root) / "scripts";
    if (!fs::exists(sdir, ec) || !fs::is_directory(sdir, ec)) {
        std::fprintf(stderr, "[lua] no scripts directory at %s\n", sdir.string().c_str());
        return false;
    }
    std::vector<fs::path> files;
    for (auto const& f : fs::directory_iterator(sdir, ec)) {
        if (ec) {
            ec.clear();
            continue;
        }
        if (f.is_regular_file() && f.path().extension() == ".lua")
            files.push_back(f.path());
    }
    std::sort(files.begin(), files.end());
    for (auto const& p : files)
        run_file(p.string());
    std::printf("[lua] loaded: %zu weapons, %zu throwables, %zu levels\n", defs_.weapons.size(),
                defs_.throwables.size(), defs_.levels.size());
    return true;
}
