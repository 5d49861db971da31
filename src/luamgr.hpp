#pragma once

#include "definitions.hpp"

#include <string>

namespace sol {
class state;
}

// Runs the data scripts and collects what they register.
class LuaManager {
  public:
    LuaManager();
    ~LuaManager();
    LuaManager(const LuaManager&) = delete;
    LuaManager& operator=(const LuaManager&) = delete;

    bool init();
    bool available() const;
    void clear();

    bool run_file(const std::string& path);
    bool run_string(const std::string& code, const std::string& chunk_name = "chunk");
    // Executes <root>/scripts/*.lua in name order. Returns false if the directory is missing.
    bool load_scripts(const std::string& root);

    const Definitions& defs() const { return defs_; }

    void add_weapon(const WeaponDef& d);
    void add_throwable(const ThrowableDef& d);
    void add_level(const LevelDef& d);

  private:
    bool register_api();
    void register_weapon_api();
    void register_level_api();

    sol::state* S{nullptr};
    Definitions defs_{};
};
