#include "runtime_settings.hpp"

#include "ini.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

static bool parse_float(const std::string& s, float& out) {
    if (s.empty())
        return false;
    char* end = nullptr;
    float v = std::strtof(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        return false;
    out = v;
    return true;
}

bool load_runtime_settings_from_ini(const std::string& path, RuntimeSettings& out) {
    RuntimeSettings r = out;
    bool ok = read_ini(path, [&](const std::string& key, const std::string& value, int line) {
        std::string val = value;
        float fv = 0.0f;
        if (key == "difficulty") {
            std::transform(val.begin(), val.end(), val.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (val == "aggressive")
                r.ai_behavior = AiBehavior::Aggressive;
            else if (val == "normal" || val == "tactical")
                r.ai_behavior = AiBehavior::Tactical;
            else
                std::fprintf(stderr, "[config] %s:%d: unknown difficulty '%s'\n", path.c_str(), line, val.c_str());
        } else if (key == "reaction_delay" && parse_float(val, fv)) {
            r.reaction_delay = std::max(0.0f, fv);
        } else if (key == "max_frame_dt" && parse_float(val, fv) && fv > 0.0f) {
            r.max_frame_dt = fv;
        } else if (key == "net_update_interval" && parse_float(val, fv) && fv > 0.0f) {
            r.net_update_interval = fv;
        } else if (key == "seed" && !val.empty()) {
            char* end = nullptr;
            unsigned long s = std::strtoul(val.c_str(), &end, 10);
            if (end != val.c_str() && *end == '\0')
                r.seed = static_cast<std::uint32_t>(s);
        } else if (key == "local_id" && !val.empty()) {
            r.local_id = val;
        }
    });
    if (ok)
        out = r;
    return ok;
}
