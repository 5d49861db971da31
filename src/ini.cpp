#include "ini.hpp"

#include <cctype>
#include <fstream>

static std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a])))
        ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
        --b;
    return s.substr(a, b - a);
}

bool read_ini(const std::string& path,
              const std::function<void(const std::string& key, const std::string& value, int line)>& fn) {
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string line;
    int n = 0;
    while (std::getline(f, line)) {
        ++n;
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        if (!key.empty())
            fn(key, trim(line.substr(eq + 1)), n);
    }
    return true;
}
