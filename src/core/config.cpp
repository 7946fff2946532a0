#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <utility>

namespace ent::core::config {

namespace {

std::vector<std::filesystem::path> dotenv_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return roots;
    }
    roots.push_back(cwd);
    if (cwd.has_parent_path() && cwd.parent_path() != cwd) {
        roots.push_back(cwd.parent_path());
        auto grandparent = cwd.parent_path().parent_path();
        if (!grandparent.empty() && grandparent != cwd.parent_path()) {
            roots.push_back(grandparent);
        }
    }
    return roots;
}

std::string trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// KEY=value, optionally prefixed with "export " and with the value quoted
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }
    if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (key.empty()) {
        return std::nullopt;
    }

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(key, value);
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static std::once_flag once;
    std::call_once(once, [&extra_search_paths]() {
        auto search_paths = dotenv_search_paths();
        search_paths.insert(search_paths.end(), extra_search_paths.begin(), extra_search_paths.end());

        for (const auto& dir : search_paths) {
            std::error_code ec;
            auto env_file = dir / ".env";
            if (!std::filesystem::is_regular_file(env_file, ec)) {
                continue;
            }

            std::ifstream in(env_file);
            std::string line;
            while (std::getline(in, line)) {
                auto entry = parse_dotenv_line(line);
                // Variables already in the environment win
                if (entry) {
                    setenv(entry->first.c_str(), entry->second.c_str(), 0);
                }
            }
            break;
        }
    });
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

std::optional<int> get_env_int(const std::string& key) {
    auto value = get_env(key);
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path default_config_path() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".") / ".ent" / "config.json";
}

} // namespace ent::core::config
