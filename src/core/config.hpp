#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ent::core::config {

// Load environment variables from a .env file (idempotent).
// Searches the working directory and its two parents, then extra_search_paths.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer environment variable; nullopt if missing or not a number.
std::optional<int> get_env_int(const std::string& key);

// ~/.ent/config.json
std::filesystem::path default_config_path();

} // namespace ent::core::config
