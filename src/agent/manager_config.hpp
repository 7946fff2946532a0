#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/types.hpp"

namespace ent::agent {

// Model chosen per task class when the caller does not pick one
struct ModelTierConfig {
    AgentModel exploration = AgentModel::HAIKU;
    AgentModel complexity = AgentModel::SONNET;
    AgentModel critical = AgentModel::OPUS;
};

struct ManagerConfig {
    AgentRole default_role = AgentRole::DEVELOPER;
    AgentModel default_model = AgentModel::HAIKU;
    int default_timeout_seconds = 300;
    std::optional<int> max_concurrent_agents = 5;  // nullopt = no cap
    ModelTierConfig model_tier;

    // Empty string when valid, otherwise the first problem found
    std::string validate() const;
};

struct ConfigLoadResult {
    bool success = false;
    std::string error;
    std::string source;  // file that was applied, empty if defaults only
    ManagerConfig config;
};

// Integer JSON value that fits in an int; nullopt for anything else,
// including integers outside int's range.
std::optional<int> json_int(const nlohmann::json& value);

// Apply the "agents" section of a config document. Returns an error message
// for the first invalid value, empty on success.
std::string apply_config_json(ManagerConfig& config, const nlohmann::json& data);

// Apply ENT_DEFAULT_ROLE, ENT_DEFAULT_MODEL, ENT_TIMEOUT_SECONDS and
// ENT_MAX_CONCURRENT on top of `config`.
std::string apply_env_overrides(ManagerConfig& config);

// Defaults, then the JSON file (explicit path, $ENT_CONFIG, ~/.ent/config.json),
// then environment overrides, then validate().
ConfigLoadResult load_manager_config(const std::filesystem::path& explicit_path = {});

} // namespace ent::agent
