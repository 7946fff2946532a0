#include "agent/manager_config.hpp"
#include "core/config.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace ent::agent {

namespace {

std::string apply_model(AgentModel& target, const nlohmann::json& source, const std::string& key) {
    if (!source.contains(key)) {
        return "";
    }
    const auto& value = source[key];
    if (!value.is_string()) {
        return key + " must be a string";
    }
    auto model = agent_model_from_string(value.get<std::string>());
    if (!model) {
        return "unknown model for " + key + ": " + value.get<std::string>();
    }
    target = *model;
    return "";
}

} // namespace

std::optional<int> json_int(const nlohmann::json& value) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < kMin || v > kMax) {
            return std::nullopt;
        }
        return static_cast<int>(v);
    }
    return std::nullopt;
}

std::string ManagerConfig::validate() const {
    if (default_timeout_seconds <= 0) {
        return "default timeout must be positive";
    }
    if (max_concurrent_agents.has_value() && *max_concurrent_agents <= 0) {
        return "max concurrent agents must be positive";
    }
    return "";
}

std::string apply_config_json(ManagerConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return "config root must be an object";
    }
    if (!data.contains("agents")) {
        return "";
    }
    const auto& agents = data["agents"];
    if (!agents.is_object()) {
        return "agents must be an object";
    }

    if (agents.contains("defaultRole")) {
        if (!agents["defaultRole"].is_string()) {
            return "defaultRole must be a string";
        }
        auto role = agent_role_from_string(agents["defaultRole"].get<std::string>());
        if (!role) {
            return "unknown role for defaultRole: " + agents["defaultRole"].get<std::string>();
        }
        config.default_role = *role;
    }

    if (auto error = apply_model(config.default_model, agents, "defaultModel"); !error.empty()) {
        return error;
    }

    if (agents.contains("timeoutSeconds")) {
        auto timeout = json_int(agents["timeoutSeconds"]);
        if (!timeout) {
            return "timeoutSeconds must be an integer in int range";
        }
        config.default_timeout_seconds = *timeout;
    }

    if (agents.contains("maxConcurrent")) {
        auto value = json_int(agents["maxConcurrent"]);
        if (!value) {
            return "maxConcurrent must be an integer in int range";
        }
        if (*value == 0) {
            config.max_concurrent_agents.reset();
        } else {
            config.max_concurrent_agents = *value;
        }
    }

    if (agents.contains("modelTier")) {
        const auto& tier = agents["modelTier"];
        if (!tier.is_object()) {
            return "modelTier must be an object";
        }
        if (auto error = apply_model(config.model_tier.exploration, tier, "exploration"); !error.empty()) {
            return error;
        }
        if (auto error = apply_model(config.model_tier.complexity, tier, "complexity"); !error.empty()) {
            return error;
        }
        if (auto error = apply_model(config.model_tier.critical, tier, "critical"); !error.empty()) {
            return error;
        }
    }

    return "";
}

std::string apply_env_overrides(ManagerConfig& config) {
    auto role_name = core::config::get_env("ENT_DEFAULT_ROLE");
    if (!role_name.empty()) {
        auto role = agent_role_from_string(role_name);
        if (!role) {
            return "ENT_DEFAULT_ROLE: unknown role " + role_name;
        }
        config.default_role = *role;
    }

    auto model_name = core::config::get_env("ENT_DEFAULT_MODEL");
    if (!model_name.empty()) {
        auto model = agent_model_from_string(model_name);
        if (!model) {
            return "ENT_DEFAULT_MODEL: unknown model " + model_name;
        }
        config.default_model = *model;
    }

    if (!core::config::get_env("ENT_TIMEOUT_SECONDS").empty()) {
        auto timeout = core::config::get_env_int("ENT_TIMEOUT_SECONDS");
        if (!timeout) {
            return "ENT_TIMEOUT_SECONDS must be an integer";
        }
        config.default_timeout_seconds = *timeout;
    }

    if (!core::config::get_env("ENT_MAX_CONCURRENT").empty()) {
        auto max = core::config::get_env_int("ENT_MAX_CONCURRENT");
        if (!max) {
            return "ENT_MAX_CONCURRENT must be an integer";
        }
        if (*max == 0) {
            config.max_concurrent_agents.reset();
        } else {
            config.max_concurrent_agents = *max;
        }
    }

    return "";
}

ConfigLoadResult load_manager_config(const std::filesystem::path& explicit_path) {
    ConfigLoadResult result;

    std::filesystem::path path = explicit_path;
    if (path.empty()) {
        auto from_env = core::config::get_env("ENT_CONFIG");
        path = from_env.empty() ? core::config::default_config_path() : std::filesystem::path(from_env);
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open config file " + path.string();
            return result;
        }

        nlohmann::json data;
        try {
            data = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            result.error = "invalid config file " + path.string() + ": " + e.what();
            return result;
        }

        auto error = apply_config_json(result.config, data);
        if (!error.empty()) {
            result.error = path.string() + ": " + error;
            return result;
        }
        result.source = path.string();
        spdlog::debug("Loaded config from {}", path.string());
    } else if (!explicit_path.empty()) {
        result.error = "config file not found: " + explicit_path.string();
        return result;
    }

    auto env_error = apply_env_overrides(result.config);
    if (!env_error.empty()) {
        result.error = env_error;
        return result;
    }

    auto invalid = result.config.validate();
    if (!invalid.empty()) {
        result.error = invalid;
        return result;
    }

    result.success = true;
    return result;
}

} // namespace ent::agent
