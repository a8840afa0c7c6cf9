#pragma once

#include "types.hpp"
#include <cstdlib>
#include <string>

namespace owl {

namespace detail {

inline std::optional<std::string> read_env(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

inline Expected<long> parse_positive(const char* name, const std::string& raw) {
    char* end = nullptr;
    const long value = std::strtol(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || value <= 0) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string(name) + " must be a positive integer",
            raw
        });
    }
    return value;
}

} // namespace detail

/**
 * @brief Build a Config from environment variables.
 *
 * Recognised variables: OLLAMA_API_URL, OLLAMA_MODEL, GOOGLE_API_KEY,
 * GOOGLE_CSE_ID, OWL_HISTORY_DB, OWL_CONNECT_TIMEOUT_MS,
 * OWL_GENERATION_TIMEOUT_MS, OWL_MAX_TOOL_ITERATIONS, OWL_LOG_LEVEL.
 * Unset variables keep the Config defaults. The result is validated.
 */
inline Expected<Config> load_config_from_environment(Config base = {}) {
    using detail::read_env;

    if (auto v = read_env("OLLAMA_API_URL")) base.backend_url = *v;
    if (auto v = read_env("OLLAMA_MODEL")) base.model = *v;
    if (auto v = read_env("GOOGLE_API_KEY")) base.google_api_key = *v;
    if (auto v = read_env("GOOGLE_CSE_ID")) base.google_cse_id = *v;
    if (auto v = read_env("OWL_HISTORY_DB")) base.history_db_path = *v;
    if (auto v = read_env("OWL_LOG_LEVEL")) base.log_level = *v;

    if (auto v = read_env("OWL_CONNECT_TIMEOUT_MS")) {
        auto ms = detail::parse_positive("OWL_CONNECT_TIMEOUT_MS", *v);
        if (!ms) return tl::unexpected(ms.error());
        base.connect_timeout = std::chrono::milliseconds(*ms);
    }
    if (auto v = read_env("OWL_GENERATION_TIMEOUT_MS")) {
        auto ms = detail::parse_positive("OWL_GENERATION_TIMEOUT_MS", *v);
        if (!ms) return tl::unexpected(ms.error());
        base.generation_timeout = std::chrono::milliseconds(*ms);
    }
    if (auto v = read_env("OWL_MAX_TOOL_ITERATIONS")) {
        auto n = detail::parse_positive("OWL_MAX_TOOL_ITERATIONS", *v);
        if (!n) return tl::unexpected(n.error());
        base.max_tool_iterations = static_cast<int>(*n);
    }

    if (auto result = base.validate(); !result) {
        return tl::unexpected(result.error());
    }
    return base;
}

} // namespace owl
