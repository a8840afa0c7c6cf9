#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace owl {
namespace util {

/// Compact serialisation that never throws on malformed UTF-8 in string
/// values; offending bytes come out as U+FFFD.
inline std::string dump_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace util
} // namespace owl
