#pragma once

// Internal header -- not part of the public API.

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace docdelta_cpp::detail {

inline constexpr auto logger_name = "docdelta";

/// The library logger, registered with spdlog as "docdelta".
///
/// Created on first use with a stderr sink at level warn unless the
/// application registered a logger under that name beforehand.
inline auto logger() -> const std::shared_ptr<spdlog::logger>& {
    static const auto instance = [] {
        if (auto existing = spdlog::get(logger_name)) return existing;
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

}  // namespace docdelta_cpp::detail
