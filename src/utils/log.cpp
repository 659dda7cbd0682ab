// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "log.h"
#include <algorithm>
#include <iterator>
#include <string>

namespace usicheck::utils {

namespace {

struct level_name_t {
    spdlog::level::level_enum level;
    std::string_view name;
};

// the names accepted in config files and on the command line
const level_name_t level_names[] = {
    {spdlog::level::trace, "trace"}, {spdlog::level::debug, "debug"}, {spdlog::level::info, "info"},
    {spdlog::level::warn, "warn"},   {spdlog::level::err, "error"},   {spdlog::level::critical, "crit"},
    {spdlog::level::off, "off"},
};

/* walks "a.b.c" -> "a.b" -> "a" and stops at the first registered logger;
 * the root logger is the last resort */
logger_t find_parent(std::string_view name) noexcept {
    while (true) {
        auto dot = name.rfind('.');
        if (dot == name.npos) {
            return spdlog::default_logger();
        }
        name = name.substr(0, dot);
        if (auto logger = spdlog::get(std::string(name))) {
            return logger;
        }
    }
}

} // namespace

level_opt_t get_log_level(std::string_view name) noexcept {
    auto it = std::find_if(std::begin(level_names), std::end(level_names),
                           [&](const level_name_t &entry) { return entry.name == name; });
    if (it == std::end(level_names)) {
        return {};
    }
    return it->level;
}

std::string_view get_level_string(spdlog::level::level_enum level) noexcept {
    auto it = std::find_if(std::begin(level_names), std::end(level_names),
                           [&](const level_name_t &entry) { return entry.level == level; });
    return it != std::end(level_names) ? it->name : std::string_view("off");
}

logger_t get_logger(std::string_view name) noexcept {
    if (auto existing = spdlog::get(std::string(name))) {
        return existing;
    }

    auto parent = find_parent(name);
    auto &parent_sinks = parent->sinks();
    auto logger = std::make_shared<spdlog::logger>(std::string(name), parent_sinks.begin(), parent_sinks.end());
    logger->set_level(parent->level());
    logger->flush_on(parent->flush_level());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace usicheck::utils
