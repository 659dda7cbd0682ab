// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "utils.h"

#include <cerrno>
#include <spdlog/spdlog.h>
#include "utils/log.h"
#include "utils/location.h"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.h>

#define SAFE_GET_VALUE(property, type, table_name)                                                                     \
    {                                                                                                                  \
        auto option = t[#property].value<type>();                                                                      \
        if (!option) {                                                                                                 \
            spdlog::warn("using default value for {}/{}", table_name, #property);                                      \
            c.property = c_default.property;                                                                           \
        } else {                                                                                                       \
            c.property = option.value();                                                                               \
        }                                                                                                              \
    }

namespace usicheck::config {

using level_t = spdlog::level::level_enum;

main_t generate_config(const bfs::path &config_path) {
    // clang-format off
    main_t cfg;
    cfg.config_path = config_path;
    cfg.log_configs = {
        log_config_t {
            "default", level_t::info, {"stderr"}
        },
    };
    cfg.check_config = check_config_t {
        true,       /* normalize_prefix */
        true,       /* print_full */
    };
    // clang-format on
    return cfg;
}

static const auto default_level = level_t::debug;

/* "file:~/some.log" is relative to the user home */
static std::string expand_sink(const std::string &sink, const utils::home_option_t &home) noexcept {
    static const std::string_view file_prefix = "file:";
    if (sink.compare(0, file_prefix.size(), file_prefix) != 0) {
        return sink;
    }
    auto path = utils::expand_home(sink.substr(file_prefix.size()), home);
    return std::string(file_prefix) + path;
}

static log_configs_t get_log_configs(toml::array &logs) noexcept {
    auto home = utils::get_home_dir();
    log_configs_t r;
    for (auto &node : logs) {
        auto t = node.as_table();
        if (!t) {
            spdlog::warn("log entry is not a table, ignored");
            continue;
        }
        auto name = (*t)["name"].value<std::string>();
        if (!name) {
            spdlog::warn("log entry without name, ignored");
            continue;
        }

        auto level = default_level;
        auto level_str = (*t)["level"].value<std::string>();
        if (!level_str) {
            spdlog::warn("using default value for log/{}/level", name.value());
        } else if (auto level_opt = utils::get_log_level(level_str.value()); level_opt) {
            level = level_opt.value();
        } else {
            spdlog::warn("unknown log level '{}' for {}, using {}", level_str.value(), name.value(),
                         utils::get_level_string(default_level));
        }

        auto sinks = log_config_t::sinks_t{};
        if (auto sinks_arr = (*t)["sinks"].as_array()) {
            for (auto &sink : *sinks_arr) {
                auto sink_name = sink.value<std::string>();
                if (sink_name) {
                    sinks.emplace_back(expand_sink(sink_name.value(), home));
                }
            }
        }
        r.emplace_back(log_config_t{name.value(), level, std::move(sinks)});
    }
    return r;
}

config_result_t get_config(std::istream &config, const bfs::path &config_path) {
    auto r = toml::parse(config);
    if (!r) {
        return std::string(r.error().description());
    }

    auto default_config = generate_config(config_path);
    main_t cfg;
    cfg.config_path = config_path;

    auto &root_tbl = r.table();
    // log
    {
        auto logs = root_tbl["log"].as_array();
        if (!logs) {
            spdlog::warn("using default value for log");
            cfg.log_configs = default_config.log_configs;
        } else {
            cfg.log_configs = get_log_configs(*logs);
        }
    }

    // check
    {
        auto t = root_tbl["check"];
        auto &c = cfg.check_config;
        auto &c_default = default_config.check_config;

        SAFE_GET_VALUE(normalize_prefix, bool, "check");
        SAFE_GET_VALUE(print_full, bool, "check");
    }

    return cfg;
}

outcome::result<void> serialize(const main_t &cfg, std::ostream &out) noexcept {
    auto logs = toml::array{};
    for (auto &c : cfg.log_configs) {
        auto sinks = toml::array{};
        for (auto &sink : c.sinks) {
            sinks.emplace_back<std::string>(sink);
        }
        auto log_table = toml::table{{
            {"name", c.name},
            {"level", utils::get_level_string(c.level)},
            {"sinks", sinks},
        }};
        logs.push_back(log_table);
    }

    // clang-format off
    auto tbl = toml::table{{
        {"log", logs},
        {"check", toml::table{{
                      {"normalize_prefix", cfg.check_config.normalize_prefix},
                      {"print_full", cfg.check_config.print_full},
                  }}},
    }};
    // clang-format on
    out << tbl;
    if (!out) {
        return boost::system::error_code{EIO, boost::system::generic_category()};
    }
    return outcome::success();
}

} // namespace usicheck::config
