// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "log-setup.h"

#include "error_code.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <memory>
#include <unordered_map>
#include <string_view>
#include <vector>

namespace usicheck::utils {

static const char *log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%L/%t%$] {%n} %v";
static const std::string_view root_name = "default";
static const std::string_view file_prefix = "file:";

using sink_result_t = outcome::result<sink_t>;
using sink_map_t = std::unordered_map<std::string, sink_t>;
using sinks_t = std::vector<sink_t>;

static sink_result_t make_file_sink(std::string_view path) noexcept {
    try {
        return std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string(path));
    } catch (const spdlog::spdlog_ex &ex) {
        spdlog::error("cannot create file sink '{}': {}", path, ex.what());
        return make_error_code(error_code_t::sink_failure);
    }
}

/* "stdout", "stderr" or "file:<path>" */
static sink_result_t make_sink(std::string_view name) noexcept {
    if (name == "stdout") {
        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    if (name == "stderr") {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    auto is_file = name.size() > file_prefix.size() && name.substr(0, file_prefix.size()) == file_prefix;
    if (is_file) {
        return make_file_sink(name.substr(file_prefix.size()));
    }
    return make_error_code(error_code_t::unknown_sink);
}

/* every sink is created once, even if several loggers refer to it */
static outcome::result<sink_map_t> make_sinks(const config::log_configs_t &configs) noexcept {
    sink_map_t sinks;
    for (auto &cfg : configs) {
        for (auto &name : cfg.sinks) {
            if (sinks.count(name)) {
                continue;
            }
            auto sink = make_sink(name);
            if (!sink) {
                return sink.assume_error();
            }
            sinks.emplace(name, std::move(sink.assume_value()));
        }
    }
    return sinks;
}

static sinks_t pick_sinks(const sink_map_t &sinks, const config::log_config_t::sinks_t &names) {
    sinks_t r;
    r.reserve(names.size());
    for (auto &name : names) {
        r.push_back(sinks.at(name));
    }
    return r;
}

/* the root logger must write into the single dist sink made by create_root_logger() */
static spdlog::sinks::dist_sink_mt *get_root_sink(const logger_t &root) noexcept {
    auto &sinks = root->sinks();
    if (sinks.size() != 1) {
        return nullptr;
    }
    return dynamic_cast<spdlog::sinks::dist_sink_mt *>(sinks.front().get());
}

outcome::result<void> init_loggers(const config::log_configs_t &configs) noexcept {
    auto root = spdlog::default_logger();
    auto root_sink = get_root_sink(root);
    if (!root_sink) {
        return make_error_code(error_code_t::misconfigured_default_logger);
    }

    auto sinks = make_sinks(configs);
    if (!sinks) {
        return sinks.assume_error();
    }
    auto &sink_map = sinks.assume_value();

    auto root_level = spdlog::level::debug;
    auto root_cfg = std::find_if(configs.begin(), configs.end(), [](auto &cfg) { return cfg.name == root_name; });
    if (root_cfg != configs.end()) {
        for (auto &sink : pick_sinks(sink_map, root_cfg->sinks)) {
            root_sink->add_sink(sink);
        }
        root_level = root_cfg->level;
        root->set_level(root_level);
        if (root_level == spdlog::level::trace) {
            root->flush_on(spdlog::level::trace);
        }
    }

    spdlog::drop_all();
    spdlog::set_default_logger(root);

    for (auto &cfg : configs) {
        if (cfg.name == root_name) {
            continue;
        }
        if (spdlog::get(cfg.name)) {
            spdlog::warn("logger '{}' is configured more than once, ignoring", cfg.name);
            continue;
        }
        auto logger_sinks = pick_sinks(sink_map, cfg.sinks);
        if (logger_sinks.empty()) {
            logger_sinks = root->sinks();
        }
        auto logger = std::make_shared<spdlog::logger>(cfg.name, logger_sinks.begin(), logger_sinks.end());
        logger->set_level(std::max(cfg.level, root_level));
        spdlog::register_logger(logger);
    }

    spdlog::set_pattern(log_pattern);
    return outcome::success();
}

bootstrap_guard_t::bootstrap_guard_t(dist_sink_t dist_sink_, sink_t sink_)
    : dist_sink{std::move(dist_sink_)}, sink{std::move(sink_)} {}

bootstrap_guard_t::~bootstrap_guard_t() {
    if (sink) {
        sink->flush();
        dist_sink->remove_sink(sink);
    }
}

auto bootstrap_guard_t::get_dist_sink() -> dist_sink_t { return dist_sink; }

dist_sink_t create_root_logger() noexcept {
    auto dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("", dist_sink);
    logger->set_level(spdlog::level::trace);
    spdlog::drop_all();
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(log_pattern);
    spdlog::set_level(spdlog::level::trace);
    return dist_sink;
}

auto bootstrap(dist_sink_t &dist_sink) noexcept -> bootstrap_guard_ptr_t {
    auto sink = spdlog::sink_ptr(new spdlog::sinks::stderr_color_sink_mt());
    sink->set_level(spdlog::level::warn);
    dist_sink->add_sink(sink);
    spdlog::trace("bootstrap sink has been added");
    return std::make_unique<bootstrap_guard_t>(dist_sink, sink);
}

} // namespace usicheck::utils
