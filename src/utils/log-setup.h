// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include "log.h"
#include "config/log.h"
#include <boost/outcome.hpp>
#include <spdlog/sinks/dist_sink.h>
#include "usicheck-export.h"

namespace usicheck::utils {

namespace outcome = boost::outcome_v2;

using dist_sink_t = std::shared_ptr<spdlog::sinks::dist_sink_mt>;
using sink_t = spdlog::sink_ptr;

/* keeps the bootstrap sink attached to the root logger until destroyed */
struct USICHECK_API bootstrap_guard_t {
    bootstrap_guard_t(dist_sink_t dist_sink, sink_t sink);
    ~bootstrap_guard_t();
    dist_sink_t get_dist_sink();

  private:
    dist_sink_t dist_sink;
    sink_t sink;
};
using bootstrap_guard_ptr_t = std::unique_ptr<bootstrap_guard_t>;

USICHECK_API outcome::result<void> init_loggers(const config::log_configs_t &configs) noexcept;

USICHECK_API dist_sink_t create_root_logger() noexcept;
USICHECK_API bootstrap_guard_ptr_t bootstrap(dist_sink_t &) noexcept;

} // namespace usicheck::utils
