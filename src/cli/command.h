// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <memory>
#include <ostream>
#include <string_view>
#include <boost/outcome.hpp>
#include "config/check.h"
#include "utils/log.h"

namespace usicheck::cli {

namespace outcome = boost::outcome_v2;

struct command_t;
using command_ptr_t = std::unique_ptr<command_t>;

struct command_t {
    virtual ~command_t() = default;

    /* true means affirmative result, i.e. the key is valid or the check
     * character has been generated */
    virtual outcome::result<bool> execute(std::ostream &out) noexcept = 0;

    static outcome::result<command_ptr_t> parse(std::string_view name, std::string_view argument,
                                                const config::check_config_t &config) noexcept;
    utils::logger_t log;
};

} // namespace usicheck::cli
