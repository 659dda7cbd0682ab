// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <boost/outcome.hpp>
#include "main.h"
#include "usicheck-export.h"

namespace usicheck::config {

namespace outcome = boost::outcome_v2;

using config_result_t = outcome::outcome<main_t, std::string>;

USICHECK_API config_result_t get_config(std::istream &config, const bfs::path &config_path);

USICHECK_API main_t generate_config(const bfs::path &config_path);

USICHECK_API outcome::result<void> serialize(const main_t &cfg, std::ostream &out) noexcept;

} // namespace usicheck::config
