// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <string>
#include <boost/outcome.hpp>
#include <filesystem>
#include "usicheck-export.h"

namespace usicheck {
namespace utils {

namespace outcome = boost::outcome_v2;
namespace bfs = std::filesystem;

using home_option_t = outcome::result<bfs::path>;

USICHECK_API outcome::result<bfs::path> get_home_dir() noexcept;

USICHECK_API outcome::result<bfs::path> get_default_config_dir() noexcept;

USICHECK_API std::string expand_home(const std::string &path, const home_option_t &home) noexcept;

} // namespace utils
} // namespace usicheck
