// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once
#include "check.h"
#include "log.h"
#include <filesystem>

namespace usicheck::config {

namespace bfs = std::filesystem;

struct main_t {
    bfs::path config_path;

    log_configs_t log_configs;
    check_config_t check_config;
};

} // namespace usicheck::config
