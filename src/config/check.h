// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

namespace usicheck::config {

struct check_config_t {
    bool normalize_prefix;
    bool print_full;
};

} // namespace usicheck::config
