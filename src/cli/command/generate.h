// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include "../command.h"
#include <string>

namespace usicheck::cli::command {

struct generate_t final : command_t {
    static outcome::result<command_ptr_t> construct(std::string_view in, const config::check_config_t &config) noexcept;
    outcome::result<bool> execute(std::ostream &out) noexcept override;

    generate_t(std::string_view prefix_, const config::check_config_t &config_) noexcept;

  private:
    std::string prefix;
    config::check_config_t config;
};

} // namespace usicheck::cli::command
