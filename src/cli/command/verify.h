// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include "../command.h"
#include <string>

namespace usicheck::cli::command {

struct verify_t final : command_t {
    static outcome::result<command_ptr_t> construct(std::string_view in) noexcept;
    outcome::result<bool> execute(std::ostream &out) noexcept override;

    verify_t(std::string_view key_) noexcept;

  private:
    std::string key;
};

} // namespace usicheck::cli::command
