// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "error_code.h"

namespace usicheck::cli::detail {

const char *error_code_category::name() const noexcept { return "usicheck_cli_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::command_is_missing:
        r = "command is missing";
        break;
    case error_code_t::unknown_command:
        r = "unknown command";
        break;
    case error_code_t::argument_is_missing:
        r = "command argument is missing";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
};

} // namespace usicheck::cli::detail

namespace usicheck::cli {

const static detail::error_code_category category;

const detail::error_code_category &error_code_category() { return category; }

} // namespace usicheck::cli
