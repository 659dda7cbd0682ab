// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "error_code.h"

namespace usicheck::utils::detail {

const char *error_code_category::name() const noexcept { return "usicheck_error"; }

std::string error_code_category::message(int c) const {
    std::string r;
    switch (static_cast<error_code_t>(c)) {
    case error_code_t::success:
        r = "success";
        break;
    case error_code_t::invalid_length:
        r = "invalid length";
        break;
    case error_code_t::invalid_character:
        r = "invalid character in input";
        break;
    case error_code_t::check_character_mismatch:
        r = "check character mismatch";
        break;
    case error_code_t::cant_determine_config_dir:
        r = "config dir cannot be determined";
        break;
    case error_code_t::unknown_sink:
        r = "unknown sink";
        break;
    case error_code_t::sink_failure:
        r = "cannot create sink";
        break;
    case error_code_t::misconfigured_default_logger:
        r = "misconfigured default logger";
        break;
    default:
        r = "unknown";
    }
    r += " (";
    r += std::to_string(c) + ")";
    return r;
}

} // namespace usicheck::utils::detail

namespace usicheck::utils {

const static detail::error_code_category category;

const detail::error_code_category &error_code_category() { return category; }

} // namespace usicheck::utils
