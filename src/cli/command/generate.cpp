// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "generate.h"
#include "../error_code.h"
#include "model/usi.h"
#include "utils/error_code.h"

namespace usicheck::cli::command {

generate_t::generate_t(std::string_view prefix_, const config::check_config_t &config_) noexcept
    : prefix{prefix_}, config{config_} {
    log = utils::get_logger("usicheck.cli.generate");
}

outcome::result<command_ptr_t> generate_t::construct(std::string_view in,
                                                     const config::check_config_t &config) noexcept {
    if (in.empty()) {
        return make_error_code(error_code_t::argument_is_missing);
    }
    return std::make_unique<command::generate_t>(in, config);
}

outcome::result<bool> generate_t::execute(std::ostream &out) noexcept {
    using usi_t = model::usi_t;
    auto input = config.normalize_prefix ? usi_t::normalize(prefix) : prefix;
    auto r = usi_t::generate_check_character(input);
    if (!r) {
        auto &ec = r.assume_error();
        if (ec == utils::error_code_t::invalid_length) {
            LOG_ERROR(log, "prefix '{}' is rejected, its length must be {} characters", prefix, usi_t::PREFIX_SIZE);
        } else {
            LOG_ERROR(log, "prefix '{}' is rejected: {}", prefix, ec.message());
        }
        return ec;
    }

    auto check = r.assume_value();
    LOG_DEBUG(log, "check character for '{}' is '{}'", input, check);
    if (config.print_full) {
        out << input << check << "\n";
    } else {
        out << check << "\n";
    }
    return true;
}

} // namespace usicheck::cli::command
