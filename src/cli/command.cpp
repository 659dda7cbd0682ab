// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "command.h"
#include "error_code.h"
#include "command/verify.h"
#include "command/generate.h"

namespace usicheck::cli {

outcome::result<command_ptr_t> command_t::parse(std::string_view name, std::string_view argument,
                                                const config::check_config_t &config) noexcept {
    if (name.empty()) {
        return make_error_code(error_code_t::command_is_missing);
    }
    if (name == "verify") {
        return command::verify_t::construct(argument);
    } else if (name == "generate") {
        return command::generate_t::construct(argument, config);
    }
    return make_error_code(error_code_t::unknown_command);
}

} // namespace usicheck::cli
