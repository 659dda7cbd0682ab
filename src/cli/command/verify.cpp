// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "verify.h"
#include "../error_code.h"
#include "model/usi.h"
#include "utils/error_code.h"

namespace usicheck::cli::command {

verify_t::verify_t(std::string_view key_) noexcept : key{key_} { log = utils::get_logger("usicheck.cli.verify"); }

outcome::result<command_ptr_t> verify_t::construct(std::string_view in) noexcept {
    if (in.empty()) {
        return make_error_code(error_code_t::argument_is_missing);
    }
    return std::make_unique<command::verify_t>(in);
}

outcome::result<bool> verify_t::execute(std::ostream &out) noexcept {
    using usi_t = model::usi_t;
    auto r = usi_t::verify(key);
    if (!r) {
        auto &ec = r.assume_error();
        if (ec == utils::error_code_t::invalid_length) {
            LOG_ERROR(log, "key '{}' is rejected, its length must be {} characters", key, usi_t::USI_SIZE);
        } else {
            LOG_ERROR(log, "key '{}' is rejected: {}", key, ec.message());
        }
        return ec;
    }

    auto valid = r.assume_value();
    auto normalized = usi_t::normalize(key);
    LOG_DEBUG(log, "key '{}' (normalized: '{}'), valid: {}", key, normalized, valid);
    out << normalized << (valid ? " is valid" : " is invalid") << "\n";
    return valid;
}

} // namespace usicheck::cli::command
