// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <boost/system/error_code.hpp>

namespace usicheck::cli {

enum class error_code_t {
    success = 0,
    command_is_missing,
    unknown_command,
    argument_is_missing,
};

namespace detail {

class error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};
} // namespace detail

const detail::error_code_category &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

} // namespace usicheck::cli

namespace boost {
namespace system {

template <> struct is_error_code_enum<usicheck::cli::error_code_t> : std::true_type {
    static const bool value = true;
};
} // namespace system
} // namespace boost
