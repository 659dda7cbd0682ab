// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once
#include <string>
#include <system_error>
#include <boost/system/error_code.hpp>
#include "usicheck-export.h"

namespace usicheck::utils {

enum class error_code_t {
    success = 0,
    invalid_length,
    invalid_character,
    check_character_mismatch,
    cant_determine_config_dir,
    unknown_sink,
    sink_failure,
    misconfigured_default_logger,
};

namespace detail {

class error_code_category : public boost::system::error_category {
    virtual const char *name() const noexcept override;
    virtual std::string message(int c) const override;
};

} // namespace detail

USICHECK_API const detail::error_code_category &error_code_category();

inline boost::system::error_code make_error_code(error_code_t e) {
    return {static_cast<int>(e), error_code_category()};
}

} // namespace usicheck::utils

namespace boost {
namespace system {

template <> struct is_error_code_enum<usicheck::utils::error_code_t> : std::true_type {
    static const bool value = true;
};

} // namespace system
} // namespace boost
