// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <boost/outcome.hpp>
#include <fmt/format.h>
#include "usicheck-export.h"

namespace usicheck::model {

namespace outcome = boost::outcome_v2;

struct USICHECK_API usi_t {
    static const constexpr std::size_t PREFIX_SIZE = 9;
    static const constexpr std::size_t USI_SIZE = PREFIX_SIZE + 1;

    /* the prefix is taken as is, i.e. lower-case symbols are rejected */
    static outcome::result<char> generate_check_character(std::string_view prefix) noexcept;

    /* only the payload symbols are validated against the alphabet, the last
     * symbol is just compared with the calculated one */
    static outcome::result<bool> verify(std::string_view key) noexcept;

    static outcome::result<usi_t> from_string(std::string_view value) noexcept;
    static outcome::result<usi_t> from_prefix(std::string_view prefix) noexcept;
    static std::string normalize(std::string_view value) noexcept;

    usi_t() noexcept = default;

    bool operator==(const usi_t &other) const noexcept { return value == other.value; }
    bool operator!=(const usi_t &other) const noexcept { return !(*this == other); }
    explicit operator bool() const noexcept { return !value.empty(); }

    const std::string &get_value() const noexcept { return value; }
    std::string_view get_prefix() const noexcept;
    char get_check_character() const noexcept;

  private:
    explicit usi_t(std::string value_) noexcept;

    std::string value;
};

} // namespace usicheck::model

namespace std {

template <> struct hash<usicheck::model::usi_t> {
    inline size_t operator()(const usicheck::model::usi_t &usi) const noexcept {
        return std::hash<std::string>()(usi.get_value());
    }
};

template <> struct less<usicheck::model::usi_t> {
    using usi_t = usicheck::model::usi_t;
    inline bool operator()(const usi_t &lhs, const usi_t &rhs) const noexcept {
        return lhs.get_value() < rhs.get_value();
    }
};

} // namespace std

template <> struct fmt::formatter<usicheck::model::usi_t> {
    using usi_t = usicheck::model::usi_t;

    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.end(); }

    template <typename FormatContext> auto format(const usi_t &usi, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", usi.get_value());
    }
};
