// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "usi.h"
#include "proto/luhn32.h"
#include "utils/error_code.h"
#include <algorithm>
#include <cctype>

using namespace usicheck::model;
using namespace usicheck::proto;
using namespace usicheck::utils;

usi_t::usi_t(std::string value_) noexcept : value{std::move(value_)} {}

std::string_view usi_t::get_prefix() const noexcept {
    if (value.empty()) {
        return {};
    }
    return std::string_view(value.data(), PREFIX_SIZE);
}

char usi_t::get_check_character() const noexcept {
    if (value.empty()) {
        return 0;
    }
    return value[PREFIX_SIZE];
}

std::string usi_t::normalize(std::string_view value) noexcept {
    auto r = std::string(value);
    std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) {
        if (c >= 'a' && c <= 'z') {
            return static_cast<char>(c - 'a' + 'A');
        }
        return static_cast<char>(c);
    });
    return r;
}

outcome::result<char> usi_t::generate_check_character(std::string_view prefix) noexcept {
    if (prefix.size() != PREFIX_SIZE) {
        return make_error_code(error_code_t::invalid_length);
    }
    return luhn32::calculate(prefix);
}

outcome::result<bool> usi_t::verify(std::string_view key) noexcept {
    if (key.size() != USI_SIZE) {
        return make_error_code(error_code_t::invalid_length);
    }

    auto normalized = normalize(key);
    auto check = generate_check_character(std::string_view(normalized).substr(0, PREFIX_SIZE));
    if (!check) {
        return check.assume_error();
    }
    return normalized[PREFIX_SIZE] == check.assume_value();
}

outcome::result<usi_t> usi_t::from_string(std::string_view value) noexcept {
    auto valid = verify(value);
    if (!valid) {
        return valid.assume_error();
    }
    if (!valid.assume_value()) {
        return make_error_code(error_code_t::check_character_mismatch);
    }
    return usi_t(normalize(value));
}

outcome::result<usi_t> usi_t::from_prefix(std::string_view prefix) noexcept {
    auto normalized = normalize(prefix);
    auto check = generate_check_character(normalized);
    if (!check) {
        return check.assume_error();
    }
    normalized += check.assume_value();
    return usi_t(std::move(normalized));
}
