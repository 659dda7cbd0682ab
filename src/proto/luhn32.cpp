// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "luhn32.h"
#include "utils/error_code.h"

using namespace usicheck::proto;
using namespace usicheck::utils;

int luhn32::alternate_factor(int factor) noexcept {
    switch (factor) {
    case 2:
        return 1;
    default:
        return 2;
    }
}

int luhn32::fold(int addend) noexcept { return (addend / n) + (addend % n); }

outcome::result<char> luhn32::calculate(std::string_view in) noexcept {
    int factor = 2;
    int sum = 0;

    for (auto it = in.rbegin(); it != in.rend(); ++it) {
        auto code_point = alphabet::index_of(*it);
        if (code_point < 0) {
            return make_error_code(error_code_t::invalid_character);
        }

        int addend = factor * code_point;

        factor = alternate_factor(factor);
        sum = (sum + fold(addend)) % n;
    }

    int check_char_index = (n - sum) % n;

    return alphabet::symbols[check_char_index];
}
