// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <string_view>
#include <boost/outcome.hpp>
#include "utils/alphabet.h"
#include "usicheck-export.h"

namespace usicheck::proto {

namespace outcome = boost::outcome_v2;

/* Luhn mod N over the USI alphabet (N = 32) */
struct USICHECK_API luhn32 {
    static const constexpr int n = static_cast<int>(utils::alphabet::size);

    /* 2 -> 1, anything else -> 2 */
    static int alternate_factor(int factor) noexcept;

    /* collapses a weighted codepoint (< 2N) back into [0, N) */
    static int fold(int addend) noexcept;

    /* scans the input right to left, the rightmost symbol gets factor 2;
     * fails on the first symbol outside of the alphabet */
    static outcome::result<char> calculate(std::string_view in) noexcept;
};

} // namespace usicheck::proto
