// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>
#include "usicheck-export.h"

namespace usicheck::utils {

/* the USI alphabet: digits without '0' and '1', letters without 'I' and 'O';
 * the position of a symbol is its codepoint */
struct USICHECK_API alphabet {
    static const constexpr std::size_t size = 32;
    static const char symbols[];

    static std::string_view view() noexcept;

    /* linear scan, -1 if the symbol is not found */
    static std::int32_t index_of(char symbol, std::string_view table) noexcept;
    static inline std::int32_t index_of(char symbol) noexcept { return index_of(symbol, view()); }
};

} // namespace usicheck::utils
