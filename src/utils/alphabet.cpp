// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "alphabet.h"

using namespace usicheck::utils;

const char alphabet::symbols[] = "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";

static_assert(sizeof(alphabet::symbols) == alphabet::size + 1, "alphabet size mismatch");

std::string_view alphabet::view() noexcept { return std::string_view(symbols, size); }

std::int32_t alphabet::index_of(char symbol, std::string_view table) noexcept {
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (table[i] == symbol) {
            return static_cast<std::int32_t>(i);
        }
    }
    return -1;
}
