// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#pragma once

#include "usicheck-export.h"

namespace usicheck::constants {
USICHECK_API extern const char *client_name;
USICHECK_API extern const char *client_version;
USICHECK_API extern const char *config_file_name;

} // namespace usicheck::constants
