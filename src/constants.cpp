// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "constants.h"
#include "usicheck-config.h"

namespace usicheck::constants {

const char *client_name = "usicheck";
const char *client_version = USICHECK_VERSION;
const char *config_file_name = "usicheck.toml";

} // namespace usicheck::constants
