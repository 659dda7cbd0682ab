// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "location.h"
#include "error_code.h"
#include "constants.h"
#include <cstdlib>
#include <cerrno>
#include <boost/system/error_code.hpp>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>
#endif

namespace usicheck::utils {

namespace sys = boost::system;

std::string expand_home(const std::string &path, const home_option_t &home) noexcept {
    if (home.has_value() && path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        auto path_view = std::string_view(path).substr(2);
        return (home.assume_value() / path_view).generic_string();
    }
    return path;
}

outcome::result<bfs::path> get_home_dir() noexcept {
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
    auto *pw = getpwuid(getuid());
    if (!pw) {
        return sys::error_code{errno, sys::generic_category()};
    }
    return bfs::path(pw->pw_dir);
#else
    if (auto home = std::getenv("HOME")) {
        return bfs::path(home);
    }
    return error_code_t::cant_determine_config_dir;
#endif
}

outcome::result<bfs::path> get_default_config_dir() noexcept {
    bfs::path dir;
#if defined(__unix__)
    if (auto xdg_home = std::getenv("XDG_CONFIG_HOME"); xdg_home && *xdg_home) {
        dir = bfs::path(xdg_home);
    }
#endif
    if (dir.empty()) {
        auto home_opt = get_home_dir();
        if (home_opt.has_error()) {
            return home_opt.assume_error();
        }
        dir = home_opt.assume_value() / ".config";
    }
    dir /= constants::client_name;
    return dir;
}

} // namespace usicheck::utils
