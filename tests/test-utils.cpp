// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "test-utils.h"
#include "utils/alphabet.h"
#include "utils/log-setup.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <iostream>
#include <random>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>

int main(int argc, char *argv[]) { return Catch::Session().run(argc, argv); }

namespace usicheck::test {

path_guard_t::path_guard_t(const bfs::path &path_) : path{path_} {}

path_guard_t::path_guard_t(path_guard_t &&other) : path{std::move(other.path)} { other.path = bfs::path{}; }

path_guard_t::~path_guard_t() {
    if (!path.empty()) {
        std::error_code ec;
        bfs::remove_all(path, ec);
    }
}

std::string read_file(const bfs::path &path) {
    auto file_path = path.string();
    auto file_path_c = file_path.c_str();
    auto in = fopen(file_path_c, "rb");
    if (!in) {
        auto ec = sys::error_code{errno, sys::generic_category()};
        std::cout << "can't open " << file_path_c << " : " << ec.message() << "\n";
        return "";
    }

    fseek(in, 0L, SEEK_END);
    auto filesize = ftell(in);
    fseek(in, 0L, SEEK_SET);
    std::vector<char> buffer(filesize, 0);
    if (filesize) {
        auto r = fread(buffer.data(), filesize, 1, in);
        (void)r;
    }
    fclose(in);
    return std::string(buffer.data(), filesize);
}

void init_logging() {
    auto dist_sink = utils::create_root_logger();
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    dist_sink->add_sink(console_sink);
}

static std::random_device rd;
static std::uniform_int_distribution<std::size_t> dist(0, utils::alphabet::size - 1);

bfs::path unique_path() {
    auto name = std::string("tmp-");
    for (int i = 0; i < 12; ++i) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(utils::alphabet::symbols[dist(rd)])));
    }
    return bfs::path(name);
}

} // namespace usicheck::test
