// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include "test-utils.h"
#include "config/utils.h"
#include "utils/location.h"
#include "utils/log-setup.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

namespace usicheck::config {

bool operator==(const log_config_t &lhs, const log_config_t &rhs) noexcept {
    return lhs.name == rhs.name && lhs.level == rhs.level && lhs.sinks == rhs.sinks;
}

bool operator==(const check_config_t &lhs, const check_config_t &rhs) noexcept {
    return lhs.normalize_prefix == rhs.normalize_prefix && lhs.print_full == rhs.print_full;
}

bool operator==(const main_t &lhs, const main_t &rhs) noexcept {
    return lhs.config_path == rhs.config_path && lhs.log_configs == rhs.log_configs &&
           lhs.check_config == rhs.check_config;
}

} // namespace usicheck::config

namespace fs = std::filesystem;
namespace st = usicheck::test;

using namespace usicheck;
using L = spdlog::level::level_enum;

TEST_CASE("expand_home", "[config]") {
    SECTION("valid home") {
        auto home = utils::home_option_t(fs::path("/user/home/.config/usicheck_test"));
        REQUIRE(utils::expand_home("some/path", home) == "some/path");
        REQUIRE(utils::expand_home("~/some/path", home) == "/user/home/.config/usicheck_test/some/path");
    }

    SECTION("invalid home") {
        auto ec = st::sys::error_code{1, st::sys::system_category()};
        auto home = utils::home_option_t(ec);
        REQUIRE(utils::expand_home("some/path", home) == "some/path");
        REQUIRE(utils::expand_home("~/some/path", home) == "~/some/path");
    }
}

TEST_CASE("default config dir", "[config]") {
    auto dir = utils::get_default_config_dir();
    REQUIRE(dir);
    CHECK(dir.value().filename() == "usicheck");
}

TEST_CASE("expand_home with the user home", "[config]") {
    auto home = utils::get_home_dir();
    REQUIRE(home);
    CHECK(utils::expand_home("~/a.log", home) == (home.value() / "a.log").generic_string());
}

TEST_CASE("default config is OK", "[config]") {
    auto cfg_path = fs::path("some-dir") / "usicheck.toml";
    auto cfg = config::generate_config(cfg_path);
    CHECK(cfg.config_path == cfg_path);
    REQUIRE(cfg.log_configs.size() == 1);
    CHECK(cfg.log_configs[0].name == "default");
    CHECK(cfg.check_config.normalize_prefix);
    CHECK(cfg.check_config.print_full);

    SECTION("serialize default") {
        std::stringstream out;
        auto r = config::serialize(cfg, out);
        CHECK(r);
        INFO(out.str());
        CHECK(out.str().find("normalize_prefix") != std::string::npos);
        auto cfg_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg_opt);

        auto cfg2 = cfg_opt.value();
        CHECK(cfg == cfg2);
    }

    SECTION("serialize custom") {
        cfg.log_configs = {
            config::log_config_t{"default", L::warn, {"stdout", "file:/tmp/usicheck.log"}},
            config::log_config_t{"usicheck.cli", L::trace, {}},
        };
        cfg.check_config.normalize_prefix = false;
        cfg.check_config.print_full = false;

        std::stringstream out;
        REQUIRE(config::serialize(cfg, out));
        auto cfg_opt = config::get_config(out, cfg_path);
        REQUIRE(cfg_opt);
        CHECK(cfg == cfg_opt.value());
    }
}

TEST_CASE("config parsing", "[config]") {
    auto cfg_path = fs::path("usicheck.toml");

    SECTION("empty config falls back to defaults") {
        std::stringstream in;
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        CHECK(cfg_opt.value() == config::generate_config(cfg_path));
    }

    SECTION("partial config") {
        std::stringstream in;
        in << "[check]\n"
           << "print_full = false\n"
           << "normalize_prefix = \"yes\"\n"
           << "[[log]]\n"
           << "name = \"default\"\n"
           << "level = \"trace\"\n"
           << "sinks = [\"stderr\"]\n"
           << "[[log]]\n"
           << "name = \"usicheck.cli\"\n"
           << "level = \"bogus\"\n";
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &cfg = cfg_opt.value();
        CHECK(!cfg.check_config.print_full);
        CHECK(cfg.check_config.normalize_prefix);
        REQUIRE(cfg.log_configs.size() == 2);
        CHECK(cfg.log_configs[0] == config::log_config_t{"default", L::trace, {"stderr"}});
        CHECK(cfg.log_configs[1] == config::log_config_t{"usicheck.cli", L::debug, {}});
    }

    SECTION("log level fallback is reported") {
        std::ostringstream log_out;
        auto dist_sink = utils::create_root_logger();
        dist_sink->add_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(log_out));

        std::stringstream in;
        in << "[[log]]\n"
           << "name = \"usicheck.cli\"\n"
           << "sinks = [\"stdout\"]\n"
           << "[[log]]\n"
           << "name = \"usicheck.cli.verify\"\n"
           << "level = \"verbose\"\n";
        auto cfg_opt = config::get_config(in, cfg_path);
        spdlog::default_logger()->flush();
        st::init_logging();

        REQUIRE(cfg_opt);
        auto &cfg = cfg_opt.value();
        REQUIRE(cfg.log_configs.size() == 2);
        CHECK(cfg.log_configs[0] == config::log_config_t{"usicheck.cli", L::debug, {"stdout"}});
        CHECK(cfg.log_configs[1] == config::log_config_t{"usicheck.cli.verify", L::debug, {}});

        auto messages = log_out.str();
        INFO(messages);
        CHECK(messages.find("using default value for log/usicheck.cli/level") != std::string::npos);
        CHECK(messages.find("unknown log level 'verbose' for usicheck.cli.verify, using debug") != std::string::npos);
    }

    SECTION("file sinks relative to home") {
        auto home = utils::get_home_dir();
        REQUIRE(home);

        std::stringstream in;
        in << "[[log]]\n"
           << "name = \"default\"\n"
           << "level = \"info\"\n"
           << "sinks = [\"stderr\", \"file:~/logs/usicheck.log\", \"file:/var/log/usicheck.log\", \"~/x\"]\n";
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(cfg_opt);
        auto &sinks = cfg_opt.value().log_configs.at(0).sinks;
        REQUIRE(sinks.size() == 4);
        CHECK(sinks[0] == "stderr");
        CHECK(sinks[1] == "file:" + (home.value() / "logs/usicheck.log").generic_string());
        CHECK(sinks[2] == "file:/var/log/usicheck.log");
        CHECK(sinks[3] == "~/x");
    }

    SECTION("malformed config") {
        std::stringstream in;
        in << "[check\n"
           << "print_full = ";
        auto cfg_opt = config::get_config(in, cfg_path);
        REQUIRE(!cfg_opt);
        CHECK(!cfg_opt.error().empty());
    }
}
