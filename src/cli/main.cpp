// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2019-2025 Ivan Baidakou

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <exception>

#include "usicheck-config.h"
#include "constants.h"
#include "config/utils.h"
#include "utils/location.h"
#include "utils/log.h"
#include "utils/log-setup.h"
#include "command.h"

namespace bfs = std::filesystem;
namespace po = boost::program_options;

using namespace usicheck;

enum exit_code_t { exit_ok = 0, exit_failure = 1, exit_mismatch = 2 };

int main(int argc, char **argv) {
    try {
        auto dist_sink = utils::create_root_logger();
        auto bootstrap_guard = utils::bootstrap(dist_sink);

        // clang-format off
        /* parse command-line & config options */
        po::options_description cmdline_descr("Allowed options");
        cmdline_descr.add_options()
            ("help", "show this help message")
            ("log_level", po::value<std::string>(),
                        "log level, overrides the configured one")
            ("config_dir", po::value<std::string>(),
                        "configuration directory path")
            ("command", po::value<std::string>(), "command to execute, either\n"
                "  verify - checks that the argument is a valid 10-character USI;\n"
                "  generate - calculates the check character for the 9-character"
                    " USI prefix given as the argument")
            ("argument", po::value<std::string>(), "USI or USI prefix");
        // clang-format on

        po::positional_options_description positional;
        positional.add("command", 1).add("argument", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(cmdline_descr).positional(positional).run(), vm);
        po::notify(vm);

        bool show_help = vm.count("help");
        if (show_help) {
            std::cout << constants::client_name << " " << USICHECK_VERSION << "\n";
            std::cout << "usage: " << constants::client_name << " [options] verify|generate VALUE\n";
            std::cout << cmdline_descr << "\n";
            return exit_failure;
        }

        bfs::path config_file_path;
        if (vm.count("config_dir")) {
            auto path = vm["config_dir"].as<std::string>();
            config_file_path = bfs::path{utils::expand_home(path, utils::get_home_dir())};
        } else {
            auto config_default = utils::get_default_config_dir();
            if (config_default) {
                config_file_path = config_default.value();
            } else {
                spdlog::error("cannot determine default config dir: {}", config_default.error().message());
                return exit_failure;
            }
        }
        config_file_path /= constants::config_file_name;
        auto config_file_path_str = config_file_path.string();

        config::main_t cfg;
        std::error_code ec;
        auto config_exists = bfs::exists(config_file_path, ec);
        if (ec) {
            spdlog::warn("cannot access config {}: {}, using defaults", config_file_path_str, ec.message());
        }
        if (!config_exists) {
            spdlog::debug("config {} does not exist, using defaults", config_file_path_str);
            cfg = config::generate_config(config_file_path);
        } else {
            std::ifstream config_file(config_file_path_str);
            if (!config_file) {
                spdlog::error("cannot open config file {}", config_file_path_str);
                return exit_failure;
            }
            auto cfg_option = config::get_config(config_file, config_file_path);
            if (!cfg_option) {
                spdlog::error("config file {} is incorrect :: {}", config_file_path_str, cfg_option.error());
                return exit_failure;
            }
            cfg = std::move(cfg_option.value());
        }

        if (vm.count("log_level")) {
            auto level_str = vm["log_level"].as<std::string>();
            auto level = utils::get_log_level(level_str);
            if (!level) {
                spdlog::error("unknown log level '{}'", level_str);
                return exit_failure;
            }
            for (auto &c : cfg.log_configs) {
                if (c.name == "default") {
                    c.level = level.value();
                }
            }
        }

        auto init_result = utils::init_loggers(cfg.log_configs);
        if (!init_result) {
            spdlog::error("loggers initialization failed :: {}", init_result.error().message());
            return exit_failure;
        }
        bootstrap_guard.reset();
        spdlog::trace("configuration seems OK");

        auto command_name = vm.count("command") ? vm["command"].as<std::string>() : std::string();
        auto argument = vm.count("argument") ? vm["argument"].as<std::string>() : std::string();
        auto cmd = cli::command_t::parse(command_name, argument, cfg.check_config);
        if (!cmd) {
            spdlog::error("error parsing command '{}' : {}", command_name, cmd.assume_error().message());
            return exit_failure;
        }

        auto r = cmd.assume_value()->execute(std::cout);
        if (!r) {
            return exit_failure;
        }
        return r.assume_value() ? exit_ok : exit_mismatch;
    } catch (const po::error &ex) {
        spdlog::critical("invalid command line: {}", ex.what());
    } catch (const std::exception &ex) {
        spdlog::critical("starting failed: {}", ex.what());
    }
    return exit_failure;
}
