#include <getopt.h>

#include <iostream>
#include <string>

#include "parley/cli/print_cli_help.hpp"
#include "parley/cli/run_shell.hpp"
#include "parley/parley_config.hpp"
#include "parley/session.hpp"

int main(int argc, char** argv) {
    parley::ParleyConfig config;
    std::string custom_config_path;

    const char* const short_opts = "hw:p:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"wrap", required_argument, nullptr, 'w'},
        {"page", required_argument, nullptr, 'p'}, {"no-color", no_argument, nullptr, 1001},
        {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    // First pass: only the config path, so later options override the file.
    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 'h') { print_cli_help(); return 0; }
        if (opt == 2001) custom_config_path = optarg;
    }
    optind = 1;

    std::string config_to_load = custom_config_path.empty() ? "parley.yaml" : custom_config_path;
    parley::load_or_create_config(config_to_load, config);

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        try {
            switch (opt) {
            case 'w': config.wrap_at = std::stoul(optarg); break;
            case 'p': config.page_at = std::stoul(optarg); break;
            case 1001: config.use_color = false; break;
            case 2001: break;
            default: print_cli_help(); return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: invalid value '" << optarg << "': " << e.what() << "\n";
            return 2;
        }
    }

    try {
        parley::Session session;
        session.Configure(config);
        run_shell(session, config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
