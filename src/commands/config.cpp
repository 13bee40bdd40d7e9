#include "commands/config.hpp"

#include "ctxwin/BudgetConfig.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int config_usage() {
    std::cerr
        << "usage:\n"
        << "  ctxwin config dump [--config <path>]\n"
        << "  ctxwin config validate --config <path>\n";
    return 2;
}

static ctxwin::BudgetConfig effective_config(const std::string& config_path) {
    ctxwin::BudgetConfig cfg = ctxwin::default_budget_config();
    if (!config_path.empty()) {
        cfg = ctxwin::merge_config(cfg, jsonio::load_config_override(config_path));
    }
    ctxwin::validate_config(cfg);
    return cfg;
}

int cmd_config(int argc, char** argv) {
    if (argc < 2) return config_usage();

    const std::string sub = argv[1];
    const std::string config_path = get_arg(argc, argv, "--config", "");

    try {
        if (sub == "dump") {
            std::cout << jsonio::config_to_json(effective_config(config_path)).dump(2) << "\n";
            return 0;
        }

        if (sub == "validate") {
            if (config_path.empty()) {
                std::cerr << "error: missing --config\n";
                return config_usage();
            }
            effective_config(config_path);
            std::cout << "CONFIG: " << config_path << "\n";
            std::cout << "VALID: yes\n";
            return 0;
        }
    } catch (const ctxwin::ConfigError& e) {
        std::cerr << "config " << sub << " failed: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "config " << sub << " failed: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "unknown config subcommand: " << sub << "\n";
    return config_usage();
}
