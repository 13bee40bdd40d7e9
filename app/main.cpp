#include "commands/config.hpp"
#include "commands/select.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  ctxwin select [args]\n"
        << "  ctxwin config dump [--config <path>]\n"
        << "  ctxwin config validate --config <path>\n"
        << "  ctxwin help\n";
    return 1;
}

static int print_select_help() {
    std::cerr
        << "usage:\n"
        << "  ctxwin select --candidates <path> [options]\n"
        << "\n"
        << "inputs:\n"
        << "  --candidates <path>          (required) JSON array or {\"candidates\": [...]}\n"
        << "  --quality <n>                default: 50 (overall memory quality, 0..100)\n"
        << "  --config <path>              optional: partial budget config override (JSON)\n"
        << "  --now <iso8601>              default: current time; fixes the evaluation instant\n"
        << "\n"
        << "trace:\n"
        << "  --turn <id>                  default: unknown\n"
        << "  --user <id>                  default: unknown\n"
        << "  --tenant <id>                default: unknown\n"
        << "\n"
        << "output:\n"
        << "  --outdir <dir>               default: out (selection.json, context_prompt.md)\n"
        << "  --item_chars <n>             default: 150 (per item in the prompt block)\n"
        << "  --items_per_domain <n>       default: 0 (no limit)\n"
        << "  --prompt_chars <n>           default: 0 (no limit)\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "select" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_select_help();

    if (cmd == "select") return cmd_select(argc - 1, argv + 1);
    if (cmd == "config") return cmd_config(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
