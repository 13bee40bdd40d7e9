#include "commands/select.hpp"

#include "ctxwin/ContextWindowEngine.hpp"
#include "ctxwin/ExplainabilityArtifact.hpp"
#include "ctxwin/Metrics.hpp"
#include "ctxwin/PromptFormatter.hpp"
#include "ctxwin/TimeUtil.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    }
    if (used != s.size()) throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    return v;
}

static int select_usage() {
    std::cerr
        << "usage:\n"
        << "  ctxwin select --candidates <path> [options]\n";
    return 2;
}

int cmd_select(int argc, char** argv) {
    try {
        const std::string candidates_path = get_arg(argc, argv, "--candidates", "");
        if (candidates_path.empty()) {
            std::cerr << "error: missing --candidates\n";
            return select_usage();
        }

        const std::string config_path = get_arg(argc, argv, "--config", "");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const int quality = get_arg_int(argc, argv, "--quality", 50);

        ctxwin::TimePoint now = ctxwin::Clock::now();
        const std::string now_arg = get_arg(argc, argv, "--now", "");
        if (!now_arg.empty()) {
            auto t = ctxwin::parse_iso8601(now_arg);
            if (!t) throw std::runtime_error("--now is not an ISO-8601 timestamp: " + now_arg);
            now = *t;
        }

        ctxwin::SelectionContext ctx;
        ctx.turn_id = get_arg(argc, argv, "--turn", ctx.turn_id);
        ctx.user_id = get_arg(argc, argv, "--user", ctx.user_id);
        ctx.tenant_id = get_arg(argc, argv, "--tenant", ctx.tenant_id);

        ctxwin::PromptFormatOptions fmt;
        fmt.max_item_chars = static_cast<size_t>(std::max(4, get_arg_int(argc, argv, "--item_chars", 150)));
        fmt.max_items_per_domain = static_cast<size_t>(std::max(0, get_arg_int(argc, argv, "--items_per_domain", 0)));
        fmt.max_total_chars = static_cast<size_t>(std::max(0, get_arg_int(argc, argv, "--prompt_chars", 0)));

        ctxwin::EngineOptions opts;
        if (!config_path.empty()) {
            opts.config = ctxwin::merge_config(opts.config, jsonio::load_config_override(config_path));
        }
        opts.log = std::make_shared<ctxwin::SelectionLog>();

        const ctxwin::ContextWindowEngine engine(std::move(opts));
        const ctxwin::BudgetConfig cfg = engine.get_config();

        const std::vector<ctxwin::Candidate> candidates = jsonio::load_candidates(candidates_path, cfg);

        const ctxwin::SelectionResult result = engine.select_context(candidates, quality, ctx, now);

        ctxwin::ExplainabilityArtifact ex;
        ex.candidates_path = candidates_path;
        ex.config_path = config_path;
        ex.quality_score = quality;
        ex.context = ctx;
        ex.config = cfg;
        ex.result = result;

        const fs::path selection_path = outdir / "selection.json";
        ex.write_to(selection_path);

        const fs::path prompt_path = outdir / "context_prompt.md";
        ctxwin::write_prompt_block(prompt_path, ctxwin::render_prompt_block(result, now, fmt));

        const auto entries = engine.log()->recent(1);

        std::cout << "CANDIDATES: " << candidates_path << " (" << candidates.size() << ")\n";
        std::cout << "CONFIG: " << (config_path.empty() ? "(defaults)" : config_path) << "\n";
        std::cout << "QUALITY: " << quality << "\n";
        std::cout << "NOW: " << ctxwin::format_iso8601(now) << "\n";
        if (!entries.empty()) std::cout << "LOG_ID: " << entries.back().log_id << "\n";
        std::cout << "OUT_SELECTION: " << selection_path.string() << "\n";
        std::cout << "OUT_PROMPT: " << prompt_path.string() << "\n";
        std::cout << "INCLUDED: " << result.metrics.total_items << "\n";
        std::cout << "EXCLUDED: " << result.metrics.excluded_count << "\n";
        std::cout << "\n" << ctxwin::format_selection_debug(result);

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "select failed: " << e.what() << "\n";
        return 1;
    }
}
