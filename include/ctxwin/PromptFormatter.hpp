#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "ctxwin/Models.hpp"

namespace ctxwin {

struct PromptFormatOptions {
    size_t max_item_chars = 150;      // per item, marker included
    size_t max_items_per_domain = 0;  // 0 = no limit
    size_t max_total_chars = 0;       // 0 = no limit
};

// "just now", "12m ago", "5h ago", "yesterday", "3d ago", else YYYY-MM-DD (UTC)
std::string format_relative_time(TimePoint when, TimePoint now);

std::string truncate_content(const std::string& content, size_t max_chars);

std::string domain_heading(Domain d);

// LLM-ready block of the included items, grouped by domain (identity first).
// Empty string when nothing was included.
std::string render_prompt_block(const SelectionResult& result,
                                TimePoint now,
                                const PromptFormatOptions& opts = {});

void write_prompt_block(const std::filesystem::path& out_path, const std::string& block);

}  // namespace ctxwin
