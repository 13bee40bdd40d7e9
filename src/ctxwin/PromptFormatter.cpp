#include "ctxwin/PromptFormatter.hpp"

#include <array>
#include <chrono>
#include <fstream>
#include <map>
#include <stdexcept>
#include <vector>

#include "ctxwin/TimeUtil.hpp"
#include "text/TextUtil.hpp"

namespace ctxwin {

std::string format_relative_time(TimePoint when, TimePoint now) {
    using namespace std::chrono;

    const auto diff = duration_cast<milliseconds>(now - when).count();
    const long long mins = diff / (1000LL * 60);
    const long long hours = diff / (1000LL * 60 * 60);
    const long long days = diff / (1000LL * 60 * 60 * 24);

    if (mins < 5) return "just now";
    if (mins < 60) return std::to_string(mins) + "m ago";
    if (hours < 24) return std::to_string(hours) + "h ago";
    if (days == 1) return "yesterday";
    if (days < 7) return std::to_string(days) + "d ago";
    return format_date(when);
}

std::string truncate_content(const std::string& content, size_t max_chars) {
    return textutil::utf8_truncate(content, max_chars, "...");
}

std::string domain_heading(Domain d) {
    switch (d) {
        case Domain::Personal: return "Personal Identity (IMPORTANT - User's Name, Location, etc.)";
        case Domain::Relationships: return "Relationships & Family";
        case Domain::Health: return "Health & Wellness";
        case Domain::Goals: return "Goals & Plans";
        case Domain::Preferences: return "User Preferences";
        case Domain::Conversation: return "Recent Conversations";
        case Domain::Tasks: return "Tasks & Work";
        case Domain::Community: return "Community";
        case Domain::EventsMeetups: return "Events";
        case Domain::ProductsServices: return "Products & Services";
        case Domain::Notes: return "Notes";
    }
    return domain_name(d);
}

// identity first, then the remaining domains in enumeration order
static std::vector<Domain> render_order() {
    std::vector<Domain> order = {
        Domain::Personal, Domain::Relationships, Domain::Preferences,
        Domain::Health, Domain::Goals, Domain::Conversation
    };
    for (Domain d : all_domains()) {
        bool seen = false;
        for (Domain o : order) seen = seen || (o == d);
        if (!seen) order.push_back(d);
    }
    return order;
}

std::string render_prompt_block(const SelectionResult& result,
                                TimePoint now,
                                const PromptFormatOptions& opts) {
    if (result.included.empty()) return "";

    std::array<std::vector<const EnrichedItem*>, kDomainCount> by_domain;
    std::map<std::string, std::vector<const EnrichedItem*>> by_unmapped_tag;
    for (const auto& it : result.included) {
        if (has_known_domain(it.candidate)) by_domain[domain_index(it.candidate.domain)].push_back(&it);
        else by_unmapped_tag[it.candidate.domain_tag].push_back(&it);
    }

    std::string out;
    out += "## User Context (from Memory)\n\n";

    auto render_section = [&](const std::string& heading, const std::string& label,
                              const std::vector<const EnrichedItem*>& items) {
        out += "### " + heading + "\n";

        const size_t limit = opts.max_items_per_domain > 0 ? opts.max_items_per_domain : items.size();
        size_t shown = 0;
        for (const EnrichedItem* it : items) {
            if (shown == limit) break;
            out += "- [" + format_relative_time(it->candidate.occurred_at, now) + "] " +
                   truncate_content(it->candidate.content, opts.max_item_chars) + "\n";
            ++shown;
        }

        if (items.size() > shown) {
            out += "  (+ " + std::to_string(items.size() - shown) + " more " + label + " items)\n";
        }
        out += "\n";
    };

    for (Domain d : render_order()) {
        const auto& items = by_domain[domain_index(d)];
        if (!items.empty()) render_section(domain_heading(d), domain_name(d), items);
    }
    // unknown tags are headed by the tag itself
    for (const auto& kv : by_unmapped_tag) render_section(kv.first, kv.first, kv.second);

    if (opts.max_total_chars > 0 && textutil::utf8_length(out) > opts.max_total_chars) {
        const size_t keep = opts.max_total_chars > 50 ? opts.max_total_chars - 50 : 0;
        out = textutil::utf8_prefix(out, keep) + "\n\n(context truncated for brevity)\n";
    }

    return out;
}

void write_prompt_block(const std::filesystem::path& out_path, const std::string& block) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << block;
    if (block.empty() || block.back() != '\n') out << "\n";
}

}  // namespace ctxwin
