#include "io/JsonIO.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

#include "ctxwin/TimeUtil.hpp"

using json = nlohmann::json;

namespace jsonio {

using ctxwin::BudgetConfig;
using ctxwin::Candidate;
using ctxwin::ConfigOverride;
using ctxwin::Domain;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<int> optional_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const json& v = j.at(key);
    const std::string path = where + "." + std::string(key);

    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(path + " is out of range");
        }
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        const auto n = v.get<std::int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw std::runtime_error(path + " is out of range");
        }
        return static_cast<int>(n);
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!std::isfinite(d) || d != std::floor(d)) {
            throw std::runtime_error(path + " must be an integer");
        }
        if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
            d > static_cast<double>(std::numeric_limits<int>::max())) {
            throw std::runtime_error(path + " is out of range");
        }
        return static_cast<int>(d);
    }
    throw std::runtime_error(path + " must be an integer");
}

static std::optional<double> optional_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

static Domain require_domain_name(const std::string& tag, const std::string& where) {
    auto d = ctxwin::parse_domain(tag);
    if (!d) throw std::runtime_error(where + ": unknown domain '" + tag + "'");
    return *d;
}

static std::set<Domain> parse_domain_set(const json& j, const std::string& where) {
    require_array(j, where);
    std::set<Domain> out;
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        if (!j.at(i).is_string()) throw std::runtime_error(oss.str() + " must be a string");
        out.insert(require_domain_name(j.at(i).get<std::string>(), oss.str()));
    }
    return out;
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    return j;
}

ctxwin::TimePoint parse_timestamp(const json& j, const std::string& where) {
    if (j.is_number_integer()) {
        return ctxwin::TimePoint(std::chrono::duration_cast<ctxwin::Clock::duration>(
            std::chrono::milliseconds(j.get<long long>())));
    }
    if (j.is_string()) {
        auto t = ctxwin::parse_iso8601(j.get<std::string>());
        if (!t) throw std::runtime_error(where + " is not an ISO-8601 timestamp: " + j.get<std::string>());
        return *t;
    }
    throw std::runtime_error(where + " must be an ISO-8601 string or epoch milliseconds");
}

static Candidate parse_candidate(const json& j, const BudgetConfig& cfg, const std::string& where) {
    require_object(j, where);

    Candidate c;
    c.id = require_string(j, "id", where);
    c.content = require_string(j, "content", where);

    const char* domain_key = j.contains("domain") ? "domain" : "category_key";
    const std::string tag = require_string(j, domain_key, where);
    auto d = ctxwin::resolve_domain(tag, cfg);
    if (!d) {
        throw std::runtime_error(where + "." + domain_key + ": unknown domain '" + tag + "'");
    }
    c.domain = *d;
    if (!ctxwin::parse_domain(tag)) c.domain_tag = tag;

    c.importance = optional_int(j, "importance", where).value_or(0);

    if (!j.contains("occurred_at")) {
        throw std::runtime_error(where + " missing required field: occurred_at");
    }
    c.occurred_at = parse_timestamp(j.at("occurred_at"), where + ".occurred_at");

    if (j.contains("source")) c.source = require_string(j, "source", where);

    return c;
}

std::vector<Candidate> parse_candidates(const json& j, const BudgetConfig& cfg) {
    const json* arr = &j;
    std::string where = "root";

    if (j.is_object()) {
        const char* key = j.contains("candidates") ? "candidates" : "items";
        if (!j.contains(key)) {
            throw std::runtime_error("root missing required field: candidates");
        }
        arr = &j.at(key);
        where = std::string("root.") + key;
    }
    require_array(*arr, where);

    std::vector<Candidate> out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parse_candidate(arr->at(i), cfg, oss.str()));
    }
    return out;
}

std::vector<Candidate> load_candidates(const std::string& path, const BudgetConfig& cfg) {
    return parse_candidates(read_json_file(path), cfg);
}

ConfigOverride parse_config_override(const json& j) {
    require_object(j, "config");

    ConfigOverride o;
    o.total_budget_chars = optional_int(j, "total_budget_chars", "config");
    o.total_item_limit = optional_int(j, "total_item_limit", "config");

    if (j.contains("domain_budgets")) {
        const json& db = j.at("domain_budgets");
        require_object(db, "config.domain_budgets");
        for (auto it = db.begin(); it != db.end(); ++it) {
            const std::string where = "config.domain_budgets." + it.key();
            const Domain d = require_domain_name(it.key(), "config.domain_budgets");
            require_object(it.value(), where);

            ctxwin::DomainBudgetOverride b;
            b.max_items = optional_int(it.value(), "max_items", where);
            b.max_chars = optional_int(it.value(), "max_chars", where);
            b.min_relevance = optional_int(it.value(), "min_relevance", where);
            b.min_confidence = optional_int(it.value(), "min_confidence", where);
            o.domain_budgets[d] = b;
        }
    }

    if (j.contains("memory_type_weights")) {
        const json& w = j.at("memory_type_weights");
        require_object(w, "config.memory_type_weights");

        ctxwin::MemoryTypeWeights mw;
        if (auto v = optional_number(w, "recent", "config.memory_type_weights")) mw.recent = *v;
        if (auto v = optional_number(w, "long_term", "config.memory_type_weights")) mw.long_term = *v;
        if (auto v = optional_number(w, "pattern", "config.memory_type_weights")) mw.pattern = *v;
        o.memory_type_weights = mw;
    }

    if (j.contains("saturation")) {
        const json& s = j.at("saturation");
        require_object(s, "config.saturation");
        o.redundancy_similarity = optional_number(s, "redundancy_similarity", "config.saturation");
        o.topic_repetition_limit = optional_int(s, "topic_repetition_limit", "config.saturation");
        o.min_diversity_score = optional_number(s, "min_diversity_score", "config.saturation");
        o.similarity_down_weight = optional_number(s, "similarity_down_weight", "config.saturation");
    }

    if (j.contains("decay")) {
        const json& dj = j.at("decay");
        require_object(dj, "config.decay");

        ctxwin::DecayConfig dc;
        if (dj.contains("curve")) {
            const std::string name = require_string(dj, "curve", "config.decay");
            auto curve = ctxwin::parse_decay_curve(name);
            if (!curve) throw std::runtime_error("config.decay.curve: unknown curve '" + name + "'");
            dc.curve = *curve;
        }
        if (auto v = optional_number(dj, "half_life_hours", "config.decay")) dc.half_life_hours = *v;
        if (auto v = optional_number(dj, "window_hours", "config.decay")) dc.window_hours = *v;
        if (auto v = optional_number(dj, "floor", "config.decay")) dc.floor = *v;
        o.decay = dc;
    }

    if (j.contains("sensitive_domains")) {
        o.sensitive_domains = parse_domain_set(j.at("sensitive_domains"), "config.sensitive_domains");
    }
    o.sensitive_domain_item_limit = optional_int(j, "sensitive_domain_item_limit", "config");

    if (j.contains("topic_exempt_domains")) {
        o.topic_exempt_domains = parse_domain_set(j.at("topic_exempt_domains"), "config.topic_exempt_domains");
    }

    if (j.contains("unknown_domain")) {
        const json& u = j.at("unknown_domain");
        require_object(u, "config.unknown_domain");

        ctxwin::UnknownDomainPolicy p;
        if (u.contains("reject")) {
            if (!u.at("reject").is_boolean()) throw std::runtime_error("config.unknown_domain.reject must be a boolean");
            p.reject = u.at("reject").get<bool>();
        }
        if (u.contains("fallback")) {
            p.fallback = require_domain_name(require_string(u, "fallback", "config.unknown_domain"),
                                             "config.unknown_domain.fallback");
        }
        o.unknown_domain = p;
    }

    return o;
}

ConfigOverride load_config_override(const std::string& path) {
    return parse_config_override(read_json_file(path));
}

static json domain_set_to_json(const std::set<Domain>& s) {
    json a = json::array();
    for (Domain d : s) a.push_back(ctxwin::domain_name(d));
    return a;
}

json config_to_json(const BudgetConfig& cfg) {
    json j;

    j["total_budget_chars"] = cfg.total_budget_chars;
    j["total_item_limit"] = cfg.total_item_limit;

    json db = json::object();
    for (Domain d : ctxwin::all_domains()) {
        const ctxwin::DomainBudget& b = ctxwin::budget_for(cfg, d);
        db[ctxwin::domain_name(d)] = {
            {"max_items", b.max_items},
            {"max_chars", b.max_chars},
            {"min_relevance", b.min_relevance},
            {"min_confidence", b.min_confidence}
        };
    }
    j["domain_budgets"] = db;

    j["memory_type_weights"] = {
        {"recent", cfg.memory_type_weights.recent},
        {"long_term", cfg.memory_type_weights.long_term},
        {"pattern", cfg.memory_type_weights.pattern}
    };

    j["saturation"] = {
        {"redundancy_similarity", cfg.saturation.redundancy_similarity},
        {"topic_repetition_limit", cfg.saturation.topic_repetition_limit},
        {"min_diversity_score", cfg.saturation.min_diversity_score},
        {"similarity_down_weight", cfg.saturation.similarity_down_weight}
    };

    j["decay"] = {
        {"curve", ctxwin::decay_curve_name(cfg.decay.curve)},
        {"half_life_hours", cfg.decay.half_life_hours},
        {"window_hours", cfg.decay.window_hours},
        {"floor", cfg.decay.floor}
    };

    j["sensitive_domains"] = domain_set_to_json(cfg.sensitive_domains);
    j["sensitive_domain_item_limit"] = cfg.sensitive_domain_item_limit;
    j["topic_exempt_domains"] = domain_set_to_json(cfg.topic_exempt_domains);

    j["unknown_domain"] = {
        {"reject", cfg.unknown_domain.reject},
        {"fallback", ctxwin::domain_name(cfg.unknown_domain.fallback)}
    };

    return j;
}

}  // namespace jsonio
