#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"

namespace jsonio {

// ISO-8601 string or integer epoch milliseconds
ctxwin::TimePoint parse_timestamp(const nlohmann::json& j, const std::string& where);

// Accepts a bare array or an object with a "candidates" (or "items") array.
// Each record: id, domain (or category_key), content, importance, occurred_at, source.
// Unknown domain tags go through cfg.unknown_domain.
std::vector<ctxwin::Candidate> parse_candidates(const nlohmann::json& j, const ctxwin::BudgetConfig& cfg);
std::vector<ctxwin::Candidate> load_candidates(const std::string& path, const ctxwin::BudgetConfig& cfg);

// Same key layout as config_to_json; every key optional.
ctxwin::ConfigOverride parse_config_override(const nlohmann::json& j);
ctxwin::ConfigOverride load_config_override(const std::string& path);

nlohmann::json config_to_json(const ctxwin::BudgetConfig& cfg);

nlohmann::json read_json_file(const std::string& path);

}  // namespace jsonio
