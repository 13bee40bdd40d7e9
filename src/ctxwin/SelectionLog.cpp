#include "ctxwin/SelectionLog.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace ctxwin {

SelectionLog::SelectionLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::string SelectionLog::append(const SelectionContext& ctx,
                                 const SelectionResult& result,
                                 std::shared_ptr<const BudgetConfig> config_snapshot) {
    SelectionLogEntry e;
    e.context = ctx;
    e.result = result;
    e.timestamp = result.selected_at;
    e.config_snapshot = std::move(config_snapshot);

    std::lock_guard<std::mutex> lock(mu_);
    e.log_id = "ctx-" + std::to_string(next_seq_++);
    const std::string id = e.log_id;

    entries_.push_back(std::move(e));
    while (entries_.size() > capacity_) entries_.pop_front();

    return id;
}

std::vector<SelectionLogEntry> SelectionLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mu_);

    const size_t n = std::min(limit, entries_.size());
    return std::vector<SelectionLogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
}

size_t SelectionLog::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

void SelectionLog::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

}  // namespace ctxwin
