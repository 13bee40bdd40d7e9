#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"

namespace ctxwin {

// Caller-supplied identifiers; only ever recorded, never used for selection.
struct SelectionContext {
    std::string turn_id = "unknown";
    std::string user_id = "unknown";
    std::string tenant_id = "unknown";
};

struct SelectionLogEntry {
    std::string log_id;                                   // "ctx-<sequence>"
    SelectionContext context;
    SelectionResult result;
    TimePoint timestamp{};
    std::shared_ptr<const BudgetConfig> config_snapshot;  // config the selection ran with
};

// Bounded in-memory ring buffer of recent selections. Appends are serialized;
// readers get copies.
class SelectionLog {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit SelectionLog(size_t capacity = kDefaultCapacity);

    // returns the assigned log id
    std::string append(const SelectionContext& ctx,
                       const SelectionResult& result,
                       std::shared_ptr<const BudgetConfig> config_snapshot);

    // newest last; at most `limit` entries
    std::vector<SelectionLogEntry> recent(size_t limit = 10) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::deque<SelectionLogEntry> entries_;
    uint64_t next_seq_ = 1;
};

}  // namespace ctxwin
