#pragma once

#include <structure_model/types.hpp>
#include <cstddef>
#include <vector>

namespace execution {

// Committed snapshots in history order; index 0 is the initial state.
// Not synchronized on its own, the owning Engine serializes access.
class HistoryManager {
public:
    void append(structure_model::StateGraphPtr state);

    // nullptr when index is not committed.
    structure_model::StateGraphPtr at(std::size_t index) const;
    structure_model::StateGraphPtr latest() const;

    std::size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }

    // Keeps the first count snapshots.
    void truncate(std::size_t count);
    void clear() { snapshots_.clear(); }

private:
    std::vector<structure_model::StateGraphPtr> snapshots_;
};

} // namespace execution
