#include <execution/history.hpp>
#include <utility>

namespace execution {

void HistoryManager::append(structure_model::StateGraphPtr state) {
    snapshots_.push_back(std::move(state));
}

structure_model::StateGraphPtr HistoryManager::at(std::size_t index) const {
    if (index >= snapshots_.size()) return nullptr;
    return snapshots_[index];
}

structure_model::StateGraphPtr HistoryManager::latest() const {
    if (snapshots_.empty()) return nullptr;
    return snapshots_.back();
}

void HistoryManager::truncate(std::size_t count) {
    if (count < snapshots_.size())
        snapshots_.resize(count);
}

} // namespace execution
