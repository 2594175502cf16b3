#include "mc/selection/SelectionState.hpp"
#include <algorithm>

namespace mc {

void SelectionState::select(const Id& id) {
  if (id.empty()) return;
  if (mode_ == SelectionMode::Single) {
    selected_.clear();
  }
  if (!containsId(id)) {
    selected_.push_back(id);
  }
  primary_ = id;
}

void SelectionState::deselect(const Id& id) {
  removeId(id);
}

void SelectionState::toggle(const Id& id) {
  if (id.empty()) return;
  if (containsId(id)) {
    removeId(id);
  } else {
    if (mode_ == SelectionMode::Single) {
      selected_.clear();
    }
    selected_.push_back(id);
    primary_ = id;
  }
}

void SelectionState::clear() {
  selected_.clear();
  primary_.clear();
}

void SelectionState::assign(const std::vector<Id>& ids) {
  selected_.clear();
  for (const auto& id : ids) {
    if (!id.empty() && !containsId(id)) selected_.push_back(id);
  }
  primary_ = selected_.size() == 1 ? selected_.front() : Id{};
}

bool SelectionState::isSelected(const Id& id) const {
  return containsId(id);
}

void SelectionState::removeId(const Id& id) {
  selected_.erase(
    std::remove_if(selected_.begin(), selected_.end(),
      [&](const Id& k) { return k == id; }),
    selected_.end());
  if (primary_ == id) {
    // Fall back to the most recently added member
    primary_ = selected_.empty() ? Id{} : selected_.back();
  }
}

bool SelectionState::containsId(const Id& id) const {
  for (auto& k : selected_) {
    if (k == id) return true;
  }
  return false;
}

} // namespace mc
