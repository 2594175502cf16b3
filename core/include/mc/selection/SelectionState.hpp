#pragma once
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <vector>

namespace mc {

enum class SelectionMode : std::uint8_t { Single, Toggle };

// Primary id (drives the style controls) plus an ordered multi-selection set.
// The primary is always a member of the set when both are non-empty.
class SelectionState {
public:
  void setMode(SelectionMode mode) { mode_ = mode; }
  SelectionMode mode() const { return mode_; }

  // Single mode replaces the selection; Toggle mode adds to it.
  void select(const Id& id);
  void deselect(const Id& id);
  void toggle(const Id& id);
  void clear();

  // Replace the whole set. The primary becomes the sole member when there
  // is exactly one, otherwise none.
  void assign(const std::vector<Id>& ids);

  bool isSelected(const Id& id) const;
  bool hasSelection() const { return !selected_.empty(); }
  std::size_t size() const { return selected_.size(); }
  const std::vector<Id>& selectedIds() const { return selected_; }

  const Id& primary() const { return primary_; }
  bool hasPrimary() const { return !primary_.empty(); }

  bool operator==(const SelectionState& o) const {
    return primary_ == o.primary_ && selected_ == o.selected_;
  }
  bool operator!=(const SelectionState& o) const { return !(*this == o); }

private:
  SelectionMode mode_{SelectionMode::Single};
  Id primary_;
  std::vector<Id> selected_;

  void removeId(const Id& id);
  bool containsId(const Id& id) const;
};

} // namespace mc
