#include "mc/grid/GridTopology.hpp"

#include <algorithm>
#include <string>

namespace mc {

namespace {

struct Offset { int dRow, dCol; };

// Indexed by Direction
constexpr Offset kOffsets[8] = {
  {-1, 0}, {-1, 1}, {0, 1}, {1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, -1}
};

constexpr const char* kDirectionNames[8] = {
  "top", "top-right", "right", "bottom-right", "bottom", "bottom-left", "left", "top-left"
};

constexpr int kFallbackScan = 10;

} // namespace

const char* directionName(Direction d) {
  return kDirectionNames[static_cast<int>(d)];
}

bool parseDirection(const std::string& s, Direction& out) {
  for (int i = 0; i < 8; i++) {
    if (s == kDirectionNames[i]) {
      out = static_cast<Direction>(i);
      return true;
    }
  }
  return false;
}

bool isOrthogonal(Direction d) {
  return d == Direction::Top || d == Direction::Right ||
         d == Direction::Bottom || d == Direction::Left;
}

void GridTopology::place(const Id& viewportId, int row, int col) {
  if (viewportId.empty()) return;
  if (contains(viewportId)) remove(viewportId);

  cells_.emplace_back(viewportId, GridCell{row, col});
  for (const auto& adj : adjacentOf(viewportId)) {
    createLinks(viewportId, adj.second);
  }
}

void GridTopology::remove(const Id& viewportId) {
  cells_.erase(
    std::remove_if(cells_.begin(), cells_.end(),
      [&](const std::pair<Id, GridCell>& c) { return c.first == viewportId; }),
    cells_.end());

  for (auto it = links_.begin(); it != links_.end();) {
    if (it->first.first == viewportId || it->first.second == viewportId) {
      it = links_.erase(it);
    } else {
      ++it;
    }
  }
}

bool GridTopology::contains(const Id& viewportId) const {
  return cellOf(viewportId) != nullptr;
}

const GridCell* GridTopology::cellOf(const Id& viewportId) const {
  for (const auto& c : cells_) {
    if (c.first == viewportId) return &c.second;
  }
  return nullptr;
}

Id GridTopology::occupantAt(int row, int col) const {
  for (const auto& c : cells_) {
    if (c.second.row == row && c.second.col == col) return c.first;
  }
  return {};
}

std::vector<Id> GridTopology::viewportIds() const {
  std::vector<Id> ids;
  ids.reserve(cells_.size());
  for (const auto& c : cells_) ids.push_back(c.first);
  return ids;
}

std::map<Direction, Id> GridTopology::adjacentOf(const Id& viewportId) const {
  std::map<Direction, Id> out;
  const GridCell* cell = cellOf(viewportId);
  if (!cell) return out;

  for (int i = 0; i < 8; i++) {
    Id other = occupantAt(cell->row + kOffsets[i].dRow, cell->col + kOffsets[i].dCol);
    if (!other.empty() && other != viewportId) {
      out[static_cast<Direction>(i)] = other;
    }
  }
  return out;
}

bool GridTopology::areAdjacent(const Id& a, const Id& b) const {
  for (const auto& adj : adjacentOf(a)) {
    if (adj.second == b) return true;
  }
  return false;
}

bool GridTopology::areOrthogonallyAdjacent(const Id& a, const Id& b) const {
  for (const auto& adj : adjacentOf(a)) {
    if (adj.second == b && isOrthogonal(adj.first)) return true;
  }
  return false;
}

GridTopology::LinkKey GridTopology::keyFor(const Id& a, const Id& b) const {
  if (model_ == LinkModel::Directional) return {a, b};
  return a < b ? LinkKey{a, b} : LinkKey{b, a};
}

void GridTopology::createLinks(const Id& a, const Id& b) {
  links_[keyFor(a, b)] = true;
  if (model_ == LinkModel::Directional) links_[keyFor(b, a)] = true;
}

bool GridTopology::toggleLink(const Id& a, const Id& b) {
  if (a == b || !areAdjacent(a, b)) return isLinked(a, b);
  auto key = keyFor(a, b);
  auto it = links_.find(key);
  bool next = (it == links_.end()) ? false : !it->second;
  links_[key] = next;
  return next;
}

bool GridTopology::setLink(const Id& a, const Id& b, bool enabled) {
  if (a == b || !areAdjacent(a, b)) return false;
  links_[keyFor(a, b)] = enabled;
  return true;
}

bool GridTopology::isLinked(const Id& a, const Id& b) const {
  if (a == b) return true;
  auto it = links_.find(keyFor(a, b));
  if (it == links_.end()) return true;
  return it->second;
}

bool GridTopology::hasLinkEntry(const Id& a, const Id& b) const {
  return links_.find(keyFor(a, b)) != links_.end();
}

bool GridTopology::anyLinkEnabled() const {
  for (const auto& l : links_) {
    if (l.second) return true;
  }
  return false;
}

GridCell GridTopology::nextPosition(Direction direction, const Id& relativeTo) const {
  const GridCell* ref = cellOf(relativeTo);
  bool axisScan = direction == Direction::Right || direction == Direction::Bottom;

  if (ref && axisScan) {
    GridCell c = *ref;
    do {
      if (direction == Direction::Right) c.col++;
      else c.row++;
    } while (!occupantAt(c.row, c.col).empty());
    return c;
  }

  for (int r = 0; r < kFallbackScan; r++) {
    for (int c = 0; c < kFallbackScan; c++) {
      if (occupantAt(r, c).empty()) return {r, c};
    }
  }

  // 10x10 block is full: open a new column to the right of everything
  int maxCol = 0;
  for (const auto& c : cells_) maxCol = std::max(maxCol, c.second.col);
  return {0, maxCol + 1};
}

} // namespace mc
