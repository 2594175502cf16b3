#pragma once
#include "mc/ids/Id.hpp"

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace mc {

// Compass order used throughout: clockwise from top.
enum class Direction : std::uint8_t {
  Top = 0, TopRight, Right, BottomRight, Bottom, BottomLeft, Left, TopLeft
};

const char* directionName(Direction d);
bool parseDirection(const std::string& s, Direction& out);
bool isOrthogonal(Direction d);

struct GridCell {
  int row{0}, col{0};
  bool operator==(const GridCell& o) const { return row == o.row && col == o.col; }
  bool operator!=(const GridCell& o) const { return !(*this == o); }
};

// Symmetric: one boolean per unordered pair.
// Directional: two booleans per pair; entry (viewer, owner) controls whether
// viewer renders elements owned by owner.
enum class LinkModel : std::uint8_t { Symmetric, Directional };

class GridTopology {
public:
  explicit GridTopology(LinkModel model = LinkModel::Symmetric) : model_(model) {}

  LinkModel linkModel() const { return model_; }

  // Records the cell and creates a default-enabled link with every
  // 8-directionally adjacent viewport. Re-placing moves the viewport.
  void place(const Id& viewportId, int row, int col);
  void remove(const Id& viewportId);

  bool contains(const Id& viewportId) const;
  const GridCell* cellOf(const Id& viewportId) const;
  // Empty id when the cell is free.
  Id occupantAt(int row, int col) const;
  std::size_t size() const { return cells_.size(); }
  std::vector<Id> viewportIds() const;  // placement order

  // Direction -> neighbour for occupied cells only.
  std::map<Direction, Id> adjacentOf(const Id& viewportId) const;
  bool areAdjacent(const Id& a, const Id& b) const;
  bool areOrthogonallyAdjacent(const Id& a, const Id& b) const;

  // Flip the link for (a,b) and return the new value. Non-adjacent pairs
  // are left untouched and the current value is returned.
  bool toggleLink(const Id& a, const Id& b);
  // Returns false when the pair is not adjacent.
  bool setLink(const Id& a, const Id& b, bool enabled);
  // Same viewport, or unrecorded pair: true.
  bool isLinked(const Id& a, const Id& b) const;
  bool hasLinkEntry(const Id& a, const Id& b) const;
  // True when at least one recorded link is enabled.
  bool anyLinkEnabled() const;
  std::size_t linkEntryCount() const { return links_.size(); }

  // Cell for a new viewport. For Right/Bottom scans from the reference
  // cell along that axis until a free cell is found. Without a usable
  // reference, the first free cell in a 10x10 row-major scan.
  GridCell nextPosition(Direction direction, const Id& relativeTo) const;

private:
  using LinkKey = std::pair<Id, Id>;
  LinkKey keyFor(const Id& a, const Id& b) const;
  void createLinks(const Id& a, const Id& b);

  LinkModel model_;
  std::vector<std::pair<Id, GridCell>> cells_;
  std::map<LinkKey, bool> links_;
};

} // namespace mc
