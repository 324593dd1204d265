#pragma once
#include <cstdint>
#include <utility>
#include <vector>

namespace ifs {

// Sorted list of disjoint half-open byte intervals [start, end).
// insert() coalesces overlapping and touching intervals, so the list is
// always in canonical form.
class RangeSet {
public:
  using Range = std::pair<uint64_t, uint64_t>;

  void insert(uint64_t start, uint64_t end);

  // True iff [start, end) is entirely contained in one interval.
  bool covers(uint64_t start, uint64_t end) const;

  uint64_t coveredBytes() const;

  // Lowest offset below limit that is not covered; limit if none.
  uint64_t firstGap(uint64_t limit) const;

  const std::vector<Range>& ranges() const { return ranges_; }
  bool empty() const { return ranges_.empty(); }

private:
  std::vector<Range> ranges_;
};

} // namespace ifs
