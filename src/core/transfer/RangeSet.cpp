#include "RangeSet.hpp"

#include <algorithm>

namespace ifs {

void RangeSet::insert(uint64_t start, uint64_t end) {
  if (start >= end) return;

  // first interval whose end reaches start (touching counts)
  auto first = std::lower_bound(ranges_.begin(), ranges_.end(), start,
                                [](const Range& r, uint64_t v) { return r.second < v; });
  auto last = first;
  while (last != ranges_.end() && last->first <= end) {
    start = std::min(start, last->first);
    end   = std::max(end, last->second);
    ++last;
  }
  first = ranges_.erase(first, last);
  ranges_.insert(first, Range{start, end});
}

bool RangeSet::covers(uint64_t start, uint64_t end) const {
  if (start >= end) return true;
  auto it = std::upper_bound(ranges_.begin(), ranges_.end(), start,
                             [](uint64_t v, const Range& r) { return v < r.first; });
  if (it == ranges_.begin()) return false;
  --it;
  return it->first <= start && end <= it->second;
}

uint64_t RangeSet::coveredBytes() const {
  uint64_t total = 0;
  for (const auto& r : ranges_) total += r.second - r.first;
  return total;
}

uint64_t RangeSet::firstGap(uint64_t limit) const {
  if (ranges_.empty() || ranges_.front().first > 0) return 0;
  return std::min(ranges_.front().second, limit);
}

} // namespace ifs
