// ============================================================================
// chunk_codec.cpp — implementation for chunk_codec.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "flightdiag/chunk_codec.hpp"

#include <algorithm>

namespace flightdiag {

// ---------------------------------------------------------------------------
// add()
// -----
// Find the first range whose end reaches r.offset (touching counts), swallow
// every following range that starts at or before r.end(), and replace the
// swallowed block with one merged range. Bytes already covered inside the
// swallowed block are subtracted to report how much was new.
// ---------------------------------------------------------------------------
uint32_t RangeSet::add(const ByteRange& r) {
  if (r.empty()) return 0;

  auto first = std::lower_bound(ranges_.begin(), ranges_.end(), r.offset,
                                [](const ByteRange& x, uint32_t off) { return x.end() < off; });

  uint32_t lo = r.offset;
  uint32_t hi = r.end();
  uint32_t already = 0;

  auto last = first;
  while (last != ranges_.end() && last->offset <= hi) {
    already += intersect(*last, r).length;       // overlap with the new range only
    lo = std::min(lo, last->offset);
    hi = std::max(hi, last->end());
    ++last;
  }

  first = ranges_.erase(first, last);
  ranges_.insert(first, ByteRange{lo, hi - lo});
  return r.length - already;
}

bool RangeSet::covers(const ByteRange& r) const {
  if (r.empty()) return true;
  for (const auto& x : ranges_) {
    if (x.offset > r.offset) return false;       // sorted: nothing later can start earlier
    if (x.end() >= r.end()) return true;
    // x starts at/before r but ends too early: only a later range could cover,
    // and merged ranges never touch, so r has a hole.
    if (x.end() > r.offset) return false;
  }
  return false;
}

bool RangeSet::contains(uint32_t pos) const {
  return covers(ByteRange{pos, 1});
}

uint64_t RangeSet::covered_bytes() const {
  uint64_t n = 0;
  for (const auto& x : ranges_) n += x.length;
  return n;
}

std::vector<ByteRange> RangeSet::missing(uint32_t total) const {
  std::vector<ByteRange> out;
  uint32_t cursor = 0;
  for (const auto& x : ranges_) {
    if (x.offset >= total) break;
    if (x.offset > cursor) out.push_back({cursor, x.offset - cursor});
    cursor = std::max(cursor, x.end());
  }
  if (cursor < total) out.push_back({cursor, total - cursor});
  return out;
}

bool RangeSet::is_complete(uint32_t total) const {
  if (total == 0) return ranges_.empty();
  return ranges_.size() == 1 && ranges_[0].offset == 0 && ranges_[0].length == total;
}

bool RangeSet::is_canonical(uint32_t total) const {
  for (size_t i = 0; i < ranges_.size(); ++i) {
    const auto& x = ranges_[i];
    if (x.empty()) return false;
    if (x.end() > total || x.end() < x.offset) return false;   // bound + overflow
    if (i > 0 && ranges_[i - 1].end() >= x.offset) return false;
  }
  return true;
}

std::vector<ByteRange> split_range(const ByteRange& r, uint32_t max_len) {
  std::vector<ByteRange> out;
  if (r.empty() || max_len == 0) return out;
  uint32_t off = r.offset;
  while (off < r.end()) {
    uint32_t n = std::min(max_len, r.end() - off);
    out.push_back({off, n});
    off += n;
  }
  return out;
}

ByteRange intersect(const ByteRange& a, const ByteRange& b) {
  uint32_t lo = std::max(a.offset, b.offset);
  uint32_t hi = std::min(a.end(), b.end());
  if (hi <= lo) return ByteRange{lo, 0};
  return ByteRange{lo, hi - lo};
}

} // namespace flightdiag
