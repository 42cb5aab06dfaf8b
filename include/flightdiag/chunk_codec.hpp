/**
 * @file chunk_codec.hpp
 * @brief Pure data-shape helpers for chunked log transfer: byte ranges, chunks, gap math.
 *
 * @details
 * ## What lives here
 * - `ByteRange`  — a half-open `[offset, offset+length)` window into a log file.
 * - `Chunk`      — one received slice of a log, bounded by `MAX_CHUNK_SIZE`.
 * - `RangeSet`   — the set of byte ranges already received, always kept sorted,
 *                  merged and disjoint.
 * - `split_range()` — cut a gap into request-sized pieces.
 *
 * No I/O, no clocks, no allocation beyond `std::vector` growth in `RangeSet`.
 * Everything here is deterministic and unit-testable in isolation; the
 * transfer engine (chunked_transfer.hpp) builds its bookkeeping on top.
 *
 * ## Invariants held by RangeSet
 * - ranges are sorted by offset ascending;
 * - no two ranges overlap or touch (touching ranges are merged);
 * - no range is empty.
 * `is_canonical(total)` checks all of the above plus the upper bound.
 *
 * @code
 *   flightdiag::RangeSet rx;
 *   rx.add({0, 90});
 *   rx.add({180, 90});
 *   auto holes = rx.missing(300);   // {90,90} and {270,30}
 * @endcode
 */
#ifndef FLIGHTDIAG_CHUNK_CODEC_HPP
#define FLIGHTDIAG_CHUNK_CODEC_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "etl/vector.h"

namespace flightdiag {

/// LOG_DATA carries at most 90 payload bytes; requests never ask for more.
static constexpr uint32_t MAX_CHUNK_SIZE = 90;

/// Half-open byte window `[offset, offset + length)`.
struct ByteRange {
  uint32_t offset{0};
  uint32_t length{0};

  uint32_t end() const { return offset + length; }
  bool empty() const { return length == 0; }
  bool contains(uint32_t pos) const { return pos >= offset && pos < end(); }

  bool operator==(const ByteRange& o) const { return offset == o.offset && length == o.length; }
  bool operator!=(const ByteRange& o) const { return !(*this == o); }
};

/// Fixed-capacity chunk payload; keeps the 90-byte bound in the type.
using ChunkBytes = etl::vector<uint8_t, MAX_CHUNK_SIZE>;

/// One received slice of a log. Transient: copied into the reassembly buffer, then dropped.
struct Chunk {
  uint32_t   offset{0};
  ChunkBytes data;

  ByteRange range() const { return ByteRange{offset, static_cast<uint32_t>(data.size())}; }
};

/**
 * @class RangeSet
 * @brief Sorted, merged, disjoint set of received byte ranges.
 */
class RangeSet {
public:
  /**
   * @brief Insert a range, merging with neighbours.
   * @return Number of bytes that were not covered before the call.
   */
  uint32_t add(const ByteRange& r);

  /// True if every byte of `r` is already covered.
  bool covers(const ByteRange& r) const;

  /// True if byte `pos` is covered.
  bool contains(uint32_t pos) const;

  /// Total number of covered bytes.
  uint64_t covered_bytes() const;

  /// Uncovered ranges inside `[0, total)`, ascending.
  std::vector<ByteRange> missing(uint32_t total) const;

  /// True when the set is exactly the single range `[0, total)` (or empty for total == 0).
  bool is_complete(uint32_t total) const;

  /// Checks the sorted/disjoint/non-adjacent/non-empty invariant and the `total` bound.
  bool is_canonical(uint32_t total) const;

  const std::vector<ByteRange>& ranges() const { return ranges_; }
  bool empty() const { return ranges_.empty(); }
  void clear() { ranges_.clear(); }

private:
  std::vector<ByteRange> ranges_;
};

/// Split `r` into consecutive pieces of at most `max_len` bytes.
std::vector<ByteRange> split_range(const ByteRange& r, uint32_t max_len);

/// Intersection of two ranges (empty range when they do not overlap).
ByteRange intersect(const ByteRange& a, const ByteRange& b);

} // namespace flightdiag

#endif // FLIGHTDIAG_CHUNK_CODEC_HPP
