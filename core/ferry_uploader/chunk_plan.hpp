// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CHUNK_PLAN_HPP
#define FERRY_CHUNK_PLAN_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <io_status.hpp>

namespace ferry {
namespace uploader {

// Byte ranges sent to a OneDrive upload session must be multiples of 320 KiB
constexpr uint64_t kChunkAlignment = 327680;

// Largest byte range OneDrive accepts in one request
constexpr uint64_t kMaxChunkSize = 60 * 1024 * 1024;

/**
 * One byte range of a chunked upload; start and end are inclusive
 */
struct ChunkRange {
  uint64_t start;
  uint64_t end;
  uint64_t total;

  uint64_t length() const {
    return end - start + 1;
  }

  // Value of the Content-Range header, e.g. "bytes 0-327679/1000000"
  std::string contentRange() const;

  bool operator==(const ChunkRange& other) const {
    return start == other.start && end == other.end && total == other.total;
  }
};

/**
 * Partition `total` bytes into ascending ranges of `factor` bytes
 *
 * Every range but the last is exactly `factor` long; the last holds the
 * remainder, or a full `factor` when `total` divides evenly.
 * Returns an empty plan when total or factor is zero.
 */
std::vector<ChunkRange> planChunks(uint64_t total, uint64_t factor);

/**
 * Check the framing of one planned range before it is sent
 *
 * @param expected_start Offset right after the previously accepted range
 * @param is_last Whether this is the final range of the plan
 * @return Protocol failure describing the first violated rule
 */
io::Status checkChunk(const ChunkRange& chunk, uint64_t factor, uint64_t expected_start, bool is_last);

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_CHUNK_PLAN_HPP
