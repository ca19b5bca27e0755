// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_plan.hpp"

#include <algorithm>

namespace ferry {
namespace uploader {

using io::ErrorKind;
using io::Status;

std::string ChunkRange::contentRange() const {
  return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
}

std::vector<ChunkRange> planChunks(uint64_t total, uint64_t factor) {
  std::vector<ChunkRange> plan;
  if (total == 0 || factor == 0) {
    return plan;
  }

  plan.reserve(static_cast<size_t>((total + factor - 1) / factor));
  for (uint64_t offset = 0; offset < total; offset += factor) {
    uint64_t end = std::min(offset + factor, total) - 1;
    plan.push_back(ChunkRange{offset, end, total});
  }
  return plan;
}

Status checkChunk(const ChunkRange& chunk, uint64_t factor, uint64_t expected_start, bool is_last) {
  if (chunk.start != expected_start) {
    return Status::Failure(
      ErrorKind::Protocol, "chunk starts at " + std::to_string(chunk.start) + ", expected " +
                             std::to_string(expected_start)
    );
  }
  if (chunk.end < chunk.start || chunk.end >= chunk.total) {
    return Status::Failure(ErrorKind::Protocol, "chunk range out of bounds: " + chunk.contentRange());
  }
  if (!is_last && chunk.length() != factor) {
    return Status::Failure(
      ErrorKind::Protocol, "non-final chunk length " + std::to_string(chunk.length()) +
                             " is not the chunk factor " + std::to_string(factor)
    );
  }
  if (is_last && chunk.end != chunk.total - 1) {
    return Status::Failure(
      ErrorKind::Protocol, "final chunk does not reach the end of the payload: " + chunk.contentRange()
    );
  }
  return Status::Success();
}

}  // namespace uploader
}  // namespace ferry
