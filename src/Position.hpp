#pragma once

#include <cstdint>
#include <limits>
#include "fstreams/Common.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

// Absolute position for a seek request. Throws InvalidArgument if it would be negative
inline uint64_t ResolvePosition(SeekOrigin origin, int64_t offset, uint64_t current, uint64_t size)
{
  uint64_t base = 0;
  switch (origin)
  {
  case SeekOrigin::Start:
    base = 0;
    break;
  case SeekOrigin::Current:
    base = current;
    break;
  case SeekOrigin::End:
    base = size;
    break;
  }

  if (offset < 0)
  {
    // Negating INT64_MIN overflows, go through unsigned arithmetic
    uint64_t const distance = uint64_t(0) - uint64_t(offset);
    if (distance > base)
      ThrowStreamError(ErrorCode::InvalidArgument, "Seek to a negative position");
    return base - distance;
  }

  if (uint64_t(offset) > uint64_t(std::numeric_limits<int64_t>::max()) - base)
    ThrowStreamError(ErrorCode::InvalidArgument, "Seek position overflows");
  return base + uint64_t(offset);
}

}
