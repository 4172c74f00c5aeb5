#ifndef _FSTREAMS_API_COMMON_H
#define _FSTREAMS_API_COMMON_H

#include <stddef.h>
#include <cstdint>
#include <vector>

namespace fstreams
{

typedef std::vector<uint8_t> Bytes;

enum class Endianness
{
  Little,
  Big
};

// Reference point of a seek request
enum class SeekOrigin
{
  Start,
  Current,
  End
};

const size_t ReadRemainingChunkSize = 64 * 1024;

}

#endif
