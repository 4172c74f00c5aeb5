#pragma once

#include <boost/optional.hpp>
#include "fstreams/FileOpenMode.hpp"
#include "fstreams/IFileDevice.hpp"

namespace fstreams
{

enum class Direction
{
  ReadOnly,
  WriteOnly,
  ReadWrite
};

// Validated configuration of a stream
struct ModeDescriptor
{
  Direction direction;
  bool append;
  bool exclusive;
  bool raw;
  TextEncoding encoding; // UTF-8 on raw streams, Latin-1 unless given otherwise
  size_t readAheadSize;
  size_t delayedWriteSize;

  bool readable() const { return direction != Direction::WriteOnly; }
  bool writable() const { return direction != Direction::ReadOnly; }
  // Byte and number I/O pass bytes through unmodified only in these modes
  bool binaryAllowed() const { return raw || encoding.isLatin1(); }

  DeviceFlags deviceFlags() const;
};

// Throws StreamError(OperationNotSupported) when Raw and Encoding are combined
ModeDescriptor ResolveOpenMode(FileOpenMode const & mode);

}
