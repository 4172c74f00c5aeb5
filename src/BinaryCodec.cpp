#include "FileStreamImpl.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

Bytes FileStream::Impl::readBytes(size_t size)
{
  requireReadable();
  requireBinary();

  Bytes data(size);
  if (size == 0)
    return data;

  size_t const count = read(size, data.data());
  if (count == 0)
    ThrowStreamError(ErrorCode::EndOfStream, "End of file stream");
  data.resize(count);
  return data;
}

Bytes FileStream::Impl::readBytesExact(size_t size)
{
  Bytes data = readBytes(size);
  if (data.size() != size)
    ThrowStreamError(ErrorCode::EndOfStream, "Not enough data left in the file stream");
  return data;
}

Bytes FileStream::Impl::readRemainingBytes()
{
  requireReadable();
  requireBinary();

  Bytes data;
  for (;;)
  {
    size_t const offset = data.size();
    data.resize(offset + ReadRemainingChunkSize);
    size_t const count = read(ReadRemainingChunkSize, data.data() + offset);
    data.resize(offset + count);
    if (count == 0)
      break;
  }
  return data;
}

void FileStream::Impl::writeBytes(void const * data, size_t size)
{
  requireWritable();
  requireBinary();
  write(size, data);
}

void FileStream::Impl::writeBits(void const * data, uint64_t bitCount)
{
  if (bitCount % 8 != 0)
    ThrowStreamError(ErrorCode::InvalidArgument, "Written data must be a whole number of bytes");
  writeBytes(data, size_t(bitCount / 8));
}

}
