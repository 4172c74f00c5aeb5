#include "FileStreamImpl.hpp"
#include <algorithm>
#include <cstring>
#include "Position.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

FileStream::Impl::Impl(std::unique_ptr<IFileDevice> && device, ModeDescriptor const & mode, uint64_t size)
  : m_device(std::move(device))
  , m_mode(mode)
  , m_position(0)
  , m_size(size)
  , m_readBufferPosition(0)
  , m_writeBufferPosition(0)
{
}

FileStream::Impl::~Impl()
{
  if (!isOpen())
    return;
  try
  {
    close();
  }
  catch (StreamError const &)
  {}
}

void FileStream::Impl::requireReadable() const
{
  if (!m_mode.readable())
    ThrowStreamError(ErrorCode::OperationNotSupported, "File stream isn't opened for reading");
}

void FileStream::Impl::requireWritable() const
{
  if (!m_mode.writable())
    ThrowStreamError(ErrorCode::OperationNotSupported, "File stream isn't opened for writing");
}

void FileStream::Impl::requireBinary() const
{
  if (!m_mode.binaryAllowed())
    ThrowStreamError(ErrorCode::OperationNotSupported,
      "Byte access requires a raw or Latin-1 file stream");
}

void FileStream::Impl::close()
{
  flushWriteBuffer();
  m_readBuffer.clear();

  std::unique_ptr<IFileDevice> device(std::move(m_device));
  boost::optional<StreamError> pendingError = m_pendingError;
  m_pendingError = boost::none;
  try
  {
    device->close();
  }
  catch (StreamError const &)
  {
    if (!pendingError)
      throw;
  }
  if (pendingError)
    throw *pendingError;
}

void FileStream::Impl::sync()
{
  flushWriteBuffer();
  if (m_pendingError)
  {
    StreamError error = *m_pendingError;
    m_pendingError = boost::none;
    throw error;
  }
  m_device->sync();
}

uint64_t FileStream::Impl::seek(SeekOrigin origin, int64_t offset)
{
  m_position = ResolvePosition(origin, offset, m_position, m_size);
  return m_position;
}

size_t FileStream::Impl::readFromDevice(uint64_t position, size_t size, char * buffer)
{
  // The device may return less than asked before end of file
  size_t total = 0;
  while (total < size)
  {
    size_t const count = m_device->read(position + total, size - total, buffer + total);
    if (count == 0)
      break;
    total += count;
  }
  return total;
}

size_t FileStream::Impl::copyFromReadBuffer(size_t size, char * buffer)
{
  if (m_position < m_readBufferPosition || m_position >= m_readBufferPosition + m_readBuffer.size())
    return 0;

  size_t const offset = size_t(m_position - m_readBufferPosition);
  size_t const count = std::min(size, m_readBuffer.size() - offset);
  std::memcpy(buffer, m_readBuffer.data() + offset, count);
  m_position += count;
  return count;
}

void FileStream::Impl::fillReadBuffer(size_t size)
{
  m_readBuffer.resize(size);
  m_readBufferPosition = m_position;
  m_readBuffer.resize(readFromDevice(m_position, size, m_readBuffer.data()));
}

size_t FileStream::Impl::read(size_t size, void * buffer)
{
  flushWriteBuffer();

  char * out = static_cast<char *>(buffer);
  size_t done = copyFromReadBuffer(size, out);
  size_t const rest = size - done;
  if (rest == 0)
    return done;

  if (m_mode.readAheadSize > rest)
  {
    fillReadBuffer(m_mode.readAheadSize);
    done += copyFromReadBuffer(rest, out + done);
  }
  else
  {
    size_t const count = readFromDevice(m_position, rest, out + done);
    m_position += count;
    done += count;
  }
  return done;
}

void FileStream::Impl::readExact(size_t size, void * buffer)
{
  if (read(size, buffer) != size)
    ThrowStreamError(ErrorCode::EndOfStream, "Not enough data left in the file stream");
}

size_t FileStream::Impl::peek(size_t size, void * buffer, size_t minimumFill)
{
  flushWriteBuffer();

  uint64_t const savedPosition = m_position;
  if (m_position < m_readBufferPosition || m_position + size > m_readBufferPosition + m_readBuffer.size())
    fillReadBuffer(std::max(size, std::max(m_mode.readAheadSize, minimumFill)));
  size_t const count = copyFromReadBuffer(size, static_cast<char *>(buffer));
  m_position = savedPosition;
  return count;
}

void FileStream::Impl::advanceAfterWrite(uint64_t target, size_t written)
{
  if (m_mode.append)
    m_size = std::max(m_size, target + written);
  else
  {
    m_position = target + written;
    m_size = std::max(m_size, m_position);
  }
}

void FileStream::Impl::write(size_t size, void const * buffer)
{
  m_readBuffer.clear();
  if (size == 0)
    return;

  uint64_t const target = m_mode.append ? m_size : m_position;
  if (m_mode.delayedWriteSize > 0)
  {
    bool const contiguous = target == m_writeBufferPosition + m_writeBuffer.size();
    if (!contiguous || m_writeBuffer.size() + size > m_mode.delayedWriteSize)
      flushWriteBuffer();
    if (size < m_mode.delayedWriteSize)
    {
      if (m_writeBuffer.empty())
        m_writeBufferPosition = target;
      char const * data = static_cast<char const *>(buffer);
      m_writeBuffer.insert(m_writeBuffer.end(), data, data + size);
      advanceAfterWrite(target, size);
      return;
    }
  }

  size_t const written = m_device->write(target, size, buffer);
  advanceAfterWrite(target, written);
  if (written != size)
    ThrowStreamError(ErrorCode::NoSpaceLeft, "Incomplete write to the file stream");
}

void FileStream::Impl::flushWriteBuffer()
{
  if (m_writeBuffer.empty())
    return;

  std::vector<char> pending;
  pending.swap(m_writeBuffer);
  try
  {
    if (m_device->write(m_writeBufferPosition, pending.size(), pending.data()) != pending.size())
      ThrowStreamError(ErrorCode::NoSpaceLeft, "Incomplete delayed write to the file stream");
  }
  catch (StreamError const & e)
  {
    // Reported by the next sync() or close()
    if (!m_pendingError)
      m_pendingError = e;
  }
}

}
