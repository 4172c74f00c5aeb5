#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "fstreams/FileStream.hpp"
#include "ModeResolver.hpp"
#include "util/ByteOrder.hpp"

namespace fstreams
{

class FileStream::Impl
{
public:
  Impl(std::unique_ptr<IFileDevice> && device, ModeDescriptor const & mode, uint64_t size);
  ~Impl();

  Impl(Impl const &) = delete;
  void operator =(Impl const &) = delete;

  bool isOpen() const { return bool(m_device); }
  ModeDescriptor const & mode() const { return m_mode; }

  void close();
  void sync();

  // Position model
  uint64_t seek(SeekOrigin origin, int64_t offset);
  uint64_t position() const { return m_position; }

  // Binary codec layer
  Bytes readBytes(size_t size);
  Bytes readBytesExact(size_t size);
  Bytes readRemainingBytes();
  void writeBytes(void const * data, size_t size);
  void writeBits(void const * data, uint64_t bitCount);

  template<class T>
  T readNumber(Endianness endianness)
  {
    requireReadable();
    requireBinary();
    unsigned char bytes[sizeof(T)];
    readExact(sizeof(bytes), bytes);
    return util::DecodeNumber<T>(bytes, endianness);
  }

  template<class T>
  void writeNumber(T value, Endianness endianness)
  {
    unsigned char bytes[sizeof(T)];
    util::EncodeNumber(value, endianness, bytes);
    writeBytes(bytes, sizeof(bytes));
  }

  // Text encoding layer
  std::string readLine();
  std::string readChars(size_t count);
  void writeChars(std::string const & text);
  void setEncoding(TextEncoding const & encoding);

private:
  // Minimum read buffer fill while decoding text
  static const size_t TextReadAheadSize = 1024;

  std::unique_ptr<IFileDevice> m_device;
  ModeDescriptor m_mode;
  uint64_t m_position;
  uint64_t m_size; // end of file as seen through this stream

  std::vector<char> m_readBuffer;
  uint64_t m_readBufferPosition;

  std::vector<char> m_writeBuffer;
  uint64_t m_writeBufferPosition;
  boost::optional<StreamError> m_pendingError;

  void requireReadable() const;
  void requireWritable() const;
  void requireBinary() const;

  // Best effort read at the current position, advances it. Returns 0 only at end of stream
  size_t read(size_t size, void * buffer);
  void readExact(size_t size, void * buffer);
  // Like read() but leaves the position as is
  size_t peek(size_t size, void * buffer, size_t minimumFill);
  void write(size_t size, void const * buffer);

  size_t readFromDevice(uint64_t position, size_t size, char * buffer);
  size_t copyFromReadBuffer(size_t size, char * buffer);
  void fillReadBuffer(size_t size);
  void advanceAfterWrite(uint64_t target, size_t written);
  void flushWriteBuffer();

  // Decodes the character at the current position without consuming it
  boost::optional<char32_t> peekChar(size_t & length);
};

}
