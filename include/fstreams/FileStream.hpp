#ifndef _FSTREAMS_API_FILE_STREAM_H
#define _FSTREAMS_API_FILE_STREAM_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "fstreams/Common.hpp"
#include "fstreams/Defs.hpp"
#include "fstreams/FileOpenMode.hpp"
#include "fstreams/IFileDevice.hpp"
#include "fstreams/StreamError.hpp"
#include "fstreams/TextEncoding.hpp"

namespace fstreams
{

// Single-owner cursor over one open file. Not thread safe.
// Every failure is reported by throwing StreamError.
class FSTREAMS_API_DECL FileStream
{
public:
  FileStream(FileStream &&);
  ~FileStream();

  FileStream(FileStream const &) = delete;
  void operator =(FileStream const &) = delete;
  FileStream & operator=(FileStream &&);

  bool isOpen() const;
  bool isReadable() const;
  bool isWritable() const;
  bool isAppend() const;
  bool isRaw() const;

  // Flushes delayed writes and closes the device. Reports a deferred write error
  void close();
  // Flushes delayed writes and the OS caches. Reports a deferred write error
  void sync();

  // Returns the new absolute position. A negative result fails with
  // InvalidArgument and leaves the position unchanged
  uint64_t seek(SeekOrigin origin, int64_t offset);
  uint64_t position() const;

  // Byte access, requires a raw or Latin-1 stream

  // Up to 'size' bytes, fewer only at end of stream. EndOfStream if none left
  Bytes readBytes(size_t size);
  // Exactly 'size' bytes or EndOfStream. A short read still consumes the bytes
  Bytes readBytesExact(size_t size);
  // Everything up to end of stream, possibly nothing
  Bytes readRemainingBytes();

  void writeBytes(Bytes const & data);
  void writeBytes(void const * data, size_t size);
  // 'bitCount' must be a whole number of bytes
  void writeBits(void const * data, uint64_t bitCount);

  int8_t readInt8();
  uint8_t readUint8();
  int16_t readInt16Le();
  int16_t readInt16Be();
  uint16_t readUint16Le();
  uint16_t readUint16Be();
  int32_t readInt32Le();
  int32_t readInt32Be();
  uint32_t readUint32Le();
  uint32_t readUint32Be();
  int64_t readInt64Le();
  int64_t readInt64Be();
  uint64_t readUint64Le();
  uint64_t readUint64Be();
  float readFloat32Le();
  float readFloat32Be();
  double readFloat64Le();
  double readFloat64Be();

  void writeInt8(int8_t);
  void writeUint8(uint8_t);
  void writeInt16Le(int16_t);
  void writeInt16Be(int16_t);
  void writeUint16Le(uint16_t);
  void writeUint16Be(uint16_t);
  void writeInt32Le(int32_t);
  void writeInt32Be(int32_t);
  void writeUint32Le(uint32_t);
  void writeUint32Be(uint32_t);
  void writeInt64Le(int64_t);
  void writeInt64Be(int64_t);
  void writeUint64Le(uint64_t);
  void writeUint64Be(uint64_t);
  void writeFloat32Le(float);
  void writeFloat32Be(float);
  void writeFloat64Le(double);
  void writeFloat64Be(double);

  // Calls 'itemReader' exactly 'count' times, the first error propagates
  template<class T>
  std::vector<T> readList(std::function<T (FileStream &)> const & itemReader, size_t count)
  {
    std::vector<T> items;
    items.reserve(count);
    for (size_t i = 0; i < count; ++i)
      items.push_back(itemReader(*this));
    return items;
  }

  // Text access. Host strings are UTF-8

  // Characters up to and including the next '\n', "\r\n" is returned as "\n"
  std::string readLine();
  // Up to 'count' characters, fewer only at end of stream. Not available on raw streams
  std::string readChars(size_t count);
  void writeChars(std::string const & text);

  TextEncoding encoding() const;
  // Affects subsequent text operations only. Not available on raw streams
  void setEncoding(TextEncoding const & encoding);

private:
  friend class FileStreamFactory;
  FileStream();

  class Impl;
  Impl * m_impl;

  // Throws BadFileDescriptor once the stream is closed
  Impl & impl() const;
};

// Default text encoding, when no mode::Encoding is given, is Latin-1
FSTREAMS_API_DECL FileStream OpenFileStream(const char * path, FileOpenMode const & mode);
FSTREAMS_API_DECL FileStream OpenFileStream(const char * path, FileOpenMode const & mode, IDeviceProvider &);

FSTREAMS_API_DECL FileStream OpenRead(const char * path);
FSTREAMS_API_DECL FileStream OpenWrite(const char * path);
FSTREAMS_API_DECL FileStream OpenReadText(const char * path, TextEncoding const & encoding);
FSTREAMS_API_DECL FileStream OpenWriteText(const char * path, TextEncoding const & encoding);

}

#endif
