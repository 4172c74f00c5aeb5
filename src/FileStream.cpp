#include "FileStreamImpl.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

class FileStreamFactory
{
public:
  static FileStream create(std::unique_ptr<IFileDevice> && device, ModeDescriptor const & mode, uint64_t size)
  {
    FileStream stream;
    stream.m_impl = new FileStream::Impl(std::move(device), mode, size);
    return stream;
  }
};

FileStream::FileStream()
  : m_impl(nullptr)
{}

FileStream::FileStream(FileStream && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

FileStream::~FileStream()
{
  delete m_impl;
}

FileStream & FileStream::operator=(FileStream && src)
{
  if (this != &src)
  {
    delete m_impl;
    m_impl = src.m_impl;
    src.m_impl = nullptr;
  }
  return *this;
}

FileStream::Impl & FileStream::impl() const
{
  if (!isOpen())
    ThrowStreamError(ErrorCode::BadFileDescriptor, "File stream is closed");
  return *m_impl;
}

bool FileStream::isOpen() const
{
  return m_impl != nullptr && m_impl->isOpen();
}

bool FileStream::isReadable() const
{
  return isOpen() && m_impl->mode().readable();
}

bool FileStream::isWritable() const
{
  return isOpen() && m_impl->mode().writable();
}

bool FileStream::isAppend() const
{
  return isOpen() && m_impl->mode().append;
}

bool FileStream::isRaw() const
{
  return isOpen() && m_impl->mode().raw;
}

void FileStream::close()
{
  impl().close();
}

void FileStream::sync()
{
  impl().sync();
}

uint64_t FileStream::seek(SeekOrigin origin, int64_t offset)
{
  return impl().seek(origin, offset);
}

uint64_t FileStream::position() const
{
  return impl().position();
}

Bytes FileStream::readBytes(size_t size)
{
  return impl().readBytes(size);
}

Bytes FileStream::readBytesExact(size_t size)
{
  return impl().readBytesExact(size);
}

Bytes FileStream::readRemainingBytes()
{
  return impl().readRemainingBytes();
}

void FileStream::writeBytes(Bytes const & data)
{
  impl().writeBytes(data.data(), data.size());
}

void FileStream::writeBytes(void const * data, size_t size)
{
  impl().writeBytes(data, size);
}

void FileStream::writeBits(void const * data, uint64_t bitCount)
{
  impl().writeBits(data, bitCount);
}

int8_t FileStream::readInt8() { return impl().readNumber<int8_t>(Endianness::Little); }
uint8_t FileStream::readUint8() { return impl().readNumber<uint8_t>(Endianness::Little); }
int16_t FileStream::readInt16Le() { return impl().readNumber<int16_t>(Endianness::Little); }
int16_t FileStream::readInt16Be() { return impl().readNumber<int16_t>(Endianness::Big); }
uint16_t FileStream::readUint16Le() { return impl().readNumber<uint16_t>(Endianness::Little); }
uint16_t FileStream::readUint16Be() { return impl().readNumber<uint16_t>(Endianness::Big); }
int32_t FileStream::readInt32Le() { return impl().readNumber<int32_t>(Endianness::Little); }
int32_t FileStream::readInt32Be() { return impl().readNumber<int32_t>(Endianness::Big); }
uint32_t FileStream::readUint32Le() { return impl().readNumber<uint32_t>(Endianness::Little); }
uint32_t FileStream::readUint32Be() { return impl().readNumber<uint32_t>(Endianness::Big); }
int64_t FileStream::readInt64Le() { return impl().readNumber<int64_t>(Endianness::Little); }
int64_t FileStream::readInt64Be() { return impl().readNumber<int64_t>(Endianness::Big); }
uint64_t FileStream::readUint64Le() { return impl().readNumber<uint64_t>(Endianness::Little); }
uint64_t FileStream::readUint64Be() { return impl().readNumber<uint64_t>(Endianness::Big); }
float FileStream::readFloat32Le() { return impl().readNumber<float>(Endianness::Little); }
float FileStream::readFloat32Be() { return impl().readNumber<float>(Endianness::Big); }
double FileStream::readFloat64Le() { return impl().readNumber<double>(Endianness::Little); }
double FileStream::readFloat64Be() { return impl().readNumber<double>(Endianness::Big); }

void FileStream::writeInt8(int8_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeUint8(uint8_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeInt16Le(int16_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeInt16Be(int16_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeUint16Le(uint16_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeUint16Be(uint16_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeInt32Le(int32_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeInt32Be(int32_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeUint32Le(uint32_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeUint32Be(uint32_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeInt64Le(int64_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeInt64Be(int64_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeUint64Le(uint64_t value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeUint64Be(uint64_t value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeFloat32Le(float value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeFloat32Be(float value) { impl().writeNumber(value, Endianness::Big); }
void FileStream::writeFloat64Le(double value) { impl().writeNumber(value, Endianness::Little); }
void FileStream::writeFloat64Be(double value) { impl().writeNumber(value, Endianness::Big); }

std::string FileStream::readLine()
{
  return impl().readLine();
}

std::string FileStream::readChars(size_t count)
{
  return impl().readChars(count);
}

void FileStream::writeChars(std::string const & text)
{
  impl().writeChars(text);
}

TextEncoding FileStream::encoding() const
{
  return impl().mode().encoding;
}

void FileStream::setEncoding(TextEncoding const & encoding)
{
  impl().setEncoding(encoding);
}

FileStream OpenFileStream(const char * path, FileOpenMode const & mode, IDeviceProvider & provider)
{
  // Rejects conflicting options before anything reaches the OS
  ModeDescriptor const descriptor = ResolveOpenMode(mode);

  boost::optional<FileStat> const stat = provider.stat(path);
  if (stat && stat->isDirectory)
    ThrowStreamError(ErrorCode::IsDirectory, "Can't open a directory as a file stream");

  DeviceFlags const flags = descriptor.deviceFlags();
  uint64_t const size = (stat && !flags.truncate) ? stat->size : 0;

  return FileStreamFactory::create(provider.open(path, flags), descriptor, size);
}

FileStream OpenFileStream(const char * path, FileOpenMode const & mode)
{
  return OpenFileStream(path, mode, DefaultDeviceProvider());
}

FileStream OpenRead(const char * path)
{
  return OpenFileStream(path, { mode::Read() });
}

FileStream OpenWrite(const char * path)
{
  return OpenFileStream(path, { mode::Write() });
}

FileStream OpenReadText(const char * path, TextEncoding const & encoding)
{
  return OpenFileStream(path, { mode::Read(), mode::Encoding{ encoding } });
}

FileStream OpenWriteText(const char * path, TextEncoding const & encoding)
{
  return OpenFileStream(path, { mode::Write(), mode::Encoding{ encoding } });
}

}
