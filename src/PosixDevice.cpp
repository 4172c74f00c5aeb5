#include "fstreams/IFileDevice.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <boost/filesystem.hpp>
#include "OsError.hpp"

namespace fstreams
{

namespace fs = boost::filesystem;

class PosixDevice: public IFileDevice
{
public:
  explicit PosixDevice(int fd)
    : m_fd(fd)
  {}

  ~PosixDevice()
  {
    if (m_fd >= 0)
      ::close(m_fd);
  }

  size_t read(uint64_t position, size_t size, void * data) override
  {
    for (;;)
    {
      ssize_t result = ::pread(m_fd, data, size, off_t(position));
      if (result >= 0)
        return size_t(result);
      if (errno != EINTR)
        ThrowOsError(errno, "pread");
    }
  }

  size_t write(uint64_t position, size_t size, void const * data) override
  {
    for (;;)
    {
      ssize_t result = ::pwrite(m_fd, data, size, off_t(position));
      if (result >= 0)
        return size_t(result);
      if (errno != EINTR)
        ThrowOsError(errno, "pwrite");
    }
  }

  void sync() override
  {
    if (::fsync(m_fd) != 0)
      ThrowOsError(errno, "fsync");
  }

  void close() override
  {
    int fd = m_fd;
    m_fd = -1;
    // The descriptor is released even when close reports an error
    if (::close(fd) != 0 && errno != EINTR)
      ThrowOsError(errno, "close");
  }

private:
  int m_fd;
};

class PosixDeviceProvider: public IDeviceProvider
{
public:
  boost::optional<FileStat> stat(const char * path) const override
  {
    boost::system::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_not_found)
      return boost::none;
    if (ec)
      ThrowOsError(ec.value(), "stat");

    FileStat result = { status.type() == fs::directory_file, 0 };
    if (status.type() == fs::regular_file)
    {
      result.size = fs::file_size(path, ec);
      if (ec)
        ThrowOsError(ec.value(), "stat");
    }
    return result;
  }

  std::unique_ptr<IFileDevice> open(const char * path, DeviceFlags const & flags) override
  {
    int oflags = O_CLOEXEC;
    if (flags.read && flags.write)
      oflags |= O_RDWR;
    else if (flags.write)
      oflags |= O_WRONLY;
    else
      oflags |= O_RDONLY;
    if (flags.create)
      oflags |= O_CREAT;
    if (flags.truncate)
      oflags |= O_TRUNC;
    if (flags.exclusive)
      oflags |= O_CREAT | O_EXCL;

    int fd;
    do
    {
      fd = ::open(path, oflags, 0666);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0)
      ThrowOsError(errno, "open");

    return std::unique_ptr<IFileDevice>(new PosixDevice(fd));
  }
};

IDeviceProvider & DefaultDeviceProvider()
{
  static PosixDeviceProvider provider;
  return provider;
}

}
