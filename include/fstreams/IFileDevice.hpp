#ifndef _FSTREAMS_API_IFILE_DEVICE_H
#define _FSTREAMS_API_IFILE_DEVICE_H

#include <cstdint>
#include <memory>
#include <boost/optional.hpp>
#include "fstreams/Common.hpp"
#include "fstreams/Defs.hpp"

namespace fstreams
{

struct FileStat
{
  bool isDirectory;
  uint64_t size;
};

struct DeviceFlags
{
  bool read;
  bool write;
  bool create;
  bool truncate;
  bool exclusive;
};

// Opened OS file descriptor. Failures throw StreamError with the mapped OS code
class IFileDevice
{
public:
  // Returns number of bytes read, 0 at end of file
  virtual size_t read(uint64_t position, size_t size, void *) = 0;
  // Single write call, may return less than 'size'
  virtual size_t write(uint64_t position, size_t size, void const *) = 0;
  virtual void sync() = 0;
  virtual void close() = 0;

  virtual ~IFileDevice() {}
};

class IDeviceProvider
{
public:
  // Returns none if nothing exists at 'path'
  virtual boost::optional<FileStat> stat(const char * path) const = 0;
  virtual std::unique_ptr<IFileDevice> open(const char * path, DeviceFlags const &) = 0;

  virtual ~IDeviceProvider() {}
};

// Provider backed by POSIX open/pread/pwrite/fsync/close
FSTREAMS_API_DECL IDeviceProvider & DefaultDeviceProvider();

}

#endif
