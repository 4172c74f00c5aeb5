#include "OsError.hpp"
#include <cerrno>
#include <cstring>
#include <string>

namespace fstreams
{

ErrorCode OsErrorCode(int errnoValue)
{
  switch (errnoValue)
  {
  case EACCES:       return ErrorCode::PermissionDenied;
  case EAGAIN:       return ErrorCode::ResourceUnavailable;
  case EBADF:        return ErrorCode::BadFileDescriptor;
  case EBADMSG:      return ErrorCode::BadMessage;
  case EBUSY:        return ErrorCode::DeviceBusy;
  case EDEADLK:      return ErrorCode::DeadlockAvoided;
  case EDQUOT:       return ErrorCode::DiskQuotaExceeded;
  case EEXIST:       return ErrorCode::FileExists;
  case EFAULT:       return ErrorCode::BadAddress;
  case EFBIG:        return ErrorCode::FileTooLarge;
  case EINTR:        return ErrorCode::Interrupted;
  case EINVAL:       return ErrorCode::InvalidArgument;
  case EIO:          return ErrorCode::IoError;
  case EISDIR:       return ErrorCode::IsDirectory;
  case ELOOP:        return ErrorCode::TooManySymbolicLinks;
  case EMFILE:       return ErrorCode::TooManyOpenFiles;
  case EMLINK:       return ErrorCode::TooManyLinks;
  case EMULTIHOP:    return ErrorCode::MultihopAttempted;
  case ENAMETOOLONG: return ErrorCode::NameTooLong;
  case ENFILE:       return ErrorCode::FileTableOverflow;
  case ENOBUFS:      return ErrorCode::NoBufferSpace;
  case ENODEV:       return ErrorCode::NoSuchDevice;
  case ENOLCK:       return ErrorCode::NoLocksAvailable;
  case ENOLINK:      return ErrorCode::LinkSevered;
  case ENOENT:       return ErrorCode::NoSuchFile;
  case ENOMEM:       return ErrorCode::OutOfMemory;
  case ENOSPC:       return ErrorCode::NoSpaceLeft;
#ifdef ENOSR
  case ENOSR:        return ErrorCode::NoStreamResources;
#endif
#ifdef ENOSTR
  case ENOSTR:       return ErrorCode::NotAStream;
#endif
  case ENOSYS:       return ErrorCode::FunctionNotImplemented;
  case ENOTBLK:      return ErrorCode::BlockDeviceRequired;
  case ENOTDIR:      return ErrorCode::NotADirectory;
  case ENOTSUP:      return ErrorCode::OperationNotSupported;
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
  case EOPNOTSUPP:   return ErrorCode::OperationNotSupported;
#endif
  case ENXIO:        return ErrorCode::NoSuchDeviceOrAddress;
  case EOVERFLOW:    return ErrorCode::ValueOverflow;
  case EPERM:        return ErrorCode::OperationNotPermitted;
  case EPIPE:        return ErrorCode::BrokenPipe;
  case ERANGE:       return ErrorCode::ResultOutOfRange;
  case EROFS:        return ErrorCode::ReadOnlyFileSystem;
  case ESPIPE:       return ErrorCode::IllegalSeek;
  case ESRCH:        return ErrorCode::NoSuchProcess;
  case ESTALE:       return ErrorCode::StaleFileHandle;
  case ETXTBSY:      return ErrorCode::TextFileBusy;
  case EXDEV:        return ErrorCode::CrossDeviceLink;
  default:
    return ErrorCode::UnknownOsError;
  }
}

void ThrowOsError(int errnoValue, const char * context)
{
  std::string message = std::string(context) + ": " + std::strerror(errnoValue);
  throw StreamError(OsErrorCode(errnoValue), message.c_str());
}

}
