#ifndef _FSTREAMS_API_STREAM_ERROR_H
#define _FSTREAMS_API_STREAM_ERROR_H

#include <exception>
#include <string>
#include "fstreams/Defs.hpp"
#include "fstreams/TextEncoding.hpp"

namespace fstreams
{

enum class ErrorCode
{
  // Operating system conditions, one per errno value
  PermissionDenied,         // EACCES
  ResourceUnavailable,      // EAGAIN
  BadFileDescriptor,        // EBADF
  BadMessage,               // EBADMSG
  DeviceBusy,               // EBUSY
  DeadlockAvoided,          // EDEADLK
  DiskQuotaExceeded,        // EDQUOT
  FileExists,               // EEXIST
  BadAddress,               // EFAULT
  FileTooLarge,             // EFBIG
  Interrupted,              // EINTR
  InvalidArgument,          // EINVAL
  IoError,                  // EIO
  IsDirectory,              // EISDIR
  TooManySymbolicLinks,     // ELOOP
  TooManyOpenFiles,         // EMFILE
  TooManyLinks,             // EMLINK
  MultihopAttempted,        // EMULTIHOP
  NameTooLong,              // ENAMETOOLONG
  FileTableOverflow,        // ENFILE
  NoBufferSpace,            // ENOBUFS
  NoSuchDevice,             // ENODEV
  NoLocksAvailable,         // ENOLCK
  LinkSevered,              // ENOLINK
  NoSuchFile,               // ENOENT
  OutOfMemory,              // ENOMEM
  NoSpaceLeft,              // ENOSPC
  NoStreamResources,        // ENOSR
  NotAStream,               // ENOSTR
  FunctionNotImplemented,   // ENOSYS
  BlockDeviceRequired,      // ENOTBLK
  NotADirectory,            // ENOTDIR
  OperationNotSupported,    // ENOTSUP, also any call the stream mode forbids
  NoSuchDeviceOrAddress,    // ENXIO
  ValueOverflow,            // EOVERFLOW
  OperationNotPermitted,    // EPERM
  BrokenPipe,               // EPIPE
  ResultOutOfRange,         // ERANGE
  ReadOnlyFileSystem,       // EROFS
  IllegalSeek,              // ESPIPE
  NoSuchProcess,            // ESRCH
  StaleFileHandle,          // ESTALE
  TextFileBusy,             // ETXTBSY
  CrossDeviceLink,          // EXDEV
  UnknownOsError,

  // Stream conditions
  EndOfStream,
  NoTranslation,            // characters not representable in the target encoding
  InvalidUnicode            // bytes not valid under the decoding encoding
};

class FSTREAMS_API_DECL StreamError: public std::exception
{
public:
  StreamError(ErrorCode code, const char * msg);
  // NoTranslation error
  StreamError(TextEncoding const & from, TextEncoding const & to);
  StreamError(StreamError const &);
  StreamError(StreamError &&);
  ~StreamError();

  StreamError & operator=(StreamError const &);
  StreamError & operator=(StreamError &&);

  ErrorCode code() const;
  const char * message() const;
  const char * what() const noexcept override;

  // Valid only for ErrorCode::NoTranslation
  TextEncoding translationSource() const;
  TextEncoding translationTarget() const;

private:
  class Impl;
  Impl * m_impl;
};

// One-line human readable description, for diagnostics only
FSTREAMS_API_DECL std::string describe(ErrorCode code);
FSTREAMS_API_DECL std::string describe(StreamError const & error);

}

#endif
