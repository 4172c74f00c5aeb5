#include "fstreams/StreamError.hpp"
#include <string>
#include <stdexcept>
#include <boost/optional.hpp>

namespace fstreams
{

class StreamError::Impl
{
public:
  ErrorCode code;
  std::string message;
  boost::optional<std::pair<TextEncoding, TextEncoding>> translation;
};

StreamError::StreamError(ErrorCode code, const char * msg)
  : m_impl(new Impl)
{
  m_impl->message = msg;
  m_impl->code = code;
}

StreamError::StreamError(TextEncoding const & from, TextEncoding const & to)
  : m_impl(new Impl)
{
  m_impl->code = ErrorCode::NoTranslation;
  m_impl->message = std::string("Can't translate text from ") + from.name() + " to " + to.name();
  m_impl->translation = std::make_pair(from, to);
}

StreamError::StreamError(StreamError && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

StreamError::StreamError(StreamError const & src)
  : m_impl(src.m_impl ? new Impl(*src.m_impl) : nullptr)
{
}

StreamError::~StreamError()
{
  delete m_impl;
}

StreamError & StreamError::operator=(StreamError const & src)
{
  if (!src.m_impl)
  {
    delete m_impl;
    m_impl = nullptr;
  }
  else if (m_impl)
    *m_impl = *src.m_impl;
  else
    m_impl = new Impl(*src.m_impl);
  return *this;
}

StreamError & StreamError::operator=(StreamError && src)
{
  delete m_impl;
  m_impl = src.m_impl;
  src.m_impl = nullptr;
  return *this;
}

ErrorCode StreamError::code() const
{
  return m_impl->code;
}

const char * StreamError::message() const
{
  return m_impl->message.c_str();
}

const char * StreamError::what() const noexcept
{
  return m_impl ? m_impl->message.c_str() : "";
}

TextEncoding StreamError::translationSource() const
{
  if (!m_impl->translation)
    throw std::logic_error("Not a translation error");
  return m_impl->translation->first;
}

TextEncoding StreamError::translationTarget() const
{
  if (!m_impl->translation)
    throw std::logic_error("Not a translation error");
  return m_impl->translation->second;
}

std::string describe(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::PermissionDenied:       return "Permission denied";
  case ErrorCode::ResourceUnavailable:    return "Resource temporarily unavailable";
  case ErrorCode::BadFileDescriptor:      return "Bad file number";
  case ErrorCode::BadMessage:             return "Not a data message";
  case ErrorCode::DeviceBusy:             return "File busy";
  case ErrorCode::DeadlockAvoided:        return "Resource deadlock avoided";
  case ErrorCode::DiskQuotaExceeded:      return "Disk quota exceeded";
  case ErrorCode::FileExists:             return "File already exists";
  case ErrorCode::BadAddress:             return "Bad address in system call argument";
  case ErrorCode::FileTooLarge:           return "File too large";
  case ErrorCode::Interrupted:            return "Interrupted system call";
  case ErrorCode::InvalidArgument:        return "Invalid argument";
  case ErrorCode::IoError:                return "I/O error";
  case ErrorCode::IsDirectory:            return "Illegal operation on a directory";
  case ErrorCode::TooManySymbolicLinks:   return "Too many levels of symbolic links";
  case ErrorCode::TooManyOpenFiles:       return "Too many open files";
  case ErrorCode::TooManyLinks:           return "Too many links";
  case ErrorCode::MultihopAttempted:      return "Multihop attempted";
  case ErrorCode::NameTooLong:            return "Filename too long";
  case ErrorCode::FileTableOverflow:      return "File table overflow";
  case ErrorCode::NoBufferSpace:          return "No buffer space available";
  case ErrorCode::NoSuchDevice:           return "No such device";
  case ErrorCode::NoLocksAvailable:       return "No locks available";
  case ErrorCode::LinkSevered:            return "Link has been severed";
  case ErrorCode::NoSuchFile:             return "No such file or directory";
  case ErrorCode::OutOfMemory:            return "Not enough memory";
  case ErrorCode::NoSpaceLeft:            return "No space left on device";
  case ErrorCode::NoStreamResources:      return "No stream resources";
  case ErrorCode::NotAStream:             return "Device not a stream";
  case ErrorCode::FunctionNotImplemented: return "Function not implemented";
  case ErrorCode::BlockDeviceRequired:    return "Block device required";
  case ErrorCode::NotADirectory:          return "Not a directory";
  case ErrorCode::OperationNotSupported:  return "Operation not supported";
  case ErrorCode::NoSuchDeviceOrAddress:  return "No such device or address";
  case ErrorCode::ValueOverflow:          return "Value too large to be stored in data type";
  case ErrorCode::OperationNotPermitted:  return "Not owner";
  case ErrorCode::BrokenPipe:             return "Broken pipe";
  case ErrorCode::ResultOutOfRange:       return "Result too large";
  case ErrorCode::ReadOnlyFileSystem:     return "Read-only file system";
  case ErrorCode::IllegalSeek:            return "Invalid seek";
  case ErrorCode::NoSuchProcess:          return "No such process";
  case ErrorCode::StaleFileHandle:        return "Stale remote file handle";
  case ErrorCode::TextFileBusy:           return "Text file busy";
  case ErrorCode::CrossDeviceLink:        return "Cross-domain link";
  case ErrorCode::UnknownOsError:         return "Unknown operating system error";
  case ErrorCode::EndOfStream:            return "End of file stream";
  case ErrorCode::NoTranslation:          return "Unable to convert encoding";
  case ErrorCode::InvalidUnicode:         return "Invalid bytes for the text encoding";
  }
  return "Unknown error";
}

std::string describe(StreamError const & error)
{
  if (error.code() == ErrorCode::NoTranslation)
    return describe(error.code()) + " from " + error.translationSource().name()
      + " to " + error.translationTarget().name();
  return describe(error.code());
}

}
