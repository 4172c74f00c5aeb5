#ifndef _FSTREAMS_API_FILE_OPEN_MODE_H
#define _FSTREAMS_API_FILE_OPEN_MODE_H

#include <vector>
#include <boost/variant.hpp>
#include "fstreams/Common.hpp"
#include "fstreams/TextEncoding.hpp"

namespace fstreams
{

namespace mode
{

struct Read {};

// Creates a missing file. Truncates an existing one unless combined with Read or Append
struct Write {};

// Every write lands at the end of the file. Implies Write
struct Append {};

// Fail with FileExists if the file is already there
struct Exclusive {};

// No text translation; character operations work in UTF-8 only
struct Raw {};

struct Encoding
{
  TextEncoding encoding;
};

struct ReadAhead
{
  size_t size;
};

struct DelayedWrite
{
  size_t size;
};

}

typedef boost::variant<
  mode::Read,
  mode::Write,
  mode::Append,
  mode::Exclusive,
  mode::Raw,
  mode::Encoding,
  mode::ReadAhead,
  mode::DelayedWrite> FileOpenOption;

typedef std::vector<FileOpenOption> FileOpenMode;

}

#endif
