#pragma once

#include "fstreams/StreamError.hpp"

namespace fstreams
{

[[noreturn]]
inline void ThrowStreamError(ErrorCode code, const char * description)
{
  throw StreamError(code, description);
}

}

#define FSTREAMS_STRINGIFY_IMPL(s) #s
#define FSTREAMS_STRINGIFY(s) FSTREAMS_STRINGIFY_IMPL(s)

#define FSTREAMS_ASSERT(expression) \
  (void)((!!(expression)) || (::fstreams::ThrowStreamError(::fstreams::ErrorCode::IoError, \
    "Internal expectation fail at " __FILE__ " (" FSTREAMS_STRINGIFY(__LINE__) ")"), false))
