#pragma once

#include "fstreams/StreamError.hpp"

namespace fstreams
{

ErrorCode OsErrorCode(int errnoValue);

// Throws StreamError for 'errnoValue' with 'context' prepended to the message
[[noreturn]]
void ThrowOsError(int errnoValue, const char * context);

}
