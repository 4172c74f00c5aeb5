#pragma once

#include <string>
#include "fstreams/TextEncoding.hpp"

namespace fstreams { namespace text {

const size_t MaxEncodedCharSize = 4;
const char32_t MaxCodePoint = 0x10FFFF;

enum class DecodeStatus
{
  Ok,
  Incomplete, // more bytes needed to finish the character
  Invalid
};

struct DecodedChar
{
  DecodeStatus status;
  char32_t codePoint;
  size_t length; // bytes consumed when status is Ok
};

// Decodes the character at the beginning of [data, data + size)
DecodedChar DecodeChar(TextEncoding const & encoding, unsigned char const * data, size_t size);

void AppendUtf8(std::string & out, char32_t codePoint);

// Converts UTF-8 'text' into 'encoding'. Throws InvalidUnicode if 'text' isn't
// valid UTF-8 and NoTranslation if a character has no representation in 'encoding'
std::string Encode(std::string const & text, TextEncoding const & encoding);

}}
