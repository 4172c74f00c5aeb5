#include "fstreams/TextEncoding.hpp"

namespace fstreams
{

unsigned TextEncoding::codeUnitSize() const
{
  switch (m_kind)
  {
  case Kind::Utf16:
    return 2;
  case Kind::Utf32:
    return 4;
  default:
    return 1;
  }
}

const char * TextEncoding::name() const
{
  bool const little = m_endianness == Endianness::Little;
  switch (m_kind)
  {
  case Kind::Latin1:
    return "latin1";
  case Kind::Unicode:
    return "utf8";
  case Kind::Utf16:
    return little ? "utf16le" : "utf16be";
  case Kind::Utf32:
    return little ? "utf32le" : "utf32be";
  }
  return "unknown";
}

bool TextEncoding::operator==(TextEncoding const & rhs) const
{
  if (m_kind != rhs.m_kind)
    return false;
  if (m_kind == Kind::Utf16 || m_kind == Kind::Utf32)
    return m_endianness == rhs.m_endianness;
  return true;
}

}
