#ifndef _FSTREAMS_API_TEXT_ENCODING_H
#define _FSTREAMS_API_TEXT_ENCODING_H

#include "fstreams/Common.hpp"
#include "fstreams/Defs.hpp"

namespace fstreams
{

// On-disk text encoding of a stream. Host strings are always UTF-8.
class FSTREAMS_API_DECL TextEncoding
{
public:
  enum class Kind
  {
    Latin1,
    Unicode, // UTF-8
    Utf16,
    Utf32
  };

  static TextEncoding latin1() { return TextEncoding(Kind::Latin1, Endianness::Big); }
  static TextEncoding unicode() { return TextEncoding(Kind::Unicode, Endianness::Big); }
  static TextEncoding utf16(Endianness endianness) { return TextEncoding(Kind::Utf16, endianness); }
  static TextEncoding utf32(Endianness endianness) { return TextEncoding(Kind::Utf32, endianness); }

  Kind kind() const { return m_kind; }
  // Only meaningful for UTF-16 and UTF-32
  Endianness endianness() const { return m_endianness; }

  bool isLatin1() const { return m_kind == Kind::Latin1; }

  // Width of one code unit in bytes
  unsigned codeUnitSize() const;

  // "latin1", "utf8", "utf16le", "utf16be", "utf32le" or "utf32be"
  const char * name() const;

  bool operator==(TextEncoding const & rhs) const;
  bool operator!=(TextEncoding const & rhs) const { return !(*this == rhs); }

private:
  TextEncoding(Kind kind, Endianness endianness)
    : m_kind(kind)
    , m_endianness(endianness)
  {}

  Kind m_kind;
  Endianness m_endianness;
};

}

#endif
