#include "TextCodec.hpp"
#include "util/Assert.hpp"
#include "util/ByteOrder.hpp"

namespace fstreams { namespace text {

namespace
{
  inline bool IsSurrogate(char32_t c)
  {
    return c >= 0xD800 && c <= 0xDFFF;
  }

  inline DecodedChar Ok(char32_t codePoint, size_t length)
  {
    return DecodedChar{ DecodeStatus::Ok, codePoint, length };
  }

  inline DecodedChar Incomplete()
  {
    return DecodedChar{ DecodeStatus::Incomplete, 0, 0 };
  }

  inline DecodedChar Invalid()
  {
    return DecodedChar{ DecodeStatus::Invalid, 0, 0 };
  }

  DecodedChar DecodeUtf8(unsigned char const * data, size_t size)
  {
    if (size == 0)
      return Incomplete();

    unsigned char const lead = data[0];
    size_t length;
    char32_t codePoint;
    char32_t minimum;
    if (lead < 0x80)
      return Ok(lead, 1);
    else if ((lead & 0xE0) == 0xC0)
    {
      length = 2;
      codePoint = lead & 0x1F;
      minimum = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      length = 3;
      codePoint = lead & 0x0F;
      minimum = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      length = 4;
      codePoint = lead & 0x07;
      minimum = 0x10000;
    }
    else
      return Invalid();

    for (size_t i = 1; i < length; ++i)
    {
      if (i >= size)
        return Incomplete();
      if ((data[i] & 0xC0) != 0x80)
        return Invalid();
      codePoint = (codePoint << 6) | (data[i] & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if (codePoint < minimum || IsSurrogate(codePoint) || codePoint > MaxCodePoint)
      return Invalid();
    return Ok(codePoint, length);
  }

  DecodedChar DecodeUtf16(unsigned char const * data, size_t size, Endianness endianness)
  {
    if (size < 2)
      return Incomplete();

    char32_t const first = util::DecodeNumber<uint16_t>(data, endianness);
    if (!IsSurrogate(first))
      return Ok(first, 2);
    if (first >= 0xDC00)
      return Invalid(); // lone low surrogate

    if (size < 4)
      return Incomplete();
    char32_t const second = util::DecodeNumber<uint16_t>(data + 2, endianness);
    if (second < 0xDC00 || second > 0xDFFF)
      return Invalid();
    return Ok(0x10000 + ((first - 0xD800) << 10) + (second - 0xDC00), 4);
  }

  DecodedChar DecodeUtf32(unsigned char const * data, size_t size, Endianness endianness)
  {
    if (size < 4)
      return Incomplete();

    char32_t const codePoint = util::DecodeNumber<uint32_t>(data, endianness);
    if (IsSurrogate(codePoint) || codePoint > MaxCodePoint)
      return Invalid();
    return Ok(codePoint, 4);
  }

  void AppendUnit16(std::string & out, uint16_t unit, Endianness endianness)
  {
    unsigned char bytes[2];
    util::EncodeNumber(unit, endianness, bytes);
    out.append(reinterpret_cast<const char *>(bytes), sizeof(bytes));
  }
}

DecodedChar DecodeChar(TextEncoding const & encoding, unsigned char const * data, size_t size)
{
  switch (encoding.kind())
  {
  case TextEncoding::Kind::Latin1:
    if (size == 0)
      return Incomplete();
    return Ok(data[0], 1);
  case TextEncoding::Kind::Unicode:
    return DecodeUtf8(data, size);
  case TextEncoding::Kind::Utf16:
    return DecodeUtf16(data, size, encoding.endianness());
  case TextEncoding::Kind::Utf32:
    return DecodeUtf32(data, size, encoding.endianness());
  }
  return Invalid();
}

void AppendUtf8(std::string & out, char32_t codePoint)
{
  FSTREAMS_ASSERT(codePoint <= MaxCodePoint);
  if (codePoint < 0x80)
    out.push_back(char(codePoint));
  else if (codePoint < 0x800)
  {
    out.push_back(char(0xC0 | (codePoint >> 6)));
    out.push_back(char(0x80 | (codePoint & 0x3F)));
  }
  else if (codePoint < 0x10000)
  {
    out.push_back(char(0xE0 | (codePoint >> 12)));
    out.push_back(char(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(char(0x80 | (codePoint & 0x3F)));
  }
  else
  {
    out.push_back(char(0xF0 | (codePoint >> 18)));
    out.push_back(char(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(char(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(char(0x80 | (codePoint & 0x3F)));
  }
}

std::string Encode(std::string const & text, TextEncoding const & encoding)
{
  std::string result;
  result.reserve(text.size() * encoding.codeUnitSize());

  unsigned char const * data = reinterpret_cast<unsigned char const *>(text.data());
  size_t remaining = text.size();
  while (remaining > 0)
  {
    DecodedChar const decoded = DecodeUtf8(data, remaining);
    if (decoded.status != DecodeStatus::Ok)
      ThrowStreamError(ErrorCode::InvalidUnicode, "Text to write isn't valid UTF-8");

    char32_t const c = decoded.codePoint;
    switch (encoding.kind())
    {
    case TextEncoding::Kind::Latin1:
      if (c > 0xFF)
        throw StreamError(TextEncoding::unicode(), encoding);
      result.push_back(char(c));
      break;
    case TextEncoding::Kind::Unicode:
      result.append(reinterpret_cast<const char *>(data), decoded.length);
      break;
    case TextEncoding::Kind::Utf16:
      if (c < 0x10000)
        AppendUnit16(result, uint16_t(c), encoding.endianness());
      else
      {
        AppendUnit16(result, uint16_t(0xD800 + ((c - 0x10000) >> 10)), encoding.endianness());
        AppendUnit16(result, uint16_t(0xDC00 + ((c - 0x10000) & 0x3FF)), encoding.endianness());
      }
      break;
    case TextEncoding::Kind::Utf32:
      {
        unsigned char bytes[4];
        util::EncodeNumber(uint32_t(c), encoding.endianness(), bytes);
        result.append(reinterpret_cast<const char *>(bytes), sizeof(bytes));
      }
      break;
    }

    data += decoded.length;
    remaining -= decoded.length;
  }
  return result;
}

}}
