#include "FileStreamImpl.hpp"
#include "TextCodec.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

boost::optional<char32_t> FileStream::Impl::peekChar(size_t & length)
{
  unsigned char bytes[text::MaxEncodedCharSize];
  size_t const available = peek(sizeof(bytes), bytes, TextReadAheadSize);
  if (available == 0)
    return boost::none;

  text::DecodedChar const decoded = text::DecodeChar(m_mode.encoding, bytes, available);
  // peek() returns less than asked only at end of stream, so an incomplete
  // character can't be completed either
  if (decoded.status != text::DecodeStatus::Ok)
    ThrowStreamError(ErrorCode::InvalidUnicode, "Invalid data for the file stream text encoding");

  length = decoded.length;
  return decoded.codePoint;
}

std::string FileStream::Impl::readLine()
{
  requireReadable();

  uint64_t const start = m_position;
  std::string line;
  try
  {
    for (;;)
    {
      size_t length = 0;
      boost::optional<char32_t> const c = peekChar(length);
      if (!c)
        break;
      m_position += length;

      if (*c == '\r')
      {
        size_t nextLength = 0;
        boost::optional<char32_t> const next = peekChar(nextLength);
        if (next && *next == '\n')
        {
          m_position += nextLength;
          line.push_back('\n');
          break;
        }
        line.push_back('\r');
        continue;
      }

      text::AppendUtf8(line, *c);
      if (*c == '\n')
        break;
    }
  }
  catch (StreamError const &)
  {
    m_position = start;
    throw;
  }

  if (line.empty())
    ThrowStreamError(ErrorCode::EndOfStream, "End of file stream");
  return line;
}

std::string FileStream::Impl::readChars(size_t count)
{
  requireReadable();
  if (m_mode.raw)
    ThrowStreamError(ErrorCode::OperationNotSupported, "Character reads aren't available on raw file streams");

  uint64_t const start = m_position;
  std::string chars;
  size_t charsRead = 0;
  try
  {
    for (; charsRead < count; ++charsRead)
    {
      size_t length = 0;
      boost::optional<char32_t> const c = peekChar(length);
      if (!c)
        break;
      m_position += length;
      text::AppendUtf8(chars, *c);
    }
  }
  catch (StreamError const &)
  {
    m_position = start;
    throw;
  }

  if (charsRead == 0 && count > 0)
    ThrowStreamError(ErrorCode::EndOfStream, "End of file stream");
  return chars;
}

void FileStream::Impl::writeChars(std::string const & text)
{
  requireWritable();
  std::string const encoded = text::Encode(text, m_mode.encoding);
  write(encoded.size(), encoded.data());
}

void FileStream::Impl::setEncoding(TextEncoding const & encoding)
{
  if (m_mode.raw)
    ThrowStreamError(ErrorCode::OperationNotSupported, "Raw file streams have no text encoding");
  m_mode.encoding = encoding;
}

}
