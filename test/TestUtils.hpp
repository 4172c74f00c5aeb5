#pragma once

#include <string>
#include <iterator>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <gtest/gtest.h>
#include "fstreams/StreamError.hpp"

#define EXPECT_STREAM_ERROR(statement, expectedCode) \
  try \
  { \
    statement; \
    ADD_FAILURE() << "StreamError expected from: " #statement; \
  } \
  catch (fstreams::StreamError const & e) \
  { \
    EXPECT_EQ(expectedCode, e.code()) << fstreams::describe(e); \
  }

// Directory removed with all its content on destruction
class TempDirectory
{
public:
  TempDirectory()
    : m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("fstreams-%%%%-%%%%-%%%%"))
  {
    boost::filesystem::create_directories(m_path);
  }

  ~TempDirectory()
  {
    boost::system::error_code ec;
    boost::filesystem::remove_all(m_path, ec);
  }

  TempDirectory(TempDirectory const &) = delete;
  void operator =(TempDirectory const &) = delete;

  std::string path() const { return m_path.string(); }
  std::string file(const char * name) const { return (m_path / name).string(); }

private:
  boost::filesystem::path const m_path;
};

inline std::string ReadFileContent(std::string const & path)
{
  boost::filesystem::ifstream stream(path, std::ios_base::binary);
  return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}
