#include "DeviceInMemory.hpp"
#include <algorithm>
#include <limits>

namespace
{

class FileInMemory: public fstreams::IFileDevice
{
public:
  FileInMemory(std::shared_ptr<DeviceInMemory::State> const & state,
      std::shared_ptr<std::vector<char>> const & data, fstreams::DeviceFlags const & flags)
    : m_state(state)
    , m_data(data)
    , m_flags(flags)
  {}

  size_t read(uint64_t position, size_t size, void * buffer) override
  {
    if (!m_flags.read)
      throw fstreams::StreamError(fstreams::ErrorCode::BadFileDescriptor, "Not opened for reading");
    if (position >= m_data->size())
      return 0;
    size_t const count = std::min(size, size_t(m_data->size() - position));
    std::copy_n(m_data->data() + position, count, static_cast<char *>(buffer));
    return count;
  }

  size_t write(uint64_t position, size_t size, void const * buffer) override
  {
    if (!m_flags.write)
      throw fstreams::StreamError(fstreams::ErrorCode::BadFileDescriptor, "Not opened for writing");
    ++m_state->writeCount;
    if (m_state->writeError)
      throw fstreams::StreamError(*m_state->writeError, "Injected write failure");

    size_t const count = std::min(size, m_state->writeLimit);
    if (position + count > m_data->size())
      m_data->resize(size_t(position + count)); // zero filled
    std::copy_n(static_cast<const char *>(buffer), count, m_data->data() + position);
    return count;
  }

  void sync() override
  {
    if (m_state->syncError)
      throw fstreams::StreamError(*m_state->syncError, "Injected sync failure");
  }

  void close() override
  {
    m_data.reset();
  }

private:
  std::shared_ptr<DeviceInMemory::State> m_state;
  std::shared_ptr<std::vector<char>> m_data;
  fstreams::DeviceFlags const m_flags;
};

}

DeviceInMemory::DeviceInMemory()
  : m_state(std::make_shared<State>())
{
  reset();
}

void DeviceInMemory::reset()
{
  m_state->openCount = 0;
  m_state->writeCount = 0;
  m_state->writeLimit = std::numeric_limits<size_t>::max();
  m_state->writeError = boost::none;
  m_state->syncError = boost::none;
}

boost::optional<fstreams::FileStat> DeviceInMemory::stat(const char * path) const
{
  if (m_state->directories.count(path))
    return fstreams::FileStat{ true, 0 };
  auto it = m_state->files.find(path);
  if (it == m_state->files.end())
    return boost::none;
  return fstreams::FileStat{ false, it->second->size() };
}

std::unique_ptr<fstreams::IFileDevice> DeviceInMemory::open(const char * path, fstreams::DeviceFlags const & flags)
{
  if (m_state->directories.count(path))
    throw fstreams::StreamError(fstreams::ErrorCode::IsDirectory, "Is a directory");

  auto it = m_state->files.find(path);
  if (it == m_state->files.end())
  {
    if (!flags.create && !flags.exclusive)
      throw fstreams::StreamError(fstreams::ErrorCode::NoSuchFile, "No such file");
    it = m_state->files.insert(std::make_pair(std::string(path), std::make_shared<std::vector<char>>())).first;
  }
  else if (flags.exclusive)
    throw fstreams::StreamError(fstreams::ErrorCode::FileExists, "File exists");

  if (flags.truncate)
    it->second->clear();

  ++m_state->openCount;
  return std::unique_ptr<fstreams::IFileDevice>(new FileInMemory(m_state, it->second, flags));
}

void DeviceInMemory::createDirectory(std::string const & path)
{
  m_state->directories.insert(path);
}

std::vector<char> & DeviceInMemory::data(std::string const & path)
{
  auto & file = m_state->files[path];
  if (!file)
    file = std::make_shared<std::vector<char>>();
  return *file;
}

std::string DeviceInMemory::content(std::string const & path) const
{
  auto it = m_state->files.find(path);
  if (it == m_state->files.end())
    return std::string();
  return std::string(it->second->begin(), it->second->end());
}
