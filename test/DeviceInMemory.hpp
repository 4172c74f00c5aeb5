#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "fstreams/IFileDevice.hpp"
#include "fstreams/StreamError.hpp"

// Files kept in memory, with failure injection for write and sync paths
class DeviceInMemory: public fstreams::IDeviceProvider
{
public:
  DeviceInMemory();

  boost::optional<fstreams::FileStat> stat(const char * path) const override;
  std::unique_ptr<fstreams::IFileDevice> open(const char * path, fstreams::DeviceFlags const &) override;

  void createDirectory(std::string const & path);
  std::vector<char> & data(std::string const & path);
  std::string content(std::string const & path) const;

  unsigned openCount() const { return m_state->openCount; }
  unsigned writeCount() const { return m_state->writeCount; }

  // Each write call stores at most 'size' bytes
  void limitWrites(size_t size) { m_state->writeLimit = size; }
  void failWrites(fstreams::ErrorCode code) { m_state->writeError = code; }
  void failSync(fstreams::ErrorCode code) { m_state->syncError = code; }
  void reset();

  struct State
  {
    std::map<std::string, std::shared_ptr<std::vector<char>>> files;
    std::set<std::string> directories;
    unsigned openCount;
    unsigned writeCount;
    size_t writeLimit;
    boost::optional<fstreams::ErrorCode> writeError;
    boost::optional<fstreams::ErrorCode> syncError;
  };

private:
  std::shared_ptr<State> m_state;
};
