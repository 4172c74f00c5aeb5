#include "ModeResolver.hpp"
#include "util/Assert.hpp"

namespace fstreams
{

namespace
{
  struct RequestedMode
  {
    bool read = false;
    bool write = false;
    bool append = false;
    bool exclusive = false;
    bool raw = false;
    boost::optional<TextEncoding> encoding;
    size_t readAheadSize = 0;
    size_t delayedWriteSize = 0;
  };

  class OptionCollector: public boost::static_visitor<>
  {
  public:
    explicit OptionCollector(RequestedMode & requested)
      : m_requested(requested)
    {}

    void operator()(mode::Read const &) const { m_requested.read = true; }
    void operator()(mode::Write const &) const { m_requested.write = true; }
    void operator()(mode::Append const &) const { m_requested.append = true; }
    void operator()(mode::Exclusive const &) const { m_requested.exclusive = true; }
    void operator()(mode::Raw const &) const { m_requested.raw = true; }
    void operator()(mode::Encoding const & option) const { m_requested.encoding = option.encoding; }
    void operator()(mode::ReadAhead const & option) const { m_requested.readAheadSize = option.size; }
    void operator()(mode::DelayedWrite const & option) const { m_requested.delayedWriteSize = option.size; }

  private:
    RequestedMode & m_requested;
  };
}

DeviceFlags ModeDescriptor::deviceFlags() const
{
  DeviceFlags flags;
  flags.read = readable();
  flags.write = writable();
  flags.create = writable();
  flags.truncate = direction == Direction::WriteOnly && !append && !exclusive;
  flags.exclusive = exclusive;
  return flags;
}

ModeDescriptor ResolveOpenMode(FileOpenMode const & mode)
{
  RequestedMode requested;
  OptionCollector collector(requested);
  for (auto const & option: mode)
    boost::apply_visitor(collector, option);

  if (requested.raw && requested.encoding)
    ThrowStreamError(ErrorCode::OperationNotSupported, "Raw mode can't be combined with a text encoding");

  // Append implies write, nothing at all means read
  bool const write = requested.write || requested.append || requested.exclusive;
  bool const read = requested.read || !write;

  ModeDescriptor descriptor = {
    read && write ? Direction::ReadWrite : (write ? Direction::WriteOnly : Direction::ReadOnly),
    requested.append,
    requested.exclusive,
    requested.raw,
    requested.raw ? TextEncoding::unicode() : requested.encoding.value_or(TextEncoding::latin1()),
    requested.readAheadSize,
    requested.delayedWriteSize
  };
  return descriptor;
}

}
