#include <gtest/gtest.h>
#include "ModeResolver.hpp"
#include "TestUtils.hpp"

using namespace fstreams;

TEST(ModeResolver, DefaultsToReadLatin1)
{
  ModeDescriptor const mode = ResolveOpenMode({});
  EXPECT_EQ(Direction::ReadOnly, mode.direction);
  EXPECT_FALSE(mode.append);
  EXPECT_FALSE(mode.raw);
  EXPECT_EQ(TextEncoding::latin1(), mode.encoding);
  EXPECT_TRUE(mode.binaryAllowed());
}

TEST(ModeResolver, Directions)
{
  EXPECT_EQ(Direction::ReadOnly, ResolveOpenMode({ mode::Read() }).direction);
  EXPECT_EQ(Direction::WriteOnly, ResolveOpenMode({ mode::Write() }).direction);
  EXPECT_EQ(Direction::ReadWrite, ResolveOpenMode({ mode::Read(), mode::Write() }).direction);
  EXPECT_EQ(Direction::ReadWrite, ResolveOpenMode({ mode::Write(), mode::Read(), mode::Read() }).direction);
}

TEST(ModeResolver, AppendImpliesWrite)
{
  ModeDescriptor const append = ResolveOpenMode({ mode::Append() });
  EXPECT_EQ(Direction::WriteOnly, append.direction);
  EXPECT_TRUE(append.append);
  EXPECT_TRUE(append.writable());

  ModeDescriptor const readAppend = ResolveOpenMode({ mode::Read(), mode::Append() });
  EXPECT_EQ(Direction::ReadWrite, readAppend.direction);
  EXPECT_TRUE(readAppend.append);
}

TEST(ModeResolver, RawUsesUtf8)
{
  ModeDescriptor const mode = ResolveOpenMode({ mode::Read(), mode::Raw() });
  EXPECT_TRUE(mode.raw);
  EXPECT_EQ(TextEncoding::unicode(), mode.encoding);
  EXPECT_TRUE(mode.binaryAllowed());
}

TEST(ModeResolver, RawAndEncodingConflict)
{
  EXPECT_STREAM_ERROR(ResolveOpenMode({ mode::Raw(), mode::Encoding{ TextEncoding::unicode() } }),
    ErrorCode::OperationNotSupported);
  EXPECT_STREAM_ERROR(ResolveOpenMode({ mode::Encoding{ TextEncoding::latin1() }, mode::Write(), mode::Raw() }),
    ErrorCode::OperationNotSupported);
}

TEST(ModeResolver, EncodingControlsBinaryAccess)
{
  EXPECT_TRUE(ResolveOpenMode({ mode::Encoding{ TextEncoding::latin1() } }).binaryAllowed());
  EXPECT_FALSE(ResolveOpenMode({ mode::Encoding{ TextEncoding::unicode() } }).binaryAllowed());
  EXPECT_FALSE(ResolveOpenMode({ mode::Encoding{ TextEncoding::utf16(Endianness::Little) } }).binaryAllowed());

  ModeDescriptor const mode = ResolveOpenMode({ mode::Encoding{ TextEncoding::utf32(Endianness::Big) } });
  EXPECT_EQ(TextEncoding::utf32(Endianness::Big), mode.encoding);
}

TEST(ModeResolver, Buffering)
{
  ModeDescriptor const mode = ResolveOpenMode({ mode::Read(), mode::ReadAhead{ 4096 }, mode::DelayedWrite{ 512 } });
  EXPECT_EQ(4096u, mode.readAheadSize);
  EXPECT_EQ(512u, mode.delayedWriteSize);
  EXPECT_EQ(0u, ResolveOpenMode({}).readAheadSize);
  EXPECT_EQ(0u, ResolveOpenMode({}).delayedWriteSize);
}

TEST(ModeResolver, DeviceFlags)
{
  DeviceFlags const read = ResolveOpenMode({}).deviceFlags();
  EXPECT_TRUE(read.read);
  EXPECT_FALSE(read.write);
  EXPECT_FALSE(read.create);
  EXPECT_FALSE(read.truncate);

  DeviceFlags const write = ResolveOpenMode({ mode::Write() }).deviceFlags();
  EXPECT_FALSE(write.read);
  EXPECT_TRUE(write.write);
  EXPECT_TRUE(write.create);
  EXPECT_TRUE(write.truncate);

  DeviceFlags const readWrite = ResolveOpenMode({ mode::Read(), mode::Write() }).deviceFlags();
  EXPECT_TRUE(readWrite.create);
  EXPECT_FALSE(readWrite.truncate);

  DeviceFlags const append = ResolveOpenMode({ mode::Append() }).deviceFlags();
  EXPECT_TRUE(append.write);
  EXPECT_FALSE(append.truncate);

  DeviceFlags const exclusive = ResolveOpenMode({ mode::Exclusive() }).deviceFlags();
  EXPECT_TRUE(exclusive.write);
  EXPECT_TRUE(exclusive.exclusive);
  EXPECT_FALSE(exclusive.truncate);
}
