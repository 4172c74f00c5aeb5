#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>
#include <boost/endian/conversion.hpp>
#include "fstreams/Common.hpp"

namespace fstreams { namespace util {

template<class T, class Enable = void>
struct BitsOf;

template<class T>
struct BitsOf<T, typename std::enable_if<std::is_integral<T>::value>::type>
{
  typedef typename std::make_unsigned<T>::type type;
};

template<>
struct BitsOf<float>
{
  typedef uint32_t type;
};

template<>
struct BitsOf<double>
{
  typedef uint64_t type;
};

// Two's complement integers and IEEE-754 floats of the width of T
template<class T>
inline T DecodeNumber(unsigned char const * data, Endianness endianness)
{
  typedef typename BitsOf<T>::type Bits;
  static_assert(sizeof(Bits) == sizeof(T), "");

  Bits bits;
  std::memcpy(&bits, data, sizeof(bits));
  bits = endianness == Endianness::Little
    ? boost::endian::little_to_native(bits)
    : boost::endian::big_to_native(bits);

  T value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

template<class T>
inline void EncodeNumber(T value, Endianness endianness, unsigned char * data)
{
  typedef typename BitsOf<T>::type Bits;
  static_assert(sizeof(Bits) == sizeof(T), "");

  Bits bits;
  std::memcpy(&bits, &value, sizeof(bits));
  bits = endianness == Endianness::Little
    ? boost::endian::native_to_little(bits)
    : boost::endian::native_to_big(bits);
  std::memcpy(data, &bits, sizeof(bits));
}

}}
