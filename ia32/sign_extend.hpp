#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

template <typename T>
inline int64_t sign_extend ( T value, size_t op_size ) {
  static_assert( std::is_unsigned_v<T>, "sign_extend expects an unsigned source" );
  const uint64_t widened = static_cast< uint64_t >( value );
  const unsigned shift = static_cast< unsigned >( 64 - op_size * 8 );
  return static_cast< int64_t >( widened << shift ) >> shift;
}

#define SIGN_EXTEND(value, op_size) sign_extend(value, op_size)
