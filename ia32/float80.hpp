#pragma once

#include <cstdint>
#include <utility>
#include "types.hpp"
#include "memory.hpp"

namespace ia32
{
	// {64-bit significand with explicit integer bit, sign:exponent word}
	using float80_bits = std::pair<uint64_t, uint16_t>;

	float80_t from_ieee754_80 ( float80_bits bits );
	float80_bits to_ieee754_80 ( const float80_t& value );

	// Ten little-endian bytes at address
	float80_t read_float80 ( const Memory& memory, uint32_t address );
	void write_float80 ( Memory& memory, uint32_t address, const float80_t& value );
};
