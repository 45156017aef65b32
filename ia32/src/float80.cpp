#include "../float80.hpp"
#include <bit>

using namespace ia32;

namespace
{
	constexpr int16_t exponent_bias = 16383;
	constexpr uint16_t exponent_all_ones = 0x7FFF;
	constexpr uint64_t integer_bit = 0x8000000000000000ULL;
	constexpr uint64_t quiet_nan_significand = 0xC000000000000000ULL;
}

float80_t ia32::from_ieee754_80 ( float80_bits bits ) {
	const uint64_t mantissa = bits.first;
	const uint16_t sign_exp = bits.second;

	const bool sign = ( sign_exp >> 15 ) & 1;
	const uint16_t biased_exp = sign_exp & exponent_all_ones;

	float80_t result;
	auto& backend = result.backend ( );

	// Exponent all ones: I=1, F=0 is infinity, everything else is a NaN
	if ( biased_exp == exponent_all_ones ) {
		if ( mantissa == integer_bit ) {
			backend.exponent ( ) = float80_t::backend_type::exponent_infinity;
			backend.sign ( ) = sign;
		}
		else {
			backend.exponent ( ) = float80_t::backend_type::exponent_nan;
			backend.sign ( ) = false;
		}
		return result;
	}

	if ( mantissa == 0 ) {
		backend.exponent ( ) = float80_t::backend_type::exponent_zero;
		backend.sign ( ) = sign;
		return result;
	}

	backend.sign ( ) = sign;

	if ( biased_exp > 0 && ( mantissa & integer_bit ) != 0 ) {
		backend.exponent ( ) = biased_exp - exponent_bias;
		backend.bits ( ) = mantissa;
		return result;
	}

	// Denormals (E=0) and pseudo-denormals (E>0, I=0) need normalizing
	const int16_t effective_exp_base = ( biased_exp == 0 )
		? static_cast< int16_t >( 1 - exponent_bias )
		: static_cast< int16_t >( biased_exp - exponent_bias );

	const int shift = std::countl_zero ( mantissa );
	backend.bits ( ) = mantissa << shift;
	backend.exponent ( ) = effective_exp_base - shift;
	return result;
}

float80_bits ia32::to_ieee754_80 ( const float80_t& value ) {
	const bool sign = value.backend ( ).sign ( );
	const uint16_t sign_word = sign ? 0x8000 : 0;

	if ( mp::isnan ( value ) ) {
		return { quiet_nan_significand, exponent_all_ones };
	}
	if ( mp::isinf ( value ) ) {
		return { integer_bit, static_cast< uint16_t >( sign_word | exponent_all_ones ) };
	}
	if ( value == 0 ) {
		return { 0, sign_word };
	}

	// |value| = fraction * 2^exp with fraction in [0.5, 1)
	int exp = 0;
	const float80_t fraction = mp::frexp ( mp::abs ( value ), &exp );
	uint64_t mantissa = mp::ldexp ( fraction, 64 ).convert_to<uint64_t> ( );
	int biased = exp - 1 + exponent_bias;

	if ( biased >= exponent_all_ones ) {
		return { integer_bit, static_cast< uint16_t >( sign_word | exponent_all_ones ) };
	}
	if ( biased <= 0 ) {
		const int shift = 1 - biased;
		mantissa = shift >= 64 ? 0 : mantissa >> shift;
		biased = 0;
	}

	return { mantissa, static_cast< uint16_t >( sign_word | static_cast< uint16_t >( biased ) ) };
}

float80_t ia32::read_float80 ( const Memory& memory, uint32_t address ) {
	memory.check ( address, 10, "read_float80" );
	const uint64_t mantissa = memory.read<uint64_t> ( address, "read_float80" );
	const uint16_t sign_exp = memory.read<uint16_t> ( address + 8, "read_float80" );
	return from_ieee754_80 ( { mantissa, sign_exp } );
}

void ia32::write_float80 ( Memory& memory, uint32_t address, const float80_t& value ) {
	const auto bits = to_ieee754_80 ( value );
	// address + 8 can wrap, so the whole operand is checked before either store
	memory.check ( address, 10, "write_float80" );
	memory.write<uint64_t> ( address, bits.first, "write_float80" );
	memory.write<uint16_t> ( address + 8, bits.second, "write_float80" );
}
