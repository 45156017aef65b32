#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// AND-Logical AND
void handlers::and_ ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_AND, opcode, context );
}

/// OR-Logical OR
void handlers::or_ ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_OR, opcode, context );
}

/// XOR-Logical Exclusive OR
void handlers::xor_ ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_XOR, opcode, context );
}

enum class RotateSide : bool {
	RIGHT = 0,
	LEFT = 1,
};

enum class RotateCarry : bool {
	WITHOUT = 0,
	WITH = 1,
};

// Returns {result, carry out}; count is already masked and non-zero
template <RotateSide side, RotateCarry rot_carry>
std::pair<uint32_t, bool> rotate ( uint32_t val, uint8_t count, uint8_t size_in_bits, bool cf ) {
	const uint32_t mask = IA32_OPERAND_MASK ( size_in_bits / 8 );

	if constexpr ( rot_carry == RotateCarry::WITH ) {
		uint32_t temp_val = val;
		bool temp_cf = cf;
		const uint8_t rot = count % ( size_in_bits + 1 );
		for ( uint8_t i = 0; i < rot; ++i ) {
			if constexpr ( side == RotateSide::LEFT ) {
				const bool msb = ( temp_val >> ( size_in_bits - 1 ) ) & 1;
				temp_val = ( ( temp_val << 1 ) | static_cast< uint32_t >( temp_cf ) ) & mask;
				temp_cf = msb;
			}
			else {
				const bool lsb = temp_val & 1;
				temp_val = ( temp_val >> 1 ) | ( static_cast< uint32_t >( temp_cf ) << ( size_in_bits - 1 ) );
				temp_cf = lsb;
			}
		}
		return { temp_val, temp_cf };
	}
	else {
		const uint8_t rot = count % size_in_bits;
		uint32_t result = val;
		if ( rot != 0 ) {
			if constexpr ( side == RotateSide::LEFT ) {
				result = ( ( val << rot ) | ( val >> ( size_in_bits - rot ) ) ) & mask;
			}
			else {
				result = ( ( val >> rot ) | ( val << ( size_in_bits - rot ) ) ) & mask;
			}
		}
		if constexpr ( side == RotateSide::LEFT ) {
			return { result, ( result & 1 ) != 0 };
		}
		else {
			return { result, ( ( result >> ( size_in_bits - 1 ) ) & 1 ) != 0 };
		}
	}
}

template <RotateSide side, RotateCarry rot_carry>
uint32_t rotate_with_flags ( x86::Flags& flags, uint32_t val, uint8_t count, size_t op_size ) {
	const uint8_t size_in_bits = static_cast< uint8_t >( op_size * 8 );

	// RCR derives OF from the operand before rotating
	if constexpr ( side == RotateSide::RIGHT && rot_carry == RotateCarry::WITH ) {
		flags.OF = ( ( val >> ( size_in_bits - 1 ) ) & 1 ) ^ flags.CF;
	}

	const auto [result, cf] = rotate<side, rot_carry> ( val, count, size_in_bits, flags.CF );
	flags.CF = cf;

	const bool msb = ( result >> ( size_in_bits - 1 ) ) & 1;
	if constexpr ( side == RotateSide::LEFT ) {
		flags.OF = msb ^ cf;
	}
	else if constexpr ( rot_carry == RotateCarry::WITHOUT ) {
		flags.OF = msb ^ ( ( result >> ( size_in_bits - 2 ) ) & 1 );
	}
	return result;
}

/// SHL/SAL-Shift Left
static uint32_t shl ( x86::Flags& flags, uint32_t uval, uint8_t count, size_t op_size ) {
	const uint8_t size_in_bits = static_cast< uint8_t >( op_size * 8 );
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	const uint32_t res = count < size_in_bits ? ( uval << count ) & mask : 0;

	flags.CF = count <= size_in_bits ? ( uval >> ( size_in_bits - count ) ) & 1 : 0;
	flags.OF = ( ( res >> ( size_in_bits - 1 ) ) & 1 ) ^ flags.CF;
	helpers::set_result_flags ( flags, res, op_size );
	return res;
}

/// SHR-Shift Right
static uint32_t shr ( x86::Flags& flags, uint32_t uval, uint8_t count, size_t op_size ) {
	const uint8_t size_in_bits = static_cast< uint8_t >( op_size * 8 );
	const uint32_t res = count < size_in_bits ? uval >> count : 0;

	flags.CF = count <= size_in_bits ? ( uval >> ( count - 1 ) ) & 1 : 0;
	flags.OF = ( uval >> ( size_in_bits - 1 ) ) & 1;
	helpers::set_result_flags ( flags, res, op_size );
	return res;
}

/// SAR-Shift Arithmetic Right
static uint32_t sar ( x86::Flags& flags, uint32_t uval, uint8_t count, size_t op_size ) {
	const int64_t sval = SIGN_EXTEND ( uval, op_size );
	const uint32_t res = static_cast< uint32_t >( sval >> count ) & IA32_OPERAND_MASK ( op_size );

	flags.CF = ( sval >> ( count - 1 ) ) & 1;
	flags.OF = 0;
	helpers::set_result_flags ( flags, res, op_size );
	return res;
}

/// Group 2 - ROL, ROR, RCL, RCR, SHL, SHR, SAL, SAR
/// C0/C1 take an imm8 count, D0/D1 shift by one, D2/D3 by CL. The count is masked to 5 bits and a zero count changes nothing.
void handlers::group2 ( uint8_t opcode, IA32& context ) {
	const size_t op_size = ( opcode & 1 ) ? context.operand_size ( ) : 1;
	const auto modrm = context.decode_modrm ( );
	const auto operand = context.resolve_operand ( modrm );

	uint8_t count_raw = 1;
	if ( opcode == 0xC0 || opcode == 0xC1 ) {
		count_raw = context.fetch8 ( );
	}
	else if ( opcode == 0xD2 || opcode == 0xD3 ) {
		count_raw = static_cast< uint8_t >( context.get_reg ( Register::ECX, 1 ) );
	}

	const uint8_t count = count_raw & 0x1F;
	if ( count == 0 ) {
		return;
	}

	const uint32_t uval = helpers::get_operand_value ( context, operand, op_size ) & IA32_OPERAND_MASK ( op_size );
	auto& flags = context.get_flags ( );

	uint32_t res = 0;
	switch ( modrm.reg ) {
		case 0: res = rotate_with_flags<RotateSide::LEFT, RotateCarry::WITHOUT> ( flags, uval, count, op_size ); break;
		case 1: res = rotate_with_flags<RotateSide::RIGHT, RotateCarry::WITHOUT> ( flags, uval, count, op_size ); break;
		case 2: res = rotate_with_flags<RotateSide::LEFT, RotateCarry::WITH> ( flags, uval, count, op_size ); break;
		case 3: res = rotate_with_flags<RotateSide::RIGHT, RotateCarry::WITH> ( flags, uval, count, op_size ); break;
		case 4:
		case 6: res = shl ( flags, uval, count, op_size ); break;
		case 5: res = shr ( flags, uval, count, op_size ); break;
		case 7: res = sar ( flags, uval, count, op_size ); break;
	}

	helpers::set_operand_value ( context, operand, res, op_size );
}
