#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// ADD - Add
void handlers::add ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_ADD, opcode, context );
}

/// ADC - Add with carry
void handlers::adc ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_ADC, opcode, context );
}

/// SUB - Subtract
void handlers::sub ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_SUB, opcode, context );
}

/// SBB - Integer subtraction with borrow
void handlers::sbb ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_SBB, opcode, context );
}

/// INC - Increment register (40+r)
void handlers::inc ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint8_t reg = opcode & 7;
	context.set_reg ( reg, helpers::inc_with_flags ( context.get_flags ( ), context.get_reg ( reg, op_size ), op_size ), op_size );
}

/// DEC - Decrement register (48+r)
void handlers::dec ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint8_t reg = opcode & 7;
	context.set_reg ( reg, helpers::dec_with_flags ( context.get_flags ( ), context.get_reg ( reg, op_size ), op_size ), op_size );
}

/// Group 1 - ALU operation with an immediate source
/// 80/82 take imm8, 81 a full-width immediate, 83 a sign-extended imm8
void handlers::group1 ( uint8_t opcode, IA32& context ) {
	const size_t op_size = ( opcode == 0x80 || opcode == 0x82 ) ? 1 : context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto destination = context.resolve_operand ( modrm );

	uint32_t imm = 0;
	switch ( opcode ) {
		case 0x81: imm = context.fetch_immediate ( op_size ); break;
		case 0x83: imm = context.fetch_signed8_extended ( ); break;
		default: imm = context.fetch8 ( ); break;
	}

	const auto operation = static_cast< helpers::AluOperation >( modrm.reg );
	const uint32_t current = helpers::get_operand_value ( context, destination, op_size );
	const uint32_t result = helpers::alu ( operation, context.get_flags ( ), current, imm, op_size );
	if ( operation != helpers::ALU_CMP ) {
		helpers::set_operand_value ( context, destination, result, op_size );
	}
}

// Accumulator register pairs by width: {low, high} as encoding indices
struct AccumulatorPair {
	uint8_t low;
	uint8_t high;
};

static AccumulatorPair accumulator_pair ( size_t op_size ) {
	if ( op_size == 1 ) {
		return { Register::EAX, 4 }; // AL, AH
	}
	return { Register::EAX, Register::EDX };
}

template <bool Signed>
void multiply ( IA32& context, uint32_t src_val, size_t op_size ) {
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	const auto regs = accumulator_pair ( op_size );
	const uint32_t acc_val = context.get_reg ( regs.low, op_size );

	uint64_t full_res = 0;
	bool overflow = false;
	if constexpr ( Signed ) {
		const int64_t product = SIGN_EXTEND ( acc_val, op_size ) * SIGN_EXTEND ( src_val & mask, op_size );
		full_res = static_cast< uint64_t >( product );
		overflow = SIGN_EXTEND ( static_cast< uint32_t >( full_res ) & mask, op_size ) != product;
	}
	else {
		full_res = static_cast< uint64_t >( acc_val ) * ( src_val & mask );
		overflow = ( full_res >> ( op_size * 8 ) ) != 0;
	}

	const uint32_t low_res = static_cast< uint32_t >( full_res ) & mask;
	const uint32_t high_res = static_cast< uint32_t >( full_res >> ( op_size * 8 ) ) & mask;

	context.set_reg ( regs.low, low_res, op_size );
	context.set_reg ( regs.high, high_res, op_size );

	auto& flags = context.get_flags ( );
	flags.CF = flags.OF = overflow;
}

template <bool Signed>
void divide ( IA32& context, uint32_t src_val, size_t op_size ) {
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	const auto regs = accumulator_pair ( op_size );
	const uint32_t divisor = src_val & mask;

	if ( divisor == 0 ) {
		throw GuestFault ( FaultCode::INTEGER_DIVIDE_BY_ZERO, "Division by zero" );
	}

	// AX for byte division, high:low register pair otherwise
	const uint64_t raw_dividend = op_size == 1
		? context.get_reg ( Register::EAX, 2 )
		: ( static_cast< uint64_t >( context.get_reg ( regs.high, op_size ) ) << ( op_size * 8 ) ) | context.get_reg ( regs.low, op_size );

	uint32_t quotient_res = 0;
	uint32_t remainder_res = 0;
	if constexpr ( Signed ) {
		const size_t dividend_bits = op_size * 16;
		const int64_t dividend = dividend_bits == 64
			? static_cast< int64_t >( raw_dividend )
			: static_cast< int64_t >( raw_dividend << ( 64 - dividend_bits ) ) >> ( 64 - dividend_bits );
		const int64_t sdivisor = SIGN_EXTEND ( divisor, op_size );
		const int64_t max_quotient = static_cast< int64_t >( IA32_SIGN_BIT ( op_size ) ) - 1;
		const int64_t min_quotient = -static_cast< int64_t >( IA32_SIGN_BIT ( op_size ) );

		if ( dividend == INT64_MIN && sdivisor == -1 ) {
			throw GuestFault ( FaultCode::INTEGER_OVERFLOW, "Division overflow" );
		}
		const int64_t quotient = dividend / sdivisor;
		if ( quotient > max_quotient || quotient < min_quotient ) {
			throw GuestFault ( FaultCode::INTEGER_OVERFLOW, "Division overflow" );
		}
		quotient_res = static_cast< uint32_t >( quotient ) & mask;
		remainder_res = static_cast< uint32_t >( dividend % sdivisor ) & mask;
	}
	else {
		const uint64_t quotient = raw_dividend / divisor;
		if ( quotient > mask ) {
			throw GuestFault ( FaultCode::INTEGER_OVERFLOW, "Division overflow" );
		}
		quotient_res = static_cast< uint32_t >( quotient );
		remainder_res = static_cast< uint32_t >( raw_dividend % divisor );
	}

	context.set_reg ( regs.low, quotient_res, op_size );
	context.set_reg ( regs.high, remainder_res, op_size );
}

/// Group 3 - TEST, NOT, NEG, MUL, IMUL, DIV, IDIV on r/m
void handlers::group3 ( uint8_t opcode, IA32& context ) {
	const size_t op_size = opcode == 0xF6 ? 1 : context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto operand = context.resolve_operand ( modrm );
	const uint32_t value = helpers::get_operand_value ( context, operand, op_size );
	auto& flags = context.get_flags ( );

	switch ( modrm.reg ) {
		case 0:
		case 1:
		{
			const uint32_t imm = context.fetch_immediate ( op_size );
			helpers::logic_with_flags ( flags, value & imm, op_size );
			break;
		}
		case 2:
		{
			helpers::set_operand_value ( context, operand, ~value, op_size );
			break;
		}
		case 3:
		{
			const uint32_t res = helpers::sub_with_flags ( flags, 0, value, op_size );
			flags.CF = ( value & IA32_OPERAND_MASK ( op_size ) ) != 0;
			helpers::set_operand_value ( context, operand, res, op_size );
			break;
		}
		case 4: multiply<false> ( context, value, op_size ); break;
		case 5: multiply<true> ( context, value, op_size ); break;
		case 6: divide<false> ( context, value, op_size ); break;
		case 7: divide<true> ( context, value, op_size ); break;
	}
}

/// Group 4 - INC/DEC r/m8
void handlers::group4 ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.reg > 1 ) {
		helpers::unsupported_extension ( "Group 4", modrm.reg );
	}

	const auto operand = context.resolve_operand ( modrm );
	const uint32_t value = helpers::get_operand_value ( context, operand, 1 );
	auto& flags = context.get_flags ( );
	const uint32_t res = modrm.reg == 0 ? helpers::inc_with_flags ( flags, value, 1 ) : helpers::dec_with_flags ( flags, value, 1 );
	helpers::set_operand_value ( context, operand, res, 1 );
}

static uint32_t signed_multiply ( x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size ) {
	const int64_t product = SIGN_EXTEND ( a & IA32_OPERAND_MASK ( op_size ), op_size ) * SIGN_EXTEND ( b & IA32_OPERAND_MASK ( op_size ), op_size );
	const uint32_t res = static_cast< uint32_t >( product ) & IA32_OPERAND_MASK ( op_size );
	flags.CF = flags.OF = SIGN_EXTEND ( res, op_size ) != product;
	return res;
}

/// IMUL - Signed multiply, r <- r * r/m (0F AF)
void handlers::imul ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t a = context.get_reg ( modrm.reg, op_size );
	const uint32_t b = helpers::get_operand_value ( context, source, op_size );
	context.set_reg ( modrm.reg, signed_multiply ( context.get_flags ( ), a, b, op_size ), op_size );
}

/// IMUL - Signed multiply, r <- r/m * imm (69 full immediate, 6B sign-extended imm8)
void handlers::imul_imm ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t a = helpers::get_operand_value ( context, source, op_size );
	const uint32_t imm = opcode == 0x6B ? context.fetch_signed8_extended ( ) : context.fetch_immediate ( op_size );
	context.set_reg ( modrm.reg, signed_multiply ( context.get_flags ( ), a, imm, op_size ), op_size );
}

/// XADD - Exchange and add
void handlers::xadd ( uint8_t opcode, IA32& context ) {
	const size_t op_size = opcode == 0xC0 ? 1 : context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto destination = context.resolve_operand ( modrm );
	const uint32_t dst_val = helpers::get_operand_value ( context, destination, op_size );
	const uint32_t src_val = context.get_reg ( modrm.reg, op_size );

	const uint32_t sum = helpers::add_with_flags ( context.get_flags ( ), dst_val, src_val, op_size );
	context.set_reg ( modrm.reg, dst_val, op_size );
	helpers::set_operand_value ( context, destination, sum, op_size );
}

/// CDQ/CWD - Sign-extend the accumulator into EDX (DX)
void handlers::cdq ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint32_t acc = context.get_reg ( Register::EAX, op_size );
	context.set_reg ( Register::EDX, ( acc & IA32_SIGN_BIT ( op_size ) ) ? 0xFFFFFFFFU : 0U, op_size );
}

/// CWDE/CBW - Sign-extend AX into EAX (AL into AX)
void handlers::cwde ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const size_t half = op_size / 2;
	const uint32_t value = context.get_reg ( Register::EAX, half );
	context.set_reg ( Register::EAX, static_cast< uint32_t >( SIGN_EXTEND ( value, half ) ), op_size );
}
