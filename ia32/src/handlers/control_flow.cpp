#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// Jcc - Jump if Condition Is Met, rel8 (70-7F)
/// Jumps relative to the next instruction if the condition in the opcode's low nibble holds, without affecting flags.
void handlers::jcc_short ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch_signed8_extended ( );
	if ( helpers::evaluate_condition ( context.get_flags ( ), opcode & 0xF ) ) {
		context.eip ( ) += rel;
	}
}

/// Jcc - Jump if Condition Is Met, rel32 (0F 80-8F)
void handlers::jcc_near ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch32 ( );
	if ( helpers::evaluate_condition ( context.get_flags ( ), opcode & 0xF ) ) {
		context.eip ( ) += rel;
	}
}

/// JMP - Jump, rel8
void handlers::jmp_short ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch_signed8_extended ( );
	context.eip ( ) += rel;
}

/// JMP - Jump, rel32
void handlers::jmp_near ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch32 ( );
	context.eip ( ) += rel;
}

/// CALL - Call Procedure, rel32
/// Pushes the address of the next instruction and jumps relative to it.
void handlers::call ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch32 ( );
	const uint32_t return_address = context.eip ( );
	context.push ( return_address );
	context.eip ( ) = return_address + rel;
}

/// RET - Return from Procedure
void handlers::ret ( uint8_t opcode, IA32& context ) {
	context.eip ( ) = context.pop ( );
}

/// RET imm16 - Return from Procedure and release imm16 bytes of arguments
void handlers::ret_imm ( uint8_t opcode, IA32& context ) {
	const uint16_t release = context.fetch16 ( );
	context.eip ( ) = context.pop ( );
	context.set_reg ( Register::ESP, context.get_reg ( Register::ESP ) + release );
}

/// LOOP/LOOPE/LOOPNE - Loop According to ECX Counter (E0-E2)
/// Decrements ECX without touching flags and jumps while it is non-zero; E0 also requires ZF clear, E1 ZF set.
void handlers::loop ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch_signed8_extended ( );
	const uint32_t counter = context.get_reg ( Register::ECX ) - 1;
	context.set_reg ( Register::ECX, counter );

	const auto& flags = context.get_flags ( );
	bool taken = counter != 0;
	if ( opcode == 0xE0 ) {
		taken = taken && !flags.ZF;
	}
	else if ( opcode == 0xE1 ) {
		taken = taken && flags.ZF;
	}

	if ( taken ) {
		context.eip ( ) += rel;
	}
}

/// JECXZ - Jump if ECX is zero
void handlers::jecxz ( uint8_t opcode, IA32& context ) {
	const uint32_t rel = context.fetch_signed8_extended ( );
	if ( context.get_reg ( Register::ECX ) == 0 ) {
		context.eip ( ) += rel;
	}
}

/// Group 5 - INC, DEC, CALL, JMP, PUSH on r/m
/// Far CALL and JMP (/3, /5) are not supported.
void handlers::group5 ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );

	switch ( modrm.reg ) {
		case 0:
		case 1:
		{
			const auto operand = context.resolve_operand ( modrm );
			const uint32_t value = helpers::get_operand_value ( context, operand, op_size );
			auto& flags = context.get_flags ( );
			const uint32_t res = modrm.reg == 0
				? helpers::inc_with_flags ( flags, value, op_size )
				: helpers::dec_with_flags ( flags, value, op_size );
			helpers::set_operand_value ( context, operand, res, op_size );
			break;
		}
		case 2:
		{
			const auto operand = context.resolve_operand ( modrm );
			const uint32_t target = helpers::get_operand_value ( context, operand, 4 );
			context.push ( context.eip ( ) );
			context.eip ( ) = target;
			break;
		}
		case 4:
		{
			const auto operand = context.resolve_operand ( modrm );
			context.eip ( ) = helpers::get_operand_value ( context, operand, 4 );
			break;
		}
		case 6:
		{
			const auto operand = context.resolve_operand ( modrm );
			context.push ( helpers::get_operand_value ( context, operand, op_size ), op_size );
			break;
		}
		default:
			helpers::unsupported_extension ( "Group 5", modrm.reg );
	}
}
