#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// CMP-Compare Two Operands
/// Subtracts the source from the destination, updating flags without storing the result.
void handlers::cmp ( uint8_t opcode, IA32& context ) {
	helpers::execute_alu_form ( helpers::ALU_CMP, opcode, context );
}

/// TEST-Logical Compare
/// ANDs the operands and updates flags; 84/85 take r/m,r and A8/A9 the accumulator with an immediate.
void handlers::test ( uint8_t opcode, IA32& context ) {
	const size_t op_size = ( opcode & 1 ) ? context.operand_size ( ) : 1;

	uint32_t a = 0;
	uint32_t b = 0;
	if ( opcode == 0xA8 || opcode == 0xA9 ) {
		a = context.get_reg ( Register::EAX, op_size );
		b = context.fetch_immediate ( op_size );
	}
	else {
		const auto modrm = context.decode_modrm ( );
		const auto operand = context.resolve_operand ( modrm );
		a = helpers::get_operand_value ( context, operand, op_size );
		b = context.get_reg ( modrm.reg, op_size );
	}

	helpers::logic_with_flags ( context.get_flags ( ), a & b, op_size );
}
