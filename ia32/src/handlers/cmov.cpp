#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// CMOVcc-Conditional Move (0F 40-4F)
/// Moves r/m into the register when the condition in the opcode's low nibble holds. The source is read either way.
void handlers::cmovcc ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t src_val = helpers::get_operand_value ( context, source, op_size );

	if ( helpers::evaluate_condition ( context.get_flags ( ), opcode & 0xF ) ) {
		context.set_reg ( modrm.reg, src_val, op_size );
	}
}
