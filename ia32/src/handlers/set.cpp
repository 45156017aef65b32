#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// SETcc-Set Byte on Condition (0F 90-9F)
/// Sets the destination byte to 1 if the condition holds, otherwise to 0.
void handlers::setcc ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	const auto destination = context.resolve_operand ( modrm );
	const uint32_t result = helpers::evaluate_condition ( context.get_flags ( ), opcode & 0xF ) ? 1 : 0;
	helpers::set_operand_value ( context, destination, result, 1 );
}
