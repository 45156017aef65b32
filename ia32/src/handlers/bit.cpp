#include <ia32/emulator.hpp>
#include <bit>
#include "helpers.hpp"

using namespace ia32;

template <typename Func>
void bit_scan ( IA32& context, Func scan ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t val = helpers::get_operand_value ( context, source, op_size ) & IA32_OPERAND_MASK ( op_size );

	auto& flags = context.get_flags ( );
	if ( val == 0 ) {
		flags.ZF = 1; // Source is zero, destination unchanged
		return;
	}

	flags.ZF = 0;
	context.set_reg ( modrm.reg, scan ( val ), op_size );
}

/// BSF-Bit Scan Forward
/// Stores the index of the least significant set bit of the source.
void handlers::bsf ( uint8_t opcode, IA32& context ) {
	bit_scan ( context, [ ] ( uint32_t val ) { return static_cast< uint32_t >( std::countr_zero ( val ) ); } );
}

/// BSR-Bit Scan Reverse
/// Stores the index of the most significant set bit of the source.
void handlers::bsr ( uint8_t opcode, IA32& context ) {
	bit_scan ( context, [ ] ( uint32_t val ) { return static_cast< uint32_t >( 31 - std::countl_zero ( val ) ); } );
}
