#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

static size_t element_size ( uint8_t opcode, IA32& context ) {
	return ( opcode & 1 ) ? context.operand_size ( ) : 1;
}

// Signed pointer increment for one element under the current DF
static uint32_t element_step ( IA32& context, size_t elem_size ) {
	const uint32_t step = static_cast< uint32_t >( elem_size );
	return context.get_flags ( ).DF ? 0U - step : step;
}

static void advance ( IA32& context, Register reg, uint32_t step ) {
	context.set_reg ( reg, context.get_reg ( reg ) + step );
}

// Runs one_iteration once, or under a repeat prefix until ECX reaches zero.
// Comparing forms also stop once ZF disagrees with the prefix (REPE: ZF clear, REPNE: ZF set).
template <bool Compares, typename Func>
void repeat_string ( IA32& context, Func one_iteration ) {
	const auto mode = context.prefixes ( ).repeat;
	if ( mode == RepeatMode::NONE ) {
		one_iteration ( );
		return;
	}

	while ( context.get_reg ( Register::ECX ) != 0 ) {
		one_iteration ( );
		context.set_reg ( Register::ECX, context.get_reg ( Register::ECX ) - 1 );

		if constexpr ( Compares ) {
			const bool zf = context.get_flags ( ).ZF;
			if ( mode == RepeatMode::REP && !zf ) {
				break;
			}
			if ( mode == RepeatMode::REPNE && zf ) {
				break;
			}
		}
	}
}

/// MOVS - Move String
/// Copies an element from [ESI] to [EDI], advancing both according to DF, without affecting flags.
void handlers::movs ( uint8_t opcode, IA32& context ) {
	const size_t elem_size = element_size ( opcode, context );
	const uint32_t step = element_step ( context, elem_size );

	repeat_string<false> ( context, [ & ] ( )
	{
		const auto src = Operand { OpKind::Memory, context.apply_segment_override ( context.get_reg ( Register::ESI ) ) };
		const auto dst = Operand { OpKind::Memory, context.get_reg ( Register::EDI ) };
		helpers::set_operand_value ( context, dst, helpers::get_operand_value ( context, src, elem_size ), elem_size );
		advance ( context, Register::ESI, step );
		advance ( context, Register::EDI, step );
	} );
}

/// CMPS - Compare String Operands
/// Sets flags from [ESI] - [EDI] and advances both pointers.
void handlers::cmps ( uint8_t opcode, IA32& context ) {
	const size_t elem_size = element_size ( opcode, context );
	const uint32_t step = element_step ( context, elem_size );

	repeat_string<true> ( context, [ & ] ( )
	{
		const auto src = Operand { OpKind::Memory, context.apply_segment_override ( context.get_reg ( Register::ESI ) ) };
		const auto dst = Operand { OpKind::Memory, context.get_reg ( Register::EDI ) };
		const uint32_t a = helpers::get_operand_value ( context, src, elem_size );
		const uint32_t b = helpers::get_operand_value ( context, dst, elem_size );
		helpers::sub_with_flags ( context.get_flags ( ), a, b, elem_size );
		advance ( context, Register::ESI, step );
		advance ( context, Register::EDI, step );
	} );
}

/// STOS - Store String
/// Stores the accumulator at [EDI] and advances EDI.
void handlers::stos ( uint8_t opcode, IA32& context ) {
	const size_t elem_size = element_size ( opcode, context );
	const uint32_t step = element_step ( context, elem_size );
	const uint32_t value = context.get_reg ( Register::EAX, elem_size );

	repeat_string<false> ( context, [ & ] ( )
	{
		const auto dst = Operand { OpKind::Memory, context.get_reg ( Register::EDI ) };
		helpers::set_operand_value ( context, dst, value, elem_size );
		advance ( context, Register::EDI, step );
	} );
}

/// LODS - Load String
/// Loads [ESI] into the accumulator and advances ESI.
void handlers::lods ( uint8_t opcode, IA32& context ) {
	const size_t elem_size = element_size ( opcode, context );
	const uint32_t step = element_step ( context, elem_size );

	repeat_string<false> ( context, [ & ] ( )
	{
		const auto src = Operand { OpKind::Memory, context.apply_segment_override ( context.get_reg ( Register::ESI ) ) };
		context.set_reg ( Register::EAX, helpers::get_operand_value ( context, src, elem_size ), elem_size );
		advance ( context, Register::ESI, step );
	} );
}

/// SCAS - Scan String
/// Sets flags from accumulator - [EDI] and advances EDI.
void handlers::scas ( uint8_t opcode, IA32& context ) {
	const size_t elem_size = element_size ( opcode, context );
	const uint32_t step = element_step ( context, elem_size );
	const uint32_t acc = context.get_reg ( Register::EAX, elem_size );

	repeat_string<true> ( context, [ & ] ( )
	{
		const auto dst = Operand { OpKind::Memory, context.get_reg ( Register::EDI ) };
		helpers::sub_with_flags ( context.get_flags ( ), acc, helpers::get_operand_value ( context, dst, elem_size ), elem_size );
		advance ( context, Register::EDI, step );
	} );
}
