#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// PUSH - Push Register (50+r)
/// The value is read before ESP moves, so PUSH ESP stores the old stack pointer.
void handlers::push_reg ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	context.push ( context.get_reg ( opcode & 7, op_size ), op_size );
}

/// POP - Pop Register (58+r)
void handlers::pop_reg ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint32_t value = context.pop ( op_size );
	context.set_reg ( opcode & 7, value, op_size );
}

/// PUSH - Push Immediate
/// 68 pushes a full-width immediate, 6A a sign-extended imm8.
void handlers::push_imm ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint32_t value = opcode == 0x6A ? context.fetch_signed8_extended ( ) : context.fetch_immediate ( op_size );
	context.push ( value, op_size );
}

/// POP - Pop r/m (8F /0)
/// The destination address is computed after ESP has been incremented.
void handlers::pop_rm ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	if ( modrm.reg != 0 ) {
		helpers::unsupported_extension ( "Group 1A", modrm.reg );
	}

	const uint32_t value = context.pop ( op_size );
	const auto destination = context.resolve_operand ( modrm );
	helpers::set_operand_value ( context, destination, value, op_size );
}

/// PUSHAD - Push All General-Purpose Registers
/// Pushes EAX, ECX, EDX, EBX, the original ESP, EBP, ESI and EDI.
void handlers::pushad ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint32_t original_esp = context.get_reg ( Register::ESP, op_size );

	for ( uint8_t reg = Register::EAX; reg < Register::COUNT; ++reg ) {
		const uint32_t value = reg == Register::ESP ? original_esp : context.get_reg ( reg, op_size );
		context.push ( value, op_size );
	}
}

/// POPAD - Pop All General-Purpose Registers
/// Restores in reverse order of PUSHAD; the saved ESP slot is discarded.
void handlers::popad ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );

	for ( int reg = Register::EDI; reg >= Register::EAX; --reg ) {
		const uint32_t value = context.pop ( op_size );
		if ( reg != Register::ESP ) {
			context.set_reg ( static_cast< uint8_t >( reg ), value, op_size );
		}
	}
}

/// PUSHFD - Push EFLAGS
void handlers::pushfd ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	context.push ( context.get_eflags ( ), op_size );
}

/// POPFD - Pop EFLAGS
/// Under 0x66 only the low 16 bits are replaced.
void handlers::popfd ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint32_t value = context.pop ( op_size );
	if ( op_size == 2 ) {
		context.set_eflags ( ( context.get_eflags ( ) & 0xFFFF0000U ) | value );
	}
	else {
		context.set_eflags ( value );
	}
}

/// LEAVE - Leave Procedure
/// Restores the stack frame by setting ESP to EBP and popping EBP, without affecting flags.
void handlers::leave ( uint8_t opcode, IA32& context ) {
	const uint32_t frame = context.get_reg ( Register::EBP );
	const uint32_t saved_ebp = context.get_memory ( ).read32 ( frame );
	context.set_reg ( Register::ESP, frame + 4 );
	context.set_reg ( Register::EBP, saved_ebp );
}
