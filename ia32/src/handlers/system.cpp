#include <ia32/emulator.hpp>
#include "helpers.hpp"

using namespace ia32;

/// HLT-Halt
/// Stops the execution loop; the instruction pointer stays past the HLT.
void handlers::hlt ( uint8_t opcode, IA32& context ) {
	context.set_halted ( true );
}

/// INT-Call to Interrupt Procedure
/// Routes vector imm8 to the embedder's interrupt callback.
void handlers::int_ ( uint8_t opcode, IA32& context ) {
	const uint8_t vector = context.fetch8 ( );
	context.raise_interrupt ( vector );
}

/// INT3-Breakpoint
void handlers::int3 ( uint8_t opcode, IA32& context ) {
	context.raise_interrupt ( 3 );
}

/// CLC-Clear Carry Flag
void handlers::clc ( uint8_t opcode, IA32& context ) {
	context.get_flags ( ).CF = 0;
}

/// STC-Set Carry Flag
void handlers::stc ( uint8_t opcode, IA32& context ) {
	context.get_flags ( ).CF = 1;
}

/// CMC-Complement Carry Flag
void handlers::cmc ( uint8_t opcode, IA32& context ) {
	auto& flags = context.get_flags ( );
	flags.CF = !flags.CF;
}

/// CLD-Clear Direction Flag
/// Clears the direction flag (DF), causing string instructions to increment the index registers.
void handlers::cld ( uint8_t opcode, IA32& context ) {
	context.get_flags ( ).DF = 0;
}

/// STD-Set Direction Flag
/// Sets the direction flag (DF), causing string instructions to decrement the index registers.
void handlers::std ( uint8_t opcode, IA32& context ) {
	context.get_flags ( ).DF = 1;
}

/// SAHF-Store AH into Flags
/// Loads SF, ZF, AF, PF and CF from AH.
void handlers::sahf ( uint8_t opcode, IA32& context ) {
	const uint32_t ah = context.get_reg ( 4, 1 );
	const uint32_t eflags = context.get_eflags ( );
	context.set_eflags ( ( eflags & ~x86::SAHF_MASK ) | ( ah & x86::SAHF_MASK ) );
}

/// LAHF-Load Status Flags into AH
void handlers::lahf ( uint8_t opcode, IA32& context ) {
	const uint32_t ah = ( context.get_eflags ( ) & x86::SAHF_MASK ) | 0x02;
	context.set_reg ( 4, ah, 1 );
}

/// FWAIT-Wait for pending x87 exceptions, which are never pending here
void handlers::fwait ( uint8_t opcode, IA32& context ) {
}

/// Two-byte escape (0F)
void handlers::two_byte ( uint8_t opcode, IA32& context ) {
	context.dispatch_two_byte ( context.fetch8 ( ) );
}
