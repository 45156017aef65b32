#include <ia32/emulator.hpp>
#include "helpers.hpp"
#include <fmt/format.h>

using namespace ia32;

static uint32_t require_memory_operand ( IA32& context, const ModRM& modrm, const char* mnemonic ) {
	if ( modrm.mod == 3 ) {
		throw GuestFault ( FaultCode::ILLEGAL_INSTRUCTION,
			fmt::format ( "{} requires a memory operand at EIP=0x{:08x}", mnemonic, context.current_instruction_address ( ) ) );
	}
	return context.resolve_effective_address ( modrm );
}

/// MOV - Move (88-8B)
/// Copies the value from the source operand to the destination operand without affecting flags.
void handlers::mov ( uint8_t opcode, IA32& context ) {
	const auto form = helpers::decode_alu_form ( opcode, context );
	helpers::set_operand_value ( context, form.destination, form.source, form.op_size );
}

/// MOV - Move between the accumulator and an absolute offset (A0-A3)
/// The offset goes through the active segment override.
void handlers::mov_moffs ( uint8_t opcode, IA32& context ) {
	const size_t op_size = ( opcode & 1 ) ? context.operand_size ( ) : 1;
	const auto location = Operand { OpKind::Memory, context.apply_segment_override ( context.fetch32 ( ) ) };

	if ( opcode <= 0xA1 ) {
		context.set_reg ( Register::EAX, helpers::get_operand_value ( context, location, op_size ), op_size );
	}
	else {
		helpers::set_operand_value ( context, location, context.get_reg ( Register::EAX, op_size ), op_size );
	}
}

/// MOV - Move imm8 to r8 (B0+r)
void handlers::mov_reg_imm8 ( uint8_t opcode, IA32& context ) {
	context.set_reg ( opcode & 7, context.fetch8 ( ), 1 );
}

/// MOV - Move immediate to register (B8+r)
void handlers::mov_reg_imm ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	context.set_reg ( opcode & 7, context.fetch_immediate ( op_size ), op_size );
}

/// MOV - Move immediate to r/m (C6 /0, C7 /0)
/// The addressing bytes precede the immediate, so the operand is resolved first.
void handlers::mov_rm_imm ( uint8_t opcode, IA32& context ) {
	const size_t op_size = opcode == 0xC6 ? 1 : context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	if ( modrm.reg != 0 ) {
		helpers::unsupported_extension ( "Group 11", modrm.reg );
	}

	const auto destination = context.resolve_operand ( modrm );
	const uint32_t imm = context.fetch_immediate ( op_size );
	helpers::set_operand_value ( context, destination, imm, op_size );
}

/// LEA - Load Effective Address
/// Stores the raw effective address; segment overrides do not apply.
void handlers::lea ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const uint32_t address = require_memory_operand ( context, modrm, "LEA" );
	context.set_reg ( modrm.reg, address, op_size );
}

/// XCHG - Exchange r/m with register (86/87)
void handlers::xchg ( uint8_t opcode, IA32& context ) {
	const size_t op_size = opcode == 0x86 ? 1 : context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const auto operand = context.resolve_operand ( modrm );

	const uint32_t rm_val = helpers::get_operand_value ( context, operand, op_size );
	const uint32_t reg_val = context.get_reg ( modrm.reg, op_size );
	helpers::set_operand_value ( context, operand, reg_val, op_size );
	context.set_reg ( modrm.reg, rm_val, op_size );
}

/// XCHG - Exchange register with the accumulator (90+r)
void handlers::xchg_eax ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const uint8_t reg = opcode & 7;
	const uint32_t acc = context.get_reg ( Register::EAX, op_size );
	context.set_reg ( Register::EAX, context.get_reg ( reg, op_size ), op_size );
	context.set_reg ( reg, acc, op_size );
}

/// LES/LDS - Load Far Pointer
/// Segment registers are not modelled; only the 32-bit offset is loaded.
void handlers::load_far_pointer ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const auto modrm = context.decode_modrm ( );
	const uint32_t address = context.apply_segment_override ( require_memory_operand ( context, modrm, opcode == 0xC4 ? "LES" : "LDS" ) );
	const auto source = Operand { OpKind::Memory, address };
	context.set_reg ( modrm.reg, helpers::get_operand_value ( context, source, op_size ), op_size );
}

/// MOVZX - Move with Zero-Extend (0F B6 from r/m8, 0F B7 from r/m16)
void handlers::movzx ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const size_t src_size = opcode == 0xB6 ? 1 : 2;
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t value = helpers::get_operand_value ( context, source, src_size );
	context.set_reg ( modrm.reg, value, op_size );
}

/// MOVSX - Move with Sign-Extend (0F BE from r/m8, 0F BF from r/m16)
void handlers::movsx ( uint8_t opcode, IA32& context ) {
	const size_t op_size = context.operand_size ( );
	const size_t src_size = opcode == 0xBE ? 1 : 2;
	const auto modrm = context.decode_modrm ( );
	const auto source = context.resolve_operand ( modrm );
	const uint32_t value = helpers::get_operand_value ( context, source, src_size );
	context.set_reg ( modrm.reg, static_cast< uint32_t >( SIGN_EXTEND ( value, src_size ) ), op_size );
}

/// NOP - No Operation (90, also PAUSE under F3)
void handlers::nop ( uint8_t opcode, IA32& context ) {
}

/// NOP r/m - Multi-byte no operation (0F 1F)
/// Consumes the addressing bytes without touching memory.
void handlers::nop_rm ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.mod != 3 ) {
		static_cast< void >( context.resolve_effective_address ( modrm ) );
	}
}
