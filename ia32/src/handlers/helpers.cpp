#include "helpers.hpp"
#include <fmt/format.h>

using namespace ia32;

helpers::AluForm helpers::decode_alu_form ( uint8_t opcode, IA32& state ) {
	const size_t full_size = state.operand_size ( );
	switch ( opcode & 7 ) {
		case 0:
		{
			const auto modrm = state.decode_modrm ( );
			const auto destination = state.resolve_operand ( modrm );
			return { destination, state.get_reg ( modrm.reg, 1 ), 1 };
		}
		case 1:
		{
			const auto modrm = state.decode_modrm ( );
			const auto destination = state.resolve_operand ( modrm );
			return { destination, state.get_reg ( modrm.reg, full_size ), full_size };
		}
		case 2:
		{
			const auto modrm = state.decode_modrm ( );
			const auto source = state.resolve_operand ( modrm );
			return { register_operand ( modrm.reg ), get_operand_value ( state, source, 1 ), 1 };
		}
		case 3:
		{
			const auto modrm = state.decode_modrm ( );
			const auto source = state.resolve_operand ( modrm );
			return { register_operand ( modrm.reg ), get_operand_value ( state, source, full_size ), full_size };
		}
		case 4:
			return { register_operand ( Register::EAX ), state.fetch8 ( ), 1 };
		case 5:
			return { register_operand ( Register::EAX ), state.fetch_immediate ( full_size ), full_size };
		default:
			break;
	}
	throw GuestFault ( FaultCode::ILLEGAL_INSTRUCTION,
		fmt::format ( "Unknown opcode: 0x{:02x} at EIP=0x{:08x}", opcode, state.current_instruction_address ( ) ) );
}

uint32_t helpers::get_operand_value ( IA32& state, const Operand& operand, size_t op_size ) {
	if ( operand.is_register ( ) ) {
		return state.get_reg ( static_cast< uint8_t >( operand.location ), op_size );
	}

	auto& memory = state.get_memory ( );
	switch ( op_size ) {
		case 1: return memory.read8 ( operand.location );
		case 2: return memory.read16 ( operand.location );
		default: return memory.read32 ( operand.location );
	}
}

void helpers::set_operand_value ( IA32& state, const Operand& operand, uint32_t value, size_t op_size ) {
	if ( operand.is_register ( ) ) {
		return state.set_reg ( static_cast< uint8_t >( operand.location ), value, op_size );
	}

	auto& memory = state.get_memory ( );
	switch ( op_size ) {
		case 1: return memory.write8 ( operand.location, static_cast< uint8_t >( value ) );
		case 2: return memory.write16 ( operand.location, static_cast< uint16_t >( value ) );
		default: return memory.write32 ( operand.location, value );
	}
}

void helpers::set_result_flags ( x86::Flags& flags, uint32_t result, size_t op_size ) {
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	flags.ZF = ( result & mask ) == 0;
	flags.SF = ( result & IA32_SIGN_BIT ( op_size ) ) != 0;
}

uint32_t helpers::add_with_flags ( x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size, bool carry_in ) {
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	const uint32_t sign = IA32_SIGN_BIT ( op_size );
	const uint32_t ua = a & mask;
	const uint32_t ub = b & mask;
	const uint64_t wide = static_cast< uint64_t >( ua ) + ub + ( carry_in ? 1 : 0 );
	const uint32_t res = static_cast< uint32_t >( wide ) & mask;

	flags.CF = wide > mask;
	flags.OF = ( ( ua & sign ) == ( ub & sign ) ) && ( ( res & sign ) != ( ua & sign ) );
	set_result_flags ( flags, res, op_size );
	return res;
}

uint32_t helpers::sub_with_flags ( x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size, bool borrow_in ) {
	const uint32_t mask = IA32_OPERAND_MASK ( op_size );
	const uint32_t sign = IA32_SIGN_BIT ( op_size );
	const uint32_t ua = a & mask;
	const uint32_t ub = b & mask;
	const uint64_t subtrahend = static_cast< uint64_t >( ub ) + ( borrow_in ? 1 : 0 );
	const uint32_t res = static_cast< uint32_t >( ua - subtrahend ) & mask;

	flags.CF = ua < subtrahend;
	flags.OF = ( ( ua & sign ) != ( ub & sign ) ) && ( ( res & sign ) != ( ua & sign ) );
	set_result_flags ( flags, res, op_size );
	return res;
}

uint32_t helpers::inc_with_flags ( x86::Flags& flags, uint32_t value, size_t op_size ) {
	const auto carry = flags.CF;
	const uint32_t res = add_with_flags ( flags, value, 1, op_size );
	flags.CF = carry;
	return res;
}

uint32_t helpers::dec_with_flags ( x86::Flags& flags, uint32_t value, size_t op_size ) {
	const auto carry = flags.CF;
	const uint32_t res = sub_with_flags ( flags, value, 1, op_size );
	flags.CF = carry;
	return res;
}

uint32_t helpers::logic_with_flags ( x86::Flags& flags, uint32_t result, size_t op_size ) {
	const uint32_t res = result & IA32_OPERAND_MASK ( op_size );
	flags.CF = 0;
	flags.OF = 0;
	set_result_flags ( flags, res, op_size );
	return res;
}

uint32_t helpers::alu ( AluOperation operation, x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size ) {
	switch ( operation ) {
		case ALU_ADD: return add_with_flags ( flags, a, b, op_size );
		case ALU_OR: return logic_with_flags ( flags, a | b, op_size );
		case ALU_ADC: return add_with_flags ( flags, a, b, op_size, flags.CF );
		case ALU_SBB: return sub_with_flags ( flags, a, b, op_size, flags.CF );
		case ALU_AND: return logic_with_flags ( flags, a & b, op_size );
		case ALU_SUB: return sub_with_flags ( flags, a, b, op_size );
		case ALU_XOR: return logic_with_flags ( flags, a ^ b, op_size );
		case ALU_CMP: return sub_with_flags ( flags, a, b, op_size );
	}
	return a;
}

void helpers::execute_alu_form ( AluOperation operation, uint8_t opcode, IA32& state ) {
	const auto form = decode_alu_form ( opcode, state );
	const uint32_t current = get_operand_value ( state, form.destination, form.op_size );
	const uint32_t result = alu ( operation, state.get_flags ( ), current, form.source, form.op_size );
	if ( operation != ALU_CMP ) {
		set_operand_value ( state, form.destination, result, form.op_size );
	}
}

bool helpers::evaluate_condition ( const x86::Flags& flags, uint8_t condition ) {
	switch ( condition & 0xF ) {
		case 0x0: return flags.OF;                                   // O
		case 0x1: return !flags.OF;                                  // NO
		case 0x2: return flags.CF;                                   // B/NAE/C
		case 0x3: return !flags.CF;                                  // AE/NB/NC
		case 0x4: return flags.ZF;                                   // E/Z
		case 0x5: return !flags.ZF;                                  // NE/NZ
		case 0x6: return flags.CF || flags.ZF;                       // BE/NA
		case 0x7: return !flags.CF && !flags.ZF;                     // A/NBE
		case 0x8: return flags.SF;                                   // S
		case 0x9: return !flags.SF;                                  // NS
		case 0xA: return false;                                      // P, parity is not tracked
		case 0xB: return true;                                       // NP
		case 0xC: return flags.SF != flags.OF;                       // L/NGE
		case 0xD: return flags.SF == flags.OF;                       // GE/NL
		case 0xE: return flags.ZF || ( flags.SF != flags.OF );       // LE/NG
		case 0xF: return !flags.ZF && ( flags.SF == flags.OF );      // G/NLE
	}
	return false;
}

void helpers::unsupported_extension ( const char* group, uint8_t extension ) {
	throw GuestFault ( FaultCode::ILLEGAL_INSTRUCTION, fmt::format ( "Unsupported {} extension: /{}", group, extension ) );
}
