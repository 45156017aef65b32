#pragma once

#include <ia32/IA32.hpp>

namespace helpers
{
	using namespace ia32;

	// Operation selected by bits 5:3 of the ALU opcodes and by the Group 1 extension
	enum AluOperation : uint8_t {
		ALU_ADD,
		ALU_OR,
		ALU_ADC,
		ALU_SBB,
		ALU_AND,
		ALU_SUB,
		ALU_XOR,
		ALU_CMP
	};

	// Operands of the six encodings shared by 00-3D
	struct AluForm {
		Operand destination;
		uint32_t source;
		size_t op_size;
	};

	AluForm decode_alu_form ( uint8_t opcode, IA32& state );

	uint32_t get_operand_value ( IA32& state, const Operand& operand, size_t op_size );
	void set_operand_value ( IA32& state, const Operand& operand, uint32_t value, size_t op_size );

	inline Operand register_operand ( uint8_t reg ) {
		return Operand { OpKind::Register, reg };
	}

	// ZF and SF from a result of op_size bytes
	void set_result_flags ( x86::Flags& flags, uint32_t result, size_t op_size );

	uint32_t add_with_flags ( x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size, bool carry_in = false );
	uint32_t sub_with_flags ( x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size, bool borrow_in = false );
	// INC/DEC leave CF untouched
	uint32_t inc_with_flags ( x86::Flags& flags, uint32_t value, size_t op_size );
	uint32_t dec_with_flags ( x86::Flags& flags, uint32_t value, size_t op_size );
	uint32_t logic_with_flags ( x86::Flags& flags, uint32_t result, size_t op_size );

	// Computes a ALU_* operation and its flags; the caller decides whether to write back
	uint32_t alu ( AluOperation operation, x86::Flags& flags, uint32_t a, uint32_t b, size_t op_size );

	// Applies a ALU_* operation to a decoded form and stores the result unless it is a compare
	void execute_alu_form ( AluOperation operation, uint8_t opcode, IA32& state );

	// Shared by Jcc, SETcc, CMOVcc and FCMOVcc
	bool evaluate_condition ( const x86::Flags& flags, uint8_t condition );

	[[noreturn]] void unsupported_extension ( const char* group, uint8_t extension );
};
