#pragma once

#include <ia32/IA32.hpp>
#include <ia32/capstone++.hpp>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

constexpr uint32_t code_base = 0x1000;
constexpr uint32_t data_base = 0x3000;
constexpr uint32_t stack_top = 0x8000;
constexpr std::size_t memory_size = 0x10000;

// EFLAGS bits the handlers maintain
constexpr uint32_t tracked_flags = 0x0001 | 0x0040 | 0x0080 | 0x0800;
constexpr uint32_t CF = 0x0001;
constexpr uint32_t ZF = 0x0040;
constexpr uint32_t SF = 0x0080;
constexpr uint32_t DF = 0x0400;
constexpr uint32_t OF = 0x0800;
constexpr uint32_t initial_eflags = 0x0202;

using RegisterState = std::vector<std::pair<ia32::Register, uint32_t>>;

struct InstructionTestCase {
	std::string name;
	std::vector<uint8_t> bytes;
	RegisterState inputs;
	RegisterState outputs;
	uint32_t flags_in = initial_eflags;
	// Only the bits in flags_mask are compared against flags_out
	uint32_t flags_mask = 0;
	uint32_t flags_out = 0;
	std::size_t steps = 1;
	std::optional<uint32_t> eip_out;
};

struct TestTally {
	std::size_t passed = 0;
	std::size_t failed = 0;

	void check ( bool condition, const std::string& name, const std::string& detail = "" ) {
		if ( condition ) {
			++passed;
			return;
		}
		++failed;
		if ( detail.empty ( ) ) {
			fmt::print ( "[!] Test case: {} failed\n", name );
		}
		else {
			fmt::print ( "[!] Test case: {} failed ({})\n", name, detail );
		}
	}
};

// Places the code at code_base and points ESP at stack_top
inline void load_code ( ia32::IA32& ctx, const std::vector<uint8_t>& bytes ) {
	ctx.load_image ( code_base, bytes );
	ctx.eip ( ) = code_base;
	ctx.set_reg ( ia32::ESP, stack_top );
}

// Length of the first instruction in bytes as Capstone decodes it, 0 when it cannot
inline uint8_t capstone_length ( const std::vector<uint8_t>& bytes ) {
	capstone::Decoder decoder ( bytes.data ( ), bytes.size ( ), code_base );
	if ( !decoder.is_open ( ) ) {
		return 0;
	}
	const auto instr = decoder.decode ( );
	return instr.is_valid ( ) ? instr.length ( ) : 0;
}

inline void run_instruction_case ( const InstructionTestCase& test_case, TestTally& tally ) {
	ia32::IA32 ctx ( memory_size );
	load_code ( ctx, test_case.bytes );
	ctx.set_eflags ( test_case.flags_in );
	for ( const auto& [reg, value] : test_case.inputs ) {
		ctx.set_reg ( reg, value );
	}

	try {
		for ( std::size_t i = 0; i < test_case.steps; ++i ) {
			ctx.step ( );
		}
	}
	catch ( const ia32::GuestFault& fault ) {
		tally.check ( false, test_case.name, fmt::format ( "unexpected fault: {}", fault.what ( ) ) );
		return;
	}

	bool success = true;
	for ( const auto& [reg, expected] : test_case.outputs ) {
		const uint32_t actual = ctx.get_reg ( reg );
		if ( actual != expected ) {
			fmt::print ( "[?] OUTPUT: {}: expected {:#x} == emu: {:#x}\n", ia32::register_names [ reg ], expected, actual );
			success = false;
		}
	}

	const uint32_t flags = ctx.get_eflags ( ) & test_case.flags_mask;
	if ( flags != ( test_case.flags_out & test_case.flags_mask ) ) {
		fmt::print ( "[?] FLAGS: expected {:#x} == emu: {:#x} (mask {:#x})\n", test_case.flags_out & test_case.flags_mask, flags, test_case.flags_mask );
		success = false;
	}

	if ( test_case.eip_out ) {
		if ( ctx.eip ( ) != *test_case.eip_out ) {
			fmt::print ( "[?] EIP: expected {:#x} == emu: {:#x}\n", *test_case.eip_out, ctx.eip ( ) );
			success = false;
		}
	}
	else if ( test_case.steps == 1 ) {
		// Straight-line instructions must consume exactly the bytes Capstone decodes
		const uint8_t length = capstone_length ( test_case.bytes );
		if ( length != 0 && ctx.eip ( ) != code_base + length ) {
			fmt::print ( "[?] LENGTH: capstone {} == emu: {}\n", length, ctx.eip ( ) - code_base );
			success = false;
		}
	}

	tally.check ( success, test_case.name );
}
