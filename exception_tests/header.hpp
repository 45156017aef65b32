#pragma once

#include <ia32/IA32.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

constexpr uint32_t test_code_base = 0x1000;
constexpr uint32_t test_stack_top = 0x8000;
constexpr std::size_t test_memory_size = 0x10000;

// Shellcode test structure
struct ExceptionTestShellcode {
	std::string name;
	std::optional<ia32::FaultCode> expected_fault; // nullopt if execution must reach the INT3 marker
	std::vector<uint8_t> bytes;
	std::string notes;
	std::optional<std::string> expected_message;
	std::optional<uint32_t> expected_address; // Start of the faulting instruction, prefixes included
	std::optional<uint32_t> expected_va;
	bool install_interrupt_handler = true;
	std::function<void ( ia32::IA32& )> setup;
	// Checked against the machine once execution stops
	std::function<bool ( const ia32::IA32& )> verify;
};

// Test result structure
struct TestResult {
	bool success = false;
	bool exception_occurred = false;
	ia32::FaultCode captured_code = ia32::FaultCode::ILLEGAL_INSTRUCTION;
	std::string captured_message;
	uint32_t captured_address = 0;
	std::optional<uint32_t> captured_va;
	uint32_t stop_eip = 0;
	std::string message;
};

// Appends nop; int3 so a test that runs clean stops on a known marker
inline void add_nop_int3 ( std::vector<uint8_t>& bytes ) {
	bytes.push_back ( 0x90 );
	bytes.push_back ( 0xCC );
}
