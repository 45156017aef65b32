#include "header.hpp"
#include <ia32/diagnostics.hpp>
#include <fmt/format.h>

using namespace ia32;

std::vector<ExceptionTestShellcode> g_exception_tests;

TestResult run_test_shellcode ( const ExceptionTestShellcode& test_case ) {
	TestResult result;
	result.message = "[" + test_case.name + "] ";

	constexpr uint64_t MAX_STEPS = 500;

	EmulatorOptions options { };
	options.halt_on_fault = 1;
	IA32 ctx ( test_memory_size, options );
	ctx.load_image ( test_code_base, test_case.bytes );
	ctx.eip ( ) = test_code_base;
	ctx.set_reg ( ESP, test_stack_top );

	bool marker_reached = false;
	if ( test_case.install_interrupt_handler ) {
		ctx.on_interrupt ( [ &marker_reached ] ( uint8_t vector, IA32& context ) {
			if ( vector == 0x03 ) {
				marker_reached = true;
				context.set_halted ( true );
			}
		} );
	}
	ctx.on_exception ( [ &result ] ( const GuestFault& fault, IA32& context ) {
		result.exception_occurred = true;
		result.captured_code = fault.code;
		result.captured_message = fault.what ( );
		result.captured_address = fault.exception_address;
		result.captured_va = fault.faulting_va;
	} );

	if ( test_case.setup ) {
		test_case.setup ( ctx );
	}

	ctx.run ( MAX_STEPS );
	result.stop_eip = ctx.eip ( );

	if ( !test_case.expected_fault ) {
		if ( result.exception_occurred ) {
			result.message += fmt::format ( "Unexpected exception {}: {}", fault_code_name ( result.captured_code ), result.captured_message );
			return result;
		}
		if ( !marker_reached ) {
			result.message += "Execution stopped before the INT3 marker.";
			return result;
		}
	}
	else {
		if ( !result.exception_occurred ) {
			result.message += fmt::format ( "Expected {} but no exception was raised.", fault_code_name ( *test_case.expected_fault ) );
			return result;
		}
		if ( result.captured_code != *test_case.expected_fault ) {
			result.message += fmt::format ( "Expected {}, got {}.", fault_code_name ( *test_case.expected_fault ), fault_code_name ( result.captured_code ) );
			return result;
		}
		if ( test_case.expected_message && result.captured_message != *test_case.expected_message ) {
			result.message += fmt::format ( "Message mismatch: \"{}\"", result.captured_message );
			return result;
		}
		if ( test_case.expected_address && result.captured_address != *test_case.expected_address ) {
			result.message += fmt::format ( "Exception address 0x{:08x}, expected 0x{:08x}.", result.captured_address, *test_case.expected_address );
			return result;
		}
		if ( test_case.expected_va && result.captured_va != test_case.expected_va ) {
			result.message += "Faulting address mismatch.";
			return result;
		}
		if ( !ctx.halted ( ) ) {
			result.message += "Machine kept running after the fault.";
			return result;
		}
	}

	if ( test_case.verify && !test_case.verify ( ctx ) ) {
		result.message += "Post-execution state check failed.";
		return result;
	}

	result.success = true;
	result.message += test_case.expected_fault ? "Expected exception captured." : "Reached the INT3 marker.";
	return result;
}

void initialize_exception_tests ( ) {
	// --- Unknown Opcode ---
	{
		ExceptionTestShellcode test;
		test.name = "Unknown Opcode";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "0xD6 has no handler; the address names the opcode byte.";
		test.bytes = {
			0x90, // nop
			0xD6, // <- Exception expected here
		};
		test.expected_message = "Unknown opcode: 0xd6 at EIP=0x00001001";
		test.expected_address = 0x1001;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Unknown Two-Byte Opcode ---
	{
		ExceptionTestShellcode test;
		test.name = "Unknown Two-Byte Opcode (UD2)";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "0x0F 0x0B has no handler in the escape table.";
		test.bytes = {
			0x0F, 0x0B, // ud2 <- Exception expected here
		};
		test.expected_message = "Unknown two-byte opcode: 0x0F 0x0b at EIP=0x00001000";
		test.expected_address = 0x1000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Fault Address Covers Prefixes ---
	{
		ExceptionTestShellcode test;
		test.name = "Fault Address Covers Prefixes";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "The reported address is the first prefix byte and the prefix state is cleared afterwards.";
		test.bytes = {
			0x90,                   // nop
			0x66, 0xF3, 0x0F, 0x0B, // ud2 under 66 and F3 <- Exception expected here
		};
		test.expected_address = 0x1001;
		test.verify = [ ] ( const IA32& ctx ) {
			const auto& prefixes = ctx.prefixes ( );
			return !prefixes.operand_size_override && prefixes.repeat == RepeatMode::NONE && prefixes.segment == SegmentOverride::NONE;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Out-of-Bounds Read ---
	{
		ExceptionTestShellcode test;
		test.name = "Out-of-Bounds Read";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "Reads a dword beyond the end of guest memory.";
		test.bytes = {
			0xA1, 0x00, 0x00, 0x02, 0x00, // mov eax, [0x20000] <- Exception expected here
		};
		test.expected_address = 0x1000;
		test.expected_va = 0x20000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Out-of-Bounds Write ---
	{
		ExceptionTestShellcode test;
		test.name = "Out-of-Bounds Write";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "A dword store that starts in memory and ends past it.";
		test.bytes = {
			0x89, 0x03, // mov [ebx], eax <- Exception expected here
		};
		test.setup = [ ] ( IA32& ctx ) {
			ctx.set_reg ( EBX, static_cast< uint32_t >( test_memory_size - 2 ) );
		};
		test.expected_va = static_cast< uint32_t >( test_memory_size - 2 );
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_memory ( ).read16 ( static_cast< uint32_t >( test_memory_size - 2 ) ) == 0;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Stack Underflow ---
	{
		ExceptionTestShellcode test;
		test.name = "Stack Underflow (Push Below Zero)";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "ESP wraps below address zero; ESP must be left untouched.";
		test.bytes = {
			0xBC, 0x02, 0x00, 0x00, 0x00, // mov esp, 2
			0x50,                         // push eax <- Exception expected here
		};
		test.expected_address = 0x1005;
		test.expected_va = 0xFFFFFFFE;
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_reg ( ESP ) == 2;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- FS-Relative Access ---
	{
		ExceptionTestShellcode test;
		test.name = "FS-Relative Access Outside Memory";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "The FS resolver maps offsets to the conventional TEB base, which is not backed.";
		test.bytes = {
			0x64, 0xA1, 0x00, 0x00, 0x00, 0x00, // mov eax, fs:[0] <- Exception expected here
		};
		test.setup = [ ] ( IA32& ctx ) {
			ctx.set_fs_resolver ( [ ] ( uint32_t address ) { return conventional_fs_base + address; } );
		};
		test.expected_address = 0x1000;
		test.expected_va = conventional_fs_base;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Integer Divide by Zero ---
	{
		ExceptionTestShellcode test;
		test.name = "Integer Divide by Zero";
		test.expected_fault = FaultCode::INTEGER_DIVIDE_BY_ZERO;
		test.notes = "DIV by a zero register; EAX and EDX keep their values.";
		test.bytes = {
			0xB8, 0x34, 0x12, 0x00, 0x00, // mov eax, 0x1234
			0xBA, 0x78, 0x56, 0x00, 0x00, // mov edx, 0x5678
			0x31, 0xC9,                   // xor ecx, ecx
			0xF7, 0xF1,                   // div ecx <- Exception expected here
		};
		test.expected_message = "Division by zero";
		test.expected_address = 0x100C;
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_reg ( EAX ) == 0x1234 && ctx.get_reg ( EDX ) == 0x5678;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Byte Divide by Zero ---
	{
		ExceptionTestShellcode test;
		test.name = "Byte Divide by Zero";
		test.expected_fault = FaultCode::INTEGER_DIVIDE_BY_ZERO;
		test.notes = "DIV r/m8 with CL = 0.";
		test.bytes = {
			0xB8, 0x64, 0x00, 0x00, 0x00, // mov eax, 100
			0x30, 0xC9,                   // xor cl, cl
			0xF6, 0xF1,                   // div cl <- Exception expected here
		};
		test.expected_address = 0x1007;
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_reg ( EAX ) == 100;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- IDIV Overflow ---
	{
		ExceptionTestShellcode test;
		test.name = "IDIV Overflow (INT_MIN / -1)";
		test.expected_fault = FaultCode::INTEGER_OVERFLOW;
		test.notes = "The signed quotient does not fit in 32 bits.";
		test.bytes = {
			0xB8, 0x00, 0x00, 0x00, 0x80, // mov eax, 0x80000000
			0x99,                         // cdq
			0xB9, 0xFF, 0xFF, 0xFF, 0xFF, // mov ecx, -1
			0xF7, 0xF9,                   // idiv ecx <- Exception expected here
		};
		test.expected_message = "Division overflow";
		test.expected_address = 0x100B;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- DIV Quotient Overflow ---
	{
		ExceptionTestShellcode test;
		test.name = "DIV Quotient Overflow";
		test.expected_fault = FaultCode::INTEGER_OVERFLOW;
		test.notes = "EDX:EAX = 2^32 divided by 1.";
		test.bytes = {
			0xBA, 0x01, 0x00, 0x00, 0x00, // mov edx, 1
			0x31, 0xC0,                   // xor eax, eax
			0xB9, 0x01, 0x00, 0x00, 0x00, // mov ecx, 1
			0xF7, 0xF1,                   // div ecx <- Exception expected here
		};
		test.expected_message = "Division overflow";
		test.expected_address = 0x100C;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Unhandled Interrupt ---
	{
		ExceptionTestShellcode test;
		test.name = "Unhandled Interrupt";
		test.expected_fault = FaultCode::UNHANDLED_INTERRUPT;
		test.notes = "INT 0x21 with no interrupt callback installed.";
		test.bytes = {
			0xCD, 0x21, // int 0x21 <- Exception expected here
		};
		test.install_interrupt_handler = false;
		test.expected_message = "Unhandled interrupt: INT 21";
		test.expected_address = 0x1000;
		g_exception_tests.push_back ( test );
	}

	// --- Unsupported Group Extension ---
	{
		ExceptionTestShellcode test;
		test.name = "Unsupported Group Extension";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "0xFE only defines /0 and /1.";
		test.bytes = {
			0xFE, 0xD0, // FE /2 <- Exception expected here
		};
		test.expected_message = "Unsupported Group 4 extension: /2";
		test.expected_address = 0x1000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- LEA With Register Operand ---
	{
		ExceptionTestShellcode test;
		test.name = "LEA With Register Operand";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "LEA has no meaning without an effective address.";
		test.bytes = {
			0x8D, 0xC0, // lea eax, eax <- Exception expected here
		};
		test.expected_address = 0x1000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Undefined x87 Encoding ---
	{
		ExceptionTestShellcode test;
		test.name = "Undefined x87 Encoding";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "D9 D1 is in the FNOP row but only D9 D0 is defined.";
		test.bytes = {
			0xD9, 0xD1, // <- Exception expected here
		};
		test.expected_address = 0x1000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- FPU Store Outside Memory ---
	{
		ExceptionTestShellcode test;
		test.name = "FPU Store Outside Memory";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "FSTP m64 at the first address past the end of memory.";
		test.bytes = {
			0xD9, 0xE8,                         // fld1
			0xDD, 0x1D, 0x00, 0x00, 0x01, 0x00, // fstp qword [0x10000] <- Exception expected here
		};
		test.expected_address = 0x1002;
		test.expected_va = 0x10000;
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Extended Store Wrapping Past 4 GiB ---
	{
		ExceptionTestShellcode test;
		test.name = "Extended Store Wrapping Past 4 GiB";
		test.expected_fault = FaultCode::ACCESS_VIOLATION;
		test.notes = "The exponent word of an m80 at 0xFFFFFFFA wraps to address 2; nothing may be stored.";
		test.bytes = {
			0xD9, 0xE8, // fld1
			0xDB, 0x3B, // fstp tbyte [ebx] <- Exception expected here
		};
		test.setup = [ ] ( IA32& ctx ) {
			ctx.set_reg ( EBX, 0xFFFFFFFA );
		};
		test.expected_message = "write_float80: address 0xfffffffa outside bounds [0, 0x00010000)";
		test.expected_address = 0x1002;
		test.expected_va = 0xFFFFFFFA;
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_memory ( ).read32 ( 0 ) == 0 && ctx.get_memory ( ).read32 ( 4 ) == 0;
		};
		add_nop_int3 ( test.bytes );
		g_exception_tests.push_back ( test );
	}

	// --- Fault Inside a Callee ---
	{
		ExceptionTestShellcode test;
		test.name = "Fault Inside a Callee";
		test.expected_fault = FaultCode::ILLEGAL_INSTRUCTION;
		test.notes = "The return address stays on the stack when the callee faults.";
		test.bytes = {
			0xE8, 0x01, 0x00, 0x00, 0x00, // call +1
			0xCC,                         // int3 (skipped)
			0xD6,                         // <- Exception expected here
		};
		test.expected_address = 0x1006;
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_reg ( ESP ) == test_stack_top - 4 && ctx.get_memory ( ).read32 ( test_stack_top - 4 ) == 0x1005;
		};
		g_exception_tests.push_back ( test );
	}

	// --- No Exception Expected ---
	{
		ExceptionTestShellcode test;
		test.name = "No Exception Expected";
		test.notes = "Simple arithmetic, should finish at the INT3 marker.";
		test.bytes = {
			0xB8, 0x0A, 0x00, 0x00, 0x00, // mov eax, 10
			0xBB, 0x05, 0x00, 0x00, 0x00, // mov ebx, 5
			0x01, 0xD8,                   // add eax, ebx
			0x29, 0xD8,                   // sub eax, ebx
		};
		test.verify = [ ] ( const IA32& ctx ) {
			return ctx.get_reg ( EAX ) == 10 && ctx.eip ( ) == test_code_base + 16;
		};
		add_nop_int3 ( test.bytes ); // Expect execution to reach here
		g_exception_tests.push_back ( test );
	}
} // End of initialize_exception_tests

// Without an exception callback the fault reaches the caller of step
TestResult fault_without_callback_propagates ( ) {
	TestResult result;
	result.message = "[Fault Without Callback] ";

	IA32 ctx ( test_memory_size );
	const std::vector<uint8_t> bytes = { 0x66, 0xD6 };
	ctx.load_image ( test_code_base, bytes );
	ctx.eip ( ) = test_code_base;

	try {
		ctx.step ( );
		result.message += "step returned normally.";
	}
	catch ( const GuestFault& fault ) {
		result.exception_occurred = true;
		result.captured_code = fault.code;
		result.captured_address = fault.exception_address;
		result.success = fault.code == FaultCode::ILLEGAL_INSTRUCTION
			&& fault.exception_address == test_code_base
			&& !ctx.prefixes ( ).operand_size_override
			&& ctx.step_count ( ) == 0;
		result.message += result.success ? "Fault propagated to the caller." : "Fault state mismatch.";
	}
	result.stop_eip = ctx.eip ( );
	return result;
}

// With halt_on_fault clear, the loop resumes after the faulting opcode
TestResult fault_without_halt_continues ( ) {
	TestResult result;
	result.message = "[Fault Without Halt] ";

	IA32 ctx ( test_memory_size );
	std::vector<uint8_t> bytes = { 0xD6 };
	add_nop_int3 ( bytes );
	ctx.load_image ( test_code_base, bytes );
	ctx.eip ( ) = test_code_base;
	ctx.set_reg ( ESP, test_stack_top );

	int faults = 0;
	ctx.on_exception ( [ & ] ( const GuestFault& fault, IA32& context ) {
		++faults;
		result.exception_occurred = true;
		result.captured_code = fault.code;
		result.captured_address = fault.exception_address;
	} );
	ctx.on_interrupt ( [ ] ( uint8_t vector, IA32& context ) {
		context.set_halted ( true );
	} );
	ctx.run ( 10 );

	result.stop_eip = ctx.eip ( );
	result.success = faults == 1 && ctx.halted ( ) && ctx.step_count ( ) == 2 && ctx.eip ( ) == test_code_base + 3;
	result.message += result.success ? "Execution resumed after the fault." : "Execution did not resume as expected.";
	return result;
}

// The diagnostic report runs against a faulting machine with a trace ring
TestResult diagnostics_report_runs ( ) {
	TestResult result;
	result.message = "[Diagnostics Report] ";

	EmulatorOptions options { };
	options.trace = 1;
	options.trace_depth = 4;
	options.halt_on_fault = 1;
	IA32 ctx ( test_memory_size, options );
	const std::vector<uint8_t> bytes = {
		0xB8, 0x00, 0x00, 0x00, 0x00, // mov eax, 0
		0x64, 0x8B, 0x00,             // mov eax, fs:[eax] <- Exception expected here
	};
	ctx.load_image ( test_code_base, bytes );
	ctx.eip ( ) = test_code_base;
	ctx.set_reg ( ESP, test_stack_top );
	ctx.set_fs_resolver ( [ ] ( uint32_t address ) { return conventional_fs_base + address; } );

	bool reported = false;
	ctx.on_exception ( [ & ] ( const GuestFault& fault, IA32& context ) {
		result.exception_occurred = true;
		result.captured_code = fault.code;
		result.captured_address = fault.exception_address;
		result.captured_va = fault.faulting_va;
		print_exception_diagnostics ( fault, context );
		reported = true;
	} );
	ctx.run ( 10 );

	result.stop_eip = ctx.eip ( );
	result.success = reported && result.captured_address == test_code_base + 5 && ctx.dump_trace ( ).size ( ) == 2;
	result.message += result.success ? "Report printed." : "Report was not produced for the expected fault.";
	return result;
}

static void print_result ( const TestResult& result ) {
	fmt::print ( "Result: {}\n", result.message );
	fmt::print ( "Stopped at EIP: 0x{:08x}\n", result.stop_eip );
	if ( result.exception_occurred ) {
		fmt::print ( "Captured Exception: Code={}, Addr=0x{:08x}, VA={}\n",
			fault_code_name ( result.captured_code ),
			result.captured_address,
			result.captured_va ? fmt::format ( "0x{:08x}", *result.captured_va ) : "<none>" );
	}
	fmt::print ( "Status: {}\n", result.success ? "PASSED" : "FAILED" );
}

int main ( ) {
	initialize_exception_tests ( );

	fmt::print ( "Running {} exception tests...\n", g_exception_tests.size ( ) + 3 );
	int passed = 0;
	int failed = 0;

	const auto tally = [ & ] ( const TestResult& result ) {
		print_result ( result );
		result.success ? ++passed : ++failed;
	};

	for ( const auto& test : g_exception_tests ) {
		fmt::print ( "------------------------------------------\n" );
		fmt::print ( "Executing Test: {}\n", test.name );
		fmt::print ( "Notes: {}\n", test.notes );
		tally ( run_test_shellcode ( test ) );
	}

	for ( auto* scenario : { &fault_without_callback_propagates, &fault_without_halt_continues, &diagnostics_report_runs } ) {
		fmt::print ( "------------------------------------------\n" );
		tally ( scenario ( ) );
	}

	fmt::print ( "==========================================\n" );
	fmt::print ( "Test Summary: Passed={}, Failed={}\n", passed, failed );
	fmt::print ( "==========================================\n" );

	return ( failed == 0 ) ? 0 : 1;
}
