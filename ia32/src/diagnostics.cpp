#include <ia32/diagnostics.hpp>
#include <fmt/format.h>
#include <array>
#include <utility>

using namespace ia32;

namespace
{
	constexpr std::array<std::pair<uint32_t, const char*>, 4> teb_fields = { {
		{ 0x00, "ExceptionList" },
		{ 0x04, "StackBase" },
		{ 0x08, "StackLimit" },
		{ 0x0C, "SubSystemTib" },
	} };

	void print_memory_access ( uint32_t address, const Memory& memory ) {
		const auto bounds = memory.get_bounds ( );
		fmt::print ( "\n--- Memory Access Diagnostics ---\n" );
		fmt::print ( "Attempted address: 0x{:08x}\n", address );
		fmt::print ( "Valid memory range: 0x{:08x}-0x{:08x} ({}MB)\n", bounds.start, bounds.end, bounds.size / ( 1024 * 1024 ) );

		if ( address <= segment_relative_threshold ) {
			return;
		}

		fmt::print ( "\nAddress is far above the image range, likely segment-relative (e.g. FS:[offset])\n" );
		fmt::print ( "  If FS base is 0x{:08x}: offset would be 0x{:x}\n", conventional_fs_base, address - conventional_fs_base );
		fmt::print ( "  Common TEB fields:\n" );
		for ( const auto& [offset, name] : teb_fields ) {
			fmt::print ( "    TEB.{}: FS:[0x{:02X}]\n", name, offset );
		}
	}
}

void ia32::print_exception_diagnostics ( const GuestFault& fault, const IA32& context ) {
	const auto& memory = context.get_memory ( );

	fmt::print ( "\n[EXCEPTION] {} ({})\n", fault.what ( ), fault_code_name ( fault.code ) );
	if ( fault.faulting_va ) {
		print_memory_access ( *fault.faulting_va, memory );
	}

	fmt::print ( "\n--- CPU State ---\n" );
	const std::string disassembly = context.disassemble ( fault.exception_address );
	fmt::print ( "EIP: 0x{:08x}  {}\n", fault.exception_address, disassembly.empty ( ) ? "<unavailable>" : disassembly );

	fmt::print ( "\nGeneral Purpose Registers:\n" );
	for ( uint8_t i = 0; i < Register::COUNT; ++i ) {
		const uint32_t value = context.get_reg ( i );
		fmt::print ( "  [{}] {}: 0x{:08x}\n", memory.is_valid_address ( value ) ? '+' : '!', register_names [ i ], value );
	}

	const uint32_t esp = context.get_reg ( ESP );
	fmt::print ( "\nStack Pointers:\n" );
	fmt::print ( "  ESP: 0x{:08x}\n", esp );
	fmt::print ( "  EBP: 0x{:08x}\n", context.get_reg ( EBP ) );
	fmt::print ( "  Stack pointer {}\n", memory.is_valid_address ( esp ) ? "valid" : "invalid" );

	const auto trace = context.dump_trace ( );
	if ( !trace.empty ( ) ) {
		fmt::print ( "\nLast {} instructions:\n", trace.size ( ) );
		for ( const auto& entry : trace ) {
			fmt::print ( "  {}\n", entry );
		}
	}
}
