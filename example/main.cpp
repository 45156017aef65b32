#include <ia32/IA32.hpp>
#include <ia32/diagnostics.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{
	constexpr std::size_t max_memory_mb = ia32::max_memory_size / ( 1024 * 1024 );

	struct RunOptions {
		std::string image_path;
		uint32_t base = 0x00400000;
		std::optional<uint32_t> entry;
		std::optional<uint32_t> stack;
		std::size_t memory_mb = 64;
		uint64_t max_steps = 1'000'000;
		bool verbose = false;
		uint32_t trace_depth = 0;
	};

	void print_usage ( ) {
		fmt::print ( "usage: ia32_run <image> [--base 0x...] [--entry 0x...] [--memory MB] [--steps N]\n" );
		fmt::print ( "                [--stack 0x...] [--verbose] [--trace N]\n" );
	}

	// Accepts decimal or 0x-prefixed hex; std::stoull throws on malformed input
	uint64_t parse_number ( std::string_view text ) {
		return std::stoull ( std::string ( text ), nullptr, 0 );
	}

	std::optional<RunOptions> parse_arguments ( int argc, char** argv ) {
		RunOptions options;
		for ( int i = 1; i < argc; ++i ) {
			const std::string_view arg = argv [ i ];
			const auto next_value = [&] ( ) -> std::optional<uint64_t> {
				if ( i + 1 >= argc ) {
					fmt::print ( "[!] {} expects a value\n", arg );
					return std::nullopt;
				}
				return parse_number ( argv [ ++i ] );
			};

			if ( arg == "--verbose" ) {
				options.verbose = true;
				continue;
			}

			if ( !arg.starts_with ( "--" ) ) {
				if ( !options.image_path.empty ( ) ) {
					fmt::print ( "[!] Unexpected argument: {}\n", arg );
					return std::nullopt;
				}
				options.image_path = arg;
				continue;
			}

			const auto value = next_value ( );
			if ( !value ) {
				return std::nullopt;
			}

			if ( arg == "--base" ) {
				options.base = static_cast< uint32_t >( *value );
			}
			else if ( arg == "--entry" ) {
				options.entry = static_cast< uint32_t >( *value );
			}
			else if ( arg == "--stack" ) {
				options.stack = static_cast< uint32_t >( *value );
			}
			else if ( arg == "--memory" ) {
				if ( *value == 0 || *value > max_memory_mb ) {
					fmt::print ( "[!] --memory must be between 1 and {} MB\n", max_memory_mb );
					return std::nullopt;
				}
				options.memory_mb = static_cast< std::size_t >( *value );
			}
			else if ( arg == "--steps" ) {
				options.max_steps = *value;
			}
			else if ( arg == "--trace" ) {
				options.trace_depth = static_cast< uint32_t >( *value );
			}
			else {
				fmt::print ( "[!] Unknown option: {}\n", arg );
				return std::nullopt;
			}
		}

		if ( options.image_path.empty ( ) ) {
			return std::nullopt;
		}
		return options;
	}

	std::optional<std::vector<uint8_t>> read_image ( const std::string& path ) {
		std::ifstream file ( path, std::ios::binary );
		if ( !file ) {
			return std::nullopt;
		}
		return std::vector<uint8_t> ( std::istreambuf_iterator<char> ( file ), std::istreambuf_iterator<char> ( ) );
	}
}

/// Loads a flat image, runs it until HLT, INT 3, INT 0x20, a fault or the step budget, and dumps the final state.
int main ( int argc, char** argv ) {
	std::optional<RunOptions> options;
	try {
		options = parse_arguments ( argc, argv );
	}
	catch ( const std::logic_error& e ) {
		fmt::print ( "[!] Malformed number: {}\n", e.what ( ) );
	}
	if ( !options ) {
		print_usage ( );
		return 1;
	}

	const auto image = read_image ( options->image_path );
	if ( !image ) {
		fmt::print ( "[!] Cannot read {}\n", options->image_path );
		return 1;
	}

	ia32::EmulatorOptions emulator_options { };
	emulator_options.verbose = options->verbose;
	emulator_options.trace = options->trace_depth != 0;
	emulator_options.trace_depth = static_cast< uint8_t >( std::min<uint32_t> ( options->trace_depth, 0xFF ) );
	emulator_options.halt_on_fault = true;

	ia32::IA32 ctx ( options->memory_mb * 1024 * 1024, emulator_options );
	try {
		ctx.load_image ( options->base, *image );
	}
	catch ( const ia32::GuestFault& fault ) {
		fmt::print ( "[!] {}\n", fault.what ( ) );
		return 1;
	}

	ctx.eip ( ) = options->entry.value_or ( options->base );
	ctx.set_reg ( ia32::ESP, options->stack.value_or ( static_cast< uint32_t >( ctx.get_memory ( ).size ( ) - 16 ) ) );

	ctx.on_interrupt ( [] ( uint8_t vector, ia32::IA32& context ) {
		fmt::print ( "[IA32] INT 0x{:02x} at EIP=0x{:08x}\n", vector, context.current_instruction_address ( ) );
		if ( vector == 0x03 || vector == 0x20 ) {
			context.set_halted ( true );
		}
	} );
	ctx.on_exception ( [] ( const ia32::GuestFault& fault, ia32::IA32& context ) {
		ia32::print_exception_diagnostics ( fault, context );
	} );

	fmt::print ( "[+] Loaded {} bytes at 0x{:08x}, entry 0x{:08x}\n", image->size ( ), options->base, ctx.eip ( ) );
	ctx.run ( options->max_steps );

	fmt::print ( "[+] {} instructions executed{}\n", ctx.step_count ( ), ctx.halted ( ) ? ", halted" : "" );
	fmt::print ( "{}\n", ctx.to_string ( ) );
	return 0;
}
