#include "../IA32.hpp"
#include "../emulator.hpp"
#include "../capstone++.hpp"
#include <fmt/format.h>

using namespace ia32;

namespace
{
	// Longest legal x86 instruction
	constexpr size_t max_instruction_length = 15;

	void unknown_opcode ( uint8_t opcode, IA32& context ) {
		throw GuestFault ( FaultCode::ILLEGAL_INSTRUCTION,
			fmt::format ( "Unknown opcode: 0x{:02x} at EIP=0x{:08x}", opcode, context.eip ( ) - 1 ) );
	}

	void unknown_two_byte_opcode ( uint8_t opcode, IA32& context ) {
		throw GuestFault ( FaultCode::ILLEGAL_INSTRUCTION,
			fmt::format ( "Unknown two-byte opcode: 0x0F 0x{:02x} at EIP=0x{:08x}", opcode, context.eip ( ) - 2 ) );
	}
}

IA32::IA32 ( std::size_t memory_size, EmulatorOptions opts ) : options ( opts ) {
	cpu = std::make_unique<CPU> ( );
	memory = std::make_unique<Memory> ( memory_size );
	dispatch_table = std::make_unique<InstructionHandlerList> ( );
	two_byte_table = std::make_unique<InstructionHandlerList> ( );
	dispatch_table->fill ( unknown_opcode );
	two_byte_table->fill ( unknown_two_byte_opcode );

	if ( options.trace_depth == 0 ) {
		options.trace_depth = default_trace_depth;
	}

	map_handlers ( );
}

#define SET_HANDLER(x, y) dispatch_table->at ( static_cast< size_t >( x ) ) = y
#define SET_HANDLER_RANGE(first, last, y) for ( size_t op = first; op <= last; ++op ) dispatch_table->at ( op ) = y
#define SET_TWO_BYTE_HANDLER(x, y) two_byte_table->at ( static_cast< size_t >( x ) ) = y
#define SET_TWO_BYTE_HANDLER_RANGE(first, last, y) for ( size_t op = first; op <= last; ++op ) two_byte_table->at ( op ) = y

void IA32::map_handlers ( ) {
	// Arithmetic and logic, six encodings each
	SET_HANDLER_RANGE ( 0x00, 0x05, handlers::add );
	SET_HANDLER_RANGE ( 0x08, 0x0D, handlers::or_ );
	SET_HANDLER_RANGE ( 0x10, 0x15, handlers::adc );
	SET_HANDLER_RANGE ( 0x18, 0x1D, handlers::sbb );
	SET_HANDLER_RANGE ( 0x20, 0x25, handlers::and_ );
	SET_HANDLER_RANGE ( 0x28, 0x2D, handlers::sub );
	SET_HANDLER_RANGE ( 0x30, 0x35, handlers::xor_ );
	SET_HANDLER_RANGE ( 0x38, 0x3D, handlers::cmp );
	SET_HANDLER_RANGE ( 0x40, 0x47, handlers::inc );
	SET_HANDLER_RANGE ( 0x48, 0x4F, handlers::dec );
	SET_HANDLER_RANGE ( 0x80, 0x83, handlers::group1 );
	SET_HANDLER ( 0x69, handlers::imul_imm );
	SET_HANDLER ( 0x6B, handlers::imul_imm );
	SET_HANDLER ( 0x98, handlers::cwde );
	SET_HANDLER ( 0x99, handlers::cdq );
	SET_HANDLER ( 0xF6, handlers::group3 );
	SET_HANDLER ( 0xF7, handlers::group3 );
	SET_HANDLER ( 0xFE, handlers::group4 );

	// Shifts and rotates
	SET_HANDLER ( 0xC0, handlers::group2 );
	SET_HANDLER ( 0xC1, handlers::group2 );
	SET_HANDLER_RANGE ( 0xD0, 0xD3, handlers::group2 );

	// Comparison
	SET_HANDLER ( 0x84, handlers::test );
	SET_HANDLER ( 0x85, handlers::test );
	SET_HANDLER ( 0xA8, handlers::test );
	SET_HANDLER ( 0xA9, handlers::test );

	// Stack and frame
	SET_HANDLER_RANGE ( 0x50, 0x57, handlers::push_reg );
	SET_HANDLER_RANGE ( 0x58, 0x5F, handlers::pop_reg );
	SET_HANDLER ( 0x60, handlers::pushad );
	SET_HANDLER ( 0x61, handlers::popad );
	SET_HANDLER ( 0x68, handlers::push_imm );
	SET_HANDLER ( 0x6A, handlers::push_imm );
	SET_HANDLER ( 0x8F, handlers::pop_rm );
	SET_HANDLER ( 0x9C, handlers::pushfd );
	SET_HANDLER ( 0x9D, handlers::popfd );
	SET_HANDLER ( 0xC9, handlers::leave );

	// Control flow
	SET_HANDLER_RANGE ( 0x70, 0x7F, handlers::jcc_short );
	SET_HANDLER ( 0xC2, handlers::ret_imm );
	SET_HANDLER ( 0xC3, handlers::ret );
	SET_HANDLER_RANGE ( 0xE0, 0xE2, handlers::loop );
	SET_HANDLER ( 0xE3, handlers::jecxz );
	SET_HANDLER ( 0xE8, handlers::call );
	SET_HANDLER ( 0xE9, handlers::jmp_near );
	SET_HANDLER ( 0xEB, handlers::jmp_short );
	SET_HANDLER ( 0xFF, handlers::group5 );

	// Data movement
	SET_HANDLER ( 0x86, handlers::xchg );
	SET_HANDLER ( 0x87, handlers::xchg );
	SET_HANDLER_RANGE ( 0x88, 0x8B, handlers::mov );
	SET_HANDLER ( 0x8D, handlers::lea );
	SET_HANDLER ( 0x90, handlers::nop );
	SET_HANDLER_RANGE ( 0x91, 0x97, handlers::xchg_eax );
	SET_HANDLER_RANGE ( 0xA0, 0xA3, handlers::mov_moffs );
	SET_HANDLER_RANGE ( 0xB0, 0xB7, handlers::mov_reg_imm8 );
	SET_HANDLER_RANGE ( 0xB8, 0xBF, handlers::mov_reg_imm );
	SET_HANDLER ( 0xC4, handlers::load_far_pointer );
	SET_HANDLER ( 0xC5, handlers::load_far_pointer );
	SET_HANDLER ( 0xC6, handlers::mov_rm_imm );
	SET_HANDLER ( 0xC7, handlers::mov_rm_imm );

	// String operations
	SET_HANDLER ( 0xA4, handlers::movs );
	SET_HANDLER ( 0xA5, handlers::movs );
	SET_HANDLER ( 0xA6, handlers::cmps );
	SET_HANDLER ( 0xA7, handlers::cmps );
	SET_HANDLER ( 0xAA, handlers::stos );
	SET_HANDLER ( 0xAB, handlers::stos );
	SET_HANDLER ( 0xAC, handlers::lods );
	SET_HANDLER ( 0xAD, handlers::lods );
	SET_HANDLER ( 0xAE, handlers::scas );
	SET_HANDLER ( 0xAF, handlers::scas );

	// x87
	SET_HANDLER ( 0xD8, handlers::fpu_d8 );
	SET_HANDLER ( 0xD9, handlers::fpu_d9 );
	SET_HANDLER ( 0xDA, handlers::fpu_da );
	SET_HANDLER ( 0xDB, handlers::fpu_db );
	SET_HANDLER ( 0xDC, handlers::fpu_dc );
	SET_HANDLER ( 0xDD, handlers::fpu_dd );
	SET_HANDLER ( 0xDE, handlers::fpu_de );
	SET_HANDLER ( 0xDF, handlers::fpu_df );

	// System and flags
	SET_HANDLER ( 0x0F, handlers::two_byte );
	SET_HANDLER ( 0x9B, handlers::fwait );
	SET_HANDLER ( 0x9E, handlers::sahf );
	SET_HANDLER ( 0x9F, handlers::lahf );
	SET_HANDLER ( 0xCC, handlers::int3 );
	SET_HANDLER ( 0xCD, handlers::int_ );
	SET_HANDLER ( 0xF4, handlers::hlt );
	SET_HANDLER ( 0xF5, handlers::cmc );
	SET_HANDLER ( 0xF8, handlers::clc );
	SET_HANDLER ( 0xF9, handlers::stc );
	SET_HANDLER ( 0xFC, handlers::cld );
	SET_HANDLER ( 0xFD, handlers::std );

	// 0x0F escape
	SET_TWO_BYTE_HANDLER ( 0x1F, handlers::nop_rm );
	SET_TWO_BYTE_HANDLER_RANGE ( 0x40, 0x4F, handlers::cmovcc );
	SET_TWO_BYTE_HANDLER_RANGE ( 0x80, 0x8F, handlers::jcc_near );
	SET_TWO_BYTE_HANDLER_RANGE ( 0x90, 0x9F, handlers::setcc );
	SET_TWO_BYTE_HANDLER ( 0xAF, handlers::imul );
	SET_TWO_BYTE_HANDLER ( 0xB6, handlers::movzx );
	SET_TWO_BYTE_HANDLER ( 0xB7, handlers::movzx );
	SET_TWO_BYTE_HANDLER ( 0xBC, handlers::bsf );
	SET_TWO_BYTE_HANDLER ( 0xBD, handlers::bsr );
	SET_TWO_BYTE_HANDLER ( 0xBE, handlers::movsx );
	SET_TWO_BYTE_HANDLER ( 0xBF, handlers::movsx );
	SET_TWO_BYTE_HANDLER ( 0xC0, handlers::xadd );
	SET_TWO_BYTE_HANDLER ( 0xC1, handlers::xadd );
}

void IA32::register_handler ( uint8_t opcode, InstructionHandler handler ) {
	SET_HANDLER ( opcode, handler );
}

void IA32::register_two_byte_handler ( uint8_t opcode, InstructionHandler handler ) {
	SET_TWO_BYTE_HANDLER ( opcode, handler );
}

void IA32::set_eflags ( uint32_t eflags ) noexcept {
	auto& flags = cpu->eflags;

	flags.CF = ( eflags >> 0 ) & 1;
	flags.PF = ( eflags >> 2 ) & 1;
	flags.AF = ( eflags >> 4 ) & 1;
	flags.ZF = ( eflags >> 6 ) & 1;
	flags.SF = ( eflags >> 7 ) & 1;
	flags.TF = ( eflags >> 8 ) & 1;
	flags.IF = ( eflags >> 9 ) & 1;
	flags.DF = ( eflags >> 10 ) & 1;
	flags.OF = ( eflags >> 11 ) & 1;
	flags.reserved1 = 1;
}

uint32_t IA32::get_access_mask ( uint8_t reg, size_t size ) const noexcept {
	switch ( size ) {
		case 4:
		{
			return 0xFFFFFFFFU;
		}
		case 2:
		{
			return 0x0000FFFFU;
		}
		case 1:
		{
			if ( reg >= 4 ) {
				return 0x0000FF00U;
			}
			return 0x000000FFU;
		}
		default: return 0;
	}
}

uint8_t IA32::get_access_shift ( uint8_t reg, size_t size ) const noexcept {
	if ( size == 1 && reg >= 4 ) {
		return 8;
	}

	return 0;
}

uint32_t IA32::get_reg ( uint8_t reg, size_t size ) const noexcept {
	const uint8_t full_reg = size == 1 ? ( reg & 3 ) : ( reg & 7 );
	const uint32_t concrete_full = cpu->registers [ full_reg ];
	return ( concrete_full & get_access_mask ( reg, size ) ) >> get_access_shift ( reg, size );
}

void IA32::set_reg ( uint8_t reg, uint32_t value, size_t size ) noexcept {
	const uint8_t full_reg = size == 1 ? ( reg & 3 ) : ( reg & 7 );
	if ( size == 4 ) {
		cpu->registers [ full_reg ] = value;
		return;
	}

	const uint32_t access_mask = get_access_mask ( reg, size );
	const uint32_t shifted_value = ( value & IA32_OPERAND_MASK ( size ) ) << get_access_shift ( reg, size );
	cpu->registers [ full_reg ] = ( cpu->registers [ full_reg ] & ~access_mask ) | ( shifted_value & access_mask );
}

void IA32::push ( uint32_t value, size_t size ) {
	const uint32_t new_esp = cpu->registers [ Register::ESP ] - static_cast< uint32_t >( size );
	if ( size == 2 ) {
		memory->write16 ( new_esp, static_cast< uint16_t >( value ) );
	}
	else {
		memory->write32 ( new_esp, value );
	}
	cpu->registers [ Register::ESP ] = new_esp;
}

uint32_t IA32::pop ( size_t size ) {
	const uint32_t esp = cpu->registers [ Register::ESP ];
	const uint32_t value = size == 2 ? memory->read16 ( esp ) : memory->read32 ( esp );
	cpu->registers [ Register::ESP ] = esp + static_cast< uint32_t >( size );
	return value;
}

void IA32::raise_interrupt ( uint8_t vector ) {
	if ( !interrupt_callback ) {
		throw GuestFault ( FaultCode::UNHANDLED_INTERRUPT, fmt::format ( "Unhandled interrupt: INT {:02x}", vector ) );
	}
	interrupt_callback ( vector, *this );
}

void IA32::dispatch ( uint8_t opcode ) {
	( *dispatch_table ) [ opcode ] ( opcode, *this );
}

void IA32::dispatch_two_byte ( uint8_t opcode ) {
	( *two_byte_table ) [ opcode ] ( opcode, *this );
}

void IA32::step ( ) {
	instruction_start = cpu->eip;
	try {
		scan_prefixes ( );
		const uint8_t opcode = fetch8 ( );

		if ( options.verbose ) {
			fmt::print ( "[IA32] {:08x}: {}\n", instruction_start, disassemble ( instruction_start ) );
		}
		if ( options.trace ) {
			record_trace ( instruction_start, opcode );
		}

		dispatch ( opcode );
		clear_prefixes ( );
		++cpu->step_count;
	}
	catch ( GuestFault& fault ) {
		fault.exception_address = instruction_start;
		clear_prefixes ( );
		if ( !exception_callback ) {
			throw;
		}

		exception_callback ( fault, *this );
		if ( options.halt_on_fault ) {
			cpu->halted = true;
		}
	}
}

void IA32::run ( uint64_t max_steps ) {
	uint64_t executed = 0;
	while ( !cpu->halted && executed < max_steps ) {
		step ( );
		++executed;
	}

	if ( !cpu->halted && executed >= max_steps ) {
		fmt::print ( "[IA32] Execution limit reached ({} steps)\n", max_steps );
	}
}

std::string IA32::to_string ( ) const {
	const auto& flags = cpu->eflags;
	std::string out = fmt::format ( "EIP={:08x}", cpu->eip );
	for ( size_t i = 0; i < Register::COUNT; ++i ) {
		out += fmt::format ( "  {}={:08x}", register_names [ i ], cpu->registers [ i ] );
	}
	out += fmt::format ( "  [{} {} {} {}]",
		flags.CF ? "CF" : "cf",
		flags.ZF ? "ZF" : "zf",
		flags.SF ? "SF" : "sf",
		flags.OF ? "OF" : "of" );
	return out;
}

std::string IA32::disassemble ( uint32_t address ) const {
	if ( !memory->is_valid_address ( address ) ) {
		return { };
	}

	const size_t available = std::min<size_t> ( max_instruction_length, memory->size ( ) - address );
	const auto bytes = memory->read_bytes ( address, available );
	capstone::Decoder decoder ( bytes.data ( ), bytes.size ( ), address );
	if ( !decoder.is_open ( ) ) {
		return { };
	}

	const auto instr = decoder.decode ( );
	if ( !instr.is_valid ( ) ) {
		return { };
	}
	return instr.to_string_no_address ( );
}

void IA32::record_trace ( uint32_t instr_addr, uint8_t opcode ) {
	auto entry = fmt::format ( "[{}] EIP=0x{:08x} op=0x{:02x} ESP=0x{:08x} EBP=0x{:08x} EAX=0x{:08x}",
		cpu->step_count,
		instr_addr,
		opcode,
		cpu->registers [ Register::ESP ],
		cpu->registers [ Register::EBP ],
		cpu->registers [ Register::EAX ] );

	const auto text = disassemble ( instr_addr );
	if ( !text.empty ( ) ) {
		entry += fmt::format ( "  {}", text );
	}

	trace_buffer.push_back ( std::move ( entry ) );
	while ( trace_buffer.size ( ) > options.trace_depth ) {
		trace_buffer.pop_front ( );
	}
}

std::vector<std::string> IA32::dump_trace ( ) const {
	return std::vector<std::string> ( trace_buffer.begin ( ), trace_buffer.end ( ) );
}
