#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "sign_extend.hpp"

#include "configuration.hpp"
#include "types.hpp"
#include "memory.hpp"

#define IA32_OPERAND_MASK(y) static_cast<uint32_t>(~0ULL >> (64 - (y) * 8))
#define IA32_SIGN_BIT(y) (1U << ((y) * 8 - 1))

namespace ia32
{
	class IA32;

	// Type alias for instruction handler function, keyed by opcode byte
	using InstructionHandler = void ( * ) ( uint8_t opcode, IA32& context );

	// Type alias for a 256-entry dispatch table
	using InstructionHandlerList = std::array<InstructionHandler, 256>;

	using InterruptCallback = std::function<void ( uint8_t vector, IA32& context )>;
	using ExceptionCallback = std::function<void ( const GuestFault& fault, IA32& context )>;
	using SegmentResolver = std::function<uint32_t ( uint32_t address )>;

	struct ModRM {
		uint8_t mod;
		uint8_t reg;
		uint8_t rm;
	};

	enum class OpKind : uint8_t {
		Register,
		Memory
	};

	// A decoded r/m operand: register encoding index or linear address
	struct Operand {
		OpKind kind;
		uint32_t location;

		[[nodiscard]] bool is_register ( ) const noexcept {
			return kind == OpKind::Register;
		}
	};

	class IA32 {
	private:
		std::unique_ptr<CPU> cpu = nullptr;
		std::unique_ptr<Memory> memory = nullptr;
		std::unique_ptr<InstructionHandlerList> dispatch_table = nullptr;
		std::unique_ptr<InstructionHandlerList> two_byte_table = nullptr;
		InterruptCallback interrupt_callback;
		ExceptionCallback exception_callback;
		SegmentResolver fs_resolver;
		SegmentResolver gs_resolver;
		EmulatorOptions options;
		std::deque<std::string> trace_buffer;
		uint32_t instruction_start = 0;

		void record_trace ( uint32_t instr_addr, uint8_t opcode );
		void map_handlers ( );

	public:
		explicit IA32 ( std::size_t memory_size, EmulatorOptions opts = {} );
		~IA32 ( ) = default;

		IA32 ( const IA32& ) = delete;
		IA32& operator=( const IA32& ) = delete;

		// Populates the one-byte dispatch table
		void register_handler ( uint8_t opcode, InstructionHandler handler );

		// Populates the table consulted after the 0x0F escape byte
		void register_two_byte_handler ( uint8_t opcode, InstructionHandler handler );

		void on_interrupt ( InterruptCallback callback ) {
			interrupt_callback = std::move ( callback );
		}

		void on_exception ( ExceptionCallback callback ) {
			exception_callback = std::move ( callback );
		}

		void set_fs_resolver ( SegmentResolver resolver ) {
			fs_resolver = std::move ( resolver );
		}

		void set_gs_resolver ( SegmentResolver resolver ) {
			gs_resolver = std::move ( resolver );
		}

		// Bulk-loads a section payload
		void load_image ( uint32_t address, std::span<const uint8_t> bytes ) {
			memory->load ( address, bytes );
		}

		Memory& get_memory ( ) noexcept {
			return *memory;
		}

		const Memory& get_memory ( ) const noexcept {
			return *memory;
		}

		// Returns a mutable reference to cpu->eflags
		x86::Flags& get_flags ( ) noexcept {
			return cpu->eflags;
		}

		uint32_t get_eflags ( ) const noexcept {
			return cpu->eflags.value;
		}

		void set_eflags ( uint32_t eflags ) noexcept;

		// Returns a reference to the Floating Point Unit
		FPU& get_fpu ( ) noexcept {
			return cpu->fpu;
		}

		const FPU& get_fpu ( ) const noexcept {
			return cpu->fpu;
		}

		// Returns a mutable reference to the EIP register
		uint32_t& eip ( ) noexcept {
			return cpu->eip;
		}

		uint32_t eip ( ) const noexcept {
			return cpu->eip;
		}

		PrefixState& prefixes ( ) noexcept {
			return cpu->prefixes;
		}

		const PrefixState& prefixes ( ) const noexcept {
			return cpu->prefixes;
		}

		// 2 under the 0x66 prefix, 4 otherwise
		size_t operand_size ( ) const noexcept {
			return cpu->prefixes.operand_size_override ? 2 : 4;
		}

		bool halted ( ) const noexcept {
			return cpu->halted;
		}

		void set_halted ( bool value ) noexcept {
			cpu->halted = value;
		}

		uint64_t step_count ( ) const noexcept {
			return cpu->step_count;
		}

		// Address of the first byte (prefixes included) of the instruction being executed
		uint32_t current_instruction_address ( ) const noexcept {
			return instruction_start;
		}

		const EmulatorOptions& get_options ( ) const noexcept {
			return options;
		}

		// Returns the access mask for a register
		uint32_t get_access_mask ( uint8_t reg, size_t size ) const noexcept;

		// Returns the access shift for a register
		uint8_t get_access_shift ( uint8_t reg, size_t size ) const noexcept;

		// Returns the value of a register by encoding index; size 1 maps 4-7 onto AH/CH/DH/BH
		uint32_t get_reg ( uint8_t reg, size_t size = 4 ) const noexcept;

		// Sets the value of a register by encoding index
		void set_reg ( uint8_t reg, uint32_t value, size_t size = 4 ) noexcept;

		// Decoder: fetches advance EIP
		uint8_t fetch8 ( );
		uint16_t fetch16 ( );
		uint32_t fetch32 ( );
		int8_t fetch_signed8 ( );
		uint32_t fetch_immediate ( size_t op_size );
		uint32_t fetch_signed8_extended ( );

		void scan_prefixes ( );
		void clear_prefixes ( ) noexcept;
		ModRM decode_modrm ( );
		uint32_t decode_sib ( uint8_t mod );
		uint32_t resolve_effective_address ( const ModRM& modrm );
		uint32_t apply_segment_override ( uint32_t address ) const;
		Operand resolve_operand ( const ModRM& modrm );

		// Stack helpers
		void push ( uint32_t value, size_t size = 4 );
		uint32_t pop ( size_t size = 4 );

		// Routes a software interrupt to the installed callback
		void raise_interrupt ( uint8_t vector );

		// Executes one instruction
		void step ( );

		// Steps until halted or until max_steps instructions have run
		void run ( uint64_t max_steps = 1'000'000 );

		void dispatch ( uint8_t opcode );
		void dispatch_two_byte ( uint8_t opcode );

		// One-line register and flag summary
		std::string to_string ( ) const;

		// Capstone text for the instruction at address, or empty when unavailable
		std::string disassemble ( uint32_t address ) const;

		// Oldest entry first
		std::vector<std::string> dump_trace ( ) const;
	};
}
