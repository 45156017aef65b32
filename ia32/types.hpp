#pragma once

#include <boost/multiprecision/cpp_bin_float.hpp>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "x86.hpp"

namespace mp = boost::multiprecision;
using float80_t =
mp::number<mp::cpp_bin_float<
	64,                 // Number of significand bits (including explicit leading bit when non-zero)
	mp::digit_base_2,   // Binary representation
	void, std::int16_t, // Use 16-bit exponent type
	-16382, 16383       // Min/Max exponent values
>, mp::et_off>;

namespace ia32
{
	// Ordered as encoded in ModRM/SIB and opcode low bits
	enum Register : uint8_t {
		EAX,
		ECX,
		EDX,
		EBX,
		ESP,
		EBP,
		ESI,
		EDI,

		COUNT
	};

	inline constexpr std::array<const char*, Register::COUNT> register_names = {
		"EAX", "ECX", "EDX", "EBX", "ESP", "EBP", "ESI", "EDI"
	};

	enum class SegmentOverride : uint8_t {
		NONE,
		FS,
		GS
	};

	enum class RepeatMode : uint8_t {
		NONE,
		REP,		// F3, REP/REPE/REPZ
		REPNE		// F2, REPNE/REPNZ
	};

	// Transient decode state, reset after every instruction
	struct PrefixState {
		SegmentOverride segment = SegmentOverride::NONE;
		RepeatMode repeat = RepeatMode::NONE;
		bool operand_size_override = false;
		bool address_size_override = false;
		bool lock = false;
	};

	struct FPU {
		std::array<double, 8> fpu_stack = { 0 };
		x86::FPUTagWord fpu_tag_word = { .value = x86::FTW_ALL_EMPTY };
		x86::FPUStatusWord fpu_status_word = { .value = 0x0000 };
		x86::FPUControlWord fpu_control_word = { .value = x86::FCW_DEFAULT };
		uint8_t fpu_top = 0;

		int get_fpu_phys_idx ( int sti ) const {
			return ( fpu_top + sti ) & 7;
		}

		void set_fpu_tag ( int phys_idx, uint8_t tag ) {
			const int shift = ( phys_idx & 7 ) * 2;
			fpu_tag_word.value = static_cast< uint16_t >( ( fpu_tag_word.value & ~( 3 << shift ) ) | ( ( tag & 3 ) << shift ) );
		}

		uint8_t get_fpu_tag ( int phys_idx ) const {
			return ( fpu_tag_word.value >> ( ( phys_idx & 7 ) * 2 ) ) & 3;
		}

		void update_fsw_top ( ) {
			fpu_status_word.value = static_cast< uint16_t >(
				( fpu_status_word.value & ~x86::FSW_TOP_MASK ) | ( ( fpu_top & 7 ) << x86::FSW_TOP_SHIFT ) );
		}

		// ST(i) relative to the current top
		double st ( int sti ) const {
			return fpu_stack [ get_fpu_phys_idx ( sti ) ];
		}

		void set_st ( int sti, double value ) {
			const int idx = get_fpu_phys_idx ( sti );
			fpu_stack [ idx ] = value;
			set_fpu_tag ( idx, x86::FPU_TAG_VALID );
		}

		// FXCH: swaps ST(0) and ST(i) together with their tags
		void exchange ( int sti ) {
			const int top = get_fpu_phys_idx ( 0 );
			const int other = get_fpu_phys_idx ( sti );
			const uint8_t top_tag = get_fpu_tag ( top );
			std::swap ( fpu_stack [ top ], fpu_stack [ other ] );
			set_fpu_tag ( top, get_fpu_tag ( other ) );
			set_fpu_tag ( other, top_tag );
		}

		// Rounds to an integral value in the mode selected by FCW.RC
		double round_to_integral ( double value ) const {
			switch ( fpu_control_word.RC ) {
				case x86::FPU_RC_DOWN: return std::floor ( value );
				case x86::FPU_RC_UP:   return std::ceil ( value );
				case x86::FPU_RC_ZERO: return std::trunc ( value );
				case x86::FPU_RC_NEAREST:
				default:               return std::nearbyint ( value );
			}
		}

		// Overwrites the oldest slot when all eight are in use
		void push ( double value ) {
			fpu_top = ( fpu_top - 1 ) & 7;
			fpu_stack [ fpu_top ] = value;
			set_fpu_tag ( fpu_top, x86::FPU_TAG_VALID );
			update_fsw_top ( );
		}

		double pop ( ) {
			const double value = fpu_stack [ fpu_top ];
			set_fpu_tag ( fpu_top, x86::FPU_TAG_EMPTY );
			fpu_top = ( fpu_top + 1 ) & 7;
			update_fsw_top ( );
			return value;
		}

		void set_condition_codes ( bool c3, bool c2, bool c0 ) {
			fpu_status_word.C3 = c3;
			fpu_status_word.C2 = c2;
			fpu_status_word.C0 = c0;
		}

		// Unordered sets C3, C2 and C0; greater clears all three
		void compare ( double a, double b ) {
			if ( std::isnan ( a ) || std::isnan ( b ) ) {
				set_condition_codes ( true, true, true );
			}
			else if ( a > b ) {
				set_condition_codes ( false, false, false );
			}
			else if ( a < b ) {
				set_condition_codes ( false, false, true );
			}
			else {
				set_condition_codes ( true, false, false );
			}
		}

		void reset ( ) {
			fpu_stack.fill ( 0.0 );
			fpu_tag_word.value = x86::FTW_ALL_EMPTY;
			fpu_status_word.value = 0;
			fpu_control_word.value = x86::FCW_DEFAULT;
			fpu_top = 0;
		}
	};

	struct CPU {
		std::array<std::uint32_t, Register::COUNT> registers = { 0 };
		std::uint32_t eip = 0;
		x86::Flags eflags = { .value = 0x00000202U };
		bool halted = false;
		FPU fpu { };
		PrefixState prefixes { };
		std::uint64_t step_count = 0;
	};

	enum class FaultCode : uint8_t {
		ILLEGAL_INSTRUCTION,
		ACCESS_VIOLATION,
		INTEGER_DIVIDE_BY_ZERO,
		INTEGER_OVERFLOW,
		UNHANDLED_INTERRUPT
	};

	inline const char* fault_code_name ( FaultCode code ) noexcept {
		switch ( code ) {
			case FaultCode::ILLEGAL_INSTRUCTION: return "ILLEGAL_INSTRUCTION";
			case FaultCode::ACCESS_VIOLATION: return "ACCESS_VIOLATION";
			case FaultCode::INTEGER_DIVIDE_BY_ZERO: return "INTEGER_DIVIDE_BY_ZERO";
			case FaultCode::INTEGER_OVERFLOW: return "INTEGER_OVERFLOW";
			case FaultCode::UNHANDLED_INTERRUPT: return "UNHANDLED_INTERRUPT";
		}
		return "UNKNOWN";
	}

	// Raised during decode or execution; caught only at the step boundary
	struct GuestFault : std::runtime_error {
		FaultCode code;
		std::optional<uint32_t> faulting_va;
		uint32_t exception_address = 0;

		GuestFault ( FaultCode fault_code, const std::string& description, std::optional<uint32_t> fault_va = std::nullopt )
			: std::runtime_error ( description ), code ( fault_code ), faulting_va ( fault_va ) { }
	};
};
