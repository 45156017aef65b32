#include <ia32/emulator.hpp>
#include <ia32/float80.hpp>
#include <cmath>
#include <limits>
#include <numbers>
#include "helpers.hpp"

using namespace ia32;

static uint32_t fpu_memory_address ( IA32& context, const ModRM& modrm ) {
	return context.apply_segment_override ( context.resolve_effective_address ( modrm ) );
}

// /0-/7 of D8 and of the memory forms of DA, DC and DE: ST(0) = ST(0) op operand
static void st0_operand_form ( IA32& context, uint8_t reg, double operand ) {
	auto& fpu = context.get_fpu ( );
	const double st0 = fpu.st ( 0 );
	switch ( reg ) {
		case 0: fpu.set_st ( 0, st0 + operand ); break;  // FADD
		case 1: fpu.set_st ( 0, st0 * operand ); break;  // FMUL
		case 2: fpu.compare ( st0, operand ); break;     // FCOM
		case 3:                                          // FCOMP
			fpu.compare ( st0, operand );
			fpu.pop ( );
			break;
		case 4: fpu.set_st ( 0, st0 - operand ); break;  // FSUB
		case 5: fpu.set_st ( 0, operand - st0 ); break;  // FSUBR
		case 6: fpu.set_st ( 0, st0 / operand ); break;  // FDIV
		case 7: fpu.set_st ( 0, operand / st0 ); break;  // FDIVR
	}
}

// Register forms of DC and DE: ST(i) = ST(i) op ST(0), optionally popping
static void sti_destination_form ( IA32& context, uint8_t reg, uint8_t sti, bool pop ) {
	auto& fpu = context.get_fpu ( );
	const double st0 = fpu.st ( 0 );
	const double value = fpu.st ( sti );
	switch ( reg ) {
		case 0: fpu.set_st ( sti, value + st0 ); break;  // FADD(P)
		case 1: fpu.set_st ( sti, value * st0 ); break;  // FMUL(P)
		case 2:                                          // FCOM alias
		case 3:                                          // FCOMP alias
			fpu.compare ( st0, value );
			pop = pop || reg == 3;
			break;
		case 4: fpu.set_st ( sti, st0 - value ); break;  // FSUBR(P)
		case 5: fpu.set_st ( sti, value - st0 ); break;  // FSUB(P)
		case 6: fpu.set_st ( sti, st0 / value ); break;  // FDIVR(P)
		case 7: fpu.set_st ( sti, value / st0 ); break;  // FDIV(P)
	}
	if ( pop ) {
		fpu.pop ( );
	}
}

// FCOMI/FUCOMI family: result goes to ZF and CF, unordered sets both
static void compare_into_eflags ( IA32& context, uint8_t sti ) {
	const auto& fpu = context.get_fpu ( );
	const double a = fpu.st ( 0 );
	const double b = fpu.st ( sti );
	auto& flags = context.get_flags ( );

	if ( std::isnan ( a ) || std::isnan ( b ) ) {
		flags.ZF = 1;
		flags.CF = 1;
	}
	else if ( a > b ) {
		flags.ZF = 0;
		flags.CF = 0;
	}
	else if ( a < b ) {
		flags.ZF = 0;
		flags.CF = 1;
	}
	else {
		flags.ZF = 1;
		flags.CF = 0;
	}
	flags.OF = 0;
}

// Out-of-range and NaN inputs produce the integer indefinite value
template <typename T>
static T to_integer ( const FPU& fpu, double value, bool truncate ) {
	const double rounded = truncate ? std::trunc ( value ) : fpu.round_to_integral ( value );
	if ( std::isnan ( rounded ) ||
			rounded < static_cast< double >( std::numeric_limits<T>::min ( ) ) ||
			rounded >= -static_cast< double >( std::numeric_limits<T>::min ( ) ) ) {
		return std::numeric_limits<T>::min ( );
	}
	return static_cast< T >( rounded );
}

static void set_fcmov ( IA32& context, uint8_t condition, uint8_t sti ) {
	auto& fpu = context.get_fpu ( );
	if ( helpers::evaluate_condition ( context.get_flags ( ), condition ) ) {
		fpu.set_st ( 0, fpu.st ( sti ) );
	}
}

static void set_top ( FPU& fpu, uint8_t top ) {
	fpu.fpu_top = top & 7;
	fpu.fpu_status_word.C1 = 0;
	fpu.update_fsw_top ( );
}

/// FXAM-Examine Floating-Point
/// Classifies ST(0) into C3, C2 and C0, with C1 holding the sign.
static void fxam ( FPU& fpu ) {
	const double value = fpu.st ( 0 );
	fpu.fpu_status_word.C1 = std::signbit ( value );

	if ( fpu.get_fpu_tag ( fpu.get_fpu_phys_idx ( 0 ) ) == x86::FPU_TAG_EMPTY ) {
		fpu.set_condition_codes ( true, false, true );
		return;
	}

	switch ( std::fpclassify ( value ) ) {
		case FP_NAN:       fpu.set_condition_codes ( false, false, true ); break;
		case FP_INFINITE:  fpu.set_condition_codes ( false, true, true ); break;
		case FP_ZERO:      fpu.set_condition_codes ( true, false, false ); break;
		case FP_SUBNORMAL: fpu.set_condition_codes ( true, true, false ); break;
		default:           fpu.set_condition_codes ( false, true, false ); break;
	}
}

/// D8-x87 arithmetic on ST(0) with ST(i) or m32real
void handlers::fpu_d8 ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.mod == 3 ) {
		st0_operand_form ( context, modrm.reg, context.get_fpu ( ).st ( modrm.rm ) );
		return;
	}

	const uint32_t address = fpu_memory_address ( context, modrm );
	st0_operand_form ( context, modrm.reg, context.get_memory ( ).read_float32 ( address ) );
}

/// D9-x87 loads, stores, control word access and transcendental operations
void handlers::fpu_d9 ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	auto& fpu = context.get_fpu ( );

	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		auto& memory = context.get_memory ( );
		switch ( modrm.reg ) {
			case 0: // FLD m32real
				fpu.push ( memory.read_float32 ( address ) );
				break;
			case 2: // FST m32real
				memory.write_float32 ( address, static_cast< float >( fpu.st ( 0 ) ) );
				break;
			case 3: // FSTP m32real
				memory.write_float32 ( address, static_cast< float >( fpu.st ( 0 ) ) );
				fpu.pop ( );
				break;
			case 4: // FLDENV
			case 6: // FNSTENV
				break;
			case 5: // FLDCW
				fpu.fpu_control_word.value = memory.read16 ( address );
				break;
			case 7: // FNSTCW
				memory.write16 ( address, fpu.fpu_control_word.value );
				break;
			default:
				helpers::unsupported_extension ( "x87 D9", modrm.reg );
		}
		return;
	}

	switch ( modrm.reg ) {
		case 0: // FLD ST(i)
			fpu.push ( fpu.st ( modrm.rm ) );
			break;
		case 1: // FXCH
			fpu.exchange ( modrm.rm );
			fpu.fpu_status_word.C1 = 0;
			break;
		case 2: // FNOP
			if ( modrm.rm != 0 ) {
				helpers::unsupported_extension ( "x87 D9", modrm.reg );
			}
			break;
		case 3: // FSTP ST(i)
			fpu.set_st ( modrm.rm, fpu.st ( 0 ) );
			fpu.pop ( );
			break;
		case 4:
			switch ( modrm.rm ) {
				case 0: fpu.set_st ( 0, -fpu.st ( 0 ) ); break;              // FCHS
				case 1: fpu.set_st ( 0, std::fabs ( fpu.st ( 0 ) ) ); break; // FABS
				case 4: fpu.compare ( fpu.st ( 0 ), 0.0 ); break;            // FTST
				case 5: fxam ( fpu ); break;                                 // FXAM
				default: helpers::unsupported_extension ( "x87 D9", modrm.reg );
			}
			break;
		case 5:
			switch ( modrm.rm ) {
				case 0: fpu.push ( 1.0 ); break;                             // FLD1
				case 1: fpu.push ( std::log2 ( 10.0 ) ); break;              // FLDL2T
				case 2: fpu.push ( std::numbers::log2e ); break;             // FLDL2E
				case 3: fpu.push ( std::numbers::pi ); break;                // FLDPI
				case 4: fpu.push ( std::log10 ( 2.0 ) ); break;              // FLDLG2
				case 5: fpu.push ( std::numbers::ln2 ); break;               // FLDLN2
				case 6: fpu.push ( 0.0 ); break;                             // FLDZ
				default: helpers::unsupported_extension ( "x87 D9", modrm.reg );
			}
			break;
		case 6:
			switch ( modrm.rm ) {
				case 0: // F2XM1
					fpu.set_st ( 0, std::exp2 ( fpu.st ( 0 ) ) - 1.0 );
					break;
				case 1: { // FYL2X
					const double x = fpu.st ( 0 );
					const double y = fpu.st ( 1 );
					fpu.pop ( );
					fpu.set_st ( 0, y * std::log2 ( x ) );
					break;
				}
				case 2: // FPTAN
					fpu.set_st ( 0, std::tan ( fpu.st ( 0 ) ) );
					fpu.push ( 1.0 );
					fpu.fpu_status_word.C2 = 0;
					break;
				case 3: { // FPATAN
					const double x = fpu.st ( 0 );
					const double y = fpu.st ( 1 );
					fpu.pop ( );
					fpu.set_st ( 0, std::atan2 ( y, x ) );
					break;
				}
				case 4: { // FXTRACT
					const double value = fpu.st ( 0 );
					if ( value == 0.0 ) {
						fpu.set_st ( 0, -std::numeric_limits<double>::infinity ( ) );
						fpu.push ( value );
						break;
					}
					const double exponent = std::logb ( value );
					fpu.set_st ( 0, exponent );
					fpu.push ( std::scalbn ( value, -static_cast< int >( exponent ) ) );
					break;
				}
				case 5: // FPREM1
					fpu.set_st ( 0, std::remainder ( fpu.st ( 0 ), fpu.st ( 1 ) ) );
					fpu.fpu_status_word.C2 = 0;
					break;
				case 6: // FDECSTP
					set_top ( fpu, fpu.fpu_top - 1 );
					break;
				case 7: // FINCSTP
					set_top ( fpu, fpu.fpu_top + 1 );
					break;
			}
			break;
		case 7:
			switch ( modrm.rm ) {
				case 0: // FPREM
					fpu.set_st ( 0, std::fmod ( fpu.st ( 0 ), fpu.st ( 1 ) ) );
					fpu.fpu_status_word.C2 = 0;
					break;
				case 1: { // FYL2XP1
					const double x = fpu.st ( 0 );
					const double y = fpu.st ( 1 );
					fpu.pop ( );
					fpu.set_st ( 0, y * std::log2 ( x + 1.0 ) );
					break;
				}
				case 2: // FSQRT
					fpu.set_st ( 0, std::sqrt ( fpu.st ( 0 ) ) );
					break;
				case 3: { // FSINCOS
					const double value = fpu.st ( 0 );
					fpu.set_st ( 0, std::sin ( value ) );
					fpu.push ( std::cos ( value ) );
					fpu.fpu_status_word.C2 = 0;
					break;
				}
				case 4: // FRNDINT
					fpu.set_st ( 0, fpu.round_to_integral ( fpu.st ( 0 ) ) );
					break;
				case 5: // FSCALE
					fpu.set_st ( 0, std::ldexp ( fpu.st ( 0 ), static_cast< int >( std::trunc ( fpu.st ( 1 ) ) ) ) );
					break;
				case 6: // FSIN
					fpu.set_st ( 0, std::sin ( fpu.st ( 0 ) ) );
					fpu.fpu_status_word.C2 = 0;
					break;
				case 7: // FCOS
					fpu.set_st ( 0, std::cos ( fpu.st ( 0 ) ) );
					fpu.fpu_status_word.C2 = 0;
					break;
			}
			break;
	}
}

/// DA-FCMOVcc, FUCOMPP, m32int arithmetic
void handlers::fpu_da ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		st0_operand_form ( context, modrm.reg, context.get_memory ( ).read_signed32 ( address ) );
		return;
	}

	auto& fpu = context.get_fpu ( );
	switch ( modrm.reg ) {
		case 0: set_fcmov ( context, 0x2, modrm.rm ); break; // FCMOVB
		case 1: set_fcmov ( context, 0x4, modrm.rm ); break; // FCMOVE
		case 2: set_fcmov ( context, 0x6, modrm.rm ); break; // FCMOVBE
		case 3: set_fcmov ( context, 0xA, modrm.rm ); break; // FCMOVU
		case 5:
			if ( modrm.rm == 1 ) { // FUCOMPP
				fpu.compare ( fpu.st ( 0 ), fpu.st ( 1 ) );
				fpu.pop ( );
				fpu.pop ( );
				break;
			}
			[[fallthrough]];
		default:
			helpers::unsupported_extension ( "x87 DA", modrm.reg );
	}
}

/// DB-FCMOVNcc, FCOMI, FUCOMI, FCLEX, FINIT, m32int and m80real transfers
void handlers::fpu_db ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	auto& fpu = context.get_fpu ( );

	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		auto& memory = context.get_memory ( );
		switch ( modrm.reg ) {
			case 0: // FILD m32int
				fpu.push ( memory.read_signed32 ( address ) );
				break;
			case 1: // FISTTP m32int
				memory.write32 ( address, static_cast< uint32_t >( to_integer<int32_t> ( fpu, fpu.st ( 0 ), true ) ) );
				fpu.pop ( );
				break;
			case 2: // FIST m32int
				memory.write32 ( address, static_cast< uint32_t >( to_integer<int32_t> ( fpu, fpu.st ( 0 ), false ) ) );
				break;
			case 3: // FISTP m32int
				memory.write32 ( address, static_cast< uint32_t >( to_integer<int32_t> ( fpu, fpu.st ( 0 ), false ) ) );
				fpu.pop ( );
				break;
			case 5: // FLD m80real
				fpu.push ( read_float80 ( memory, address ).convert_to<double> ( ) );
				break;
			case 7: // FSTP m80real
				write_float80 ( memory, address, float80_t ( fpu.st ( 0 ) ) );
				fpu.pop ( );
				break;
			default:
				helpers::unsupported_extension ( "x87 DB", modrm.reg );
		}
		return;
	}

	switch ( modrm.reg ) {
		case 0: set_fcmov ( context, 0x3, modrm.rm ); break; // FCMOVNB
		case 1: set_fcmov ( context, 0x5, modrm.rm ); break; // FCMOVNE
		case 2: set_fcmov ( context, 0x7, modrm.rm ); break; // FCMOVNBE
		case 3: set_fcmov ( context, 0xB, modrm.rm ); break; // FCMOVNU
		case 4:
			switch ( modrm.rm ) {
				case 0: // FENI, FDISI and FSETPM are no-ops past the 287
				case 1:
				case 4:
					break;
				case 2: // FNCLEX
					fpu.fpu_status_word.value &= static_cast< uint16_t >( ~( x86::FSW_EXCEPTION_MASK | x86::FSW_B ) );
					break;
				case 3: // FNINIT
					fpu.reset ( );
					break;
				default:
					helpers::unsupported_extension ( "x87 DB", modrm.reg );
			}
			break;
		case 5: // FUCOMI
		case 6: // FCOMI
			compare_into_eflags ( context, modrm.rm );
			break;
		default:
			helpers::unsupported_extension ( "x87 DB", modrm.reg );
	}
}

/// DC-x87 arithmetic with m64real, or into ST(i)
void handlers::fpu_dc ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.mod == 3 ) {
		sti_destination_form ( context, modrm.reg, modrm.rm, false );
		return;
	}

	const uint32_t address = fpu_memory_address ( context, modrm );
	st0_operand_form ( context, modrm.reg, context.get_memory ( ).read_float64 ( address ) );
}

/// DD-FFREE, FST/FSTP, FUCOM/FUCOMP, m64real and m64int transfers, FNSTSW m16
void handlers::fpu_dd ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	auto& fpu = context.get_fpu ( );

	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		auto& memory = context.get_memory ( );
		switch ( modrm.reg ) {
			case 0: // FLD m64real
				fpu.push ( memory.read_float64 ( address ) );
				break;
			case 1: // FISTTP m64int
				memory.write<uint64_t> ( address, static_cast< uint64_t >( to_integer<int64_t> ( fpu, fpu.st ( 0 ), true ) ), "fisttp" );
				fpu.pop ( );
				break;
			case 2: // FST m64real
				memory.write_float64 ( address, fpu.st ( 0 ) );
				break;
			case 3: // FSTP m64real
				memory.write_float64 ( address, fpu.st ( 0 ) );
				fpu.pop ( );
				break;
			case 4: // FRSTOR
			case 6: // FNSAVE
				break;
			case 7: // FNSTSW m16
				memory.write16 ( address, fpu.fpu_status_word.value );
				break;
			default:
				helpers::unsupported_extension ( "x87 DD", modrm.reg );
		}
		return;
	}

	switch ( modrm.reg ) {
		case 0: // FFREE
			fpu.set_fpu_tag ( fpu.get_fpu_phys_idx ( modrm.rm ), x86::FPU_TAG_EMPTY );
			break;
		case 2: // FST ST(i)
			fpu.set_st ( modrm.rm, fpu.st ( 0 ) );
			break;
		case 3: // FSTP ST(i)
			fpu.set_st ( modrm.rm, fpu.st ( 0 ) );
			fpu.pop ( );
			break;
		case 4: // FUCOM
			fpu.compare ( fpu.st ( 0 ), fpu.st ( modrm.rm ) );
			break;
		case 5: // FUCOMP
			fpu.compare ( fpu.st ( 0 ), fpu.st ( modrm.rm ) );
			fpu.pop ( );
			break;
		default:
			helpers::unsupported_extension ( "x87 DD", modrm.reg );
	}
}

/// DE-Popping arithmetic into ST(i), FCOMPP, m16int arithmetic
void handlers::fpu_de ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		st0_operand_form ( context, modrm.reg, context.get_memory ( ).read_signed16 ( address ) );
		return;
	}

	if ( modrm.reg == 3 ) {
		if ( modrm.rm != 1 ) {
			helpers::unsupported_extension ( "x87 DE", modrm.reg );
		}
		// FCOMPP
		auto& fpu = context.get_fpu ( );
		fpu.compare ( fpu.st ( 0 ), fpu.st ( 1 ) );
		fpu.pop ( );
		fpu.pop ( );
		return;
	}

	sti_destination_form ( context, modrm.reg, modrm.rm, true );
}

/// DF-FNSTSW AX, FCOMIP, FUCOMIP, m16int and m64int transfers
void handlers::fpu_df ( uint8_t opcode, IA32& context ) {
	const auto modrm = context.decode_modrm ( );
	auto& fpu = context.get_fpu ( );

	if ( modrm.mod != 3 ) {
		const uint32_t address = fpu_memory_address ( context, modrm );
		auto& memory = context.get_memory ( );
		switch ( modrm.reg ) {
			case 0: // FILD m16int
				fpu.push ( memory.read_signed16 ( address ) );
				break;
			case 1: // FISTTP m16int
				memory.write16 ( address, static_cast< uint16_t >( to_integer<int16_t> ( fpu, fpu.st ( 0 ), true ) ) );
				fpu.pop ( );
				break;
			case 2: // FIST m16int
				memory.write16 ( address, static_cast< uint16_t >( to_integer<int16_t> ( fpu, fpu.st ( 0 ), false ) ) );
				break;
			case 3: // FISTP m16int
				memory.write16 ( address, static_cast< uint16_t >( to_integer<int16_t> ( fpu, fpu.st ( 0 ), false ) ) );
				fpu.pop ( );
				break;
			case 5: // FILD m64int
				fpu.push ( static_cast< double >( static_cast< int64_t >( memory.read<uint64_t> ( address, "fild" ) ) ) );
				break;
			case 7: // FISTP m64int
				memory.write<uint64_t> ( address, static_cast< uint64_t >( to_integer<int64_t> ( fpu, fpu.st ( 0 ), false ) ), "fistp" );
				fpu.pop ( );
				break;
			default:
				// FBLD and FBSTP (packed BCD)
				helpers::unsupported_extension ( "x87 DF", modrm.reg );
		}
		return;
	}

	switch ( modrm.reg ) {
		case 4:
			if ( modrm.rm != 0 ) {
				helpers::unsupported_extension ( "x87 DF", modrm.reg );
			}
			// FNSTSW AX
			context.set_reg ( EAX, fpu.fpu_status_word.value, 2 );
			break;
		case 5: // FUCOMIP
		case 6: // FCOMIP
			compare_into_eflags ( context, modrm.rm );
			fpu.pop ( );
			break;
		default:
			helpers::unsupported_extension ( "x87 DF", modrm.reg );
	}
}
