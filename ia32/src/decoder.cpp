#include "../IA32.hpp"

using namespace ia32;

uint8_t IA32::fetch8 ( ) {
	const uint8_t value = memory->read8 ( cpu->eip );
	cpu->eip += 1;
	return value;
}

uint16_t IA32::fetch16 ( ) {
	const uint16_t value = memory->read16 ( cpu->eip );
	cpu->eip += 2;
	return value;
}

uint32_t IA32::fetch32 ( ) {
	const uint32_t value = memory->read32 ( cpu->eip );
	cpu->eip += 4;
	return value;
}

int8_t IA32::fetch_signed8 ( ) {
	return static_cast< int8_t >( fetch8 ( ) );
}

uint32_t IA32::fetch_immediate ( size_t op_size ) {
	switch ( op_size ) {
		case 1: return fetch8 ( );
		case 2: return fetch16 ( );
		default: return fetch32 ( );
	}
}

uint32_t IA32::fetch_signed8_extended ( ) {
	return static_cast< uint32_t >( static_cast< int32_t >( fetch_signed8 ( ) ) );
}

void IA32::scan_prefixes ( ) {
	auto& prefix = cpu->prefixes;
	while ( true ) {
		switch ( memory->read8 ( cpu->eip ) ) {
			case 0x26: // ES
			case 0x2E: // CS
			case 0x36: // SS
			case 0x3E: // DS
				break;
			case 0x64:
				prefix.segment = SegmentOverride::FS;
				break;
			case 0x65:
				prefix.segment = SegmentOverride::GS;
				break;
			case 0x66:
				prefix.operand_size_override = true;
				break;
			case 0x67:
				prefix.address_size_override = true;
				break;
			case 0xF0:
				prefix.lock = true;
				break;
			case 0xF2:
				prefix.repeat = RepeatMode::REPNE;
				break;
			case 0xF3:
				prefix.repeat = RepeatMode::REP;
				break;
			default:
				return;
		}
		cpu->eip += 1;
	}
}

void IA32::clear_prefixes ( ) noexcept {
	cpu->prefixes = PrefixState { };
}

ModRM IA32::decode_modrm ( ) {
	const uint8_t byte = fetch8 ( );
	return ModRM {
		.mod = static_cast< uint8_t >( ( byte >> 6 ) & 3 ),
		.reg = static_cast< uint8_t >( ( byte >> 3 ) & 7 ),
		.rm = static_cast< uint8_t >( byte & 7 )
	};
}

uint32_t IA32::decode_sib ( uint8_t mod ) {
	const uint8_t sib = fetch8 ( );
	const uint8_t scale = ( sib >> 6 ) & 3;
	const uint8_t index = ( sib >> 3 ) & 7;
	const uint8_t base = sib & 7;

	uint32_t address = 0;
	if ( base == Register::EBP && mod == 0 ) {
		address = fetch32 ( );
	}
	else {
		address = cpu->registers [ base ];
	}

	// Index 4 (ESP) encodes "no index"
	if ( index != Register::ESP ) {
		address += cpu->registers [ index ] << scale;
	}

	return address;
}

uint32_t IA32::resolve_effective_address ( const ModRM& modrm ) {
	uint32_t address = 0;

	if ( modrm.mod == 0 && modrm.rm == 5 ) {
		return fetch32 ( );
	}

	if ( modrm.rm == 4 ) {
		address = decode_sib ( modrm.mod );
	}
	else {
		address = cpu->registers [ modrm.rm ];
	}

	switch ( modrm.mod ) {
		case 1:
			address += fetch_signed8_extended ( );
			break;
		case 2:
			address += fetch32 ( );
			break;
		default:
			break;
	}

	return address;
}

uint32_t IA32::apply_segment_override ( uint32_t address ) const {
	switch ( cpu->prefixes.segment ) {
		case SegmentOverride::FS:
			return fs_resolver ? fs_resolver ( address ) : address;
		case SegmentOverride::GS:
			return gs_resolver ? gs_resolver ( address ) : address;
		default:
			return address;
	}
}

Operand IA32::resolve_operand ( const ModRM& modrm ) {
	if ( modrm.mod == 3 ) {
		return Operand { OpKind::Register, modrm.rm };
	}
	return Operand { OpKind::Memory, apply_segment_override ( resolve_effective_address ( modrm ) ) };
}
