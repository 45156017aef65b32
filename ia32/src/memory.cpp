#include "../memory.hpp"
#include <fmt/core.h>
#include <stdexcept>

using namespace ia32;

Memory::Memory ( std::size_t size ) {
	if ( size > max_memory_size ) {
		throw std::length_error ( fmt::format ( "memory size 0x{:x} exceeds the 32-bit address space", size ) );
	}
	data.assign ( size, 0 );
}

void Memory::check ( uint32_t addr, std::size_t width, const char* op ) const {
	if ( static_cast< uint64_t >( addr ) + width <= data.size ( ) ) {
		return;
	}

	auto message = fmt::format ( "{}: address 0x{:08x} outside bounds [0, 0x{:08x})", op, addr, data.size ( ) );
	if constexpr ( verbose_memory ) {
		fmt::print ( "[IA32] {}\n", message );
	}
	throw GuestFault ( FaultCode::ACCESS_VIOLATION, message, addr );
}

void Memory::load ( uint32_t addr, std::span<const uint8_t> bytes ) {
	if ( static_cast< uint64_t >( addr ) + bytes.size ( ) > data.size ( ) ) {
		throw GuestFault ( FaultCode::ACCESS_VIOLATION,
			fmt::format ( "load: cannot fit {} bytes at 0x{:08x}, would exceed bounds [0, 0x{:08x})", bytes.size ( ), addr, data.size ( ) ),
			addr );
	}
	std::copy ( bytes.begin ( ), bytes.end ( ), data.begin ( ) + addr );
}

std::vector<uint8_t> Memory::read_bytes ( uint32_t addr, std::size_t count ) const {
	check ( addr, count, "read_bytes" );
	return std::vector<uint8_t> ( data.begin ( ) + addr, data.begin ( ) + addr + count );
}

bool Memory::is_valid_address ( uint32_t addr ) const noexcept {
	return addr < data.size ( );
}

bool Memory::is_valid_range ( uint32_t addr, std::size_t count ) const noexcept {
	return static_cast< uint64_t >( addr ) + count <= data.size ( );
}

MemoryBounds Memory::get_bounds ( ) const noexcept {
	return { 0, static_cast< uint64_t >( data.size ( ) ), data.size ( ) };
}
