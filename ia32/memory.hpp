#ifndef IA32_MEMORY_HPP
#define IA32_MEMORY_HPP

#include <bit>
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <span>
#include <vector>
#include "types.hpp"

namespace ia32
{
	constexpr auto verbose_memory = false;
	// One past the highest 32-bit address
	constexpr std::size_t max_memory_size = 0x100000000ULL;

	struct MemoryBounds {
		uint32_t start;
		uint64_t end;
		std::size_t size;
	};

	// Flat, zero-based, bounds-checked guest memory. Sized once at construction.
	class Memory {
	public:
		explicit Memory ( std::size_t size );

		[[nodiscard]] uint8_t read8 ( uint32_t addr ) const { return read<uint8_t> ( addr, "read8" ); }
		[[nodiscard]] uint16_t read16 ( uint32_t addr ) const { return read<uint16_t> ( addr, "read16" ); }
		[[nodiscard]] uint32_t read32 ( uint32_t addr ) const { return read<uint32_t> ( addr, "read32" ); }
		[[nodiscard]] int8_t read_signed8 ( uint32_t addr ) const { return static_cast< int8_t >( read<uint8_t> ( addr, "read_signed8" ) ); }
		[[nodiscard]] int16_t read_signed16 ( uint32_t addr ) const { return static_cast< int16_t >( read<uint16_t> ( addr, "read_signed16" ) ); }
		[[nodiscard]] int32_t read_signed32 ( uint32_t addr ) const { return static_cast< int32_t >( read<uint32_t> ( addr, "read_signed32" ) ); }
		[[nodiscard]] float read_float32 ( uint32_t addr ) const { return std::bit_cast< float >( read<uint32_t> ( addr, "read_float32" ) ); }
		[[nodiscard]] double read_float64 ( uint32_t addr ) const { return std::bit_cast< double >( read<uint64_t> ( addr, "read_float64" ) ); }

		void write8 ( uint32_t addr, uint8_t val ) { write<uint8_t> ( addr, val, "write8" ); }
		void write16 ( uint32_t addr, uint16_t val ) { write<uint16_t> ( addr, val, "write16" ); }
		void write32 ( uint32_t addr, uint32_t val ) { write<uint32_t> ( addr, val, "write32" ); }
		void write_float32 ( uint32_t addr, float val ) { write<uint32_t> ( addr, std::bit_cast< uint32_t >( val ), "write_float32" ); }
		void write_float64 ( uint32_t addr, double val ) { write<uint64_t> ( addr, std::bit_cast< uint64_t >( val ), "write_float64" ); }

		// Copies a section payload into memory
		void load ( uint32_t addr, std::span<const uint8_t> bytes );
		[[nodiscard]] std::vector<uint8_t> read_bytes ( uint32_t addr, std::size_t count ) const;

		[[nodiscard]] bool is_valid_address ( uint32_t addr ) const noexcept;
		[[nodiscard]] bool is_valid_range ( uint32_t addr, std::size_t count ) const noexcept;
		[[nodiscard]] MemoryBounds get_bounds ( ) const noexcept;
		[[nodiscard]] std::size_t size ( ) const noexcept {
			return data.size ( );
		}

		template<typename T> [[nodiscard]] T read ( uint32_t addr, const char* op = "read" ) const;
		template<typename T> void write ( uint32_t addr, T val, const char* op = "write" );

		// Throws ACCESS_VIOLATION unless [addr, addr + width) lies inside memory
		void check ( uint32_t addr, std::size_t width, const char* op ) const;

	private:
		std::vector<uint8_t> data;
	};

	template<typename T>
	inline T Memory::read ( uint32_t addr, const char* op ) const {
		check ( addr, sizeof ( T ), op );
		T val { 0 };
		std::memcpy ( &val, data.data ( ) + addr, sizeof ( T ) );
		if constexpr ( std::endian::native == std::endian::big ) {
			auto* bytes = reinterpret_cast< uint8_t* >( &val );
			std::reverse ( bytes, bytes + sizeof ( T ) );
		}
		return val;
	}

	template<typename T>
	inline void Memory::write ( uint32_t addr, T val, const char* op ) {
		check ( addr, sizeof ( T ), op );
		if constexpr ( std::endian::native == std::endian::big ) {
			auto* bytes = reinterpret_cast< uint8_t* >( &val );
			std::reverse ( bytes, bytes + sizeof ( T ) );
		}
		std::memcpy ( data.data ( ) + addr, &val, sizeof ( T ) );
	}
} // namespace ia32

#endif
