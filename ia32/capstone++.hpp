#pragma once

#include <cstdint>
#include <string>
#include <capstone/capstone.h>
#include <capstone/x86.h>
#include <fmt/format.h>

namespace capstone
{
	class Instruction {
	public:
		Instruction ( ) noexcept = default;

		explicit Instruction ( const cs_insn* insn ) noexcept {
			if ( insn && insn->id != X86_INS_INVALID && insn->size > 0 ) {
				valid_ = true;
				size_ = static_cast< uint8_t >( insn->size );
				mnemonic_str_ = insn->mnemonic;
				op_str_ = insn->op_str;
			}
		}

		[[nodiscard]] inline uint8_t length ( ) const noexcept {
			return size_;
		}
		[[nodiscard]] inline bool is_valid ( ) const noexcept {
			return valid_;
		}

		[[nodiscard]] std::string to_string_no_address ( ) const {
			if ( !valid_ ) {
				return "invalid instruction";
			}
			if ( op_str_.empty ( ) ) {
				return mnemonic_str_;
			}
			return fmt::format ( "{} {}", mnemonic_str_, op_str_ );
		}

	private:
		uint8_t size_ = 0;
		bool valid_ = false;
		std::string mnemonic_str_;
		std::string op_str_;
	};

	// 32-bit protected mode decoder over a caller-owned byte window
	class Decoder {
	public:
		Decoder ( const uint8_t* data = nullptr, size_t size = 0, uint64_t base_addr = 0 ) noexcept
			: data_ ( data ), ip_ ( base_addr ), base_addr_ ( base_addr ), size_ ( static_cast< uint32_t >( size ) ) {
			if ( cs_open ( CS_ARCH_X86, CS_MODE_32, &handle_ ) != CS_ERR_OK ) {
				handle_ = 0;
			}
		}

		Decoder ( const Decoder& ) = delete;
		Decoder& operator=( const Decoder& ) = delete;

		~Decoder ( ) noexcept {
			if ( handle_ ) {
				cs_close ( &handle_ );
			}
		}

		[[nodiscard]] bool is_open ( ) const noexcept {
			return handle_ != 0;
		}

		[[nodiscard]] bool can_decode ( ) const noexcept {
			return handle_ != 0 && data_ != nullptr && ip_ >= base_addr_ && ip_ - base_addr_ < size_;
		}

		[[nodiscard]] Instruction decode ( ) noexcept {
			if ( !can_decode ( ) ) [[unlikely]] {
				return Instruction ( );
			}

			const uint8_t* current_ptr = data_ + ( ip_ - base_addr_ );
			size_t code_size = size_ - static_cast< size_t >( ip_ - base_addr_ );
			uint64_t address = ip_;

			cs_insn* insn = cs_malloc ( handle_ );
			if ( !insn ) {
				return Instruction ( );
			}

			Instruction result;
			if ( cs_disasm_iter ( handle_, &current_ptr, &code_size, &address, insn ) ) [[likely]] {
				result = Instruction ( insn );
				ip_ += insn->size;
			}
			cs_free ( insn, 1 );
			return result;
		}

	private:
		csh handle_ = 0;
		const uint8_t* data_ = nullptr;
		uint64_t ip_ = 0;
		uint64_t base_addr_ = 0;
		uint32_t size_ = 0;
	};
};
