#pragma once

#include <cstdint>

namespace x86
{
	// EFLAGS Register (32 bits)
	union Flags {
		std::uint32_t value;
		struct {
			std::uint32_t CF : 1;					// Carry Flag
			std::uint32_t reserved1 : 1;		// Reserved (always 1)
			std::uint32_t PF : 1;					// Parity Flag
			std::uint32_t reserved3 : 1;		// Reserved (0)
			std::uint32_t AF : 1;					// Auxiliary Carry Flag
			std::uint32_t reserved5 : 1;		// Reserved (0)
			std::uint32_t ZF : 1;					// Zero Flag
			std::uint32_t SF : 1;					// Sign Flag
			std::uint32_t TF : 1;					// Trap Flag
			std::uint32_t IF : 1;					// Interrupt Enable Flag
			std::uint32_t DF : 1;					// Direction Flag
			std::uint32_t OF : 1;					// Overflow Flag
			std::uint32_t IOPL : 2;				// I/O Privilege Level
			std::uint32_t NT : 1;					// Nested Task Flag
			std::uint32_t reserved15 : 1;  // Reserved (0)
			std::uint32_t RF : 1;					// Resume Flag
			std::uint32_t VM : 1;					// Virtual-8086 Mode
			std::uint32_t AC : 1;					// Alignment Check / Access Control
			std::uint32_t VIF : 1;					// Virtual Interrupt Flag
			std::uint32_t VIP : 1;					// Virtual Interrupt Pending
			std::uint32_t ID : 1;					// ID Flag
			std::uint32_t reserved22_31 : 10;  // Reserved (0)
		};
	};

	// SAHF/LAHF touch SF, ZF, AF, PF and CF only
	static constexpr uint32_t SAHF_MASK = 0xD5;

	// x87 FPU Control Word (16 bits)
	union FPUControlWord {
		std::uint16_t value;
		struct {
			unsigned int IM : 1;  // Invalid Operation Mask
			unsigned int DM : 1;  // Denormal Operand Mask
			unsigned int ZM : 1;  // Divide-by-Zero Mask
			unsigned int OM : 1;  // Overflow Mask
			unsigned int UM : 1;  // Underflow Mask
			unsigned int PM : 1;  // Precision Mask
			unsigned int reserved6 : 1;  // Reserved
			unsigned int reserved7 : 1;  // Reserved
			unsigned int PC : 2;  // Precision Control
			unsigned int RC : 2;  // Rounding Control
			unsigned int IC : 1;  // Infinity Control (legacy)
			unsigned int reserved13 : 3;  // Reserved
		};
	};

	// x87 FPU Status Word (16 bits)
	union FPUStatusWord {
		std::uint16_t value;
		struct {
			unsigned int IE : 1;  // Invalid Operation Flag
			unsigned int DE : 1;  // Denormal Operand Flag
			unsigned int ZE : 1;  // Divide-by-Zero Flag
			unsigned int OE : 1;  // Overflow Flag
			unsigned int UE : 1;  // Underflow Flag
			unsigned int PE : 1;  // Precision Flag
			unsigned int SF : 1;  // Stack Fault Flag
			unsigned int ES : 1;  // Exception Summary Status Flag
			unsigned int C0 : 1;  // Condition Code 0
			unsigned int C1 : 1;  // Condition Code 1
			unsigned int C2 : 1;  // Condition Code 2
			unsigned int TOP : 3; // Top of Stack Pointer
			unsigned int C3 : 1;  // Condition Code 3
			unsigned int B : 1;   // Busy Flag
		};
	};

	// x87 FPU Tag Word (16 bits), two bits per physical slot
	union FPUTagWord {
		std::uint16_t value;
		struct {
			unsigned int TAG0 : 2;
			unsigned int TAG1 : 2;
			unsigned int TAG2 : 2;
			unsigned int TAG3 : 2;
			unsigned int TAG4 : 2;
			unsigned int TAG5 : 2;
			unsigned int TAG6 : 2;
			unsigned int TAG7 : 2;
		};
	};

	static constexpr uint8_t FPU_TAG_VALID = 0b00;
	static constexpr uint8_t FPU_TAG_EMPTY = 0b11;
	static constexpr uint16_t FSW_EXCEPTION_MASK = 0x00FF;
	static constexpr uint16_t FSW_TOP_SHIFT = 11;
	static constexpr uint16_t FSW_TOP_MASK = ( 0b111 << FSW_TOP_SHIFT );
	static constexpr uint16_t FSW_B = ( 1 << 15 );
	static constexpr uint16_t FCW_DEFAULT = 0x037F;
	static constexpr uint16_t FTW_ALL_EMPTY = 0xFFFF;

	// FCW.RC encodings
	static constexpr uint8_t FPU_RC_NEAREST = 0;
	static constexpr uint8_t FPU_RC_DOWN = 1;
	static constexpr uint8_t FPU_RC_UP = 2;
	static constexpr uint8_t FPU_RC_ZERO = 3;
};
