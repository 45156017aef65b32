#pragma once

#include "IA32.hpp"

namespace ia32
{
	// Conventional FS base of the first thread's TEB on 32-bit Windows
	constexpr uint32_t conventional_fs_base = 0x7FFDD000;

	// Addresses above this are reported as probable segment-relative offsets
	constexpr uint32_t segment_relative_threshold = 0x40000000;

	// Prints the fault, the memory-access context and the register file to stdout
	void print_exception_diagnostics ( const GuestFault& fault, const IA32& context );
};
