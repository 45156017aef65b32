#pragma once

#include <cstdint>

namespace ia32
{
	struct EmulatorOptions {
		uint8_t verbose : 1;
		uint8_t trace : 1;
		uint8_t halt_on_fault : 1;
		uint8_t reserved : 5;
		uint8_t trace_depth;
	};

	constexpr uint8_t default_trace_depth = 20;
};
