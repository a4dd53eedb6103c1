#ifndef POSTERIZE_TRACE_HPP_INCLUDED
#define POSTERIZE_TRACE_HPP_INCLUDED

#include "posterize/image.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace posterize {

/// Enable or disable diagnostic output on stderr, disabled by default
POSTERIZE_API void set_trace(bool enabled);
POSTERIZE_API bool trace_enabled();

/// Print one diagnostic line, e.g. trace_line("quantizer: {} samples", n)
template<typename... Args>
void trace_line(fmt::format_string<Args...> format, Args&&... args)
{
	if (trace_enabled())
	{
		fmt::print(stderr, "posterize::{}\n", fmt::format(format, std::forward<Args>(args)...));
	}
}

} // posterize

#endif // POSTERIZE_TRACE_HPP_INCLUDED
