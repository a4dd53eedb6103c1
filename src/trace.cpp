#include "posterize/trace.hpp"

#include <atomic>

namespace posterize {

static std::atomic<bool> trace_enabled_(false);

void set_trace(bool enabled)
{
	trace_enabled_ = enabled;
}

bool trace_enabled()
{
	return trace_enabled_;
}

} // posterize
