#ifndef POSTERIZE_CODEC_HPP_INCLUDED
#define POSTERIZE_CODEC_HPP_INCLUDED

#include <csetjmp>
#include <cstdio>
#include <utility>

#include <jpeglib.h>

namespace posterize {

template<typename F>
struct scope_guard_t
{
	scope_guard_t(F&& fun) : on_exit(std::move(fun)) {}
	~scope_guard_t() { on_exit(); }
	F on_exit;
};

template<typename F>
auto scope_guard(F&& f) { return scope_guard_t<F>(std::move(f)); }

/// libjpeg error manager that jumps back to the caller instead of calling exit()
struct jpeg_error_context
{
	jpeg_error_mgr mgr;
	std::jmp_buf jump;
	char message[JMSG_LENGTH_MAX];
};

inline void jpeg_error_exit(j_common_ptr cinfo)
{
	jpeg_error_context* context = reinterpret_cast<jpeg_error_context*>(cinfo->err);
	(*cinfo->err->format_message)(cinfo, context->message);
	std::longjmp(context->jump, 1);
}

inline void jpeg_output_message(j_common_ptr)
{
	// warnings are not reported
}

} // posterize

#endif // POSTERIZE_CODEC_HPP_INCLUDED
