#include "posterize/decoder.hpp"
#include "posterize/encoder.hpp"
#include "posterize/options.hpp"
#include "posterize/rescaler.hpp"
#include "posterize/session.hpp"
#include "posterize/trace.hpp"

#include <boost/program_options/errors.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <utility>

using namespace posterize;

static void run(options const& opts)
{
	pixel_buffer image = fit_image(load_image(opts.input), opts.max_size);

	std::unique_ptr<session> s = opts.seed
		? std::make_unique<session>(opts.settings(), *opts.seed)
		: std::make_unique<session>(opts.settings());

	s->load(std::move(image));
	if (!opts.custom_palette.empty())
	{
		s->set_palette(opts.custom_palette);
	}
	if (opts.clean_edges)
	{
		s->clean_edges();
	}
	for (auto const& point : opts.erase_points)
	{
		s->erase_at(point.first, point.second);
	}

	for (color const& c : s->colors())
	{
		fmt::print("{}\n", to_hex(c));
	}

	if (!opts.svg_output.empty())
	{
		save_file(opts.svg_output, s->export_svg(opts.complexity).to_svg());
	}
	if (!opts.png_output.empty())
	{
		buffer data;
		if (opts.indexed)
		{
			generate_png(s->current(), data, -1, png_color_type::palette, s->colors());
		}
		else
		{
			generate_png(s->current(), data);
		}
		save_file(opts.png_output, data);
	}
	if (!opts.jpeg_output.empty())
	{
		buffer data;
		generate_jpeg(s->current(), data);
		save_file(opts.jpeg_output, data);
	}
}

int main(int argc, char const* argv[])
{
	try
	{
		options const opts = parse_options(argc, argv);
		if (opts.help)
		{
			fmt::print("usage: posterize --input image [options]\n\n{}", opts.usage);
			return 0;
		}
		validate(opts);
		set_trace(opts.verbose);

		run(opts);
	}
	catch (boost::program_options::error const& e)
	{
		fmt::print(stderr, "posterize: {}, see --help\n", e.what());
		return 1;
	}
	catch (std::exception const& e)
	{
		fmt::print(stderr, "posterize: {}\n", e.what());
		return 1;
	}
	return 0;
}
