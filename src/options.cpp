#include "posterize/options.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <fmt/core.h>

#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace posterize {

namespace {

std::string const& single_value(boost::any& v, std::vector<std::string> const& values)
{
	po::validators::check_first_occurrence(v);
	return po::validators::get_single_string(values);
}

} // anonymous namespace

void validate(boost::any& v, std::vector<std::string> const& values, mapping_mode*, int)
{
	std::string const& s = single_value(v, values);
	if (s == "replace") v = mapping_mode::replace;
	else if (s == "closest") v = mapping_mode::closest;
	else throw po::invalid_option_value(s);
}

void validate(boost::any& v, std::vector<std::string> const& values, smoothing_level*, int)
{
	std::string const& s = single_value(v, values);
	if (s == "simple") v = smoothing_level::simple;
	else if (s == "complex") v = smoothing_level::complex;
	else throw po::invalid_option_value(s);
}

void validate(boost::any& v, std::vector<std::string> const& values, erase_method*, int)
{
	std::string const& s = single_value(v, values);
	if (s == "area") v = erase_method::area;
	else if (s == "color") v = erase_method::color;
	else throw po::invalid_option_value(s);
}

std::pair<int, int> parse_point(std::string const& text)
{
	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of(","));
	if (parts.size() != 2)
	{
		throw po::invalid_option_value(text);
	}
	try
	{
		return std::make_pair(boost::lexical_cast<int>(boost::trim_copy(parts[0])),
			boost::lexical_cast<int>(boost::trim_copy(parts[1])));
	}
	catch (boost::bad_lexical_cast const&)
	{
		throw po::invalid_option_value(text);
	}
}

palette parse_palette(std::string const& text)
{
	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of(","));

	palette colors;
	for (std::string const& part : parts)
	{
		colors.push_back(from_hex(boost::trim_copy(part)));
	}
	return colors;
}

session_settings options::settings() const
{
	session_settings result;
	result.colors = custom_palette.empty()? colors : custom_palette.size();
	result.mode = mode;
	result.smoothing = smoothing;
	result.method = method;
	result.area_tolerance = area_tolerance;
	result.color_tolerance = color_tolerance;
	return result;
}

options parse_options(int argc, char const* const argv[])
{
	options opts;
	std::string palette_text;
	std::vector<std::string> erase_text;
	uint32_t seed = 0;

	po::options_description general("General");
	general.add_options()
		("help,h", po::bool_switch(&opts.help), "print this help")
		("config", po::value(&opts.config_file), "read options from an INI style file")
		("verbose,v", po::bool_switch(&opts.verbose), "print diagnostics on stderr")
		("seed", po::value(&seed), "random seed for palette extraction")
		;

	po::options_description posterizing("Posterizing");
	posterizing.add_options()
		("input,i", po::value(&opts.input), "PNG or JPEG image, at most 10 MB")
		("colors,k", po::value(&opts.colors)->default_value(opts.colors), "palette size, 2 to 16")
		("mode", po::value(&opts.mode)->default_value(opts.mode, "replace"), "replace|closest")
		("smooth", po::bool_switch(&opts.smoothing), "blur the source before mapping")
		("palette", po::value(&palette_text), "comma separated #rrggbb colors, replaces the extracted palette")
		("clean-edges", po::bool_switch(&opts.clean_edges), "reassign anti-aliased edge pixels")
		("max-size", po::value(&opts.max_size)->default_value(opts.max_size), "longest side after downscaling")
		;

	po::options_description transparency("Transparency");
	transparency.add_options()
		("erase", po::value(&erase_text)->multitoken()->composing(), "X,Y points to make transparent")
		("erase-method", po::value(&opts.method)->default_value(opts.method, "area"), "area|color")
		("area-tolerance", po::value(&opts.area_tolerance)->default_value(opts.area_tolerance), "flood fill tolerance")
		("color-tolerance", po::value(&opts.color_tolerance)->default_value(opts.color_tolerance), "color match tolerance")
		;

	po::options_description exporting("Export");
	exporting.add_options()
		("complexity", po::value(&opts.complexity)->default_value(opts.complexity, "simple"), "simple|complex SVG paths")
		("svg", po::value(&opts.svg_output), "write SVG document")
		("png", po::value(&opts.png_output), "write PNG image")
		("indexed", po::bool_switch(&opts.indexed), "write the PNG with a palette")
		("jpeg", po::value(&opts.jpeg_output), "write JPEG image over white")
		;

	po::options_description all("posterize options");
	all.add(general).add(posterizing).add(transparency).add(exporting);

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, all), vm);
	if (vm.count("config"))
	{
		std::string const config_file = vm["config"].as<std::string>();
		po::store(po::parse_config_file<char>(config_file.c_str(), all), vm);
	}
	po::notify(vm);

	if (opts.help)
	{
		std::ostringstream text;
		text << all;
		opts.usage = text.str();
		return opts;
	}

	if (vm.count("seed"))
	{
		opts.seed = seed;
	}
	if (!palette_text.empty())
	{
		opts.custom_palette = parse_palette(palette_text);
	}
	for (std::string const& point : erase_text)
	{
		opts.erase_points.push_back(parse_point(point));
	}
	return opts;
}

void validate(options const& opts)
{
	if (opts.input.empty())
	{
		throw std::invalid_argument("no input image, use --input");
	}
	check_palette_size(opts.colors);
	if (!opts.custom_palette.empty())
	{
		check_palette_size(opts.custom_palette.size());
	}
	if (opts.max_size <= 0)
	{
		throw std::out_of_range(fmt::format("max size {} must be positive", opts.max_size));
	}
	if (opts.area_tolerance < 0 || opts.color_tolerance < 0)
	{
		throw std::out_of_range("tolerances must not be negative");
	}
}

} // posterize
