#ifndef POSTERIZE_OPTIONS_HPP_INCLUDED
#define POSTERIZE_OPTIONS_HPP_INCLUDED

#include "posterize/image.hpp"
#include "posterize/mapper.hpp"
#include "posterize/rescaler.hpp"
#include "posterize/session.hpp"
#include "posterize/tracer.hpp"

#include <boost/any.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace posterize {

struct options
{
	std::string input;
	std::string svg_output;
	std::string png_output;
	std::string jpeg_output;
	std::string config_file;

	size_t colors = 5;
	mapping_mode mode = mapping_mode::replace;
	bool smoothing = false;
	smoothing_level complexity = smoothing_level::simple;

	/// Palette given on the command line, replaces the extracted one
	palette custom_palette;
	bool clean_edges = false;
	bool indexed = false;

	erase_method method = erase_method::area;
	double area_tolerance = default_area_tolerance;
	double color_tolerance = default_color_tolerance;
	std::vector<std::pair<int, int>> erase_points;

	int max_size = default_max_side;
	std::optional<uint32_t> seed;
	bool verbose = false;

	bool help = false;
	std::string usage;

	session_settings settings() const;
};

/// Parse the command line and the optional --config file into options.
/// Values on the command line take precedence over the config file.
/// Throws boost::program_options::error on malformed input.
POSTERIZE_API options parse_options(int argc, char const* const argv[]);

/// Check value ranges, throws std::out_of_range or std::invalid_argument
POSTERIZE_API void validate(options const& opts);

/// "X,Y" erase point
POSTERIZE_API std::pair<int, int> parse_point(std::string const& text);

/// Comma separated list of hex colors
POSTERIZE_API palette parse_palette(std::string const& text);

// boost::program_options conversions, found by argument dependent lookup
void validate(boost::any& v, std::vector<std::string> const& values, mapping_mode*, int);
void validate(boost::any& v, std::vector<std::string> const& values, smoothing_level*, int);
void validate(boost::any& v, std::vector<std::string> const& values, erase_method*, int);

} // posterize

#endif // POSTERIZE_OPTIONS_HPP_INCLUDED
