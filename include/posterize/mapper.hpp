#ifndef POSTERIZE_MAPPER_HPP_INCLUDED
#define POSTERIZE_MAPPER_HPP_INCLUDED

#include "posterize/image.hpp"

namespace posterize {

/// Posterization modes offered to users, both map to the nearest palette color
enum class mapping_mode
{
	replace,
	closest
};

double const default_area_tolerance = 30.0;
double const default_color_tolerance = 10.0;

/// Index of the nearest palette color, the first one wins on ties
POSTERIZE_API size_t nearest_color_index(color const& c, palette const& colors);

/// Replace the color of every pixel with alpha >= 128 by its nearest palette color.
/// Pixels with alpha < 128 pass through unchanged.
POSTERIZE_API pixel_buffer map_to_palette(pixel_buffer const& image, palette const& colors,
	mapping_mode mode = mapping_mode::replace);

/// Pixel indices of the 4-connected region around (x, y) whose colors are
/// within tolerance of the start pixel color
POSTERIZE_API std::vector<size_t> flood_region(pixel_buffer const& image, int x, int y, double tolerance);

/// Set alpha to 0 for the flood_region() of (x, y)
POSTERIZE_API pixel_buffer erase_region(pixel_buffer const& image, int x, int y,
	double tolerance = default_area_tolerance);

/// Set alpha to 0 for every pixel within tolerance of the target color
POSTERIZE_API pixel_buffer erase_color(pixel_buffer const& image, color const& target,
	double tolerance = default_color_tolerance);

/// Reassign anti-aliased pixels (farther than 5 from every palette color) to
/// the most frequent nearest palette color among their 8 neighbours
POSTERIZE_API pixel_buffer clean_edges(pixel_buffer const& image, palette const& colors);

/// 3x3 box blur of the color channels, alpha and border pixels are kept
POSTERIZE_API pixel_buffer smooth(pixel_buffer const& image);

} // posterize

#endif // POSTERIZE_MAPPER_HPP_INCLUDED
