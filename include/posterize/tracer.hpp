#ifndef POSTERIZE_TRACER_HPP_INCLUDED
#define POSTERIZE_TRACER_HPP_INCLUDED

#include "posterize/image.hpp"

#include <string>
#include <vector>

namespace posterize {

/// Sub-pixel contour point
struct point
{
	double x, y;

	point(double x = 0.0, double y = 0.0) : x(x), y(y) {}

	bool operator==(point const& other) const { return x == other.x && y == other.y; }
	bool operator!=(point const& other) const { return !(*this == other); }
};

typedef std::vector<point> contour;

/// Vector output detail level
enum class smoothing_level
{
	simple,  ///< coarser, fewer points
	complex  ///< finer detail
};

/// RDP tolerance for the level: 2.0 for simple, 0.5 for complex
POSTERIZE_API double simplify_tolerance(smoothing_level level);

/// Binary grid, reads outside the grid return false
class POSTERIZE_API mask
{
public:
	explicit mask(image_size const& size)
		: size_(size)
		, bits_(size.area(), false)
	{
	}

	image_size const& size() const { return size_; }
	int width() const { return size_.width; }
	int height() const { return size_.height; }

	bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < size_.width && y < size_.height; }

	bool at(int x, int y) const { return contains(x, y) && bits_[static_cast<size_t>(y) * size_.width + x]; }
	void set(int x, int y, bool value = true) { bits_[static_cast<size_t>(y) * size_.width + x] = value; }

	size_t count() const;

private:
	image_size size_;
	std::vector<bool> bits_;
};

/// Pixels with alpha > 128 whose channels all differ from target by less than 5
POSTERIZE_API mask make_mask(pixel_buffer const& image, color const& target);

/// Mask of palette entry index, excluding pixels already matched by an earlier entry.
/// Throws std::out_of_range for an index outside the palette
POSTERIZE_API mask make_mask(pixel_buffer const& image, palette const& colors, size_t index);

/// Marching squares configuration of the 2x2 cell anchored at (x, y):
/// 8 top-left, 4 top-right, 2 bottom-right, 1 bottom-left
POSTERIZE_API int cell_configuration(mask const& m, int x, int y);

/// Boundary segments of the cell at (x, y) as point pairs, two pairs for the saddles 5 and 10
POSTERIZE_API contour cell_boundary(mask const& m, int x, int y);

/// Trace one contour per unvisited mask pixel in raster order
POSTERIZE_API std::vector<contour> trace_contours(mask const& m);

/// Ramer-Douglas-Peucker simplification, keeps the first and last point
POSTERIZE_API contour simplify(contour const& points, double tolerance);

/// Closed path data of quadratic curves through the midpoints of the points
POSTERIZE_API std::string smooth_path(contour const& points);

/// All paths of one palette color
struct shape_group
{
	color fill;
	std::vector<std::string> paths;
};

/// Traced image, one group per palette color with surviving contours
class POSTERIZE_API vector_document
{
public:
	explicit vector_document(image_size const& size = image_size())
		: size_(size)
	{
	}

	image_size const& size() const { return size_; }

	std::vector<shape_group> const& groups() const { return groups_; }
	void add_group(shape_group group);

	/// Serialize as an SVG document
	std::string to_svg() const;

private:
	image_size size_;
	std::vector<shape_group> groups_;
};

/// Trace a single palette entry. Entries are independent of each other and
/// may be traced concurrently.
POSTERIZE_API shape_group trace_color(pixel_buffer const& image, palette const& colors, size_t index,
	smoothing_level level);

/// Trace every palette entry of a palette-mapped image
POSTERIZE_API vector_document trace(pixel_buffer const& image, palette const& colors,
	smoothing_level level = smoothing_level::simple);

} // posterize

#endif // POSTERIZE_TRACER_HPP_INCLUDED
