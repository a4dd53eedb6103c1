#include "posterize/tracer.hpp"
#include "posterize/trace.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace posterize {

namespace {

// Boundary segments per cell configuration, as offsets from the cell anchor.
// Saddles 5 and 10 emit both segments instead of choosing a diagonal.
//
// 8 4   tl tr
// 1 2   bl br
struct segment
{
	double x0, y0, x1, y1;
};

struct cell_edges
{
	int count;
	segment segments[2];
};

cell_edges const marching_squares[16] =
{
	/*  0 */ { 0, {} },
	/*  1 */ { 1, { { 0.0, 0.5, 0.5, 1.0 } } },
	/*  2 */ { 1, { { 0.5, 1.0, 1.0, 0.5 } } },
	/*  3 */ { 1, { { 0.0, 0.5, 1.0, 0.5 } } },
	/*  4 */ { 1, { { 1.0, 0.5, 0.5, 0.0 } } },
	/*  5 */ { 2, { { 0.0, 0.5, 0.5, 0.0 }, { 1.0, 0.5, 0.5, 1.0 } } },
	/*  6 */ { 1, { { 0.5, 1.0, 0.5, 0.0 } } },
	/*  7 */ { 1, { { 0.0, 0.5, 0.5, 0.0 } } },
	/*  8 */ { 1, { { 0.5, 0.0, 0.0, 0.5 } } },
	/*  9 */ { 1, { { 0.5, 0.0, 0.5, 1.0 } } },
	/* 10 */ { 2, { { 0.5, 0.0, 1.0, 0.5 }, { 0.5, 1.0, 0.0, 0.5 } } },
	/* 11 */ { 1, { { 0.5, 0.0, 1.0, 0.5 } } },
	/* 12 */ { 1, { { 1.0, 0.5, 0.0, 0.5 } } },
	/* 13 */ { 1, { { 1.0, 0.5, 0.5, 1.0 } } },
	/* 14 */ { 1, { { 0.5, 1.0, 0.0, 0.5 } } },
	/* 15 */ { 0, {} },
};

// walk directions: right, down, left, up
int const step_x[4] = { 1, 0, -1, 0 };
int const step_y[4] = { 0, 1, 0, -1 };

inline int reverse_direction(int dir)
{
	return dir < 0? -1 : (dir + 2) % 4;
}

inline bool matches(pixel_buffer const& image, size_t i, color const& target)
{
	if (image.alpha_at(i) <= 128) return false;
	uint8_t const* p = image.pixel(i);
	return std::abs(int(p[0]) - target.r) < 5
		&& std::abs(int(p[1]) - target.g) < 5
		&& std::abs(int(p[2]) - target.b) < 5;
}

int next_direction(mask const& m, int x, int y, int incoming)
{
	int const back = reverse_direction(incoming);
	for (int dir = 0; dir < 4; ++dir)
	{
		if (dir == back) continue;
		if (m.at(x + step_x[dir], y + step_y[dir]))
		{
			return dir;
		}
	}
	return -1;
}

// Walk from the start cell until it is reached again or the step budget
// of width * height is exhausted, marking each visited anchor pixel.
contour walk_contour(mask const& m, int start_x, int start_y, mask& visited)
{
	contour points;

	size_t const budget = m.size().area();
	size_t steps = 0;
	int x = start_x;
	int y = start_y;
	int incoming = -1;

	do
	{
		visited.set(x, y);

		contour const boundary = cell_boundary(m, x, y);
		points.insert(points.end(), boundary.begin(), boundary.end());

		int const dir = next_direction(m, x, y, incoming);
		if (dir < 0) break;

		x += step_x[dir];
		y += step_y[dir];
		incoming = dir;
		++steps;
	}
	while ((x != start_x || y != start_y) && steps < budget);

	return points;
}

double perpendicular_distance(point const& p, point const& start, point const& end)
{
	double const dx = end.x - start.x;
	double const dy = end.y - start.y;
	double const denominator = std::sqrt(dx * dx + dy * dy);
	if (denominator == 0.0)
	{
		return 0.0;
	}
	return std::fabs(dy * p.x - dx * p.y + end.x * start.y - end.y * start.x) / denominator;
}

} // anonymous namespace

double simplify_tolerance(smoothing_level level)
{
	return level == smoothing_level::simple? 2.0 : 0.5;
}

size_t mask::count() const
{
	size_t n = 0;
	for (bool bit : bits_)
	{
		if (bit) ++n;
	}
	return n;
}

mask make_mask(pixel_buffer const& image, color const& target)
{
	mask result(image.size());
	for (int y = 0; y < image.height(); ++y)
	{
		for (int x = 0; x < image.width(); ++x)
		{
			if (matches(image, image.index(x, y), target))
			{
				result.set(x, y);
			}
		}
	}
	return result;
}

mask make_mask(pixel_buffer const& image, palette const& colors, size_t index)
{
	if (index >= colors.size())
	{
		throw std::out_of_range(fmt::format("palette index {} is outside palette of {} colors", index, colors.size()));
	}

	mask result(image.size());
	for (int y = 0; y < image.height(); ++y)
	{
		for (int x = 0; x < image.width(); ++x)
		{
			size_t const i = image.index(x, y);
			if (!matches(image, i, colors[index])) continue;

			bool claimed = false;
			for (size_t j = 0; j < index && !claimed; ++j)
			{
				claimed = matches(image, i, colors[j]);
			}
			if (!claimed)
			{
				result.set(x, y);
			}
		}
	}
	return result;
}

int cell_configuration(mask const& m, int x, int y)
{
	return (m.at(x, y)? 8 : 0)
		| (m.at(x + 1, y)? 4 : 0)
		| (m.at(x + 1, y + 1)? 2 : 0)
		| (m.at(x, y + 1)? 1 : 0);
}

contour cell_boundary(mask const& m, int x, int y)
{
	contour points;
	cell_edges const& edges = marching_squares[cell_configuration(m, x, y)];
	for (int i = 0; i < edges.count; ++i)
	{
		segment const& s = edges.segments[i];
		points.push_back(point(x + s.x0, y + s.y0));
		points.push_back(point(x + s.x1, y + s.y1));
	}
	return points;
}

std::vector<contour> trace_contours(mask const& m)
{
	std::vector<contour> contours;
	mask visited(m.size());

	for (int y = 0; y < m.height(); ++y)
	{
		for (int x = 0; x < m.width(); ++x)
		{
			if (visited.at(x, y) || !m.at(x, y)) continue;

			contour points = walk_contour(m, x, y, visited);
			if (points.size() > 2)
			{
				contours.push_back(std::move(points));
			}
		}
	}
	return contours;
}

contour simplify(contour const& points, double tolerance)
{
	size_t const n = points.size();
	if (n <= 2)
	{
		return points;
	}

	std::vector<bool> keep(n, false);
	keep[0] = keep[n - 1] = true;

	std::vector<std::pair<size_t, size_t>> ranges;
	ranges.push_back(std::make_pair(size_t(0), n - 1));
	while (!ranges.empty())
	{
		size_t const first = ranges.back().first;
		size_t const last = ranges.back().second;
		ranges.pop_back();

		double max_distance = 0.0;
		size_t max_index = first;
		for (size_t i = first + 1; i < last; ++i)
		{
			double const d = perpendicular_distance(points[i], points[first], points[last]);
			if (d > max_distance)
			{
				max_distance = d;
				max_index = i;
			}
		}

		if (max_distance > tolerance)
		{
			keep[max_index] = true;
			ranges.push_back(std::make_pair(first, max_index));
			ranges.push_back(std::make_pair(max_index, last));
		}
	}

	contour result;
	for (size_t i = 0; i < n; ++i)
	{
		if (keep[i]) result.push_back(points[i]);
	}
	return result;
}

std::string smooth_path(contour const& points)
{
	std::string path;
	if (points.empty())
	{
		return path;
	}

	auto out = std::back_inserter(path);
	fmt::format_to(out, "M {} {}", points[0].x, points[0].y);
	if (points.size() == 1)
	{
		path += " Z";
		return path;
	}

	for (size_t i = 1; i + 1 < points.size(); ++i)
	{
		point const& control = points[i];
		point const& next = points[i + 1];
		fmt::format_to(out, " Q {} {}, {} {}", control.x, control.y,
			(control.x + next.x) / 2, (control.y + next.y) / 2);
	}

	point const& last = points.back();
	fmt::format_to(out, " L {} {} Z", last.x, last.y);
	return path;
}

void vector_document::add_group(shape_group group)
{
	groups_.push_back(std::move(group));
}

std::string vector_document::to_svg() const
{
	std::string svg;
	auto out = std::back_inserter(svg);

	fmt::format_to(out, "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 {0} {1}\" width=\"{0}\" height=\"{1}\">",
		size_.width, size_.height);
	for (shape_group const& group : groups_)
	{
		fmt::format_to(out, "<g fill=\"{}\">", to_hex(group.fill));
		for (std::string const& path : group.paths)
		{
			fmt::format_to(out, "<path d=\"{}\" />", path);
		}
		svg += "</g>";
	}
	svg += "</svg>";
	return svg;
}

shape_group trace_color(pixel_buffer const& image, palette const& colors, size_t index, smoothing_level level)
{
	double const tolerance = simplify_tolerance(level);

	shape_group group;
	group.fill = colors[index];
	for (contour const& points : trace_contours(make_mask(image, colors, index)))
	{
		group.paths.push_back(smooth_path(simplify(points, tolerance)));
	}
	return group;
}

vector_document trace(pixel_buffer const& image, palette const& colors, smoothing_level level)
{
	check_palette_size(colors.size());

	vector_document document(image.size());
	for (size_t i = 0; i < colors.size(); ++i)
	{
		shape_group group = trace_color(image, colors, i, level);
		trace_line("tracer: {} paths for {}", group.paths.size(), to_hex(group.fill));
		// colors without contours contribute no group
		if (!group.paths.empty())
		{
			document.add_group(std::move(group));
		}
	}
	return document;
}

} // posterize
