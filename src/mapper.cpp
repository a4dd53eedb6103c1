#include "posterize/mapper.hpp"
#include "posterize/trace.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace posterize {

namespace {

double const edge_artifact_distance = 5.0;

uint8_t const opaque_threshold = 128;

} // anonymous namespace

size_t nearest_color_index(color const& c, palette const& colors)
{
	size_t nearest = 0;
	int best = std::numeric_limits<int>::max();
	for (size_t i = 0; i < colors.size(); ++i)
	{
		int const d = distance2(c, colors[i]);
		if (d < best)
		{
			best = d;
			nearest = i;
		}
	}
	return nearest;
}

pixel_buffer map_to_palette(pixel_buffer const& image, palette const& colors, mapping_mode)
{
	check_palette_size(colors.size());

	pixel_buffer result = image;
	for (size_t i = 0, count = result.pixel_count(); i < count; ++i)
	{
		if (result.alpha_at(i) < opaque_threshold) continue;
		result.set_color(i, colors[nearest_color_index(result.color_at(i), colors)]);
	}
	return result;
}

std::vector<size_t> flood_region(pixel_buffer const& image, int x, int y, double tolerance)
{
	if (!image.contains(x, y))
	{
		throw std::out_of_range(fmt::format("flood fill start ({}, {}) is outside {}x{} image",
			x, y, image.width(), image.height()));
	}

	int const width = image.width();
	int const height = image.height();
	color const start = image.color_at(x, y);

	std::vector<size_t> region;
	std::vector<bool> visited(image.pixel_count(), false);

	// explicit worklist, large regions would overflow the call stack
	std::vector<size_t> pending;
	pending.push_back(image.index(x, y));
	visited[pending.back()] = true;

	while (!pending.empty())
	{
		size_t const i = pending.back();
		pending.pop_back();

		if (distance(image.color_at(i), start) > tolerance) continue;
		region.push_back(i);

		int const px = static_cast<int>(i % width);
		int const py = static_cast<int>(i / width);
		int const neighbours[4][2] = { { px + 1, py }, { px - 1, py }, { px, py + 1 }, { px, py - 1 } };
		for (auto const& n : neighbours)
		{
			if (n[0] < 0 || n[1] < 0 || n[0] >= width || n[1] >= height) continue;
			size_t const ni = image.index(n[0], n[1]);
			if (visited[ni]) continue;
			visited[ni] = true;
			pending.push_back(ni);
		}
	}

	return region;
}

pixel_buffer erase_region(pixel_buffer const& image, int x, int y, double tolerance)
{
	std::vector<size_t> const region = flood_region(image, x, y, tolerance);

	pixel_buffer result = image;
	for (size_t i : region)
	{
		result.set_alpha(i, 0);
	}
	trace_line("mapper: erased region of {} pixels at ({}, {})", region.size(), x, y);
	return result;
}

pixel_buffer erase_color(pixel_buffer const& image, color const& target, double tolerance)
{
	pixel_buffer result = image;
	size_t erased = 0;
	for (size_t i = 0, count = result.pixel_count(); i < count; ++i)
	{
		if (distance(result.color_at(i), target) <= tolerance)
		{
			result.set_alpha(i, 0);
			++erased;
		}
	}
	trace_line("mapper: erased {} pixels matching {}", erased, to_hex(target));
	return result;
}

pixel_buffer clean_edges(pixel_buffer const& image, palette const& colors)
{
	check_palette_size(colors.size());

	int const width = image.width();
	int const height = image.height();

	pixel_buffer result = image;
	size_t cleaned = 0;

	for (int y = 1; y < height - 1; ++y)
	{
		for (int x = 1; x < width - 1; ++x)
		{
			color const c = image.color_at(x, y);
			if (distance(c, colors[nearest_color_index(c, colors)]) <= edge_artifact_distance) continue;

			// plurality vote, ties go to the color encountered first
			size_t counts[max_palette_size] = {};
			size_t order[max_palette_size];
			size_t seen = 0;
			for (int dy = -1; dy <= 1; ++dy)
			{
				for (int dx = -1; dx <= 1; ++dx)
				{
					if (dx == 0 && dy == 0) continue;
					size_t const n = nearest_color_index(image.color_at(x + dx, y + dy), colors);
					if (counts[n]++ == 0)
					{
						order[seen++] = n;
					}
				}
			}

			size_t best = 0;
			size_t best_count = 0;
			for (size_t i = 0; i < seen; ++i)
			{
				if (counts[order[i]] > best_count)
				{
					best_count = counts[order[i]];
					best = order[i];
				}
			}

			result.set_color(x, y, colors[best]);
			++cleaned;
		}
	}

	trace_line("mapper: cleaned {} edge pixels", cleaned);
	return result;
}

pixel_buffer smooth(pixel_buffer const& image)
{
	int const width = image.width();
	int const height = image.height();

	pixel_buffer result = image;
	for (int y = 1; y < height - 1; ++y)
	{
		for (int x = 1; x < width - 1; ++x)
		{
			int r = 0, g = 0, b = 0;
			for (int dy = -1; dy <= 1; ++dy)
			{
				for (int dx = -1; dx <= 1; ++dx)
				{
					uint8_t const* p = image.pixel(image.index(x + dx, y + dy));
					r += p[0];
					g += p[1];
					b += p[2];
				}
			}
			result.set_color(x, y, color(
				static_cast<uint8_t>(std::lround(r / 9.0)),
				static_cast<uint8_t>(std::lround(g / 9.0)),
				static_cast<uint8_t>(std::lround(b / 9.0))));
		}
	}
	return result;
}

} // posterize
