#include "posterize/image.hpp"

#include <fmt/core.h>

#include <cctype>
#include <cmath>

namespace posterize {

double distance(color const& a, color const& b)
{
	return std::sqrt(static_cast<double>(distance2(a, b)));
}

void check_palette_size(size_t num_colors)
{
	if (num_colors < min_palette_size || num_colors > max_palette_size)
	{
		throw std::out_of_range(fmt::format("palette size {} is outside [{}, {}]",
			num_colors, min_palette_size, max_palette_size));
	}
}

invalid_color::invalid_color(std::string const& text)
	: std::invalid_argument("invalid color \"" + text + "\"")
{
}

std::string to_hex(color const& c)
{
	return fmt::format("#{:02x}{:02x}{:02x}", c.r, c.g, c.b);
}

static inline int hex_digit(char ch)
{
	if (ch >= '0' && ch <= '9') return ch - '0';
	ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
	if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
	return -1;
}

color from_hex(std::string const& text)
{
	size_t const start = (!text.empty() && text[0] == '#')? 1 : 0;
	if (text.size() - start != 6)
	{
		throw invalid_color(text);
	}

	uint8_t channels[3];
	for (size_t i = 0; i < 3; ++i)
	{
		int const hi = hex_digit(text[start + i * 2]);
		int const lo = hex_digit(text[start + i * 2 + 1]);
		if (hi < 0 || lo < 0)
		{
			throw invalid_color(text);
		}
		channels[i] = static_cast<uint8_t>(hi * 16 + lo);
	}
	return color(channels[0], channels[1], channels[2]);
}

pixel_buffer::pixel_buffer(image_size const& size)
{
	if (size.width < 0 || size.height < 0)
	{
		throw std::invalid_argument(fmt::format("invalid image size {}x{}", size.width, size.height));
	}
	size_ = size;
	data_.resize(size.area() * bytes_per_pixel, 0);
}

pixel_buffer::pixel_buffer(image_size const& size, buffer data)
{
	if (size.width < 0 || size.height < 0)
	{
		throw std::invalid_argument(fmt::format("invalid image size {}x{}", size.width, size.height));
	}
	if (data.size() != size.area() * bytes_per_pixel)
	{
		throw std::invalid_argument(fmt::format("pixel data of {} bytes does not match {}x{} RGBA image",
			data.size(), size.width, size.height));
	}
	size_ = size;
	data_.swap(data);
}

void pixel_buffer::set_color(size_t i, color const& c)
{
	uint8_t* p = pixel(i);
	p[0] = c.r;
	p[1] = c.g;
	p[2] = c.b;
}

void pixel_buffer::fill(color const& c, uint8_t alpha)
{
	for (size_t i = 0, count = pixel_count(); i < count; ++i)
	{
		set_color(i, c);
		set_alpha(i, alpha);
	}
}

bool pixel_buffer::has_transparency() const
{
	for (size_t i = 0, count = pixel_count(); i < count; ++i)
	{
		if (alpha_at(i) != 255) return true;
	}
	return false;
}

} // posterize
