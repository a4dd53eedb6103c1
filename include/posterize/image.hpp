#ifndef POSTERIZE_IMAGE_HPP_INCLUDED
#define POSTERIZE_IMAGE_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#if _MSC_VER
#if defined(POSTERIZE_EXPORTS)
#define POSTERIZE_API __declspec(dllexport)
#else
#define POSTERIZE_API __declspec(dllimport)
#endif
#elif __GNUC__ >= 4
# define POSTERIZE_API __attribute__((visibility("default")))
#else
#define POSTERIZE_API // nothing, symbols in a shared library are exported by default
#endif

namespace posterize {

typedef std::vector<uint8_t> buffer;

struct image_size
{
	int width;
	int height;

	image_size(int width = 0, int height = 0)
		: width(width)
		, height(height)
	{
	}

	bool is_empty() const { return width <= 0 || height <= 0; }
	size_t area() const { return is_empty()? 0 : static_cast<size_t>(width) * height; }

	bool operator==(image_size const& other) const { return width == other.width && height == other.height; }
	bool operator!=(image_size const& other) const { return !(*this == other); }
};

struct color
{
	uint8_t r, g, b;

	color(uint8_t r = 0, uint8_t g = 0, uint8_t b = 0)
		: r(r), g(g), b(b)
	{
	}

	bool operator==(color const& other) const { return r == other.r && g == other.g && b == other.b; }
	bool operator!=(color const& other) const { return !(*this == other); }
};

typedef std::vector<color> palette;

size_t const min_palette_size = 2;
size_t const max_palette_size = 16;

/// Euclidean distance in raw RGB space
POSTERIZE_API double distance(color const& a, color const& b);

/// Squared distance, for comparisons and k-means++ weights
inline int distance2(color const& a, color const& b)
{
	int const dr = int(a.r) - b.r;
	int const dg = int(a.g) - b.g;
	int const db = int(a.b) - b.b;
	return dr * dr + dg * dg + db * db;
}

/// Throws std::out_of_range when num_colors is not in [2, 16]
POSTERIZE_API void check_palette_size(size_t num_colors);

/// Thrown by from_hex() on unparsable color text
class POSTERIZE_API invalid_color : public std::invalid_argument
{
public:
	explicit invalid_color(std::string const& text);
};

/// "#rrggbb", lowercase and zero padded
POSTERIZE_API std::string to_hex(color const& c);

/// Parse "#rrggbb" or "rrggbb" in any case
POSTERIZE_API color from_hex(std::string const& text);

/// RGBA8 image, row-major, 4 bytes per pixel
class POSTERIZE_API pixel_buffer
{
public:
	static constexpr size_t bytes_per_pixel = 4;

	pixel_buffer() {}

	/// Create a fully transparent black buffer
	explicit pixel_buffer(image_size const& size);

	/// Adopt RGBA8 data, data.size() must be width * height * 4
	pixel_buffer(image_size const& size, buffer data);

	image_size const& size() const { return size_; }
	int width() const { return size_.width; }
	int height() const { return size_.height; }
	size_t pixel_count() const { return size_.area(); }
	bool empty() const { return data_.empty(); }

	size_t row_bytes() const { return size_.width * bytes_per_pixel; }

	uint8_t const* data() const { return data_.empty()? nullptr : &data_[0]; }
	uint8_t* data() { return data_.empty()? nullptr : &data_[0]; }
	size_t data_size() const { return data_.size(); }

	bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < size_.width && y < size_.height; }
	size_t index(int x, int y) const { return static_cast<size_t>(y) * size_.width + x; }

	uint8_t const* pixel(size_t i) const { return &data_[i * bytes_per_pixel]; }
	uint8_t* pixel(size_t i) { return &data_[i * bytes_per_pixel]; }

	color color_at(size_t i) const { uint8_t const* p = pixel(i); return color(p[0], p[1], p[2]); }
	color color_at(int x, int y) const { return color_at(index(x, y)); }

	uint8_t alpha_at(size_t i) const { return data_[i * bytes_per_pixel + 3]; }
	uint8_t alpha_at(int x, int y) const { return alpha_at(index(x, y)); }

	void set_color(size_t i, color const& c);
	void set_color(int x, int y, color const& c) { set_color(index(x, y), c); }

	void set_alpha(size_t i, uint8_t a) { data_[i * bytes_per_pixel + 3] = a; }
	void set_alpha(int x, int y, uint8_t a) { set_alpha(index(x, y), a); }

	/// Fill every pixel with the same color and alpha
	void fill(color const& c, uint8_t alpha = 255);

	/// True when any pixel has alpha below 255
	bool has_transparency() const;

	bool operator==(pixel_buffer const& other) const { return size_ == other.size_ && data_ == other.data_; }
	bool operator!=(pixel_buffer const& other) const { return !(*this == other); }

private:
	image_size size_;
	buffer data_;
};

} // posterize

#endif // POSTERIZE_IMAGE_HPP_INCLUDED
