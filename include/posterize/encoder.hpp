#ifndef POSTERIZE_ENCODER_HPP_INCLUDED
#define POSTERIZE_ENCODER_HPP_INCLUDED

#include "posterize/image.hpp"

#include <string>

namespace posterize {

class POSTERIZE_API png_color_type
{
public:
	enum value_type { palette, rgb, rgba };

	png_color_type(value_type value) : value_(value) {}
	operator value_type() const { return value_; }
private:
	value_type value_;
};

/// Compresses image into PNG and place in result buffer, return MIME type
/// compression is in [0..9], where 0 - no compression, 1 - best speed, 9 - best compression, -1 is default, see comression levels in libpng
///
/// png_color_type::palette stores palette indices, colors must be the palette
/// the image was mapped to. Pixels with alpha 0 get their own fully
/// transparent palette entry.
POSTERIZE_API std::string generate_png(pixel_buffer const& image, buffer& result,
	int compression = -1, png_color_type color_type = png_color_type::rgba, palette const& colors = palette());

/// Compresses image into JPEG and place in result buffer, return MIME type.
/// JPEG has no alpha channel, pixels are composited over the background color.
POSTERIZE_API std::string generate_jpeg(pixel_buffer const& image, buffer& result,
	int quality = 95, color const& background = color(255, 255, 255));

} // posterize

#endif // POSTERIZE_ENCODER_HPP_INCLUDED
