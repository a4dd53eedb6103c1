#ifndef POSTERIZE_DECODER_HPP_INCLUDED
#define POSTERIZE_DECODER_HPP_INCLUDED

#include "posterize/image.hpp"

#include <string>

namespace posterize {

/// Largest accepted image file, 10 MB
size_t const max_file_size = 10 * 1024 * 1024;

/// Decode PNG data of any color type into RGBA8
POSTERIZE_API pixel_buffer load_png(buffer const& data);

/// Decode JPEG data into RGBA8 with alpha 255
POSTERIZE_API pixel_buffer load_jpeg(buffer const& data);

/// Decode PNG or JPEG data, the format is detected from its signature
POSTERIZE_API pixel_buffer load_image(buffer const& data);

/// Read and decode an image file.
/// Throws std::runtime_error for unreadable, oversized or undecodable files.
POSTERIZE_API pixel_buffer load_image(std::string const& filename);

/// Write data into file, throws std::runtime_error on failure
POSTERIZE_API void save_file(std::string const& filename, buffer const& data);
POSTERIZE_API void save_file(std::string const& filename, std::string const& text);

} // posterize

#endif // POSTERIZE_DECODER_HPP_INCLUDED
