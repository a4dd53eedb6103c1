#include "posterize/encoder.hpp"
#include "posterize/mapper.hpp"

#include "codec.hpp"

#include <png.h>
#include <jpeglib.h>
#include <zlib.h>

#include <boost/algorithm/clamp.hpp>

#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace posterize {

// -- callbacks
inline void png_write_file(png_struct* png, png_byte* data, png_size_t size)
{
	buffer& result = *reinterpret_cast<buffer*>(png_get_io_ptr(png)); // user data

	size_t const pos = result.size();
	result.resize(pos + size);
	memcpy(&result[pos], data, size);
}

inline void png_flush_file(png_struct*)
{
	// do nothing - used for flushing file i/o
}

std::string generate_png(pixel_buffer const& image, buffer& result,
	int compression, png_color_type color_type, palette const& colors)
{
	if (image.empty())
	{
		throw std::invalid_argument("generate_png() got an empty image");
	}
	if (color_type == png_color_type::palette)
	{
		check_palette_size(colors.size());
	}

	int const width = image.width();
	int const height = image.height();
	compression = boost::algorithm::clamp(compression, Z_DEFAULT_COMPRESSION, Z_BEST_COMPRESSION);

	// palette indices, the entry after the colors is fully transparent
	buffer indices;
	png_color entries[max_palette_size + 1];
	png_byte alphas[max_palette_size + 1];
	int num_entries = 0;
	if (color_type == png_color_type::palette)
	{
		indices.resize(image.pixel_count());
		size_t const transparent = colors.size();
		bool has_transparent = false;
		for (size_t i = 0; i < indices.size(); ++i)
		{
			if (image.alpha_at(i) < 128)
			{
				indices[i] = static_cast<uint8_t>(transparent);
				has_transparent = true;
			}
			else
			{
				indices[i] = static_cast<uint8_t>(nearest_color_index(image.color_at(i), colors));
			}
		}

		for (size_t k = 0; k < colors.size(); ++k)
		{
			entries[k].red = colors[k].r;
			entries[k].green = colors[k].g;
			entries[k].blue = colors[k].b;
			alphas[k] = 255;
		}
		num_entries = static_cast<int>(colors.size());
		if (has_transparent)
		{
			entries[num_entries].red = entries[num_entries].green = entries[num_entries].blue = 0;
			alphas[num_entries] = 0;
			++num_entries;
		}
	}

	result.clear();

	png_struct* png = png_create_write_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
	png_info* info = png? png_create_info_struct(png) : NULL;
	auto const destroy_on_exit = scope_guard([&png, &info]()
	{
		png_destroy_write_struct(&png, &info);
	});

	if (!png || !info)
	{
		throw std::runtime_error("libpng failed to create write struct");
	}
	if (setjmp(png_jmpbuf(png)))
	{
		throw std::runtime_error("libpng failed to encode image");
	}

	png_set_write_fn(png, &result, &png_write_file, &png_flush_file);
	png_set_compression_level(png, compression);

	int libpng_color_type;
	switch (color_type)
	{
	case png_color_type::palette:
		libpng_color_type = PNG_COLOR_TYPE_PALETTE;
		break;
	case png_color_type::rgb:
		libpng_color_type = PNG_COLOR_TYPE_RGB;
		break;
	default:
		libpng_color_type = PNG_COLOR_TYPE_RGBA;
		break;
	}

	png_set_IHDR(png, info, width, height, 8, libpng_color_type,
		PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

	if (color_type == png_color_type::palette)
	{
		png_set_PLTE(png, info, entries, num_entries);
		png_set_tRNS(png, info, alphas, num_entries, NULL);
	}

	png_write_info(png, info);

	if (color_type == png_color_type::rgb)
	{
		// drop the alpha byte of every RGBA pixel
		png_set_filler(png, 0, PNG_FILLER_AFTER);
	}

	for (int y = 0; y < height; ++y)
	{
		if (color_type == png_color_type::palette)
		{
			png_write_row(png, &indices[static_cast<size_t>(y) * width]);
		}
		else
		{
			png_write_row(png, const_cast<png_bytep>(image.data() + y * image.row_bytes()));
		}
	}
	png_write_end(png, NULL);

	return "image/png";
}

std::string generate_jpeg(pixel_buffer const& image, buffer& result, int quality, color const& background)
{
	if (image.empty())
	{
		throw std::invalid_argument("generate_jpeg() got an empty image");
	}

	int const width = image.width();
	int const height = image.height();
	quality = boost::algorithm::clamp(quality, 1, 100);

	// JPEG has no alpha, composite every row over the background
	buffer rgb(static_cast<size_t>(width) * height * 3);
	for (size_t i = 0, count = image.pixel_count(); i < count; ++i)
	{
		uint8_t const* src = image.pixel(i);
		unsigned const a = src[3];
		uint8_t* dst = &rgb[i * 3];
		dst[0] = static_cast<uint8_t>((src[0] * a + background.r * (255 - a) + 127) / 255);
		dst[1] = static_cast<uint8_t>((src[1] * a + background.g * (255 - a) + 127) / 255);
		dst[2] = static_cast<uint8_t>((src[2] * a + background.b * (255 - a) + 127) / 255);
	}

	jpeg_compress_struct cinfo;
	jpeg_error_context jerr;
	unsigned char* buf_data = NULL;
	unsigned long  buf_size = 0;

	// Step 1: allocate and initialize JPEG compression objects
	cinfo.err = jpeg_std_error(&jerr.mgr);
	jerr.mgr.error_exit = &jpeg_error_exit;
	jerr.mgr.output_message = &jpeg_output_message;
	jpeg_create_compress(&cinfo);

	auto const destroy_on_exit = scope_guard([&cinfo, &buf_data]()
	{
		jpeg_destroy_compress(&cinfo);
		free(buf_data);
	});

	if (setjmp(jerr.jump))
	{
		throw std::runtime_error(std::string("libjpeg failed to encode image: ") + jerr.message);
	}

	// Step 2: specify data destination, compressing in memory
	jpeg_mem_dest(&cinfo, &buf_data, &buf_size);

	// Step 3: set parameters for compression
	cinfo.image_width			= width;      // image width and height, in pixels
	cinfo.image_height			= height;
	cinfo.input_components		= 3;          // # of color components per pixel
	cinfo.in_color_space		= JCS_RGB;    // colorspace of input image

	jpeg_set_defaults(&cinfo);
	jpeg_set_quality(&cinfo, quality, TRUE /* limit to baseline-JPEG values */);

	// Step 4: Start compressor
	jpeg_start_compress(&cinfo, TRUE);

	// Step 5: one scanline per call
	size_t const stride = static_cast<size_t>(width) * 3;
	while (cinfo.next_scanline < cinfo.image_height)
	{
		JSAMPROW line = &rgb[cinfo.next_scanline * stride];
		jpeg_write_scanlines(&cinfo, &line, 1);
	}

	// Step 6: Finish compression
	jpeg_finish_compress(&cinfo);

	// copy back the memory to the requester
	result.assign(buf_data, buf_data + buf_size);

	return "image/jpeg";
}

} // posterize
