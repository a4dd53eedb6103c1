#include "posterize/decoder.hpp"
#include "posterize/trace.hpp"

#include "codec.hpp"

#include <png.h>
#include <jpeglib.h>

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace posterize {

namespace {

struct png_memory_source
{
	buffer const& data;
	size_t pos;
};

void png_read_memory(png_struct* png, png_byte* out, png_size_t size)
{
	png_memory_source& source = *reinterpret_cast<png_memory_source*>(png_get_io_ptr(png));
	if (source.pos + size > source.data.size())
	{
		png_error(png, "unexpected end of PNG data");
	}
	memcpy(out, &source.data[source.pos], size);
	source.pos += size;
}

bool is_png(buffer const& data)
{
	return data.size() >= 8 && png_sig_cmp(const_cast<png_bytep>(&data[0]), 0, 8) == 0;
}

bool is_jpeg(buffer const& data)
{
	return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

} // anonymous namespace

pixel_buffer load_png(buffer const& data)
{
	if (!is_png(data))
	{
		throw std::runtime_error("data is not a PNG image");
	}

	png_memory_source source = { data, 0 };
	buffer pixels;
	std::vector<png_bytep> rows;
	png_uint_32 width = 0, height = 0;

	png_struct* png = png_create_read_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
	png_info* info = png? png_create_info_struct(png) : NULL;
	auto const destroy_on_exit = scope_guard([&png, &info]()
	{
		png_destroy_read_struct(&png, &info, NULL);
	});

	if (!png || !info)
	{
		throw std::runtime_error("libpng failed to create read struct");
	}
	if (setjmp(png_jmpbuf(png)))
	{
		throw std::runtime_error("libpng failed to decode image");
	}

	png_set_read_fn(png, &source, &png_read_memory);
	png_read_info(png, info);

	width = png_get_image_width(png, info);
	height = png_get_image_height(png, info);
	png_byte const color_type = png_get_color_type(png, info);
	png_byte const bit_depth = png_get_bit_depth(png, info);

	// normalize every color type to 8 bit RGBA
	if (bit_depth == 16) png_set_strip_16(png);
	if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
	if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
	if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
	if (color_type == PNG_COLOR_TYPE_RGB || color_type == PNG_COLOR_TYPE_GRAY
		|| color_type == PNG_COLOR_TYPE_PALETTE)
	{
		png_set_add_alpha(png, 0xFF, PNG_FILLER_AFTER);
	}
	if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
	png_set_interlace_handling(png);
	png_read_update_info(png, info);

	if (png_get_rowbytes(png, info) != width * 4)
	{
		throw std::runtime_error("libpng produced an unexpected row layout");
	}

	pixels.resize(static_cast<size_t>(width) * height * 4);
	rows.resize(height);
	for (png_uint_32 y = 0; y < height; ++y)
	{
		rows[y] = &pixels[static_cast<size_t>(y) * width * 4];
	}
	png_read_image(png, &rows[0]);
	png_read_end(png, NULL);

	trace_line("decoder: PNG {}x{}", width, height);
	return pixel_buffer(image_size(width, height), std::move(pixels));
}

pixel_buffer load_jpeg(buffer const& data)
{
	if (!is_jpeg(data))
	{
		throw std::runtime_error("data is not a JPEG image");
	}

	jpeg_decompress_struct cinfo;
	jpeg_error_context jerr;
	buffer pixels;
	buffer line;

	cinfo.err = jpeg_std_error(&jerr.mgr);
	jerr.mgr.error_exit = &jpeg_error_exit;
	jerr.mgr.output_message = &jpeg_output_message;
	jpeg_create_decompress(&cinfo);

	auto const destroy_on_exit = scope_guard([&cinfo]()
	{
		jpeg_destroy_decompress(&cinfo);
	});

	if (setjmp(jerr.jump))
	{
		throw std::runtime_error(std::string("libjpeg failed to decode image: ") + jerr.message);
	}

	jpeg_mem_src(&cinfo, const_cast<unsigned char*>(&data[0]), static_cast<unsigned long>(data.size()));
	jpeg_read_header(&cinfo, TRUE);
	cinfo.out_color_space = JCS_RGB;
	jpeg_start_decompress(&cinfo);

	size_t const width = cinfo.output_width;
	size_t const height = cinfo.output_height;
	pixels.resize(width * height * 4);
	line.resize(width * cinfo.output_components);

	while (cinfo.output_scanline < cinfo.output_height)
	{
		size_t const y = cinfo.output_scanline;
		JSAMPROW row = &line[0];
		jpeg_read_scanlines(&cinfo, &row, 1);

		uint8_t* dst = &pixels[y * width * 4];
		for (size_t x = 0; x < width; ++x, dst += 4)
		{
			memcpy(dst, &line[x * 3], 3);
			dst[3] = 255;
		}
	}
	jpeg_finish_decompress(&cinfo);

	trace_line("decoder: JPEG {}x{}", width, height);
	return pixel_buffer(image_size(static_cast<int>(width), static_cast<int>(height)), std::move(pixels));
}

pixel_buffer load_image(buffer const& data)
{
	if (is_png(data))
	{
		return load_png(data);
	}
	if (is_jpeg(data))
	{
		return load_jpeg(data);
	}
	throw std::runtime_error("unsupported image format, expected PNG or JPEG");
}

pixel_buffer load_image(std::string const& filename)
{
	std::ifstream file(filename, std::ios::binary | std::ios::ate);
	if (!file)
	{
		throw std::runtime_error(fmt::format("cannot open {}", filename));
	}

	std::streamoff const size = file.tellg();
	if (size < 0)
	{
		throw std::runtime_error(fmt::format("cannot read {}", filename));
	}
	if (static_cast<size_t>(size) > max_file_size)
	{
		throw std::runtime_error(fmt::format("{} is {} bytes, larger than the {} bytes limit",
			filename, size, max_file_size));
	}

	buffer data(static_cast<size_t>(size));
	file.seekg(0);
	if (!data.empty() && !file.read(reinterpret_cast<char*>(&data[0]), size))
	{
		throw std::runtime_error(fmt::format("cannot read {}", filename));
	}
	return load_image(data);
}

void save_file(std::string const& filename, buffer const& data)
{
	std::ofstream file(filename, std::ios::binary | std::ios::trunc);
	if (!file || !file.write(reinterpret_cast<char const*>(data.data()), data.size()))
	{
		throw std::runtime_error(fmt::format("cannot write {}", filename));
	}
}

void save_file(std::string const& filename, std::string const& text)
{
	std::ofstream file(filename, std::ios::binary | std::ios::trunc);
	if (!file || !file.write(text.data(), text.size()))
	{
		throw std::runtime_error(fmt::format("cannot write {}", filename));
	}
}

} // posterize
