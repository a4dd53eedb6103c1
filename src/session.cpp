#include "posterize/session.hpp"
#include "posterize/trace.hpp"

#include <stdexcept>
#include <utility>

namespace posterize {

session::session(session_settings const& config)
	: config_(config)
	, has_transparency_(false)
{
	check_palette_size(config_.colors);
	set_tolerances(config_.area_tolerance, config_.color_tolerance);
}

session::session(session_settings const& config, uint32_t seed)
	: config_(config)
	, quantizer_(seed)
	, has_transparency_(false)
{
	check_palette_size(config_.colors);
	set_tolerances(config_.area_tolerance, config_.color_tolerance);
}

void session::check_loaded(char const* operation) const
{
	if (!loaded())
	{
		throw std::logic_error(fmt::format("session::{}() called before an image was loaded", operation));
	}
}

void session::load(pixel_buffer image)
{
	if (image.empty())
	{
		throw std::invalid_argument("session::load() got an empty image");
	}
	original_ = std::move(image);
	trace_line("session: loaded {}x{} image", original_.width(), original_.height());

	extract();
	remap();
}

void session::extract()
{
	palette_ = quantizer_.extract(original_, config_.colors);
}

void session::set_palette_size(size_t colors)
{
	check_palette_size(colors);
	config_.colors = colors;
	if (loaded())
	{
		extract();
		remap();
	}
}

void session::set_color(size_t index, color const& c)
{
	check_loaded("set_color");
	if (index >= palette_.size())
	{
		throw std::out_of_range(fmt::format("palette index {} is outside palette of {} colors", index, palette_.size()));
	}
	palette_[index] = c;
	remap();
}

void session::set_palette(palette const& colors)
{
	check_loaded("set_palette");
	if (colors.size() != palette_.size())
	{
		throw std::invalid_argument(fmt::format("palette of {} colors does not replace palette of {} colors",
			colors.size(), palette_.size()));
	}
	palette_ = colors;
	remap();
}

void session::set_mode(mapping_mode mode)
{
	config_.mode = mode;
	if (loaded()) remap();
}

void session::set_smoothing(bool enabled)
{
	config_.smoothing = enabled;
	if (loaded()) remap();
}

void session::set_tolerances(double area_tolerance, double color_tolerance)
{
	if (area_tolerance < 0 || color_tolerance < 0)
	{
		throw std::out_of_range(fmt::format("tolerances must not be negative, got area {} and color {}",
			area_tolerance, color_tolerance));
	}
	config_.area_tolerance = area_tolerance;
	config_.color_tolerance = color_tolerance;
}

void session::remap()
{
	check_loaded("remap");

	if (config_.smoothing)
	{
		current_ = map_to_palette(smooth(original_), palette_, config_.mode);
	}
	else
	{
		current_ = map_to_palette(original_, palette_, config_.mode);
	}
	pristine_ = current_;
	has_transparency_ = false;
}

void session::erase_at(int x, int y)
{
	check_loaded("erase_at");

	if (config_.method == erase_method::area)
	{
		current_ = erase_region(current_, x, y, config_.area_tolerance);
	}
	else
	{
		if (!current_.contains(x, y))
		{
			throw std::out_of_range(fmt::format("erase point ({}, {}) is outside {}x{} image",
				x, y, current_.width(), current_.height()));
		}
		current_ = erase_color(current_, current_.color_at(x, y), config_.color_tolerance);
	}
	has_transparency_ = true;
}

void session::reset()
{
	check_loaded("reset");
	current_ = pristine_;
	has_transparency_ = false;
}

void session::clear_transparency()
{
	remap();
}

void session::clean_edges()
{
	check_loaded("clean_edges");
	current_ = ::posterize::clean_edges(current_, palette_);
}

vector_document session::export_svg(smoothing_level level) const
{
	check_loaded("export_svg");
	return trace(current_, palette_, level);
}

} // posterize
