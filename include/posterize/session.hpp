#ifndef POSTERIZE_SESSION_HPP_INCLUDED
#define POSTERIZE_SESSION_HPP_INCLUDED

#include "posterize/image.hpp"
#include "posterize/mapper.hpp"
#include "posterize/quantizer.hpp"
#include "posterize/tracer.hpp"

#include <boost/noncopyable.hpp>

namespace posterize {

/// Transparency tool method
enum class erase_method
{
	area,  ///< flood fill from the clicked pixel
	color  ///< every pixel of the clicked color
};

struct session_settings
{
	size_t colors = 5;
	mapping_mode mode = mapping_mode::replace;
	bool smoothing = false;
	erase_method method = erase_method::area;
	double area_tolerance = default_area_tolerance;
	double color_tolerance = default_color_tolerance;
};

/// Host-side editing state: the source image, its palette and the
/// posterized result as a (current, pristine) pair. Transparency edits
/// change only the current buffer, reset() restores it from the pristine
/// one without quantizing again.
class POSTERIZE_API session : boost::noncopyable
{
public:
	explicit session(session_settings const& config = session_settings());
	session(session_settings const& config, uint32_t seed);

	session_settings const& config() const { return config_; }

	/// Take a new source image, extract its palette and posterize it
	void load(pixel_buffer image);
	bool loaded() const { return !original_.empty(); }

	/// Re-extract with a new palette size
	void set_palette_size(size_t colors);

	/// Replace one palette slot and posterize again
	void set_color(size_t index, color const& c);

	/// Replace the whole palette, it must have the same size as the current one
	void set_palette(palette const& colors);

	void set_mode(mapping_mode mode);
	void set_smoothing(bool enabled);
	void set_erase_method(erase_method method) { config_.method = method; }
	void set_tolerances(double area_tolerance, double color_tolerance);

	/// Map the (optionally smoothed) source to the palette, current = pristine
	void remap();

	/// Apply the transparency tool at (x, y) of the current buffer
	void erase_at(int x, int y);

	/// Restore the current buffer from the pristine snapshot
	void reset();

	/// Drop all transparency edits by posterizing again
	void clear_transparency();

	/// Reassign anti-aliased pixels of the current buffer
	void clean_edges();

	vector_document export_svg(smoothing_level level) const;

	pixel_buffer const& original() const { return original_; }
	pixel_buffer const& current() const { return current_; }
	pixel_buffer const& pristine() const { return pristine_; }
	palette const& colors() const { return palette_; }
	bool has_transparency() const { return has_transparency_; }

private:
	void extract();
	void check_loaded(char const* operation) const;

	session_settings config_;
	quantizer quantizer_;

	pixel_buffer original_;
	palette palette_;
	pixel_buffer current_;
	pixel_buffer pristine_;
	bool has_transparency_;
};

} // posterize

#endif // POSTERIZE_SESSION_HPP_INCLUDED
