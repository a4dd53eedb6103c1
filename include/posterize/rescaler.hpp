#ifndef POSTERIZE_RESCALER_HPP_INCLUDED
#define POSTERIZE_RESCALER_HPP_INCLUDED

#include "posterize/image.hpp"

#include <boost/noncopyable.hpp>

namespace posterize {

/// Longest side an uploaded image is reduced to before quantizing
int const default_max_side = 1200;

/// Size that fits into max_side x max_side, keeping the aspect ratio.
/// Sizes that already fit are returned unchanged.
POSTERIZE_API image_size fit_size(image_size const& size, int max_side = default_max_side);

class POSTERIZE_API rescaler : boost::noncopyable
{
public:
	enum mode
	{
		NEAREST,
		BILINEAR
	};

	/// Resample source into a buffer of dst_size.
	/// Bilinear averages the covered source pixels when shrinking and
	/// interpolates between neighbours when growing, per axis.
	pixel_buffer rescale(pixel_buffer const& source, image_size const& dst_size, mode m = BILINEAR);

private:
	template<int N>
	float get(int x, int y) const;

	void set(int x, int y, float v1, float v2, float v3, float v4);

	template<int N>
	float integrate(float p, int q, float scale, int dir) const;

	template<int N>
	float lint(float p, int q, int dir) const;

	void resize_nearest(int xwidth, int ywidth);
	void resize_bilinear(int xwidth, int ywidth);

	void alloc(int dst_width, int dst_height, bool reassign);

	buffer source_;
	buffer result_;

	int src_width_, src_height_;
	int dst_width_, dst_height_;
};

/// Shrink image to fit_size(image.size(), max_side) with bilinear filtering
POSTERIZE_API pixel_buffer fit_image(pixel_buffer const& image, int max_side = default_max_side);

} // posterize

#endif // POSTERIZE_RESCALER_HPP_INCLUDED
