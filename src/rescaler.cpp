#include "posterize/rescaler.hpp"
#include "posterize/trace.hpp"

#include <boost/algorithm/clamp.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace posterize {

#define XDIR 0
#define YDIR 1

image_size fit_size(image_size const& size, int max_side)
{
	if (size.is_empty() || max_side <= 0)
	{
		throw std::invalid_argument(fmt::format("cannot fit {}x{} image into {} pixels",
			size.width, size.height, max_side));
	}
	if (size.width <= max_side && size.height <= max_side)
	{
		return size;
	}

	double const ratio = std::min(double(max_side) / size.width, double(max_side) / size.height);
	int const width = std::max(1, static_cast<int>(std::floor(size.width * ratio)));
	int const height = std::max(1, static_cast<int>(std::floor(size.height * ratio)));
	return image_size(width, height);
}

template<int N>
float rescaler::get(int x, int y) const
{
	return source_[(static_cast<size_t>(y) * src_width_ + x) * 4 + N];
}

void rescaler::set(int x, int y, float v1, float v2, float v3, float v4)
{
	uint8_t* p = &result_[(static_cast<size_t>(y) * dst_width_ + x) * 4];
	p[0] = static_cast<uint8_t>(boost::algorithm::clamp(v1 + 0.5f, 0.0f, 255.0f));
	p[1] = static_cast<uint8_t>(boost::algorithm::clamp(v2 + 0.5f, 0.0f, 255.0f));
	p[2] = static_cast<uint8_t>(boost::algorithm::clamp(v3 + 0.5f, 0.0f, 255.0f));
	p[3] = static_cast<uint8_t>(boost::algorithm::clamp(v4 + 0.5f, 0.0f, 255.0f));
}

// box filter over the source span [p - 0.5/scale, p + 0.5/scale]
template<int N>
float rescaler::integrate(float p, int q, float scale, int dir) const
{
	int const res = dir == XDIR? src_width_ : src_height_;

	float const s = 1.0f / scale;
	float const minus = boost::algorithm::clamp(p - 0.5f * s, 0.0f, float(res));
	float const plus = boost::algorithm::clamp(p + 0.5f * s, 0.0f, float(res));
	float const num = plus - minus;
	if (num <= 0.0f)
	{
		return 0.0f;
	}

	int const start = static_cast<int>(minus);
	int const end = std::min(static_cast<int>(std::ceil(plus)), res);

	float val = 0.0f;
	for (int pos = start; pos < end; ++pos)
	{
		// coverage of source pixel [pos, pos + 1]
		float const f = std::min(plus, pos + 1.0f) - std::max(minus, float(pos));
		if (dir == XDIR) val += get<N>(pos, q) * f;
		else             val += get<N>(q, pos) * f;
	}
	return val / num;
}

// linear interpolation between the two source pixels around p
template<int N>
float rescaler::lint(float p, int q, int dir) const
{
	int const res = dir == XDIR? src_width_ : src_height_;

	p = boost::algorithm::clamp(p - 0.5f, 0.0f, float(res - 1));
	int const p1 = static_cast<int>(p);
	int const p2 = std::min(p1 + 1, res - 1);

	float const f2 = p - p1;
	float const f1 = 1.0f - f2;

	if (dir == XDIR) return get<N>(p1, q) * f1 + get<N>(p2, q) * f2;
	else             return get<N>(q, p1) * f1 + get<N>(q, p2) * f2;
}

void rescaler::resize_nearest(int xwidth, int ywidth)
{
	int const src_width = src_width_;
	int const src_height = src_height_;

	alloc(xwidth, ywidth, false);

	for (int y = 0; y < ywidth; ++y)
	{
		int const oldy = std::min(static_cast<int>((y + 0.5) * src_height / ywidth), src_height - 1);
		for (int x = 0; x < xwidth; ++x)
		{
			int const oldx = std::min(static_cast<int>((x + 0.5) * src_width / xwidth), src_width - 1);
			set(x, y, get<0>(oldx, oldy), get<1>(oldx, oldy), get<2>(oldx, oldy), get<3>(oldx, oldy));
		}
	}
}

void rescaler::resize_bilinear(int xwidth, int ywidth)
{
	float const xscale = float(xwidth) / src_width_;
	float const yscale = float(ywidth) / src_height_;

	// horizontal pass into xwidth x src_height
	alloc(xwidth, src_height_, false);
	for (int y = 0; y < src_height_; ++y)
	{
		for (int x = 0; x < xwidth; ++x)
		{
			float const fx = (x + 0.5f) / xscale;
			if (xscale < 1.0f)
			{
				set(x, y, integrate<0>(fx, y, xscale, XDIR), integrate<1>(fx, y, xscale, XDIR),
					integrate<2>(fx, y, xscale, XDIR), integrate<3>(fx, y, xscale, XDIR));
			}
			else
			{
				set(x, y, lint<0>(fx, y, XDIR), lint<1>(fx, y, XDIR), lint<2>(fx, y, XDIR), lint<3>(fx, y, XDIR));
			}
		}
	}

	// vertical pass reads the horizontal result
	alloc(xwidth, ywidth, true);
	for (int y = 0; y < ywidth; ++y)
	{
		for (int x = 0; x < xwidth; ++x)
		{
			float const fy = (y + 0.5f) / yscale;
			if (yscale < 1.0f)
			{
				set(x, y, integrate<0>(fy, x, yscale, YDIR), integrate<1>(fy, x, yscale, YDIR),
					integrate<2>(fy, x, yscale, YDIR), integrate<3>(fy, x, yscale, YDIR));
			}
			else
			{
				set(x, y, lint<0>(fy, x, YDIR), lint<1>(fy, x, YDIR), lint<2>(fy, x, YDIR), lint<3>(fy, x, YDIR));
			}
		}
	}
}

void rescaler::alloc(int dst_width, int dst_height, bool reassign)
{
	if (reassign)
	{
		source_.swap(result_);
		src_width_ = dst_width_;
		src_height_ = dst_height_;
	}

	result_.assign(static_cast<size_t>(dst_width) * dst_height * 4, 0);
	dst_width_ = dst_width;
	dst_height_ = dst_height;
}

pixel_buffer rescaler::rescale(pixel_buffer const& source, image_size const& dst_size, mode m)
{
	if (source.empty() || dst_size.is_empty())
	{
		throw std::invalid_argument(fmt::format("cannot rescale {}x{} image to {}x{}",
			source.width(), source.height(), dst_size.width, dst_size.height));
	}

	source_.assign(source.data(), source.data() + source.data_size());
	src_width_ = source.width();
	src_height_ = source.height();

	switch (m)
	{
	case NEAREST:
		resize_nearest(dst_size.width, dst_size.height);
		break;
	default:
	case BILINEAR:
		resize_bilinear(dst_size.width, dst_size.height);
		break;
	}

	source_.clear();
	return pixel_buffer(image_size(dst_width_, dst_height_), std::move(result_));
}

pixel_buffer fit_image(pixel_buffer const& image, int max_side)
{
	image_size const size = fit_size(image.size(), max_side);
	if (size == image.size())
	{
		return image;
	}

	trace_line("rescaler: {}x{} -> {}x{}", image.width(), image.height(), size.width, size.height);
	rescaler r;
	return r.rescale(image, size, rescaler::BILINEAR);
}

} // posterize
