#include "posterize/quantizer.hpp"
#include "posterize/trace.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace posterize {

static inline double centroid_distance2(double r0, double g0, double b0, double r1, double g1, double b1)
{
	double const dr = r0 - r1;
	double const dg = g0 - g1;
	double const db = b0 - b1;
	return dr * dr + dg * dg + db * db;
}

static inline uint8_t round_channel(double v)
{
	if (v <= 0.0) return 0;
	if (v >= 255.0) return 255;
	return static_cast<uint8_t>(std::lround(v));
}

quantizer::quantizer()
	: random_(std::random_device()())
	, sample_count_(0)
	, iterations_(0)
	, converged_(false)
	, used_fallback_(false)
{
}

quantizer::quantizer(uint32_t seed)
	: random_(seed)
	, sample_count_(0)
	, iterations_(0)
	, converged_(false)
	, used_fallback_(false)
{
}

palette quantizer::extract(pixel_buffer const& image, size_t num_colors)
{
	check_palette_size(num_colors);

	sample_count_ = 0;
	iterations_ = 0;
	converged_ = false;
	used_fallback_ = false;

	std::vector<color> const samples = sample(image);
	sample_count_ = samples.size();

	// clustering fewer points than clusters is ill-defined
	if (samples.size() < num_colors)
	{
		trace_line("quantizer: {} opaque samples for {} colors, using default palette", samples.size(), num_colors);
		used_fallback_ = true;
		return default_palette(num_colors);
	}

	std::vector<centroid> const centroids = cluster(samples, seed_centroids(samples, num_colors));
	trace_line("quantizer: {} samples, {} iterations{}", samples.size(), iterations_,
		converged_? "" : " (not converged)");

	palette result;
	result.reserve(centroids.size());
	for (centroid const& c : centroids)
	{
		result.push_back(color(round_channel(c.r), round_channel(c.g), round_channel(c.b)));
	}
	return result;
}

std::vector<color> quantizer::sample(pixel_buffer const& image) const
{
	size_t const count = image.pixel_count();
	size_t const step = std::max<size_t>(1, count / sample_target);

	std::vector<color> samples;
	samples.reserve(std::min(count, sample_target + 1));
	for (size_t i = 0; i < count; i += step)
	{
		// transparent regions never skew the palette
		if (image.alpha_at(i) < 128) continue;
		samples.push_back(image.color_at(i));
	}
	return samples;
}

std::vector<quantizer::centroid> quantizer::seed_centroids(std::vector<color> const& samples, size_t num_colors)
{
	std::vector<centroid> centroids;
	centroids.reserve(num_colors);

	std::uniform_int_distribution<size_t> pick_first(0, samples.size() - 1);
	color const& first = samples[pick_first(random_)];
	centroids.push_back(centroid{ double(first.r), double(first.g), double(first.b) });

	// squared distance of every sample to its nearest chosen centroid
	std::vector<double> weights(samples.size(), std::numeric_limits<double>::max());
	std::uniform_real_distribution<double> unit(0.0, 1.0);

	while (centroids.size() < num_colors)
	{
		centroid const& last = centroids.back();
		double total = 0.0;
		for (size_t i = 0; i < samples.size(); ++i)
		{
			double const d = centroid_distance2(samples[i].r, samples[i].g, samples[i].b, last.r, last.g, last.b);
			weights[i] = std::min(weights[i], d);
			total += weights[i];
		}

		// weighted roulette, all-zero weights select the first sample
		double remaining = unit(random_) * total;
		size_t chosen = 0;
		size_t last_weighted = 0;
		bool found = false;
		for (size_t i = 0; i < samples.size(); ++i)
		{
			if (weights[i] > 0.0) last_weighted = i;
			remaining -= weights[i];
			if (remaining <= 0.0)
			{
				chosen = i;
				found = true;
				break;
			}
		}
		if (!found)
		{
			chosen = last_weighted;
		}

		color const& c = samples[chosen];
		centroids.push_back(centroid{ double(c.r), double(c.g), double(c.b) });
	}

	return centroids;
}

std::vector<quantizer::centroid> quantizer::cluster(std::vector<color> const& samples, std::vector<centroid> centroids)
{
	struct sum
	{
		double r, g, b;
		size_t count;
	};

	size_t const k = centroids.size();
	std::vector<sum> sums(k);

	while (iterations_ < max_iterations)
	{
		std::fill(sums.begin(), sums.end(), sum{ 0.0, 0.0, 0.0, 0 });

		for (color const& s : samples)
		{
			size_t nearest = 0;
			double best = std::numeric_limits<double>::max();
			for (size_t i = 0; i < k; ++i)
			{
				double const d = centroid_distance2(s.r, s.g, s.b, centroids[i].r, centroids[i].g, centroids[i].b);
				if (d < best)
				{
					best = d;
					nearest = i;
				}
			}
			sum& acc = sums[nearest];
			acc.r += s.r;
			acc.g += s.g;
			acc.b += s.b;
			++acc.count;
		}

		bool moved = false;
		for (size_t i = 0; i < k; ++i)
		{
			// an empty cluster keeps its previous centroid
			if (sums[i].count == 0) continue;

			centroid const updated = {
				sums[i].r / sums[i].count,
				sums[i].g / sums[i].count,
				sums[i].b / sums[i].count
			};
			double const shift = std::sqrt(centroid_distance2(updated.r, updated.g, updated.b,
				centroids[i].r, centroids[i].g, centroids[i].b));
			if (shift >= convergence_threshold)
			{
				moved = true;
			}
			centroids[i] = updated;
		}

		++iterations_;
		if (!moved)
		{
			converged_ = true;
			break;
		}
	}

	return centroids;
}

palette quantizer::default_palette(size_t num_colors)
{
	palette result;
	result.reserve(num_colors);
	for (size_t i = 0; i < num_colors; ++i)
	{
		double const hue = static_cast<double>(i) / num_colors * 360.0;
		result.push_back(hsl_to_rgb(hue, 70.0, 50.0));
	}
	return result;
}

color quantizer::hsl_to_rgb(double h, double s, double l)
{
	s /= 100.0;
	l /= 100.0;

	double const c = (1.0 - std::fabs(2.0 * l - 1.0)) * s;
	double const x = c * (1.0 - std::fabs(std::fmod(h / 60.0, 2.0) - 1.0));
	double const m = l - c / 2.0;

	double r, g, b;
	if (h < 60.0)       { r = c; g = x; b = 0; }
	else if (h < 120.0) { r = x; g = c; b = 0; }
	else if (h < 180.0) { r = 0; g = c; b = x; }
	else if (h < 240.0) { r = 0; g = x; b = c; }
	else if (h < 300.0) { r = x; g = 0; b = c; }
	else                { r = c; g = 0; b = x; }

	return color(round_channel((r + m) * 255.0), round_channel((g + m) * 255.0), round_channel((b + m) * 255.0));
}

} // posterize
