#ifndef POSTERIZE_QUANTIZER_HPP_INCLUDED
#define POSTERIZE_QUANTIZER_HPP_INCLUDED

#include "posterize/image.hpp"

#include <random>

namespace posterize {

/// Palette extraction with k-means++ seeded Lloyd iterations in RGB space.
///
/// Seeding and roulette draws are random, repeated extraction on the same
/// image may return different but comparably good palettes. Construct with
/// an explicit seed to make the result reproducible.
class POSTERIZE_API quantizer
{
public:
	/// Approximate number of pixels sampled from an image
	static constexpr size_t sample_target = 10000;
	static constexpr size_t max_iterations = 50;
	/// Centroids moving less than this distance are considered converged
	static constexpr double convergence_threshold = 1.0;

	quantizer();
	explicit quantizer(uint32_t seed);

	/// Extract num_colors representative colors from opaque pixels of the image.
	/// Throws std::out_of_range when num_colors is not in [2, 16].
	palette extract(pixel_buffer const& image, size_t num_colors);

	/// Statistics of the last extract() call
	size_t sample_count() const { return sample_count_; }
	size_t iterations() const { return iterations_; }
	bool converged() const { return converged_; }
	bool used_fallback() const { return used_fallback_; }

	/// num_colors hues evenly spaced around the wheel, saturation 70%, lightness 50%
	static palette default_palette(size_t num_colors);

	/// h in [0, 360), s and l in [0, 100]
	static color hsl_to_rgb(double h, double s, double l);

private:
	struct centroid
	{
		double r, g, b;
	};

	std::vector<color> sample(pixel_buffer const& image) const;
	std::vector<centroid> seed_centroids(std::vector<color> const& samples, size_t num_colors);
	std::vector<centroid> cluster(std::vector<color> const& samples, std::vector<centroid> centroids);

	std::mt19937 random_;

	size_t sample_count_;
	size_t iterations_;
	bool converged_;
	bool used_fallback_;
};

} // posterize

#endif // POSTERIZE_QUANTIZER_HPP_INCLUDED
