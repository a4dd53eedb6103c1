#include "posterize/mapper.hpp"
#include "posterize/quantizer.hpp"
#include "posterize/tracer.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace posterize;

namespace {

color const red(255, 0, 0);
color const blue(0, 0, 255);

pixel_buffer solid_image(int width, int height, color const& c)
{
	pixel_buffer image(image_size(width, height));
	image.fill(c);
	return image;
}

bool starts_with(std::string const& s, std::string const& prefix)
{
	return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string const& s, std::string const& suffix)
{
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

TEST(tracer, simplify_tolerance)
{
	EXPECT_DOUBLE_EQ(simplify_tolerance(smoothing_level::simple), 2.0);
	EXPECT_DOUBLE_EQ(simplify_tolerance(smoothing_level::complex), 0.5);
}

TEST(tracer, mask_reads_outside_are_empty)
{
	mask m(image_size(2, 2));
	m.set(0, 0);
	m.set(1, 1);

	EXPECT_TRUE(m.at(0, 0));
	EXPECT_FALSE(m.at(1, 0));
	EXPECT_FALSE(m.at(-1, 0));
	EXPECT_FALSE(m.at(2, 1));
	EXPECT_EQ(m.count(), 2u);
}

TEST(tracer, make_mask_matches_opaque_near_colors)
{
	pixel_buffer image = solid_image(4, 1, blue);
	image.set_color(1, color(4, 4, 251));
	image.set_color(2, color(5, 0, 255));
	image.set_alpha(3, 128);

	mask const m = make_mask(image, blue);
	EXPECT_TRUE(m.at(0, 0));
	EXPECT_TRUE(m.at(1, 0));
	EXPECT_FALSE(m.at(2, 0));
	EXPECT_FALSE(m.at(3, 0));
}

TEST(tracer, make_mask_excludes_earlier_palette_entries)
{
	pixel_buffer const image = solid_image(3, 3, blue);
	palette const colors = { blue, color(0, 2, 253) };

	EXPECT_EQ(make_mask(image, colors, 0).count(), 9u);
	EXPECT_EQ(make_mask(image, colors, 1).count(), 0u);
	EXPECT_EQ(make_mask(image, color(0, 2, 253)).count(), 9u);
}

TEST(tracer, cell_configuration_weights)
{
	mask m(image_size(2, 2));
	m.set(0, 0);
	m.set(1, 0);
	m.set(0, 1);
	m.set(1, 1);

	EXPECT_EQ(cell_configuration(m, 0, 0), 15);
	EXPECT_EQ(cell_configuration(m, 1, 1), 8);
	EXPECT_EQ(cell_configuration(m, 0, 1), 12);
	EXPECT_EQ(cell_configuration(m, 1, 0), 9);
	EXPECT_EQ(cell_configuration(m, -1, -1), 2);
	EXPECT_EQ(cell_configuration(m, -1, 1), 4);
	EXPECT_EQ(cell_configuration(m, 5, 5), 0);
}

TEST(tracer, saddle_cells_emit_two_segments)
{
	mask falling(image_size(3, 3));
	falling.set(0, 0);
	falling.set(1, 1);
	EXPECT_EQ(cell_configuration(falling, 0, 0), 10);
	EXPECT_EQ(cell_boundary(falling, 0, 0),
		contour({ point(0.5, 0), point(1, 0.5), point(0.5, 1), point(0, 0.5) }));

	mask rising(image_size(3, 3));
	rising.set(1, 0);
	rising.set(0, 1);
	EXPECT_EQ(cell_configuration(rising, 0, 0), 5);
	EXPECT_EQ(cell_boundary(rising, 0, 0),
		contour({ point(0, 0.5), point(0.5, 0), point(1, 0.5), point(0.5, 1) }));

	EXPECT_TRUE(cell_boundary(falling, 2, 0).empty());
	EXPECT_EQ(cell_boundary(falling, 1, 1), contour({ point(1.5, 1), point(1, 1.5) }));
}

TEST(tracer, diagonal_pair_traces_saddle_contour)
{
	mask m(image_size(3, 3));
	m.set(0, 0);
	m.set(1, 1);

	// the lower pixel only contributes a single corner segment
	std::vector<contour> const contours = trace_contours(m);
	ASSERT_EQ(contours.size(), 1u);
	EXPECT_EQ(contours[0], contour({ point(0.5, 0), point(1, 0.5), point(0.5, 1), point(0, 0.5) }));
}

TEST(tracer, empty_mask_has_no_contours)
{
	EXPECT_TRUE(trace_contours(mask(image_size(5, 5))).empty());
}

TEST(tracer, isolated_pixel_is_dropped)
{
	mask m(image_size(3, 3));
	m.set(1, 1);

	// the walk only sees one corner segment of the pixel
	EXPECT_TRUE(trace_contours(m).empty());
}

TEST(tracer, block_contours_stay_near_the_block)
{
	mask m(image_size(6, 6));
	for (int y = 1; y < 4; ++y)
	{
		for (int x = 1; x < 4; ++x)
		{
			m.set(x, y);
		}
	}

	std::vector<contour> const contours = trace_contours(m);
	ASSERT_FALSE(contours.empty());
	for (contour const& points : contours)
	{
		EXPECT_GT(points.size(), 2u);
		for (point const& p : points)
		{
			EXPECT_GE(p.x, 1.0);
			EXPECT_LE(p.x, 4.0);
			EXPECT_GE(p.y, 1.0);
			EXPECT_LE(p.y, 4.0);
		}
	}
}

TEST(tracer, simplify_keeps_endpoints)
{
	contour const points = {
		point(0, 0), point(1, 0.1), point(2, -0.1), point(3, 5), point(4, 6), point(5, 7), point(6, 8.1), point(7, 9)
	};

	for (double tolerance : { 0.0, 0.5, 2.0, 100.0 })
	{
		contour const simplified = simplify(points, tolerance);
		ASSERT_GE(simplified.size(), 2u);
		EXPECT_LE(simplified.size(), points.size());
		EXPECT_EQ(simplified.front(), points.front());
		EXPECT_EQ(simplified.back(), points.back());
	}
}

TEST(tracer, simplify_collinear_points)
{
	contour const line = { point(0, 0), point(1, 1), point(2, 2), point(3, 3) };
	EXPECT_EQ(simplify(line, 0.5), contour({ point(0, 0), point(3, 3) }));

	contour const corner = { point(0, 0), point(5, 0), point(5, 5) };
	EXPECT_EQ(simplify(corner, 2.0), corner);
	EXPECT_EQ(simplify(corner, 10.0), contour({ point(0, 0), point(5, 5) }));

	contour const two = { point(1, 1), point(2, 2) };
	EXPECT_EQ(simplify(two, 0.5), two);
	EXPECT_TRUE(simplify(contour(), 0.5).empty());
}

TEST(tracer, smooth_path_commands)
{
	EXPECT_EQ(smooth_path(contour()), "");
	EXPECT_EQ(smooth_path({ point(1, 2) }), "M 1 2 Z");
	EXPECT_EQ(smooth_path({ point(0, 0), point(3, 0.5) }), "M 0 0 L 3 0.5 Z");
	EXPECT_EQ(smooth_path({ point(0, 0), point(2, 0), point(2, 2) }), "M 0 0 Q 2 0, 2 1 L 2 2 Z");
}

TEST(tracer, smooth_path_is_closed)
{
	contour const points = { point(0.5, 0), point(1, 0.5), point(0.5, 1), point(0, 0.5), point(0.5, 0) };
	std::string const path = smooth_path(points);
	EXPECT_TRUE(starts_with(path, "M "));
	EXPECT_TRUE(ends_with(path, " Z"));
}

TEST(tracer, solid_image_gives_one_group)
{
	pixel_buffer const image = solid_image(4, 4, blue);
	vector_document const document = trace(image, { blue, red });

	ASSERT_EQ(document.groups().size(), 1u);
	shape_group const& group = document.groups()[0];
	EXPECT_EQ(group.fill, blue);
	ASSERT_FALSE(group.paths.empty());
	for (std::string const& path : group.paths)
	{
		EXPECT_TRUE(starts_with(path, "M ")) << path;
		EXPECT_TRUE(ends_with(path, " Z")) << path;
	}

	std::string const svg = document.to_svg();
	EXPECT_TRUE(starts_with(svg,
		"<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 4 4\" width=\"4\" height=\"4\"><g fill=\"#0000ff\"><path d=\"M "));
	EXPECT_TRUE(ends_with(svg, " Z\" /></g></svg>"));
}

TEST(tracer, solid_image_through_the_whole_chain)
{
	pixel_buffer const image = solid_image(4, 4, blue);

	for (uint32_t seed = 0; seed < 5; ++seed)
	{
		quantizer q(seed);
		palette const colors = q.extract(image, 2);
		ASSERT_EQ(colors.size(), 2u);

		pixel_buffer const mapped = map_to_palette(image, colors);
		EXPECT_EQ(mapped, image);

		vector_document const document = trace(mapped, colors);
		ASSERT_EQ(document.groups().size(), 1u) << "seed " << seed;
		EXPECT_EQ(document.groups()[0].fill, blue);
	}
}

TEST(tracer, duplicate_palette_entries_give_one_group)
{
	pixel_buffer const image = solid_image(4, 4, blue);
	vector_document const document = trace(image, { blue, blue, red });
	EXPECT_EQ(document.groups().size(), 1u);
}

TEST(tracer, transparent_image_gives_empty_document)
{
	pixel_buffer const image(image_size(6, 4));
	vector_document const document = trace(image, { blue, red }, smoothing_level::complex);

	EXPECT_TRUE(document.groups().empty());
	EXPECT_EQ(document.to_svg(),
		"<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 6 4\" width=\"6\" height=\"4\"></svg>");
}

TEST(tracer, two_color_image_groups_in_palette_order)
{
	pixel_buffer image = solid_image(8, 8, red);
	for (int y = 0; y < 8; ++y)
	{
		for (int x = 4; x < 8; ++x)
		{
			image.set_color(x, y, blue);
		}
	}

	vector_document const document = trace(image, { blue, red });
	ASSERT_EQ(document.groups().size(), 2u);
	EXPECT_EQ(document.groups()[0].fill, blue);
	EXPECT_EQ(document.groups()[1].fill, red);
}

TEST(tracer, invalid_arguments)
{
	pixel_buffer const image = solid_image(2, 2, blue);
	EXPECT_THROW(trace(image, { blue }), std::out_of_range);
	EXPECT_THROW(trace_color(image, { blue, red }, 2, smoothing_level::simple), std::out_of_range);

	palette const colors = { blue, red };
	EXPECT_THROW(make_mask(image, colors, 2), std::out_of_range);
	EXPECT_EQ(make_mask(image, colors, 1).count(), 0u);
}
