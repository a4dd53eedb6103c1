#include "posterize/session.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace posterize;

namespace {

color const red(255, 0, 0);
color const blue(0, 0, 255);

pixel_buffer split_image()
{
	pixel_buffer image(image_size(10, 10));
	for (int y = 0; y < 10; ++y)
	{
		for (int x = 0; x < 10; ++x)
		{
			image.set_color(x, y, x < 5? red : blue);
			image.set_alpha(x, y, 255);
		}
	}
	return image;
}

session_settings two_colors()
{
	session_settings settings;
	settings.colors = 2;
	return settings;
}

bool has_color(palette const& colors, color const& c)
{
	return std::find(colors.begin(), colors.end(), c) != colors.end();
}

} // anonymous namespace

TEST(session, default_settings)
{
	session s;
	EXPECT_EQ(s.config().colors, 5u);
	EXPECT_EQ(s.config().mode, mapping_mode::replace);
	EXPECT_FALSE(s.config().smoothing);
	EXPECT_EQ(s.config().method, erase_method::area);
	EXPECT_DOUBLE_EQ(s.config().area_tolerance, 30.0);
	EXPECT_DOUBLE_EQ(s.config().color_tolerance, 10.0);
	EXPECT_FALSE(s.loaded());

	session_settings bad;
	bad.colors = 1;
	EXPECT_THROW(session invalid(bad), std::out_of_range);
}

TEST(session, tolerances_must_not_be_negative)
{
	session s(two_colors(), 1);
	s.set_tolerances(0, 12.5);
	EXPECT_DOUBLE_EQ(s.config().area_tolerance, 0.0);
	EXPECT_DOUBLE_EQ(s.config().color_tolerance, 12.5);

	EXPECT_THROW(s.set_tolerances(-1, 10), std::out_of_range);
	EXPECT_THROW(s.set_tolerances(30, -0.5), std::out_of_range);
	EXPECT_DOUBLE_EQ(s.config().color_tolerance, 12.5);

	session_settings bad = two_colors();
	bad.area_tolerance = -3;
	EXPECT_THROW(session invalid(bad), std::out_of_range);
}

TEST(session, operations_require_an_image)
{
	session s(two_colors(), 1);
	EXPECT_THROW(s.remap(), std::logic_error);
	EXPECT_THROW(s.erase_at(0, 0), std::logic_error);
	EXPECT_THROW(s.reset(), std::logic_error);
	EXPECT_THROW(s.clean_edges(), std::logic_error);
	EXPECT_THROW(s.set_color(0, red), std::logic_error);
	EXPECT_THROW(s.export_svg(smoothing_level::simple), std::logic_error);
	EXPECT_THROW(s.load(pixel_buffer()), std::invalid_argument);
}

TEST(session, load_extracts_and_posterizes)
{
	session s(two_colors(), 3);
	s.load(split_image());

	ASSERT_TRUE(s.loaded());
	ASSERT_EQ(s.colors().size(), 2u);
	EXPECT_TRUE(has_color(s.colors(), red));
	EXPECT_TRUE(has_color(s.colors(), blue));
	EXPECT_EQ(s.current(), s.original());
	EXPECT_EQ(s.pristine(), s.current());
	EXPECT_FALSE(s.has_transparency());
}

TEST(session, erase_and_reset)
{
	session s(two_colors(), 3);
	s.load(split_image());

	s.erase_at(0, 0);
	EXPECT_TRUE(s.has_transparency());
	EXPECT_EQ(s.current().alpha_at(4, 9), 0);
	EXPECT_EQ(s.current().alpha_at(5, 0), 255);
	EXPECT_EQ(s.pristine().alpha_at(0, 0), 255);

	s.reset();
	EXPECT_FALSE(s.has_transparency());
	EXPECT_EQ(s.current(), s.pristine());
}

TEST(session, erase_by_color)
{
	pixel_buffer image = split_image();
	// a separate red island on the blue side
	image.set_color(8, 8, red);

	session s(two_colors(), 3);
	s.load(image);
	s.set_erase_method(erase_method::color);
	s.erase_at(0, 0);

	EXPECT_EQ(s.current().alpha_at(8, 8), 0);
	EXPECT_EQ(s.current().alpha_at(9, 9), 255);
	EXPECT_THROW(s.erase_at(10, 0), std::out_of_range);
}

TEST(session, clear_transparency_posterizes_again)
{
	session s(two_colors(), 3);
	s.load(split_image());
	s.erase_at(7, 7);
	ASSERT_TRUE(s.current().has_transparency());

	s.clear_transparency();
	EXPECT_FALSE(s.current().has_transparency());
	EXPECT_FALSE(s.has_transparency());
}

TEST(session, palette_edits)
{
	session s(two_colors(), 3);
	s.load(split_image());

	size_t const red_index = s.colors()[0] == red? 0 : 1;
	color const orange(200, 50, 0);
	s.set_color(red_index, orange);
	EXPECT_EQ(s.colors()[red_index], orange);
	EXPECT_EQ(s.current().color_at(0, 0), orange);
	EXPECT_EQ(s.current().color_at(9, 0), blue);

	EXPECT_THROW(s.set_color(2, orange), std::out_of_range);
	EXPECT_THROW(s.set_palette({ red, blue, orange }), std::invalid_argument);

	s.set_palette({ color(250, 0, 0), color(0, 0, 250) });
	EXPECT_EQ(s.current().color_at(0, 0), color(250, 0, 0));
	EXPECT_EQ(s.current().color_at(9, 9), color(0, 0, 250));
}

TEST(session, palette_size_changes)
{
	session s(two_colors(), 3);
	s.load(split_image());

	s.set_palette_size(4);
	EXPECT_EQ(s.colors().size(), 4u);
	EXPECT_EQ(s.config().colors, 4u);
	EXPECT_THROW(s.set_palette_size(17), std::out_of_range);
	EXPECT_EQ(s.colors().size(), 4u);
}

TEST(session, smoothing_changes_the_source)
{
	session_settings settings = two_colors();
	settings.smoothing = true;
	session s(settings, 3);
	s.load(split_image());

	EXPECT_EQ(s.colors().size(), 2u);
	for (size_t i = 0; i < s.current().pixel_count(); ++i)
	{
		EXPECT_TRUE(has_color(s.colors(), s.current().color_at(i)));
	}
}

TEST(session, export_svg_traces_current)
{
	session s(two_colors(), 3);
	s.load(split_image());

	vector_document const document = s.export_svg(smoothing_level::simple);
	EXPECT_EQ(document.size(), image_size(10, 10));
	EXPECT_EQ(document.groups().size(), 2u);

	s.set_erase_method(erase_method::color);
	s.erase_at(0, 0);
	s.erase_at(9, 9);
	EXPECT_TRUE(s.export_svg(smoothing_level::complex).groups().empty());
}
