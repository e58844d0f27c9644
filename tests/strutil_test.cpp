/*
 * remapd - A key remapping daemon.
 *
 * © 2019 Raheman Vaiya (see also: LICENSE).
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "strutil.h"

template <char Ch>
static std::vector<std::string> fields(std::string_view s)
{
	std::vector<std::string> v;
	for (auto f : split_char<Ch>(s))
		v.emplace_back(f);
	return v;
}

TEST(StrutilTest, SplitsOnSeparator)
{
	EXPECT_EQ(fields<','>("a, b,c"), (std::vector<std::string>{ "a", " b", "c" }));
	EXPECT_EQ(fields<'\n'>("+a 0\n-a 5\n"), (std::vector<std::string>{ "+a 0", "-a 5", "" }));
}

TEST(StrutilTest, EmptyStringIsOneField)
{
	EXPECT_EQ(fields<','>(""), (std::vector<std::string>{ "" }));
	EXPECT_EQ(fields<','>(",,"), (std::vector<std::string>{ "", "", "" }));
}

TEST(StrutilTest, Trim)
{
	EXPECT_EQ(trim(" \ta = b\r"), "a = b");
	EXPECT_EQ(trim("   "), "");
	EXPECT_EQ(trim(""), "");
}
