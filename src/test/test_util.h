#pragma once

#include <gtest/gtest.h>
#include <sstream>
#include <thread>

#include "../main/util.h"

using namespace hornet;


TEST(UtilityTest, String)
{
	string_t s("xYZYYz");

	EXPECT_EQ(s.lower(), "xyzyyz");

	EXPECT_EQ(s.split("Y").size(), 3);
	EXPECT_EQ(s.split("Y", 1).size(), 2);
	EXPECT_EQ(s.split("Y", 1).back(), "ZYYz");

	EXPECT_EQ(s.strip("xz"), "YZYY");
	EXPECT_EQ(s.strip("zxY"), "Z");
	EXPECT_EQ(s.replace("YZ", "ab"), "xabYYz");

	EXPECT_TRUE(s.startswith("xYZ"));
	EXPECT_FALSE(s.startswith("Zx"));
	EXPECT_FALSE(s.startswith("xYZYYzz"));

	EXPECT_TRUE(s.endswith("YYz"));
	EXPECT_FALSE(s.endswith("xz"));

	EXPECT_EQ(string_t("  a b \t").strip(" \t"), "a b");
	EXPECT_EQ(string_t(" \t ").strip(" \t"), "");
	EXPECT_FALSE(static_cast<bool>(string_t("")));
}


TEST(UtilityTest, Filepath)
{
	filepath_t s("/aaa/bbb/ccc.txt");

	EXPECT_EQ(s.filename(), "ccc.txt");
	EXPECT_EQ(s.dirname(), filepath_t("/aaa/bbb"));
	EXPECT_EQ(filepath_t("ccc.txt").filename(), "ccc.txt");
	EXPECT_EQ(filepath_t("ccc.txt").dirname(), "");
	EXPECT_FALSE(filepath_t("/no/such/file/exists.txt").find_file());
}


TEST(UtilityTest, ParameterStrage)
{
	param()->add("aaa", "xxx");
	param()->add("bbb", "123");
	param()->add("ccc", "12.4");
	param()->add("eee", "not a number");

	EXPECT_TRUE(param()->has("aaa"));
	EXPECT_FALSE(param()->has("xxx"));

	EXPECT_EQ(param()->get("aaa"), "xxx");
	EXPECT_EQ(param()->geti("bbb"), 123);
	EXPECT_EQ(param()->geti("ccc"), -1);
	EXPECT_EQ(param()->geti("ccc", 3), 3);
	EXPECT_EQ(param()->get("ddd"), "");
	EXPECT_EQ(param()->get("ddd", "xxx"), "xxx");
	EXPECT_EQ(param()->geti("ddd"), -1);
	EXPECT_EQ(param()->geti("eee", 5), 5);

	param()->add("aaa", "yyy");
	EXPECT_EQ(param()->get("aaa"), "yyy");
}


TEST(UtilityTest, Console)
{
	int verbosity = console()->verbosity();

	console()->verbosity() = VERBOSE_2;
	EXPECT_TRUE(console()->is(VERBOSE_1));
	EXPECT_TRUE(console()->is(VERBOSE_2));
	EXPECT_FALSE(console()->is(VERBOSE_3));

	console()->verbosity() = verbosity;

	EXPECT_EQ(console()->indent_depth(), 0);
	console()->add_indent();
	console()->add_indent();
	EXPECT_EQ(console()->indent_depth(), 2);

	// ANOTHER THREAD HAS ITS OWN INDENTATION.
	int depth_in_thread = -1;
	std::thread th([&depth_in_thread]()
	{
		console()->add_indent();
		depth_in_thread = console()->indent_depth();
	});
	th.join();

	EXPECT_EQ(depth_in_thread, 1);
	EXPECT_EQ(console()->indent_depth(), 2);

	console()->sub_indent();
	console()->sub_indent();
	console()->sub_indent();
	EXPECT_EQ(console()->indent_depth(), 0);
}


TEST(UtilityTest, XML)
{
	xml_element_t root("root");
	root.add_attribute("name", "a<b");
	root.add_child(xml_element_t("leaf", "x & y"));
	root.add_child(xml_element_t("empty"));

	ASSERT_NE(root.find_attribute("name"), nullptr);
	EXPECT_EQ(*root.find_attribute("name"), "a<b");
	EXPECT_EQ(root.find_attribute("none"), nullptr);

	std::ostringstream ss;
	root.print(&ss);

	EXPECT_EQ(ss.str(),
		"<root name=\"a&lt;b\">\n"
		"  <leaf>x &amp; y</leaf>\n"
		"  <empty/>\n"
		"</root>\n");
}


TEST(UtilityTest, Others)
{
	std::vector<std::string> strs{ "aa", "bb", "cc", "dd" };

	auto joined = join(strs.begin(), strs.end(), " | ");
	EXPECT_EQ(joined, "aa | bb | cc | dd");

	EXPECT_EQ(format("%s-%03d", "x", 7), "x-007");
	EXPECT_EQ(escape_xml("\"'"), "&quot;&apos;");
}
