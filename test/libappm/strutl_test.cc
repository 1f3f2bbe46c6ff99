#include <config.h>

#include <appm-pkg/strutl.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(StrUtilTest,StartsWithEndsWith)
{
   EXPECT_TRUE(APPM::String::Endswith("pyapp.toml", ".toml"));
   EXPECT_TRUE(APPM::String::Endswith("pyapp.toml", ""));
   EXPECT_FALSE(APPM::String::Endswith("pyapp.toml", ".gz"));
   EXPECT_FALSE(APPM::String::Endswith("gz", ".gz"));

   EXPECT_TRUE(APPM::String::Startswith("/tmp/pyappm", "/tmp"));
   EXPECT_TRUE(APPM::String::Startswith("/tmp/pyappm", ""));
   EXPECT_FALSE(APPM::String::Startswith("/tmp", "/tmp/pyappm"));
}
TEST(StrUtilTest,StringToBool)
{
   EXPECT_EQ(1, StringToBool("True"));
   EXPECT_EQ(0, StringToBool("False"));
   EXPECT_EQ(1, StringToBool("yes"));
   EXPECT_EQ(0, StringToBool("NO"));
   EXPECT_EQ(1, StringToBool("1"));
   EXPECT_EQ(0, StringToBool("0"));
   EXPECT_EQ(1, StringToBool("enable"));
   EXPECT_EQ(-1, StringToBool("maybe"));
   EXPECT_EQ(7, StringToBool("", 7));
}
TEST(StrUtilTest,VectorizeString)
{
   std::vector<std::string> vec = VectorizeString("", ',');
   EXPECT_TRUE(vec.empty());

   vec = VectorizeString("abc", ',');
   ASSERT_EQ(1u, vec.size());
   EXPECT_EQ("abc", vec[0]);

   vec = VectorizeString("a,,b", ',');
   ASSERT_EQ(3u, vec.size());
   EXPECT_EQ("a", vec[0]);
   EXPECT_EQ("", vec[1]);
   EXPECT_EQ("b", vec[2]);

   vec = VectorizeString("a,b,", ',');
   ASSERT_EQ(3u, vec.size());
   EXPECT_EQ("b", vec[1]);
   EXPECT_EQ("", vec[2]);
}
TEST(StrUtilTest,Printf)
{
   std::string out;
   strprintf(out, "%s:%u:%u", "pyapp.toml", 3u, 14u);
   EXPECT_EQ("pyapp.toml:3:14", out);

   std::string longText(1000, 'x');
   strprintf(out, "<%s>", longText.c_str());
   EXPECT_EQ("<" + longText + ">", out);
}
