#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>
#include <appm-pkg/tomltokenizer.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

static void ExpectSyntaxError(std::string const &Text, std::string const &Message)
{
   SCOPED_TRACE(Text);
   TomlDocument Doc;
   Doc.Set("untouched::key", "value");
   EXPECT_FALSE(ParseTomlString(Text, Doc));
   EXPECT_TRUE(_error->PendingError());
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ(Message, text);
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));
   _error->Discard();
   // a failed parse never hands out a partial document
   ASSERT_EQ(1u, Doc.Keys().size());
   EXPECT_EQ("value", Doc.FindS("untouched::key"));
}

TEST(TomlParserTest,MinimalDocument)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[a]\nb=\"c\"\n", Doc));

   TomlDocument Expected;
   Expected.Set("a::b", "c");
   EXPECT_EQ(Expected, Doc);
   EXPECT_EQ(TomlDocument::String, Doc.Find("a::b")->Type);
}
TEST(TomlParserTest,NestedStructures)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[a]\nb=[{x=\"1\"}, \"y\"]\n", Doc));

   TomlDocument Expected;
   TomlDocument::Item * const L = Expected.EnsureList("a::b");
   TomlDocument::Item * const T = Expected.Append(L, TomlDocument::Table);
   Expected.Assign(T, "x", TomlDocument::String, "1");
   Expected.Append(L, TomlDocument::String, "y");
   EXPECT_EQ(Expected, Doc);

   EXPECT_EQ("1", Doc.FindS("a::b::0::x"));
   EXPECT_EQ("y", Doc.FindS("a::b::1"));
}
TEST(TomlParserTest,BareWords)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[a]\nb=True\nversion=0.1.0\n", Doc));
   TomlDocument::Item const * const B = Doc.Find("a::b");
   ASSERT_NE(nullptr, B);
   EXPECT_EQ(TomlDocument::Bare, B->Type);
   EXPECT_EQ("True", B->Value);
   EXPECT_TRUE(Doc.FindB("a::b"));
   EXPECT_EQ(TomlDocument::Bare, Doc.Find("a::version")->Type);
   EXPECT_EQ("0.1.0", Doc.FindS("a::version"));
}
TEST(TomlParserTest,KeyNormalization)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[tool-settings]\nenv-name=\"x\"\nt={lib-dir=\"y\"}\n", Doc));
   EXPECT_EQ("x", Doc.FindS("tool-settings::env_name"));
   EXPECT_EQ("y", Doc.FindS("tool-settings::t::lib_dir"));
   EXPECT_FALSE(Doc.Exists("tool-settings::env-name"));
   EXPECT_EQ("a_b_c", TomlParser::NormalizeKey("a-b_c"));
}
TEST(TomlParserTest,Whitespace)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("\n[ a ]\r\n  b = \"c\"\t\n\tl = [ 1 ,\n  2 ,\n\t3 ]\n"
			       "t = {\n x = 1,\n y = [] }\ne = {}\n\n", Doc));
   EXPECT_EQ("c", Doc.FindS("a::b"));
   std::vector<std::string> const L = Doc.FindVector("a::l");
   ASSERT_EQ(3u, L.size());
   EXPECT_EQ("1", L[0]);
   EXPECT_EQ("3", L[2]);
   EXPECT_EQ("1", Doc.FindS("a::t::x"));
   EXPECT_EQ(TomlDocument::List, Doc.Find("a::t::y")->Type);
   EXPECT_EQ(0u, Doc.Find("a::t::y")->Size());
   EXPECT_EQ(TomlDocument::Table, Doc.Find("a::e")->Type);
}
TEST(TomlParserTest,Comments)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("# leading comment\n[a]\n# b=1\nc=2 # trailing\n  # indented\n", Doc));
   std::vector<std::string> const Keys = Doc.Keys("a");
   ASSERT_EQ(1u, Keys.size());
   EXPECT_EQ("c", Keys[0]);
   EXPECT_EQ("2", Doc.FindS("a::c"));
}
TEST(TomlParserTest,Strings)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[a]\n"
			       "d='say \"hi\"'\n"
			       "s=\"it's\"\n"
			       "e=\"\"\n"
			       "m=\"first\nsecond\"\n"
			       "c=\"a # b, [c] = {d}\"\n", Doc));
   EXPECT_EQ("say \"hi\"", Doc.FindS("a::d"));
   EXPECT_EQ("it's", Doc.FindS("a::s"));
   EXPECT_EQ("", Doc.FindS("a::e", "unset"));
   EXPECT_EQ(TomlDocument::String, Doc.Find("a::e")->Type);
   EXPECT_EQ("first\nsecond", Doc.FindS("a::m"));
   EXPECT_EQ("a # b, [c] = {d}", Doc.FindS("a::c"));
}
TEST(TomlParserTest,RepeatedSections)
{
   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlString("[a]\nx=1\n[b]\ny=2\n[a]\nz=3\n", Doc));
   std::vector<std::string> const Sections = Doc.Keys();
   ASSERT_EQ(2u, Sections.size());
   EXPECT_EQ("a", Sections[0]);
   EXPECT_EQ("b", Sections[1]);
   EXPECT_FALSE(Doc.Exists("a::x"));
   EXPECT_EQ("3", Doc.FindS("a::z"));

   // a repeated key replaces the value in place
   EXPECT_TRUE(ParseTomlString("[a]\nx=1\ny=2\nx=3\n", Doc));
   std::vector<std::string> const Keys = Doc.Keys("a");
   ASSERT_EQ(2u, Keys.size());
   EXPECT_EQ("x", Keys[0]);
   EXPECT_EQ("3", Doc.FindS("a::x"));
}
TEST(TomlParserTest,EmptyInput)
{
   TomlDocument Doc;
   Doc.Set("old::key", "value");
   EXPECT_TRUE(ParseTomlString("", Doc));
   EXPECT_TRUE(Doc.empty());
   EXPECT_TRUE(ParseTomlString("# only a comment\n\n", Doc));
   EXPECT_TRUE(Doc.empty());
}
TEST(TomlParserTest,SyntaxErrors)
{
   ExpectSyntaxError("[a]\nb \"c\"\n", "Syntax error <string>:2:3: Expected equal sign");
   ExpectSyntaxError("[a]\nb=[1, 2\n", "Syntax error <string>:3:1: Expected right bracket");
   ExpectSyntaxError("b=\"c\"\n[a]\n", "Syntax error <string>:1:1: Key-value pair outside of a section");
   ExpectSyntaxError("[a]\nb=\"c\n", "Syntax error <string>:2:3: Unterminated string");
   ExpectSyntaxError("[a]\nb='c\"\n", "Syntax error <string>:2:3: Unterminated string");
   ExpectSyntaxError("[a]\nb=[1,]\n", "Syntax error <string>:2:5: Unexpected comma");
   ExpectSyntaxError("[a]\nb=[,]\n", "Syntax error <string>:2:4: Unexpected comma");
   ExpectSyntaxError("[a]\nb={x=1 y=2}\n", "Syntax error <string>:2:8: Expected right brace");
   ExpectSyntaxError("[a]\nb={x=1,}\n", "Syntax error <string>:2:7: Unexpected comma");
   ExpectSyntaxError("[a]\nb={=1}\n", "Syntax error <string>:2:4: Expected key");
   ExpectSyntaxError("[a]\nb={x 1}\n", "Syntax error <string>:2:6: Expected equal sign");
   ExpectSyntaxError("[a\nb=1\n", "Syntax error <string>:1:3: Expected right bracket");
   ExpectSyntaxError("[]\n", "Syntax error <string>:1:2: Expected section name");
   ExpectSyntaxError("[a b]\n", "Syntax error <string>:1:4: Expected right bracket");
   ExpectSyntaxError("=x\n", "Syntax error <string>:1:1: Unexpected token '='");
   ExpectSyntaxError("[a]\nb=\n", "Syntax error <string>:3:1: Unexpected end of file");
   ExpectSyntaxError("[a]\nb=#\n", "Syntax error <string>:2:3: Unexpected token '#'");
   ExpectSyntaxError("[a]\nb=1 ]\n", "Syntax error <string>:2:5: Unexpected token ']'");
   ExpectSyntaxError("[a]\n\"b\"=1\n", "Syntax error <string>:2:1: Unexpected token '\"'");
}
TEST(TomlParserTest,SourceNameInErrors)
{
   TomlDocument Doc;
   EXPECT_FALSE(ParseTomlString("[a]\nb\n", Doc, "pyapp.toml"));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Syntax error pyapp.toml:3:1: Expected equal sign", text);
   _error->Discard();
}
TEST(TomlParserTest,Tokens)
{
   std::vector<TomlToken> Tokens;
   TomlTokenizer().TokenizeString("[a]\nb=c\n", Tokens);
   TomlDocument Doc;
   EXPECT_TRUE(TomlParser("tokens").Parse(Tokens, Doc));
   EXPECT_EQ("c", Doc.FindS("a::b"));

   // the terminating Eof is optional for the parser
   Tokens.pop_back();
   TomlDocument Doc2;
   EXPECT_TRUE(TomlParser("tokens").Parse(Tokens, Doc2));
   EXPECT_EQ(Doc, Doc2);
}
TEST(TomlParserTest,Cursor)
{
   std::vector<TomlToken> Tokens;
   TomlTokenizer().TokenizeString(" \n x", Tokens);
   TomlParser::Cursor C(Tokens);
   EXPECT_TRUE(C.At(TomlToken::Space));
   C.SkipSpaces();
   EXPECT_TRUE(C.At(TomlToken::Newline));
   C.SkipWhitespace();
   EXPECT_TRUE(C.At(TomlToken::Char));
   EXPECT_EQ('x', C.Advance().Value);
   EXPECT_TRUE(C.At(TomlToken::Newline));
   C.Advance();
   EXPECT_TRUE(C.At(TomlToken::Eof));
   // Eof is never passed
   C.Advance();
   EXPECT_TRUE(C.At(TomlToken::Eof));
   EXPECT_EQ(Tokens.size() - 1, C.Pos);
}
TEST(TomlParserTest,File)
{
   ScopedFileDeleter const file = createTemporaryFile("parser", "[project]\nname = \"demo\"\ndependencies = [\n  \"requests\",\n]");
   TomlDocument Doc;
   EXPECT_FALSE(ParseTomlFile(file.Name(), Doc));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Syntax error " + file.Name() + ":4:13: Unexpected comma", text);
   _error->Discard();

   ScopedFileDeleter const good = createTemporaryFile("parser", "[project]\nname = \"demo\"\ndependencies = [\n  \"requests\"\n]");
   EXPECT_TRUE(ParseTomlFile(good.Name(), Doc));
   EXPECT_EQ("demo", Doc.FindS("project::name"));
   std::vector<std::string> const Deps = Doc.FindVector("project::dependencies");
   ASSERT_EQ(1u, Deps.size());
   EXPECT_EQ("requests", Deps[0]);

   EXPECT_FALSE(ParseTomlFile("/not-there/pyapp.toml", Doc));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_EQ("demo", Doc.FindS("project::name"));
}
