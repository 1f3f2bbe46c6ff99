// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Parser - recursive descent parser for manifest files

   Every grammar rule is a method taking the shared Cursor. Values are
   placed directly into a scratch document which is swapped into the
   caller's document once the Eof token was reached.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/strutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>
#include <appm-pkg/tomltokenizer.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <appmi18n.h>
									/*}}}*/

// Cursor::Peek - Current token, Eof past the end			/*{{{*/
TomlToken const &TomlParser::Cursor::Peek() const
{
   static TomlToken const End(TomlToken::Eof, '\0', 0, 0);
   if (Pos < Tokens.size())
      return Tokens[Pos];
   return End;
}
									/*}}}*/
// Cursor::Advance - Return the current token and move past it		/*{{{*/
TomlToken const &TomlParser::Cursor::Advance()
{
   TomlToken const &Tok = Peek();
   if (Pos < Tokens.size() && Tok.Type != TomlToken::Eof)
      ++Pos;
   return Tok;
}
									/*}}}*/
// Cursor::SkipSpaces - Skip blanks on the current line			/*{{{*/
void TomlParser::Cursor::SkipSpaces()
{
   while (At(TomlToken::Space) == true)
      Advance();
}
									/*}}}*/
// Cursor::SkipWhitespace - Skip blanks and line ends			/*{{{*/
void TomlParser::Cursor::SkipWhitespace()
{
   while (true)
   {
      switch (Peek().Type)
      {
	 case TomlToken::Space:
	 case TomlToken::Newline:
	 case TomlToken::CarriageReturn:
	    Advance();
	    continue;
	 default:
	    return;
      }
   }
}
									/*}}}*/
// TomlParser::NormalizeKey - Keys use '_' instead of '-'		/*{{{*/
std::string TomlParser::NormalizeKey(std::string Key)
{
   std::replace(Key.begin(), Key.end(), '-', '_');
   return Key;
}
									/*}}}*/
// TomlParser::SyntaxError - Report the position of a syntax error	/*{{{*/
bool TomlParser::SyntaxError(TomlToken const &Tok, std::string const &What) const
{
   return _error->Error(_("Syntax error %s:%u:%u: %s"), Source.c_str(),
			Tok.Line, Tok.Column, What.c_str());
}
bool TomlParser::UnexpectedToken(TomlToken const &Tok) const
{
   std::string What;
   switch (Tok.Type)
   {
      case TomlToken::Eof:
	 What = _("Unexpected end of file");
	 break;
      case TomlToken::Newline:
	 What = _("Unexpected end of line");
	 break;
      case TomlToken::Comma:
	 What = _("Unexpected comma");
	 break;
      case TomlToken::Equal:
      case TomlToken::LBracket:
      case TomlToken::RBracket:
      case TomlToken::LBrace:
      case TomlToken::RBrace:
      case TomlToken::Quote:
      case TomlToken::Comment:
      case TomlToken::CarriageReturn:
      case TomlToken::Space:
      case TomlToken::Char:
	 strprintf(What, _("Unexpected token '%c'"), Tok.Value);
	 break;
   }
   return SyntaxError(Tok, What);
}
									/*}}}*/
// TomlParser::ParseBareRun - Maximal run of Char tokens			/*{{{*/
bool TomlParser::ParseBareRun(Cursor &C, std::string &Value) const
{
   Value.clear();
   while (C.At(TomlToken::Char) == true)
      Value.push_back(C.Advance().Value);
   return Value.empty() == false;
}
									/*}}}*/
// TomlParser::ParseString - Text up to the matching quote		/*{{{*/
bool TomlParser::ParseString(Cursor &C, std::string &Value) const
{
   TomlToken const &Open = C.Advance();
   Value.clear();
   while (true)
   {
      TomlToken const &Tok = C.Peek();
      if (Tok.Type == TomlToken::Eof)
	 return SyntaxError(Open, _("Unterminated string"));
      C.Advance();
      if (Tok.Type == TomlToken::Quote && Tok.Value == Open.Value)
	 return true;
      Value.push_back(Tok.Value);
   }
}
									/*}}}*/
// TomlParser::ParseValue - Parse a value into a table or list		/*{{{*/
// ---------------------------------------------------------------------
/* With Parent being a table the value is stored as Key, otherwise it is
   appended to the list Parent. */
bool TomlParser::ParseValue(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Parent,
			    std::string const &Key) const
{
   auto const Place = [&](TomlDocument::ItemType const Type, std::string const &Value) {
      if (Parent->Type == TomlDocument::Table)
	 return Doc.Assign(Parent, Key, Type, Value);
      return Doc.Append(Parent, Type, Value);
   };

   C.SkipWhitespace();
   TomlToken const &Tok = C.Peek();
   switch (Tok.Type)
   {
      case TomlToken::Quote:
      {
	 std::string Value;
	 if (ParseString(C, Value) == false)
	    return false;
	 if (Debug == true)
	    std::clog << "String \"" << Value << "\"" << std::endl;
	 return Place(TomlDocument::String, Value) != nullptr;
      }
      case TomlToken::Char:
      {
	 std::string Value;
	 ParseBareRun(C, Value);
	 if (Debug == true)
	    std::clog << "Bare " << Value << std::endl;
	 return Place(TomlDocument::Bare, Value) != nullptr;
      }
      case TomlToken::LBracket:
      {
	 TomlDocument::Item * const List = Place(TomlDocument::List, "");
	 if (List == nullptr)
	    return false;
	 return ParseList(C, Doc, List);
      }
      case TomlToken::LBrace:
      {
	 TomlDocument::Item * const Table = Place(TomlDocument::Table, "");
	 if (Table == nullptr)
	    return false;
	 return ParseInlineTable(C, Doc, Table);
      }
      case TomlToken::Equal:
      case TomlToken::RBracket:
      case TomlToken::RBrace:
      case TomlToken::Comma:
      case TomlToken::Comment:
      case TomlToken::Newline:
      case TomlToken::CarriageReturn:
      case TomlToken::Space:
      case TomlToken::Eof:
	 break;
   }
   return UnexpectedToken(Tok);
}
									/*}}}*/
// TomlParser::ParseList - '[' value, value ']'				/*{{{*/
bool TomlParser::ParseList(Cursor &C, TomlDocument &Doc, TomlDocument::Item *List) const
{
   if (Debug == true)
      std::clog << "List " << List->FullTag() << std::endl;
   C.Advance();
   C.SkipWhitespace();
   if (C.At(TomlToken::RBracket) == true)
   {
      C.Advance();
      return true;
   }

   while (true)
   {
      if (ParseValue(C, Doc, List, "") == false)
	 return false;
      C.SkipWhitespace();
      if (C.At(TomlToken::Comma) == true)
      {
	 TomlToken const &Comma = C.Advance();
	 C.SkipWhitespace();
	 if (C.At(TomlToken::RBracket) == true)
	    return SyntaxError(Comma, _("Unexpected comma"));
	 continue;
      }
      if (C.At(TomlToken::RBracket) == true)
      {
	 C.Advance();
	 return true;
      }
      return SyntaxError(C.Peek(), _("Expected right bracket"));
   }
}
									/*}}}*/
// TomlParser::ParseInlineTable - '{' key=value, key=value '}'		/*{{{*/
bool TomlParser::ParseInlineTable(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Table) const
{
   if (Debug == true)
      std::clog << "Inline table " << Table->FullTag() << std::endl;
   C.Advance();
   C.SkipWhitespace();
   if (C.At(TomlToken::RBrace) == true)
   {
      C.Advance();
      return true;
   }

   while (true)
   {
      std::string Key;
      if (ParseBareRun(C, Key) == false)
	 return SyntaxError(C.Peek(), _("Expected key"));
      C.SkipWhitespace();
      if (C.At(TomlToken::Equal) == false)
	 return SyntaxError(C.Peek(), _("Expected equal sign"));
      C.Advance();
      if (ParseValue(C, Doc, Table, NormalizeKey(Key)) == false)
	 return false;

      C.SkipWhitespace();
      if (C.At(TomlToken::Comma) == true)
      {
	 TomlToken const &Comma = C.Advance();
	 C.SkipWhitespace();
	 if (C.At(TomlToken::RBrace) == true)
	    return SyntaxError(Comma, _("Unexpected comma"));
	 continue;
      }
      if (C.At(TomlToken::RBrace) == true)
      {
	 C.Advance();
	 return true;
      }
      return SyntaxError(C.Peek(), _("Expected right brace"));
   }
}
									/*}}}*/
// TomlParser::ParseSection - '[' name ']' starts a new section		/*{{{*/
bool TomlParser::ParseSection(Cursor &C, TomlDocument &Doc, TomlDocument::Item *&Current) const
{
   C.Advance();
   C.SkipSpaces();
   std::string Name;
   if (ParseBareRun(C, Name) == false)
      return SyntaxError(C.Peek(), _("Expected section name"));
   C.SkipSpaces();
   if (C.At(TomlToken::RBracket) == false)
      return SyntaxError(C.Peek(), _("Expected right bracket"));
   C.Advance();

   if (Debug == true)
      std::clog << "Section [" << Name << "]" << std::endl;
   Current = Doc.Assign(Doc.RootItem(), Name, TomlDocument::Table);
   return Current != nullptr;
}
									/*}}}*/
// TomlParser::ParseKeyValue - key '=' value in the current section	/*{{{*/
bool TomlParser::ParseKeyValue(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Table) const
{
   TomlToken const &Start = C.Peek();
   std::string Key;
   ParseBareRun(C, Key);
   if (Table == nullptr)
      return SyntaxError(Start, _("Key-value pair outside of a section"));

   C.SkipWhitespace();
   if (C.At(TomlToken::Equal) == false)
      return SyntaxError(C.Peek(), _("Expected equal sign"));
   C.Advance();

   Key = NormalizeKey(Key);
   if (Debug == true)
      std::clog << "Key " << Table->Tag << "::" << Key << std::endl;
   return ParseValue(C, Doc, Table, Key);
}
									/*}}}*/
// TomlParser::Parse - Parse a complete token sequence			/*{{{*/
bool TomlParser::Parse(std::vector<TomlToken> const &Tokens, TomlDocument &Doc) const
{
   TomlDocument Scratch;
   TomlDocument::Item *Current = nullptr;
   Cursor C(Tokens);

   while (true)
   {
      C.SkipWhitespace();
      TomlToken const &Tok = C.Peek();
      switch (Tok.Type)
      {
	 case TomlToken::Eof:
	    Doc.Swap(Scratch);
	    return true;
	 case TomlToken::LBracket:
	    if (ParseSection(C, Scratch, Current) == false)
	       return false;
	    continue;
	 case TomlToken::Char:
	    if (ParseKeyValue(C, Scratch, Current) == false)
	       return false;
	    continue;
	 case TomlToken::Comment:
	    while (C.At(TomlToken::Newline) == false && C.At(TomlToken::Eof) == false)
	       C.Advance();
	    continue;
	 case TomlToken::Equal:
	 case TomlToken::RBracket:
	 case TomlToken::LBrace:
	 case TomlToken::RBrace:
	 case TomlToken::Quote:
	 case TomlToken::Comma:
	 case TomlToken::Newline:
	 case TomlToken::CarriageReturn:
	 case TomlToken::Space:
	    break;
      }
      return UnexpectedToken(Tok);
   }
}
									/*}}}*/
// ParseTomlFile - Read a file into a document				/*{{{*/
bool ParseTomlFile(std::string const &FileName, TomlDocument &Doc, bool const Debug)
{
   std::vector<TomlToken> Tokens;
   if (TomlTokenizer(Debug).TokenizeFile(FileName, Tokens) == false)
      return false;
   return TomlParser(FileName, Debug).Parse(Tokens, Doc);
}
									/*}}}*/
// ParseTomlString - Read an in-memory text into a document		/*{{{*/
bool ParseTomlString(std::string const &Text, TomlDocument &Doc,
		     std::string const &Source, bool const Debug)
{
   std::vector<TomlToken> Tokens;
   TomlTokenizer(Debug).TokenizeString(Text, Tokens);
   return TomlParser(Source, Debug).Parse(Tokens, Doc);
}
									/*}}}*/
