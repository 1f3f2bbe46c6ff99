// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Tokenizer - split a manifest or configuration file into tokens

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/tomltokenizer.h>

#include <iostream>
#include <string>
#include <vector>

#include <appmi18n.h>
									/*}}}*/

// TomlTokenTypeName - Human readable name of a token type		/*{{{*/
char const *TomlTokenTypeName(TomlToken::TokenType const Type)
{
   switch (Type)
   {
      case TomlToken::Equal: return "Equal";
      case TomlToken::LBracket: return "LBracket";
      case TomlToken::RBracket: return "RBracket";
      case TomlToken::LBrace: return "LBrace";
      case TomlToken::RBrace: return "RBrace";
      case TomlToken::Quote: return "Quote";
      case TomlToken::Comma: return "Comma";
      case TomlToken::Comment: return "Comment";
      case TomlToken::Newline: return "Newline";
      case TomlToken::CarriageReturn: return "CarriageReturn";
      case TomlToken::Space: return "Space";
      case TomlToken::Char: return "Char";
      case TomlToken::Eof: return "Eof";
   }
   return "Unknown";
}
									/*}}}*/
// TomlTokenizer::Classify - Token type of a single character		/*{{{*/
TomlToken::TokenType TomlTokenizer::Classify(char const C)
{
   switch (C)
   {
      case '=': return TomlToken::Equal;
      case '[': return TomlToken::LBracket;
      case ']': return TomlToken::RBracket;
      case '{': return TomlToken::LBrace;
      case '}': return TomlToken::RBrace;
      case '"':
      case '\'': return TomlToken::Quote;
      case ',': return TomlToken::Comma;
      case '#': return TomlToken::Comment;
      case '\n': return TomlToken::Newline;
      case '\r': return TomlToken::CarriageReturn;
      case ' ':
      case '\t': return TomlToken::Space;
   }
   return TomlToken::Char;
}
									/*}}}*/
// TomlTokenizer::TokenizeLine - Tokens of one line without its newline	/*{{{*/
void TomlTokenizer::TokenizeLine(std::string const &Text, unsigned int const LineNo,
				 std::vector<TomlToken> &Tokens) const
{
   if (Text.empty() == false && Text[0] == '#')
   {
      if (Debug == true)
	 std::clog << "Skip comment line " << LineNo << std::endl;
      return;
   }

   unsigned int Column = 0;
   for (char const C : Text)
      Tokens.emplace_back(Classify(C), C, LineNo, ++Column);
   Tokens.emplace_back(TomlToken::Newline, '\n', LineNo, ++Column);
}
									/*}}}*/
// TomlTokenizer::TokenizeString - Tokenize an in-memory document	/*{{{*/
void TomlTokenizer::TokenizeString(std::string const &Text, std::vector<TomlToken> &Tokens) const
{
   std::vector<TomlToken> Result;
   unsigned int LineNo = 0;
   std::string::size_type Start = 0;
   while (Start < Text.length())
   {
      std::string::size_type End = Text.find('\n', Start);
      if (End == std::string::npos)
	 End = Text.length();
      TokenizeLine(Text.substr(Start, End - Start), ++LineNo, Result);
      Start = End + 1;
   }
   Result.emplace_back(TomlToken::Eof, '\0', LineNo + 1, 1);

   if (Debug == true)
      std::clog << "Tokenized " << LineNo << " lines into " << Result.size() << " tokens" << std::endl;
   Tokens.swap(Result);
}
									/*}}}*/
// TomlTokenizer::TokenizeFile - Tokenize a file line by line		/*{{{*/
bool TomlTokenizer::TokenizeFile(std::string const &FileName, std::vector<TomlToken> &Tokens) const
{
   FileFd Fd;
   if (Fd.Open(FileName, FileFd::ReadOnly, FileFd::Extension) == false)
      return false;
   return TokenizeFile(Fd, Tokens);
}
bool TomlTokenizer::TokenizeFile(FileFd &Fd, std::vector<TomlToken> &Tokens) const
{
   if (Fd.IsOpen() == false || Fd.Failed() == true)
      return _error->Error(_("Can't read from %s as it is not open"), Fd.Name().c_str());

   std::vector<TomlToken> Result;
   unsigned int LineNo = 0;
   std::string Line;
   while (Fd.ReadLine(Line) == true)
      TokenizeLine(Line, ++LineNo, Result);
   if (Fd.Failed() == true)
      return false;
   Result.emplace_back(TomlToken::Eof, '\0', LineNo + 1, 1);

   if (Debug == true)
      std::clog << "Tokenized " << LineNo << " lines of " << Fd.Name() << " into "
		<< Result.size() << " tokens" << std::endl;
   Tokens.swap(Result);
   return true;
}
									/*}}}*/
