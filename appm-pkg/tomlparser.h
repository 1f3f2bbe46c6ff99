// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Parser - recursive descent parser for manifest files

   The accepted grammar, on the tokens of TomlTokenizer:

     document      := ( section | key_value | comment )*
     section       := '[' bare_run ']'
     key_value     := bare_run '=' value
     value         := string | bare_run | list | inline_table
     list          := '[' ( value ( ',' value )* )? ']'
     inline_table  := '{' ( bare_run '=' value ( ',' bare_run '=' value )* )? '}'
     string        := '"' ... '"' | '\'' ... '\''
     bare_run      := Char+

   Whitespace and newlines may appear between all elements, but not
   inside a bare_run. A string ends at the next quote of the kind which
   opened it; there are no escape sequences. Keys have '-' replaced by
   '_' and every key-value pair has to belong to a section.

   Parsing stops at the first error, the target document is only
   replaced if the whole input was parsed.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_TOMLPARSER_H
#define APPMLIB_TOMLPARSER_H

#include <appm-pkg/macros.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomltokenizer.h>

#include <string>
#include <utility>
#include <vector>

class APPM_PUBLIC TomlParser
{
   public:

   // position in the token sequence shared by all grammar rules
   struct Cursor
   {
      std::vector<TomlToken> const &Tokens;
      size_t Pos;

      TomlToken const &Peek() const;
      TomlToken const &Advance();
      inline bool At(TomlToken::TokenType const Type) const { return Peek().Type == Type; };
      void SkipSpaces();
      void SkipWhitespace();

      explicit Cursor(std::vector<TomlToken> const &Tokens) : Tokens(Tokens), Pos(0) {};
   };

   private:
   std::string Source;
   bool Debug;

   APPM_HIDDEN bool SyntaxError(TomlToken const &Tok, std::string const &What) const APPM_COLD;
   APPM_HIDDEN bool UnexpectedToken(TomlToken const &Tok) const APPM_COLD;

   APPM_HIDDEN bool ParseSection(Cursor &C, TomlDocument &Doc, TomlDocument::Item *&Current) const;
   APPM_HIDDEN bool ParseKeyValue(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Table) const;
   APPM_HIDDEN bool ParseValue(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Parent,
			       std::string const &Key) const;
   APPM_HIDDEN bool ParseList(Cursor &C, TomlDocument &Doc, TomlDocument::Item *List) const;
   APPM_HIDDEN bool ParseInlineTable(Cursor &C, TomlDocument &Doc, TomlDocument::Item *Table) const;
   APPM_HIDDEN bool ParseString(Cursor &C, std::string &Value) const;
   APPM_HIDDEN bool ParseBareRun(Cursor &C, std::string &Value) const;

   public:

   /** \brief turn '-' into '_' as done for every key read from a file */
   static std::string NormalizeKey(std::string Key);

   /** \brief parse the tokens into Doc
    *
    *  \return \b false with a syntax error on _error, Doc is untouched
    *  in that case
    */
   bool Parse(std::vector<TomlToken> const &Tokens, TomlDocument &Doc) const;

   /** \param Source name of the input used in error messages */
   explicit TomlParser(std::string Source = "<string>", bool const Debug = false) :
      Source(std::move(Source)), Debug(Debug) {};
};

/** \brief tokenize and parse a file, I/O errors are reported as is */
APPM_PUBLIC bool ParseTomlFile(std::string const &FileName, TomlDocument &Doc, bool const Debug = false);
APPM_PUBLIC bool ParseTomlString(std::string const &Text, TomlDocument &Doc,
				 std::string const &Source = "<string>", bool const Debug = false);

#endif
