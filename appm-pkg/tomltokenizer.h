// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Tokenizer - split a manifest or configuration file into tokens

   Every character of the input becomes exactly one token, classified by
   the role it can play in the grammar. Lines starting with '#' are
   comments and produce no tokens at all. Each line is followed by a
   Newline token and the sequence is terminated by a single Eof token.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_TOMLTOKENIZER_H
#define APPMLIB_TOMLTOKENIZER_H

#include <appm-pkg/macros.h>

#include <string>
#include <vector>

class FileFd;

struct APPM_PUBLIC TomlToken
{
   enum TokenType
   {
      Equal,
      LBracket,
      RBracket,
      LBrace,
      RBrace,
      Quote,
      Comma,
      Comment,
      Newline,
      CarriageReturn,
      Space,
      Char,
      Eof
   };

   TokenType Type;
   char Value;
   // 1-based position in the input
   unsigned int Line;
   unsigned int Column;

   TomlToken(TokenType const Type, char const Value, unsigned int const Line, unsigned int const Column) :
      Type(Type), Value(Value), Line(Line), Column(Column) {};
};

APPM_PUBLIC char const *TomlTokenTypeName(TomlToken::TokenType const Type);

class APPM_PUBLIC TomlTokenizer
{
   bool Debug;

   APPM_HIDDEN void TokenizeLine(std::string const &Text, unsigned int const LineNo,
				 std::vector<TomlToken> &Tokens) const;

   public:
   static TomlToken::TokenType Classify(char const C) APPM_PURE;

   /** \brief tokenize a complete file
    *
    *  A ".gz" file is decompressed while reading.
    *
    *  \param FileName file to read
    *  \param[out] Tokens replaced by the tokens of the file on success,
    *  untouched on failure
    *  \return \b false with an I/O error on _error if the file could not
    *  be opened or read
    */
   bool TokenizeFile(std::string const &FileName, std::vector<TomlToken> &Tokens) const;
   bool TokenizeFile(FileFd &Fd, std::vector<TomlToken> &Tokens) const;
   void TokenizeString(std::string const &Text, std::vector<TomlToken> &Tokens) const;

   explicit TomlTokenizer(bool const Debug = false) : Debug(Debug) {};
};

#endif
