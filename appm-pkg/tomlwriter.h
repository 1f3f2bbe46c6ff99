// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Writer - format a TomlDocument in the grammar of TomlParser

   Each top-level table is written as a [section] followed by one
   key=value line per entry; sections are separated by a blank line.
   Nested tables are written inline as {k=v, k=v}, lists as [v, v].
   Strings are quoted with '"', or with '\'' if they contain a '"'.

   The complete text is formatted before anything is written, and files
   are replaced atomically, so a document which can not be represented
   never leaves a partial file behind.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_TOMLWRITER_H
#define APPMLIB_TOMLWRITER_H

#include <appm-pkg/macros.h>
#include <appm-pkg/tomldocument.h>

#include <string>
#include <utility>

class APPM_PUBLIC TomlWriter
{
   std::string Destination;

   APPM_HIDDEN bool TypeError(TomlDocument::Item const *Itm, std::string const &What) const APPM_COLD;
   APPM_HIDDEN bool WriteKey(std::string &Out, TomlDocument::Item const *Itm) const;
   APPM_HIDDEN bool WriteValue(std::string &Out, TomlDocument::Item const *Itm) const;

   public:
   /** \brief can Text be written without quotes and read back as is? */
   static bool IsBareRun(std::string const &Text) APPM_PURE;

   /** \brief format Doc
    *
    *  \param[out] Out replaced by the text on success, untouched otherwise
    *  \return \b false with a type error on _error if Doc can't be
    *  represented
    */
   bool Write(TomlDocument const &Doc, std::string &Out) const;

   /** \param Destination name of the output used in error messages */
   explicit TomlWriter(std::string Destination = "<string>") : Destination(std::move(Destination)) {};
};

/** \brief format Doc and atomically replace FileName with it
 *
 *  A FileName ending in ".gz" is written gzip compressed.
 */
APPM_PUBLIC bool WriteTomlFile(TomlDocument const &Doc, std::string const &FileName);
APPM_PUBLIC bool WriteTomlString(TomlDocument const &Doc, std::string &Out);

#endif
