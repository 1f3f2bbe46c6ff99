// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Application Manifest - the pyapp.toml file of an application

   A manifest has three sections:
     [tools]       commands used to manage the environment of the app
     [project]     name, version, authors and dependencies
     [executable]  entry points as name = "module:function"

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_MANIFEST_H
#define APPMLIB_MANIFEST_H

#include <appm-pkg/macros.h>

#include <string>

class AppmConfiguration;
class TomlDocument;

/** \brief read the manifest FileName into Doc
 *
 *  \param Debug trace tokenizer and parser on std::clog
 *  \return \b false with an error on _error if the file is missing or
 *  not valid, Doc is untouched in that case
 */
APPM_PUBLIC bool LoadAppManifest(std::string const &FileName, TomlDocument &Doc, bool const Debug = false);
APPM_PUBLIC bool SaveAppManifest(TomlDocument const &Doc, std::string const &FileName);

/** \brief write a new manifest for the application AppName
 *
 *  The values are taken from the defaults in Config. An existing file
 *  is never overwritten.
 */
APPM_PUBLIC bool CreateAppManifest(std::string const &FileName, std::string const &AppName,
				   AppmConfiguration const &Config);
/** \brief fill Doc with the content of a new manifest for AppName */
APPM_PUBLIC bool NewAppManifest(TomlDocument &Doc, std::string const &AppName,
				AppmConfiguration const &Config);

/** \brief search FileName in StartDir and its parents
 *
 *  The search ends at the home directory of the user or at /.
 *
 *  \param[out] Found full path of the file if one was found
 *  \return \b true if the file was found, not finding it is no error
 */
APPM_PUBLIC bool FindAppManifest(std::string const &StartDir, std::string const &FileName,
				 std::string &Found);

#endif
