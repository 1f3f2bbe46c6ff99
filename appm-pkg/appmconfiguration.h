// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Application Manager Configuration - settings of the tool itself

   The settings live in the [pyappm] section of the configuration file.
   Every other section of the file describes one application tracked by
   the manager, named after the section.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_APPMCONFIGURATION_H
#define APPMLIB_APPMCONFIGURATION_H

#include <appm-pkg/macros.h>

#include <string>
#include <vector>

class TomlDocument;

namespace APPM {
   /** \brief ~/.config/pyappm/pyappmconfig.toml */
   APPM_PUBLIC std::string DefaultConfigFile();
   /** \brief file name of an application manifest: pyapp.toml */
   APPM_PUBLIC std::string ManifestFileName();
}

struct APPM_PUBLIC AppmAuthor
{
   std::string Name;
   std::string Email;
};

struct APPM_PUBLIC AppmApplication
{
   std::string Name;
   std::string Version;
   std::string Description;
   std::string ReadmeFile;
   std::string License;
   std::string LicenseFile;
   std::string Copyright;
   std::string Author;
   std::string AppType;
   std::string Module;
   std::string Function;
   std::vector<std::string> Dependencies;
};

class APPM_PUBLIC AppmConfiguration
{
   public:
   // name of the section holding the settings of the tool
   static char const * const SectionName;

   std::string TempDir;
   std::string EnvCreateTool;
   std::string EnvActivateTool;
   std::string EnvDeactivateTool;
   std::string DefaultEnvName;
   std::string DefaultAppType;
   std::string DefaultMainFunction;
   std::string EnvLibInstallerTool;
   std::string RequiresPython;
   std::string DefaultAppVersion;
   std::vector<AppmAuthor> Authors;
   std::vector<std::string> Dependencies;

   bool CreateVenv;
   bool CreateLicense;
   bool CreateReadme;
   bool CreateChangelog;
   bool CreateAbout;
   bool CreateInit;
   bool CreateTyped;
   bool CreateGitignore;
   bool RunGitInit;
   bool DebugParser;

   std::vector<AppmApplication> Applications;

   /** \brief read the configuration file
    *
    *  \param CreateIfMissing write the defaults to FileName if it does
    *  not exist yet instead of failing
    */
   bool Load(std::string const &FileName, bool const CreateIfMissing = false);
   bool Save(std::string const &FileName) const;

   bool FromDocument(TomlDocument const &Doc, std::string const &Source);
   bool ToDocument(TomlDocument &Doc) const;

   AppmApplication *FindApplication(std::string const &Name);
   bool AddApplication(AppmApplication const &App);
   bool RemoveApplication(std::string const &Name);
   /** \brief a record for Name filled in from the defaults */
   AppmApplication NewApplication(std::string const &Name) const;

   AppmConfiguration();
};

#endif
