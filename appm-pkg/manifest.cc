// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Application Manifest - the pyapp.toml file of an application

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/appmconfiguration.h>
#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/manifest.h>
#include <appm-pkg/strutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>
#include <appm-pkg/tomlwriter.h>

#include <string>

#include <appmi18n.h>
									/*}}}*/

// LoadAppManifest - Read a manifest file				/*{{{*/
bool LoadAppManifest(std::string const &FileName, TomlDocument &Doc, bool const Debug)
{
   if (RealFileExists(FileName) == false)
      return _error->Error(_("File not found: %s"), FileName.c_str());
   return ParseTomlFile(FileName, Doc, Debug);
}
									/*}}}*/
// SaveAppManifest - Write a manifest file				/*{{{*/
bool SaveAppManifest(TomlDocument const &Doc, std::string const &FileName)
{
   return WriteTomlFile(Doc, FileName);
}
									/*}}}*/
// NewAppManifest - Content of a manifest for a new application		/*{{{*/
bool NewAppManifest(TomlDocument &Doc, std::string const &AppName,
		    AppmConfiguration const &Config)
{
   if (AppName.empty() == true)
      return _error->Error(_("Application name can not be empty"));

   TomlDocument Tmp;
   TomlDocument::Item * const Tools = Tmp.EnsureTable("tools");
   if (Tmp.Assign(Tools, "env_create_tool", TomlDocument::String, Config.EnvCreateTool) == nullptr ||
       Tmp.Assign(Tools, "env_activate_tool", TomlDocument::String, Config.EnvActivateTool) == nullptr ||
       Tmp.Assign(Tools, "env_deactivate_tool", TomlDocument::String, Config.EnvDeactivateTool) == nullptr ||
       Tmp.Assign(Tools, "env_name", TomlDocument::String, Config.DefaultEnvName) == nullptr ||
       Tmp.Assign(Tools, "env_lib_installer", TomlDocument::String, Config.EnvLibInstallerTool) == nullptr)
      return false;

   TomlDocument::Item * const Project = Tmp.EnsureTable("project");
   if (Tmp.Assign(Project, "name", TomlDocument::String, AppName) == nullptr ||
       Tmp.Assign(Project, "version", TomlDocument::String, Config.DefaultAppVersion) == nullptr ||
       Tmp.Assign(Project, "readme", TomlDocument::String, "README.md") == nullptr ||
       Tmp.Assign(Project, "license", TomlDocument::String, "LICENSE.txt") == nullptr ||
       Tmp.Assign(Project, "description", TomlDocument::String, "") == nullptr)
      return false;

   TomlDocument::Item * const Authors = Tmp.Assign(Project, "authors", TomlDocument::List);
   for (auto const &A : Config.Authors)
   {
      TomlDocument::Item * const T = Tmp.Append(Authors, TomlDocument::Table);
      if (Tmp.Assign(T, "name", TomlDocument::String, A.Name) == nullptr ||
	  Tmp.Assign(T, "email", TomlDocument::String, A.Email) == nullptr)
	 return false;
   }

   if (Tmp.Assign(Project, "requires_python", TomlDocument::String, Config.RequiresPython) == nullptr ||
       Tmp.Assign(Project, "type", TomlDocument::String, "application") == nullptr)
      return false;

   // default dependencies are managed like the ones added later on
   TomlDocument::Item * const Deps = Tmp.Assign(Project, "dependencies", TomlDocument::List);
   for (auto const &D : Config.Dependencies)
   {
      TomlDocument::Item * const T = Tmp.Append(Deps, TomlDocument::Table);
      if (Tmp.Assign(T, "name", TomlDocument::String, D) == nullptr ||
	  Tmp.Assign(T, "new_packages", TomlDocument::List) == nullptr)
	 return false;
   }

   std::string const Key = TomlParser::NormalizeKey(AppName);
   if (Tmp.Set("executable::" + Key, AppName + ":run") == nullptr)
      return false;

   Doc.Swap(Tmp);
   return true;
}
									/*}}}*/
// CreateAppManifest - Write the manifest of a new application		/*{{{*/
bool CreateAppManifest(std::string const &FileName, std::string const &AppName,
		       AppmConfiguration const &Config)
{
   if (FileExists(FileName) == true)
      return _error->Error(_("File %s already exists"), FileName.c_str());

   TomlDocument Doc;
   if (NewAppManifest(Doc, AppName, Config) == false)
      return false;
   return WriteTomlFile(Doc, FileName);
}
									/*}}}*/
// FindAppManifest - Search the manifest upwards from a directory	/*{{{*/
bool FindAppManifest(std::string const &StartDir, std::string const &FileName,
		     std::string &Found)
{
   std::string Dir = flAbsPath(StartDir);
   if (Dir.empty() == true)
      return false;
   while (Dir.length() > 1 && Dir.back() == '/')
      Dir.erase(Dir.length() - 1);

   std::string Home = GetHomeDir();
   while (Home.length() > 1 && Home.back() == '/')
      Home.erase(Home.length() - 1);

   while (true)
   {
      std::string const File = flCombine(Dir, FileName);
      if (RealFileExists(File) == true)
      {
	 Found = File;
	 return true;
      }
      if (Dir == "/" || Dir == Home)
	 return false;

      std::string::size_type const Slash = Dir.rfind('/');
      if (Slash == std::string::npos)
	 return false;
      Dir.erase(Slash == 0 ? 1 : Slash);
   }
}
									/*}}}*/
