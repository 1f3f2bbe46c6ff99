// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Application Manager Configuration - settings of the tool itself

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/appmconfiguration.h>
#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>
#include <appm-pkg/tomlwriter.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <appmi18n.h>
									/*}}}*/

char const * const AppmConfiguration::SectionName = "pyappm";

namespace APPM {
std::string DefaultConfigFile()
{
   return flCombine(GetHomeDir(), ".config/pyappm/pyappmconfig.toml");
}
std::string ManifestFileName()
{
   return "pyapp.toml";
}
}

// AppmConfiguration::AppmConfiguration - Constructor with defaults	/*{{{*/
AppmConfiguration::AppmConfiguration() :
   TempDir(flCombine(GetTempDir(), "pyappm")), EnvCreateTool("python3 -m venv"),
   EnvActivateTool("source bin/activate"), EnvDeactivateTool("deactivate"),
   DefaultEnvName("env"), DefaultAppType("application"),
   DefaultMainFunction("main"), EnvLibInstallerTool("pip3 install"),
   RequiresPython(">=3.10"), DefaultAppVersion("0.1.0"),
   CreateVenv(true), CreateLicense(true), CreateReadme(true),
   CreateChangelog(true), CreateAbout(true), CreateInit(false),
   CreateTyped(false), CreateGitignore(false), RunGitInit(false),
   DebugParser(false)
{
}
									/*}}}*/
// AppmConfiguration::NewApplication - Record prefilled with defaults	/*{{{*/
AppmApplication AppmConfiguration::NewApplication(std::string const &Name) const
{
   AppmApplication App;
   App.Name = Name;
   App.Version = DefaultAppVersion;
   App.ReadmeFile = "README.md";
   App.LicenseFile = "LICENSE.txt";
   App.AppType = DefaultAppType;
   App.Function = DefaultMainFunction;
   return App;
}
									/*}}}*/
// AppmConfiguration::FromDocument - Take the settings from a document	/*{{{*/
// ---------------------------------------------------------------------
/* Keys missing in the document keep their current value. */
bool AppmConfiguration::FromDocument(TomlDocument const &Doc, std::string const &Source)
{
   std::string const S = std::string(SectionName) + "::";
   if (Doc.Exists(SectionName) == false || Doc.Find(SectionName)->Type != TomlDocument::Table)
      return _error->Error(_("Configuration file %s is invalid"), Source.c_str());

   TempDir = Doc.FindS(S + "temp_dir", TempDir);
   EnvCreateTool = Doc.FindS(S + "env_create_tool", EnvCreateTool);
   EnvActivateTool = Doc.FindS(S + "env_activate_tool", EnvActivateTool);
   EnvDeactivateTool = Doc.FindS(S + "env_deactivate_tool", EnvDeactivateTool);
   DefaultEnvName = Doc.FindS(S + "default_env_name", DefaultEnvName);
   DefaultAppType = Doc.FindS(S + "default_app_type", DefaultAppType);
   DefaultMainFunction = Doc.FindS(S + "default_main_function", DefaultMainFunction);
   EnvLibInstallerTool = Doc.FindS(S + "env_lib_installer_tool", EnvLibInstallerTool);
   RequiresPython = Doc.FindS(S + "requires_python", RequiresPython);
   DefaultAppVersion = Doc.FindS(S + "default_app_version", DefaultAppVersion);

   if (Doc.Exists(S + "dependencies") == true)
      Dependencies = Doc.FindVector(S + "dependencies");

   TomlDocument::Item const * const A = Doc.Find(S + "authors");
   if (A != nullptr && A->Type == TomlDocument::List)
   {
      Authors.clear();
      for (auto I = A->Child; I != nullptr; I = I->Next)
      {
	 if (I->Type != TomlDocument::Table)
	 {
	    _error->Warning(_("Ignoring author entry %s in %s as it is not a table"),
		  I->FullTag().c_str(), Source.c_str());
	    continue;
	 }
	 std::string const Prefix = I->FullTag() + "::";
	 Authors.push_back({Doc.FindS(Prefix + "name"), Doc.FindS(Prefix + "email")});
      }
   }

   CreateVenv = Doc.FindB(S + "create_venv", CreateVenv);
   CreateLicense = Doc.FindB(S + "create_license", CreateLicense);
   CreateReadme = Doc.FindB(S + "create_readme", CreateReadme);
   CreateChangelog = Doc.FindB(S + "create_changelog", CreateChangelog);
   CreateAbout = Doc.FindB(S + "create_about", CreateAbout);
   CreateInit = Doc.FindB(S + "create_init", CreateInit);
   CreateTyped = Doc.FindB(S + "create_typed", CreateTyped);
   CreateGitignore = Doc.FindB(S + "create_gitignore", CreateGitignore);
   RunGitInit = Doc.FindB(S + "run_git_init", RunGitInit);
   DebugParser = Doc.FindB(S + "debug_parser", DebugParser);

   Applications.clear();
   for (auto const &Section : Doc.Keys())
   {
      if (Section == SectionName)
	 continue;
      std::string const P = Section + "::";
      AppmApplication App = NewApplication(Doc.FindS(P + "name", Section));
      App.Version = Doc.FindS(P + "version", App.Version);
      App.Description = Doc.FindS(P + "description");
      App.ReadmeFile = Doc.FindS(P + "readme_file", App.ReadmeFile);
      App.License = Doc.FindS(P + "license");
      App.LicenseFile = Doc.FindS(P + "license_file", App.LicenseFile);
      App.Copyright = Doc.FindS(P + "copyright");
      App.Author = Doc.FindS(P + "author");
      App.AppType = Doc.FindS(P + "app_type", App.AppType);
      App.Module = Doc.FindS(P + "module");
      App.Function = Doc.FindS(P + "function", App.Function);
      App.Dependencies = Doc.FindVector(P + "dependencies");
      Applications.push_back(std::move(App));
   }
   return true;
}
									/*}}}*/
// AppmConfiguration::ToDocument - Store the settings in a document	/*{{{*/
bool AppmConfiguration::ToDocument(TomlDocument &Doc) const
{
   TomlDocument Tmp;
   TomlDocument::Item * const Cfg = Tmp.EnsureTable(SectionName);
   if (Cfg == nullptr)
      return false;

   auto const SetS = [&](char const * const Key, std::string const &Value) {
      return Tmp.Assign(Cfg, Key, TomlDocument::String, Value) != nullptr;
   };
   auto const SetB = [&](char const * const Key, bool const Value) {
      return Tmp.Assign(Cfg, Key, TomlDocument::Bare, Value ? "True" : "False") != nullptr;
   };

   bool Res = SetS("temp_dir", TempDir) &&
      SetS("env_create_tool", EnvCreateTool) &&
      SetS("env_activate_tool", EnvActivateTool) &&
      SetS("env_deactivate_tool", EnvDeactivateTool) &&
      SetS("default_env_name", DefaultEnvName) &&
      SetS("default_app_type", DefaultAppType) &&
      SetS("default_main_function", DefaultMainFunction) &&
      SetS("env_lib_installer_tool", EnvLibInstallerTool) &&
      SetS("requires_python", RequiresPython) &&
      SetS("default_app_version", DefaultAppVersion);
   if (Res == false)
      return false;

   TomlDocument::Item * const A = Tmp.Assign(Cfg, "authors", TomlDocument::List);
   for (auto const &Author : Authors)
   {
      TomlDocument::Item * const T = Tmp.Append(A, TomlDocument::Table);
      if (Tmp.Assign(T, "name", TomlDocument::String, Author.Name) == nullptr ||
	  Tmp.Assign(T, "email", TomlDocument::String, Author.Email) == nullptr)
	 return false;
   }

   Res = SetB("create_venv", CreateVenv) &&
      SetB("create_license", CreateLicense) &&
      SetB("create_readme", CreateReadme) &&
      SetB("create_changelog", CreateChangelog) &&
      SetB("create_about", CreateAbout) &&
      SetB("create_init", CreateInit) &&
      SetB("create_typed", CreateTyped) &&
      SetB("create_gitignore", CreateGitignore) &&
      SetB("run_git_init", RunGitInit);
   if (Res == false)
      return false;
   if (DebugParser == true && SetB("debug_parser", DebugParser) == false)
      return false;
   if (Tmp.SetList(std::string(SectionName) + "::dependencies", Dependencies) == nullptr)
      return false;

   for (auto const &App : Applications)
   {
      if (App.Name == SectionName)
	 return _error->Error(_("Application name %s is reserved"), App.Name.c_str());
      TomlDocument::Item * const T = Tmp.Assign(Tmp.RootItem(), App.Name, TomlDocument::Table);
      if (T == nullptr)
	 return false;
      std::pair<char const *, std::string const *> const Fields[] = {
	 {"name", &App.Name},
	 {"version", &App.Version},
	 {"description", &App.Description},
	 {"readme_file", &App.ReadmeFile},
	 {"license", &App.License},
	 {"license_file", &App.LicenseFile},
	 {"copyright", &App.Copyright},
	 {"author", &App.Author},
      };
      for (auto const &F : Fields)
	 if (Tmp.Assign(T, F.first, TomlDocument::String, *F.second) == nullptr)
	    return false;
      TomlDocument::Item * const D = Tmp.Assign(T, "dependencies", TomlDocument::List);
      for (auto const &Dep : App.Dependencies)
	 if (Tmp.Append(D, TomlDocument::String, Dep) == nullptr)
	    return false;
      if (Tmp.Assign(T, "app_type", TomlDocument::String, App.AppType) == nullptr ||
	  Tmp.Assign(T, "module", TomlDocument::String, App.Module) == nullptr ||
	  Tmp.Assign(T, "function", TomlDocument::String, App.Function) == nullptr)
	 return false;
   }

   Doc.Swap(Tmp);
   return true;
}
									/*}}}*/
// AppmConfiguration::Load - Read the configuration file		/*{{{*/
bool AppmConfiguration::Load(std::string const &FileName, bool const CreateIfMissing)
{
   if (RealFileExists(FileName) == false)
   {
      if (CreateIfMissing == false)
	 return _error->Error(_("Configuration file not found: %s"), FileName.c_str());

      std::string const Dir = flNotFile(FileName);
      if (DirectoryExists(Dir) == false)
      {
	 std::string const Abs = Dir[0] == '/' ? Dir : SafeGetCWD() + Dir;
	 if (CreateDirectory("/", Abs) == false)
	    return _error->Error(_("Unable to create directory %s"), Abs.c_str());
      }
      _error->Notice(_("Creating default configuration %s"), FileName.c_str());
      return Save(FileName);
   }

   TomlDocument Doc;
   if (ParseTomlFile(FileName, Doc, DebugParser) == false)
      return false;
   return FromDocument(Doc, FileName);
}
									/*}}}*/
// AppmConfiguration::Save - Write the configuration file		/*{{{*/
bool AppmConfiguration::Save(std::string const &FileName) const
{
   TomlDocument Doc;
   if (ToDocument(Doc) == false)
      return false;
   return WriteTomlFile(Doc, FileName);
}
									/*}}}*/
// AppmConfiguration::FindApplication - Tracked application by name	/*{{{*/
AppmApplication *AppmConfiguration::FindApplication(std::string const &Name)
{
   auto const A = std::find_if(Applications.begin(), Applications.end(),
			       [&Name](AppmApplication const &App) { return App.Name == Name; });
   if (A == Applications.end())
      return nullptr;
   return &(*A);
}
									/*}}}*/
// AppmConfiguration::AddApplication - Start tracking an application	/*{{{*/
bool AppmConfiguration::AddApplication(AppmApplication const &App)
{
   if (App.Name.empty() == true || App.Name == SectionName)
      return _error->Error(_("Invalid application name '%s'"), App.Name.c_str());
   if (FindApplication(App.Name) != nullptr)
      return _error->Error(_("Application %s is already registered"), App.Name.c_str());
   Applications.push_back(App);
   return true;
}
									/*}}}*/
// AppmConfiguration::RemoveApplication - Stop tracking an application	/*{{{*/
bool AppmConfiguration::RemoveApplication(std::string const &Name)
{
   auto const Old = Applications.size();
   Applications.erase(std::remove_if(Applications.begin(), Applications.end(),
				     [&Name](AppmApplication const &App) { return App.Name == Name; }),
		      Applications.end());
   if (Old == Applications.size())
      return _error->Error(_("Application %s is not registered"), Name.c_str());
   return true;
}
									/*}}}*/
