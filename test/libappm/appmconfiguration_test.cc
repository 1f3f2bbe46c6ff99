#include <config.h>

#include <appm-pkg/appmconfiguration.h>
#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>

#include <string>
#include <stdlib.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(AppmConfigurationTest,Defaults)
{
   AppmConfiguration Cnf;
   EXPECT_EQ(flCombine(GetTempDir(), "pyappm"), Cnf.TempDir);
   EXPECT_EQ("python3 -m venv", Cnf.EnvCreateTool);
   EXPECT_EQ("source bin/activate", Cnf.EnvActivateTool);
   EXPECT_EQ("deactivate", Cnf.EnvDeactivateTool);
   EXPECT_EQ("env", Cnf.DefaultEnvName);
   EXPECT_EQ("application", Cnf.DefaultAppType);
   EXPECT_EQ("main", Cnf.DefaultMainFunction);
   EXPECT_EQ("pip3 install", Cnf.EnvLibInstallerTool);
   EXPECT_EQ(">=3.10", Cnf.RequiresPython);
   EXPECT_EQ("0.1.0", Cnf.DefaultAppVersion);
   EXPECT_TRUE(Cnf.Authors.empty());
   EXPECT_TRUE(Cnf.Dependencies.empty());
   EXPECT_TRUE(Cnf.CreateVenv);
   EXPECT_TRUE(Cnf.CreateLicense);
   EXPECT_TRUE(Cnf.CreateReadme);
   EXPECT_TRUE(Cnf.CreateChangelog);
   EXPECT_TRUE(Cnf.CreateAbout);
   EXPECT_FALSE(Cnf.CreateInit);
   EXPECT_FALSE(Cnf.CreateTyped);
   EXPECT_FALSE(Cnf.CreateGitignore);
   EXPECT_FALSE(Cnf.RunGitInit);
   EXPECT_FALSE(Cnf.DebugParser);
   EXPECT_TRUE(Cnf.Applications.empty());
}
TEST(AppmConfigurationTest,FileNames)
{
   char const * const envhome = getenv("HOME");
   std::string old_home;
   if (envhome != NULL)
      old_home = envhome;

   setenv("HOME", "/home/appm-test", 1);
   EXPECT_EQ("/home/appm-test/.config/pyappm/pyappmconfig.toml", APPM::DefaultConfigFile());
   EXPECT_EQ("pyapp.toml", APPM::ManifestFileName());

   if (old_home.empty() == false)
      setenv("HOME", old_home.c_str(), 1);
   else
      unsetenv("HOME");
}
TEST(AppmConfigurationTest,FromDocument)
{
   TomlDocument Doc;
   ASSERT_TRUE(ParseTomlString("[pyappm]\n"
			       "temp-dir = \"/var/tmp/appm\"\n"
			       "default_env_name = \"venv\"\n"
			       "authors = [{name=\"Jane Doe\", email=\"jane@example.com\"}, {name=\"John\"}]\n"
			       "dependencies = [\"requests\", \"rich\"]\n"
			       "create_venv = False\n"
			       "run_git_init = yes\n"
			       "debug_parser = True\n"
			       "\n"
			       "[demo]\n"
			       "description = \"A demo\"\n"
			       "dependencies = [\"click\"]\n"
			       "module = \"demo\"\n"
			       "\n"
			       "[tool]\n"
			       "name = \"real-tool\"\n"
			       "version = \"2.0\"\n"
			       "function = \"run\"\n", Doc));

   AppmConfiguration Cnf;
   EXPECT_TRUE(Cnf.FromDocument(Doc, "test"));
   EXPECT_EQ("/var/tmp/appm", Cnf.TempDir);
   EXPECT_EQ("venv", Cnf.DefaultEnvName);
   // keys not in the file keep their defaults
   EXPECT_EQ("python3 -m venv", Cnf.EnvCreateTool);
   EXPECT_TRUE(Cnf.CreateLicense);

   ASSERT_EQ(2u, Cnf.Authors.size());
   EXPECT_EQ("Jane Doe", Cnf.Authors[0].Name);
   EXPECT_EQ("jane@example.com", Cnf.Authors[0].Email);
   EXPECT_EQ("John", Cnf.Authors[1].Name);
   EXPECT_EQ("", Cnf.Authors[1].Email);

   ASSERT_EQ(2u, Cnf.Dependencies.size());
   EXPECT_EQ("rich", Cnf.Dependencies[1]);
   EXPECT_FALSE(Cnf.CreateVenv);
   EXPECT_TRUE(Cnf.RunGitInit);
   EXPECT_TRUE(Cnf.DebugParser);

   ASSERT_EQ(2u, Cnf.Applications.size());
   AppmApplication const &Demo = Cnf.Applications[0];
   EXPECT_EQ("demo", Demo.Name);
   EXPECT_EQ("A demo", Demo.Description);
   EXPECT_EQ("demo", Demo.Module);
   ASSERT_EQ(1u, Demo.Dependencies.size());
   EXPECT_EQ("click", Demo.Dependencies[0]);
   // missing values are taken from the defaults
   EXPECT_EQ("0.1.0", Demo.Version);
   EXPECT_EQ("README.md", Demo.ReadmeFile);
   EXPECT_EQ("LICENSE.txt", Demo.LicenseFile);
   EXPECT_EQ("application", Demo.AppType);
   EXPECT_EQ("main", Demo.Function);

   AppmApplication const &Tool = Cnf.Applications[1];
   EXPECT_EQ("real-tool", Tool.Name);
   EXPECT_EQ("2.0", Tool.Version);
   EXPECT_EQ("run", Tool.Function);
}
TEST(AppmConfigurationTest,InvalidDocument)
{
   TomlDocument Doc;
   ASSERT_TRUE(ParseTomlString("[demo]\nname = \"demo\"\n", Doc));
   AppmConfiguration Cnf;
   EXPECT_FALSE(Cnf.FromDocument(Doc, "broken.toml"));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Configuration file broken.toml is invalid", text);
   _error->Discard();
   EXPECT_TRUE(Cnf.Applications.empty());
}
TEST(AppmConfigurationTest,SaveAndLoad)
{
   std::string tempdir;
   createTemporaryDirectory("config", tempdir);
   std::string const file = flCombine(tempdir, "pyappmconfig.toml");

   AppmConfiguration Cnf;
   Cnf.TempDir = "/var/tmp/it's mine";
   Cnf.Authors.push_back({"Jane Doe", "jane@example.com"});
   Cnf.Dependencies = {"requests"};
   Cnf.CreateTyped = true;
   AppmApplication App = Cnf.NewApplication("demo");
   App.Description = "say \"hi\"";
   App.Dependencies = {"click", "rich"};
   EXPECT_TRUE(Cnf.AddApplication(App));
   EXPECT_TRUE(Cnf.Save(file));

   TomlDocument Doc;
   EXPECT_TRUE(ParseTomlFile(file, Doc));
   EXPECT_EQ("True", Doc.FindS("pyappm::create_typed"));
   EXPECT_EQ(TomlDocument::Bare, Doc.Find("pyappm::create_typed")->Type);
   EXPECT_FALSE(Doc.Exists("pyappm::debug_parser"));
   EXPECT_EQ("jane@example.com", Doc.FindS("pyappm::authors::0::email"));

   AppmConfiguration Loaded;
   EXPECT_TRUE(Loaded.Load(file));
   EXPECT_EQ(Cnf.TempDir, Loaded.TempDir);
   ASSERT_EQ(1u, Loaded.Authors.size());
   EXPECT_EQ("Jane Doe", Loaded.Authors[0].Name);
   ASSERT_EQ(1u, Loaded.Dependencies.size());
   EXPECT_TRUE(Loaded.CreateTyped);
   EXPECT_TRUE(Loaded.CreateVenv);
   ASSERT_EQ(1u, Loaded.Applications.size());
   EXPECT_EQ("say \"hi\"", Loaded.Applications[0].Description);
   ASSERT_EQ(2u, Loaded.Applications[0].Dependencies.size());
   EXPECT_EQ("rich", Loaded.Applications[0].Dependencies[1]);
   EXPECT_EQ("main", Loaded.Applications[0].Function);

   // saving again gives the same file
   std::string const first = fileContent(file);
   EXPECT_TRUE(Loaded.Save(file));
   EXPECT_EQ(first, fileContent(file));

   removeDirectory(tempdir);
}
TEST(AppmConfigurationTest,LoadMissing)
{
   std::string tempdir;
   createTemporaryDirectory("configmissing", tempdir);
   std::string const file = flCombine(tempdir, "sub/dir/pyappmconfig.toml");

   AppmConfiguration Cnf;
   EXPECT_FALSE(Cnf.Load(file));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Configuration file not found: " + file, text);
   _error->Discard();
   EXPECT_FALSE(FileExists(file));

   EXPECT_TRUE(Cnf.Load(file, true));
   EXPECT_FALSE(_error->PendingError());
   _error->Discard();
   EXPECT_TRUE(RealFileExists(file));
   EXPECT_EQ(flCombine(GetTempDir(), "pyappm"), Cnf.TempDir);

   AppmConfiguration Created;
   Created.TempDir = "changed";
   EXPECT_TRUE(Created.Load(file));
   EXPECT_EQ(flCombine(GetTempDir(), "pyappm"), Created.TempDir);

   removeDirectory(tempdir);
}
TEST(AppmConfigurationTest,LoadBroken)
{
   ScopedFileDeleter const syntax = createTemporaryFile("config", "[pyappm\n");
   AppmConfiguration Cnf;
   EXPECT_FALSE(Cnf.Load(syntax.Name()));
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Syntax error " + syntax.Name() + ":1:8: Expected right bracket", text);
   _error->Discard();

   ScopedFileDeleter const nosection = createTemporaryFile("config", "[other]\nx = 1\n");
   EXPECT_FALSE(Cnf.Load(nosection.Name()));
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Configuration file " + nosection.Name() + " is invalid", text);
   _error->Discard();
}
TEST(AppmConfigurationTest,Applications)
{
   AppmConfiguration Cnf;
   Cnf.DefaultAppVersion = "1.0.0";
   AppmApplication const App = Cnf.NewApplication("demo");
   EXPECT_EQ("demo", App.Name);
   EXPECT_EQ("1.0.0", App.Version);
   EXPECT_EQ("README.md", App.ReadmeFile);
   EXPECT_EQ("LICENSE.txt", App.LicenseFile);
   EXPECT_EQ("application", App.AppType);
   EXPECT_EQ("main", App.Function);

   EXPECT_EQ(nullptr, Cnf.FindApplication("demo"));
   EXPECT_TRUE(Cnf.AddApplication(App));
   ASSERT_NE(nullptr, Cnf.FindApplication("demo"));
   Cnf.FindApplication("demo")->Description = "changed";
   EXPECT_EQ("changed", Cnf.Applications[0].Description);

   std::string text;
   EXPECT_FALSE(Cnf.AddApplication(App));
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Application demo is already registered", text);

   EXPECT_FALSE(Cnf.AddApplication(Cnf.NewApplication("pyappm")));
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Invalid application name 'pyappm'", text);

   EXPECT_FALSE(Cnf.RemoveApplication("other"));
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Application other is not registered", text);
   _error->Discard();

   EXPECT_TRUE(Cnf.RemoveApplication("demo"));
   EXPECT_TRUE(Cnf.Applications.empty());
}
