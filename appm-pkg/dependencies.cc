// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Dependencies - the dependency lists of an application manifest

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/dependencies.h>
#include <appm-pkg/error.h>
#include <appm-pkg/tomldocument.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <appmi18n.h>
									/*}}}*/

// DependencyListName - project::dependencies or local_dependencies	/*{{{*/
char const *DependencyListName(DependencyKind const Kind)
{
   switch (Kind)
   {
   case DependencyKind::Remote:
      return "project::dependencies";
   case DependencyKind::Local:
      return "project::local_dependencies";
   }
   return "project::dependencies";
}
									/*}}}*/
// DependencyName - Name of a dependency entry				/*{{{*/
// ---------------------------------------------------------------------
/* Older manifests list dependencies as plain strings. */
static std::string DependencyName(TomlDocument::Item const *Itm)
{
   switch (Itm->Type)
   {
   case TomlDocument::String:
   case TomlDocument::Bare:
      return Itm->Value;
   case TomlDocument::Table:
      for (auto I = Itm->Child; I != nullptr; I = I->Next)
	 if (I->Tag == "name" && I->IsScalar() == true)
	    return I->Value;
      return "";
   case TomlDocument::List:
      return "";
   }
   return "";
}
static TomlDocument::Item const *FindDependency(TomlDocument const &Doc,
						std::string const &Name,
						DependencyKind const Kind)
{
   TomlDocument::Item const * const L = Doc.Find(DependencyListName(Kind));
   if (L == nullptr || L->Type != TomlDocument::List)
      return nullptr;
   for (auto I = L->Child; I != nullptr; I = I->Next)
      if (DependencyName(I) == Name)
	 return I;
   return nullptr;
}
									/*}}}*/
// GetDependencies - All dependencies of a kind				/*{{{*/
std::vector<AppmDependency> GetDependencies(TomlDocument const &Doc, DependencyKind const Kind)
{
   std::vector<AppmDependency> Deps;
   TomlDocument::Item const * const L = Doc.Find(DependencyListName(Kind));
   if (L == nullptr || L->Type != TomlDocument::List)
      return Deps;

   for (auto I = L->Child; I != nullptr; I = I->Next)
   {
      AppmDependency D;
      D.Name = DependencyName(I);
      if (D.Name.empty() == true)
	 continue;
      if (I->Type == TomlDocument::Table)
	 D.NewPackages = Doc.FindVector(I->FullTag() + "::new_packages");
      Deps.push_back(std::move(D));
   }
   return Deps;
}
									/*}}}*/
// HasDependency - Is a dependency listed				/*{{{*/
bool HasDependency(TomlDocument const &Doc, std::string const &Name, DependencyKind const Kind)
{
   return FindDependency(Doc, Name, Kind) != nullptr;
}
									/*}}}*/
// AddDependency - Append a dependency entry				/*{{{*/
bool AddDependency(TomlDocument &Doc, std::string const &Name,
		   std::vector<std::string> const &NewPackages, DependencyKind const Kind)
{
   if (Name.empty() == true)
      return _error->Error(_("Dependency name can not be empty"));
   if (HasDependency(Doc, Name, Kind) == true)
      return _error->Error(_("%s is already a dependency"), Name.c_str());

   TomlDocument::Item * const L = Doc.EnsureList(DependencyListName(Kind));
   TomlDocument::Item * const T = Doc.Append(L, TomlDocument::Table);
   if (T == nullptr || Doc.Assign(T, "name", TomlDocument::String, Name) == nullptr)
      return false;
   TomlDocument::Item * const P = Doc.Assign(T, "new_packages", TomlDocument::List);
   if (P == nullptr)
      return false;
   for (auto const &N : NewPackages)
      if (Doc.Append(P, TomlDocument::String, N) == nullptr)
	 return false;
   return true;
}
									/*}}}*/
// RemoveDependency - Drop a dependency entry				/*{{{*/
bool RemoveDependency(TomlDocument &Doc, std::string const &Name,
		      std::vector<std::string> &NewPackages, DependencyKind const Kind)
{
   TomlDocument::Item const * const Dep = FindDependency(Doc, Name, Kind);
   if (Dep == nullptr)
      return _error->Error(_("%s is not a dependency"), Name.c_str());

   NewPackages.clear();
   if (Dep->Type == TomlDocument::Table)
      NewPackages = Doc.FindVector(Dep->FullTag() + "::new_packages");
   Doc.Remove(const_cast<TomlDocument::Item *>(Dep));
   return true;
}
									/*}}}*/
// NewPackagesDiff - Packages pulled in by an installation		/*{{{*/
std::vector<std::string> NewPackagesDiff(std::vector<std::string> const &Before,
					 std::vector<std::string> const &After,
					 std::string const &Dep)
{
   std::vector<std::string> Diff;
   std::copy_if(After.begin(), After.end(), std::back_inserter(Diff), [&](std::string const &P) {
      return P != Dep && std::find(Before.begin(), Before.end(), P) == Before.end();
   });
   return Diff;
}
									/*}}}*/
