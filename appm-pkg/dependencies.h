// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Dependencies - the dependency lists of an application manifest

   Dependencies are kept in project::dependencies for packages from a
   remote index and in project::local_dependencies for packages
   installed from local files. Each entry is an inline table
     {name="requests", new_packages=["idna", "urllib3"]}
   where new_packages records the packages which were pulled in by the
   installation of the dependency, so they can be removed with it.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_DEPENDENCIES_H
#define APPMLIB_DEPENDENCIES_H

#include <appm-pkg/macros.h>

#include <string>
#include <vector>

class TomlDocument;

enum class DependencyKind
{
   Remote,
   Local
};

struct APPM_PUBLIC AppmDependency
{
   std::string Name;
   std::vector<std::string> NewPackages;
};

/** \brief name of the list holding dependencies of the given kind */
APPM_PUBLIC char const *DependencyListName(DependencyKind const Kind) APPM_PURE;

APPM_PUBLIC std::vector<AppmDependency> GetDependencies(TomlDocument const &Doc,
							DependencyKind const Kind = DependencyKind::Remote);
APPM_PUBLIC bool HasDependency(TomlDocument const &Doc, std::string const &Name,
			       DependencyKind const Kind = DependencyKind::Remote);
/** \brief record a new dependency
 *
 *  \return \b false with an error on _error if Name is already listed
 */
APPM_PUBLIC bool AddDependency(TomlDocument &Doc, std::string const &Name,
			       std::vector<std::string> const &NewPackages,
			       DependencyKind const Kind = DependencyKind::Remote);
/** \brief drop a dependency
 *
 *  \param[out] NewPackages the packages recorded with the dependency
 *  \return \b false with an error on _error if Name is not listed
 */
APPM_PUBLIC bool RemoveDependency(TomlDocument &Doc, std::string const &Name,
				  std::vector<std::string> &NewPackages,
				  DependencyKind const Kind = DependencyKind::Remote);

/** \brief packages in After which are neither in Before nor Dep itself */
APPM_PUBLIC std::vector<std::string> NewPackagesDiff(std::vector<std::string> const &Before,
						     std::vector<std::string> const &After,
						     std::string const &Dep);

#endif
