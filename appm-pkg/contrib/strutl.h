// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used across libappm-pkg

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_STRUTL_H
#define APPMLIB_STRUTL_H

#include <cstdarg>
#include <cstddef>
#include <string>
#include <vector>

#include "macros.h"


namespace APPM {
   namespace String {
      APPM_PUBLIC bool Endswith(const std::string &s, const std::string &ending);
      APPM_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
   }
}

/** \brief interpret the usual spellings of a boolean
 *
 *  Accepts 0/1 and (case-insensitively) yes/no, true/false, on/off,
 *  with/without, enable/disable.
 *
 *  \return 1 for true, 0 for false and \b Default for anything else
 */
APPM_PUBLIC int StringToBool(const std::string &Text,int Default = -1);

/** \brief split a string at every occurrence of a character
 *
 *  Empty fields are kept, so "a,,b" results in three entries.
 */
APPM_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) APPM_PURE;

APPM_PUBLIC void strprintf(std::string &out,const char *format,...) APPM_PRINTF(2);
APPM_PUBLIC void vstrprintf(std::string &out,const char *format,va_list &args);

#endif
