// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used across libappm-pkg

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <appm-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

using namespace std;
									/*}}}*/

namespace APPM {
   namespace String {
bool Endswith(const std::string &s, const std::string &end)
{
   if (end.size() > s.size())
      return false;
   return (s.compare(s.size() - end.size(), end.size(), end) == 0);
}

bool Startswith(const std::string &s, const std::string &start)
{
   if (start.size() > s.size())
      return false;
   return (s.compare(0, start.size(), start) == 0);
}
   }
}

// StringToBool - Converts a string into a boolean			/*{{{*/
int StringToBool(const string &Text,int Default)
{
   if (Text == "0")
      return 0;
   if (Text == "1")
      return 1;

   static char const * const Negatives[] = { "no", "false", "without", "off", "disable" };
   static char const * const Positives[] = { "yes", "true", "with", "on", "enable" };
   auto const Matches = [&Text](char const * const W) { return strcasecmp(Text.c_str(), W) == 0; };

   if (std::any_of(std::begin(Negatives), std::end(Negatives), Matches) == true)
      return 0;
   if (std::any_of(std::begin(Positives), std::end(Positives), Matches) == true)
      return 1;

   return Default;
}
									/*}}}*/
// VectorizeString - Split a string at a separator			/*{{{*/
vector<string> VectorizeString(string const &haystack, char const &split)
{
   vector<string> exploded;
   if (haystack.empty() == true)
      return exploded;
   string::const_iterator start = haystack.begin();
   string::const_iterator end = start;
   do {
      for (; end != haystack.end() && *end != split; ++end);
      exploded.push_back(string(start, end));
      start = end + 1;
   } while (end != haystack.end() && (++end) != haystack.end());
   if (haystack.back() == split)
      exploded.push_back("");
   return exploded;
}
									/*}}}*/
// vstrprintf - C format string into a std::string			/*{{{*/
void vstrprintf(string &out,const char *format,va_list &args)
{
   va_list copy;
   va_copy(copy, args);
   int const n = vsnprintf(nullptr, 0, format, copy);
   va_end(copy);
   if (n < 0)
   {
      out.clear();
      return;
   }
   std::vector<char> S(n + 1);
   vsnprintf(S.data(), S.size(), format, args);
   out.assign(S.data(), n);
}
									/*}}}*/
// strprintf - C format string outputter				/*{{{*/
void strprintf(string &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   vstrprintf(out, format, args);
   va_end(args);
}
									/*}}}*/
