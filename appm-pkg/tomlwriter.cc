// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Writer - format a TomlDocument in the grammar of TomlParser

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/strutl.h>
#include <appm-pkg/tomldocument.h>
#include <appm-pkg/tomlparser.h>
#include <appm-pkg/tomltokenizer.h>
#include <appm-pkg/tomlwriter.h>

#include <algorithm>
#include <string>

#include <appmi18n.h>
									/*}}}*/

// TomlWriter::IsBareRun - Only characters of Char tokens		/*{{{*/
bool TomlWriter::IsBareRun(std::string const &Text)
{
   if (Text.empty() == true)
      return false;
   return std::all_of(Text.begin(), Text.end(), [](char const C) {
      return TomlTokenizer::Classify(C) == TomlToken::Char;
   });
}
									/*}}}*/
// TomlWriter::TypeError - Report a value which can't be written	/*{{{*/
bool TomlWriter::TypeError(TomlDocument::Item const *Itm, std::string const &What) const
{
   std::string const Name = Itm->FullTag();
   return _error->Error(_("Type error writing %s at %s: %s"), Destination.c_str(),
			Name.empty() ? "/" : Name.c_str(), What.c_str());
}
									/*}}}*/
// TomlWriter::WriteKey - Tag of a table entry				/*{{{*/
bool TomlWriter::WriteKey(std::string &Out, TomlDocument::Item const *Itm) const
{
   if (IsBareRun(Itm->Tag) == false)
   {
      std::string What;
      strprintf(What, _("key '%s' contains characters not allowed in a key"), Itm->Tag.c_str());
      return TypeError(Itm, What);
   }
   // section names are read back as they are, other keys get normalized
   bool const Section = Itm->Parent != nullptr && Itm->Parent->Parent == nullptr;
   if (Section == false && TomlParser::NormalizeKey(Itm->Tag) != Itm->Tag)
   {
      std::string What;
      strprintf(What, _("key '%s' would be read back as '%s'"), Itm->Tag.c_str(),
	    TomlParser::NormalizeKey(Itm->Tag).c_str());
      return TypeError(Itm, What);
   }
   Out.append(Itm->Tag);
   return true;
}
									/*}}}*/
// TomlWriter::WriteValue - Recursive value formatter			/*{{{*/
bool TomlWriter::WriteValue(std::string &Out, TomlDocument::Item const *Itm) const
{
   switch (Itm->Type)
   {
      case TomlDocument::String:
      {
	 bool const Double = Itm->Value.find('"') != std::string::npos;
	 bool const Single = Itm->Value.find('\'') != std::string::npos;
	 if (Double == true && Single == true)
	    return TypeError(Itm, _("string contains both kinds of quotes"));
	 if (Itm->Value.find("\n#") != std::string::npos)
	    return TypeError(Itm, _("string contains a line starting with '#'"));
	 char const Q = Double ? '\'' : '"';
	 Out.append(1, Q).append(Itm->Value).append(1, Q);
	 return true;
      }
      case TomlDocument::Bare:
	 if (IsBareRun(Itm->Value) == false)
	 {
	    std::string What;
	    strprintf(What, _("'%s' can't be written as a bare value"), Itm->Value.c_str());
	    return TypeError(Itm, What);
	 }
	 Out.append(Itm->Value);
	 return true;
      case TomlDocument::List:
	 Out.append("[");
	 for (auto I = Itm->Child; I != nullptr; I = I->Next)
	 {
	    if (I != Itm->Child)
	       Out.append(", ");
	    if (WriteValue(Out, I) == false)
	       return false;
	 }
	 Out.append("]");
	 return true;
      case TomlDocument::Table:
	 Out.append("{");
	 for (auto I = Itm->Child; I != nullptr; I = I->Next)
	 {
	    if (I != Itm->Child)
	       Out.append(", ");
	    if (WriteKey(Out, I) == false)
	       return false;
	    Out.append("=");
	    if (WriteValue(Out, I) == false)
	       return false;
	 }
	 Out.append("}");
	 return true;
   }
   return TypeError(Itm, _("unknown value type"));
}
									/*}}}*/
// TomlWriter::Write - Format the whole document			/*{{{*/
bool TomlWriter::Write(TomlDocument const &Doc, std::string &Out) const
{
   std::string Text;
   for (auto S = Doc.RootItem()->Child; S != nullptr; S = S->Next)
   {
      if (S->Type != TomlDocument::Table)
      {
	 std::string What;
	 strprintf(What, _("top-level entry is a %s, not a table"), TomlItemTypeName(S->Type));
	 return TypeError(S, What);
      }

      if (S != Doc.RootItem()->Child)
	 Text.append("\n");
      Text.append("[");
      if (WriteKey(Text, S) == false)
	 return false;
      Text.append("]\n");

      for (auto I = S->Child; I != nullptr; I = I->Next)
      {
	 if (WriteKey(Text, I) == false)
	    return false;
	 Text.append("=");
	 if (WriteValue(Text, I) == false)
	    return false;
	 Text.append("\n");
      }
   }
   Out.swap(Text);
   return true;
}
									/*}}}*/
// WriteTomlFile - Format and atomically replace a file			/*{{{*/
bool WriteTomlFile(TomlDocument const &Doc, std::string const &FileName)
{
   std::string Text;
   if (TomlWriter(FileName).Write(Doc, Text) == false)
      return false;

   FileFd Fd;
   if (Fd.Open(FileName, FileFd::WriteAtomic, FileFd::Extension, 0644) == false)
      return false;
   bool const Written = Fd.Write(Text) && Fd.Sync();
   if (Written == false)
      Fd.OpFail();
   // a failed file is dropped instead of being renamed into place
   return Fd.Close() && Written;
}
									/*}}}*/
// WriteTomlString - Format into a string				/*{{{*/
bool WriteTomlString(TomlDocument const &Doc, std::string &Out)
{
   return TomlWriter().Write(Doc, Out);
}
									/*}}}*/
