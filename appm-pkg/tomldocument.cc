// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Document - ordered tree of tables, lists and scalar values

   Nodes are linked through Parent/Child/Next pointers, the children of
   a node form a singly linked list in insertion order. Tables look up
   their children by tag, lists by position.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/strutl.h>
#include <appm-pkg/tomldocument.h>

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <appmi18n.h>

using namespace std;
									/*}}}*/

// TomlItemTypeName - Human readable name of an item type		/*{{{*/
char const *TomlItemTypeName(TomlDocument::ItemType const Type)
{
   switch (Type)
   {
      case TomlDocument::Table: return "table";
      case TomlDocument::List: return "list";
      case TomlDocument::String: return "string";
      case TomlDocument::Bare: return "bare value";
   }
   return "unknown";
}
									/*}}}*/
// TomlDocument::TomlDocument - Constructor				/*{{{*/
TomlDocument::TomlDocument() : Root(new Item)
{
}
									/*}}}*/
// TomlDocument::~TomlDocument - Destructor				/*{{{*/
TomlDocument::~TomlDocument()
{
   FreeChildren(Root);
   delete Root;
}
									/*}}}*/
// TomlDocument::FreeChildren - Delete everything below an item		/*{{{*/
// ---------------------------------------------------------------------
/* Walks the tree without recursion, so deeply nested values can not
   exhaust the stack. Top itself stays, but loses its children. */
void TomlDocument::FreeChildren(Item *Top)
{
   if (Top == nullptr)
      return;

   Item * const Stop = Top;
   Top = Top->Child;
   Stop->Child = nullptr;
   while (Top != nullptr)
   {
      if (Top->Child != nullptr)
      {
	 Top = Top->Child;
	 continue;
      }

      while (Top != nullptr && Top->Next == nullptr)
      {
	 Item *Tmp = Top;
	 Top = Top->Parent;
	 delete Tmp;

	 if (Top == Stop)
	    return;
	 // the children of Top are all gone now
	 Top->Child = nullptr;
      }

      Item *Tmp = Top;
      Top = Top->Next;
      delete Tmp;
   }
}
									/*}}}*/
// TomlDocument::Lookup - Lookup a single item				/*{{{*/
// ---------------------------------------------------------------------
/* Tables are searched by tag and, if requested, a missing tag is
   appended as a new empty table. Lists accept a decimal index but are
   never extended here. Scalars have no children to look into. */
TomlDocument::Item *TomlDocument::Lookup(Item *Head,const char *S,
					 unsigned long const &Len,bool const &Create)
{
   if (Len == 0)
      return nullptr;

   switch (Head->Type)
   {
      case Table:
      {
	 Item **Last = &Head->Child;
	 for (Item *I = Head->Child; I != nullptr; Last = &I->Next, I = I->Next)
	    if (I->Tag.length() == Len && I->Tag.compare(0, Len, S, Len) == 0)
	       return I;
	 if (Create == false)
	    return nullptr;

	 Item *I = new Item;
	 I->Tag.assign(S,Len);
	 I->Parent = Head;
	 *Last = I;
	 return I;
      }
      case List:
      {
	 unsigned long Index = 0;
	 for (unsigned long i = 0; i < Len; ++i)
	 {
	    if (isdigit(S[i]) == 0)
	       return nullptr;
	    Index = Index * 10 + (S[i] - '0');
	 }
	 Item *I = Head->Child;
	 for (; I != nullptr && Index != 0; I = I->Next, --Index);
	 return I;
      }
      case String:
      case Bare:
	 return nullptr;
   }
   return nullptr;
}
									/*}}}*/
// TomlDocument::Lookup - Lookup a fully scoped item			/*{{{*/
// ---------------------------------------------------------------------
/* An empty name is the root table itself. */
TomlDocument::Item *TomlDocument::Lookup(const char *Name,bool const &Create)
{
   if (Name == nullptr || *Name == '\0')
      return Root;

   const char *Start = Name;
   const char *End = Start + strlen(Name);
   const char *TagEnd = Name;
   Item *Itm = Root;
   for (; End - TagEnd >= 2; TagEnd++)
   {
      if (TagEnd[0] == ':' && TagEnd[1] == ':')
      {
	 Itm = Lookup(Itm,Start,TagEnd - Start,Create);
	 if (Itm == nullptr)
	    return nullptr;
	 TagEnd = Start = TagEnd + 2;
      }
   }

   return Lookup(Itm,Start,End - Start,Create);
}
									/*}}}*/
// TomlDocument::Item::FullTag - Return the fully scoped tag		/*{{{*/
// ---------------------------------------------------------------------
/* Stop sets an optional max recursion depth if this item is being viewed as
   part of a sub tree. List entries are named by their position. */
string TomlDocument::Item::FullTag(const Item *Stop) const
{
   if (Parent == nullptr)
      return "";

   std::string Name = Tag;
   if (Parent->Type == List)
   {
      size_t Index = 0;
      for (Item const *I = Parent->Child; I != nullptr && I != this; I = I->Next)
	 ++Index;
      Name = std::to_string(Index);
   }

   if (Parent->Parent == nullptr || Parent == Stop)
      return Name;
   return Parent->FullTag(Stop) + "::" + Name;
}
									/*}}}*/
// TomlDocument::Item::Size - Number of children			/*{{{*/
size_t TomlDocument::Item::Size() const
{
   size_t Count = 0;
   for (Item const *I = Child; I != nullptr; I = I->Next)
      ++Count;
   return Count;
}
									/*}}}*/
// TomlDocument::FindS - Find a scalar value				/*{{{*/
string TomlDocument::FindS(std::string const &Name,std::string const &Default) const
{
   Item const * const Itm = Find(Name);
   if (Itm == nullptr || Itm->IsScalar() == false)
      return Default;
   return Itm->Value;
}
									/*}}}*/
// TomlDocument::FindB - Find a boolean type				/*{{{*/
bool TomlDocument::FindB(std::string const &Name,bool const &Default) const
{
   Item const * const Itm = Find(Name);
   if (Itm == nullptr || Itm->IsScalar() == false)
      return Default;
   return StringToBool(Itm->Value,Default);
}
									/*}}}*/
// TomlDocument::FindVector - Find the scalars of a list		/*{{{*/
vector<string> TomlDocument::FindVector(std::string const &Name) const
{
   vector<string> Vec;
   Item const * const Top = Find(Name);
   if (Top == nullptr || Top->Type != List)
      return Vec;

   for (Item const *I = Top->Child; I != nullptr; I = I->Next)
      if (I->IsScalar() == true)
	 Vec.push_back(I->Value);
   return Vec;
}
									/*}}}*/
// TomlDocument::Keys - Tags of a table in order			/*{{{*/
vector<string> TomlDocument::Keys(std::string const &Name) const
{
   vector<string> Vec;
   Item const * const Top = Find(Name);
   if (Top == nullptr || Top->Type != Table)
      return Vec;

   for (Item const *I = Top->Child; I != nullptr; I = I->Next)
      Vec.push_back(I->Tag);
   return Vec;
}
									/*}}}*/
// TomlDocument::EnsureTable - Find or create a table			/*{{{*/
TomlDocument::Item *TomlDocument::EnsureTable(std::string const &Name)
{
   Item *Itm = Root;
   std::string::size_type Start = 0;
   while (Start <= Name.length() && Name.empty() == false)
   {
      std::string::size_type End = Name.find("::", Start);
      if (End == std::string::npos)
	 End = Name.length();

      if (Itm->Type != Table)
      {
	 _error->Error(_("Can't create %s as %s is a %s, not a table"), Name.c_str(),
	       Itm->FullTag().c_str(), TomlItemTypeName(Itm->Type));
	 return nullptr;
      }
      if (End == Start)
      {
	 _error->Error(_("Empty key in %s"), Name.c_str());
	 return nullptr;
      }
      Itm = Lookup(Itm, Name.c_str() + Start, End - Start, true);
      Start = End + 2;
   }

   if (Itm->Type != Table)
   {
      _error->Error(_("%s is a %s, not a table"), Name.c_str(), TomlItemTypeName(Itm->Type));
      return nullptr;
   }
   return Itm;
}
									/*}}}*/
// SplitLastScope - "a::b::c" into "a::b" and "c"			/*{{{*/
static void SplitLastScope(std::string const &Name, std::string &Parent, std::string &Key)
{
   std::string::size_type const Pos = Name.rfind("::");
   if (Pos == std::string::npos)
   {
      Parent.clear();
      Key = Name;
      return;
   }
   Parent = Name.substr(0, Pos);
   Key = Name.substr(Pos + 2);
}
									/*}}}*/
// TomlDocument::EnsureList - Find or create a list			/*{{{*/
TomlDocument::Item *TomlDocument::EnsureList(std::string const &Name)
{
   std::string ParentName, Key;
   SplitLastScope(Name, ParentName, Key);
   Item * const Parent = EnsureTable(ParentName);
   if (Parent == nullptr)
      return nullptr;

   Item * const Itm = Lookup(Parent, Key.c_str(), Key.length(), false);
   if (Itm == nullptr)
      return Assign(Parent, Key, List);
   if (Itm->Type != List)
   {
      _error->Error(_("%s is a %s, not a list"), Name.c_str(), TomlItemTypeName(Itm->Type));
      return nullptr;
   }
   return Itm;
}
									/*}}}*/
// TomlDocument::Set - Set a value, creating the tables on the way	/*{{{*/
TomlDocument::Item *TomlDocument::Set(std::string const &Name,std::string const &Value,ItemType const Type)
{
   std::string ParentName, Key;
   SplitLastScope(Name, ParentName, Key);
   Item * const Parent = EnsureTable(ParentName);
   if (Parent == nullptr)
      return nullptr;
   return Assign(Parent, Key, Type, Value);
}
TomlDocument::Item *TomlDocument::SetB(std::string const &Name,bool const Value)
{
   return Set(Name, Value ? "True" : "False", Bare);
}
TomlDocument::Item *TomlDocument::SetList(std::string const &Name,std::vector<std::string> const &Values,ItemType const Type)
{
   Item * const L = Set(Name, "", List);
   if (L == nullptr)
      return nullptr;
   for (auto const &V : Values)
      Append(L, Type, V);
   return L;
}
									/*}}}*/
// TomlDocument::Assign - Create or reset a child of a table		/*{{{*/
TomlDocument::Item *TomlDocument::Assign(Item *Parent,std::string const &Key,ItemType const Type,std::string const &Value)
{
   if (Parent == nullptr)
      return nullptr;
   if (Parent->Type != Table)
   {
      _error->Error(_("Can't set %s in %s as it is a %s, not a table"), Key.c_str(),
	    Parent->FullTag().c_str(), TomlItemTypeName(Parent->Type));
      return nullptr;
   }
   if (Key.empty() == true)
   {
      _error->Error(_("Empty key in %s"), Parent->FullTag().c_str());
      return nullptr;
   }

   Item * const Itm = Lookup(Parent, Key.c_str(), Key.length(), true);
   FreeChildren(Itm);
   Itm->Type = Type;
   if (Itm->IsScalar() == true)
      Itm->Value = Value;
   else
      Itm->Value.clear();
   return Itm;
}
									/*}}}*/
// TomlDocument::Append - Add an entry at the end of a list		/*{{{*/
TomlDocument::Item *TomlDocument::Append(Item *Parent,ItemType const Type,std::string const &Value)
{
   if (Parent == nullptr)
      return nullptr;
   if (Parent->Type != List)
   {
      _error->Error(_("Can't append to %s as it is a %s, not a list"),
	    Parent->FullTag().c_str(), TomlItemTypeName(Parent->Type));
      return nullptr;
   }

   Item **Last = &Parent->Child;
   for (; *Last != nullptr; Last = &(*Last)->Next);

   Item *I = new Item;
   I->Type = Type;
   if (I->IsScalar() == true)
      I->Value = Value;
   I->Parent = Parent;
   *Last = I;
   return I;
}
									/*}}}*/
// TomlDocument::Remove - Drop an item and everything below it		/*{{{*/
bool TomlDocument::Remove(std::string const &Name)
{
   Item * const Itm = Lookup(Name.c_str(), false);
   if (Itm == nullptr)
      return false;
   Remove(Itm);
   return true;
}
void TomlDocument::Remove(Item *Itm)
{
   if (Itm == nullptr)
      return;
   if (Itm == Root || Itm->Parent == nullptr)
   {
      Clear();
      return;
   }

   for (Item **I = &Itm->Parent->Child; *I != nullptr; I = &(*I)->Next)
   {
      if (*I != Itm)
	 continue;
      *I = Itm->Next;
      break;
   }
   FreeChildren(Itm);
   delete Itm;
}
									/*}}}*/
// TomlDocument::Clear - Remove every section				/*{{{*/
void TomlDocument::Clear()
{
   FreeChildren(Root);
}
									/*}}}*/
// TomlDocument::Swap - Exchange the content of two documents		/*{{{*/
void TomlDocument::Swap(TomlDocument &Other)
{
   std::swap(Root, Other.Root);
}
									/*}}}*/
// TomlDocument::Equals - Compare two subtrees by value			/*{{{*/
// ---------------------------------------------------------------------
/* Tags, types, values and the order of children have to match. */
bool TomlDocument::Equals(const Item *A,const Item *B)
{
   if (A == nullptr || B == nullptr)
      return A == B;
   if (A->Type != B->Type || A->Tag != B->Tag || A->Value != B->Value)
      return false;

   Item const *CA = A->Child;
   Item const *CB = B->Child;
   for (; CA != nullptr && CB != nullptr; CA = CA->Next, CB = CB->Next)
      if (Equals(CA, CB) == false)
	 return false;
   return CA == nullptr && CB == nullptr;
}
									/*}}}*/
// TomlDocument::Dump - Dump the document				/*{{{*/
// ---------------------------------------------------------------------
/* One line per node in document order, only useful for debugging. */
void TomlDocument::Dump(ostream& str) const
{
   Item const *Top = Root->Child;
   while (Top != nullptr)
   {
      str << Top->FullTag() << " (" << TomlItemTypeName(Top->Type) << ")";
      if (Top->IsScalar() == true)
	 str << " \"" << Top->Value << "\"";
      str << ";" << std::endl;

      if (Top->Child != nullptr)
      {
	 Top = Top->Child;
	 continue;
      }

      while (Top != nullptr && Top->Next == nullptr)
	 Top = Top->Parent;
      if (Top != nullptr)
	 Top = Top->Next;
   }
}
									/*}}}*/
