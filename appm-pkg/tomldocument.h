// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   TOML Document - ordered tree of tables, lists and scalar values

   The document is the in-memory form of a manifest or configuration
   file. Its root is a table whose children are the [sections] of the
   file; every node keeps its children in insertion order, which is the
   order they are written back out in.

   Each node is addressed by a fully scoped name such as
     project::dependencies::0::name
   where numeric scopes index into lists.

   Reading never changes the document: Find and the Find* helpers return
   nothing or the given default for absent names. Code which is about to
   fill in a part of the document uses EnsureTable, which creates every
   missing table on the way:
     Doc.EnsureTable("project");
     Doc.Set("project::name", "demo");

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_TOMLDOCUMENT_H
#define APPMLIB_TOMLDOCUMENT_H

#include <appm-pkg/macros.h>

#include <iostream>
#include <string>
#include <vector>

class APPM_PUBLIC TomlDocument
{
   public:

   enum ItemType
   {
      Table,	// tagged children; a [section] or an inline {...}
      List,	// untagged children in order
      String,	// quoted text in Value
      Bare	// unquoted word in Value, e.g. True or 0.1.0
   };

   struct Item
   {
      ItemType Type;
      std::string Tag;
      std::string Value;
      Item *Parent;
      Item *Child;
      Item *Next;

      std::string FullTag(const Item *Stop = 0) const;
      inline bool IsScalar() const { return Type == String || Type == Bare; };
      size_t Size() const APPM_PURE;

      Item() : Type(Table), Parent(0), Child(0), Next(0) {};
   };

   private:

   Item *Root;

   Item *Lookup(Item *Head,const char *S,unsigned long const &Len,bool const &Create);
   Item *Lookup(const char *Name,bool const &Create);
   inline const Item *Lookup(const char *Name) const
   {
      return const_cast<TomlDocument *>(this)->Lookup(Name,false);
   }
   static void FreeChildren(Item *Top);

   public:

   // Non-mutating access
   const Item *Find(std::string const &Name) const {return Lookup(Name.c_str());};
   inline bool Exists(std::string const &Name) const {return Find(Name) != nullptr;};

   /** \brief text of a String or Bare value
    *
    *  \return \b Default if Name is absent or not a scalar
    */
   std::string FindS(std::string const &Name,std::string const &Default = "") const;
   /** \brief a scalar interpreted by StringToBool, True/False in files */
   bool FindB(std::string const &Name,bool const &Default = false) const;
   /** \brief the scalar entries of the list Name, others are skipped */
   std::vector<std::string> FindVector(std::string const &Name) const;
   /** \brief the keys of the table Name in order, the sections for "" */
   std::vector<std::string> Keys(std::string const &Name = "") const;

   // Mutating access
   /** \brief return the table Name, creating it and all missing parents
    *
    *  \return \b nullptr with an error on _error if a part of Name
    *  exists, but is not a table
    */
   Item *EnsureTable(std::string const &Name);
   Item *EnsureList(std::string const &Name);

   Item *Set(std::string const &Name,std::string const &Value,ItemType const Type = String);
   Item *SetB(std::string const &Name,bool const Value);
   Item *SetList(std::string const &Name,std::vector<std::string> const &Values,ItemType const Type = String);

   /** \brief create or reset the child Key of the table Parent
    *
    *  An existing child keeps its position, but loses its old content.
    */
   Item *Assign(Item *Parent,std::string const &Key,ItemType const Type,std::string const &Value = "");
   /** \brief add an untagged child at the end of the list Parent */
   Item *Append(Item *Parent,ItemType const Type,std::string const &Value = "");

   bool Remove(std::string const &Name);
   void Remove(Item *Itm);
   void Clear();
   void Swap(TomlDocument &Other);

   inline Item *RootItem() {return Root;};
   inline const Item *RootItem() const {return Root;};
   inline bool empty() const {return Root->Child == nullptr;};

   static bool Equals(const Item *A,const Item *B);
   inline bool operator==(TomlDocument const &Other) const {return Equals(Root, Other.Root);};
   inline bool operator!=(TomlDocument const &Other) const {return Equals(Root, Other.Root) == false;};

   inline void Dump() const { Dump(std::clog); };
   void Dump(std::ostream& str) const;

   TomlDocument();
   ~TomlDocument();
   TomlDocument(TomlDocument const &) = delete;
   TomlDocument &operator=(TomlDocument const &) = delete;
};

APPM_PUBLIC char const *TomlItemTypeName(TomlDocument::ItemType const Type);

#endif
