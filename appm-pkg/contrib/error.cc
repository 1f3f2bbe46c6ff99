// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by the whole library

   Messages are kept in a list; PendingFlag tracks whether any of them
   is an error.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/strutl.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <list>
#include <string>
#include <errno.h>
#include <stdarg.h>
									/*}}}*/

// Global Error Object							/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// GlobalError::GlobalError - Constructor				/*{{{*/
GlobalError::GlobalError() : PendingFlag(false), UseColor(false) {}
									/*}}}*/
// GlobalError::VInsert - Format and queue a message			/*{{{*/
/* Function is non-null for the errno variants, in which case errno is
   appended the same way perror would do it. */
bool GlobalError::VInsert(MsgType type, const char *Function,
			  const char *Description, va_list &args)
{
   int const errsv = errno;
   std::string Text;
   vstrprintf(Text, Description, args);
   if (Function != nullptr)
      Text.append(" - ").append(Function).append(" (")
	 .append(std::to_string(errsv)).append(": ")
	 .append(strerror(errsv)).append(")");
   return Insert(type, Text);
}
									/*}}}*/
// GlobalError::Errno, WarningE - Add errno messages to the list	/*{{{*/
#define GEMessageE(NAME, TYPE) \
bool GlobalError::NAME (const char *Function, const char *Description,...) { \
	va_list args; \
	va_start(args,Description); \
	VInsert(TYPE, Function, Description, args); \
	va_end(args); \
	return false; \
}
GEMessageE(Errno, ERROR)
GEMessageE(WarningE, WARNING)
#undef GEMessageE
									/*}}}*/
// GlobalError::Fatal, Error, Warning, Notice and Debug - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Description,...) { \
	va_list args; \
	va_start(args,Description); \
	VInsert(TYPE, nullptr, Description, args); \
	va_end(args); \
	return false; \
}
GEMessage(Fatal, FATAL)
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
GEMessage(Debug, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::Insert - Add a formatted message of a given type	/*{{{*/
bool GlobalError::Insert(MsgType const &type, const char *Description,...)
{
   va_list args;
   va_start(args,Description);
   VInsert(type, nullptr, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
// GlobalError::Insert - Queue a finished message			/*{{{*/
bool GlobalError::Insert(MsgType const &type, std::string const &Text)
{
   Messages.emplace_back(Text, type);

   if (type == ERROR || type == FATAL)
      PendingFlag = true;

   if (type == FATAL || type == DEBUG)
   {
      Print(std::clog, Messages.back());
      std::clog << std::endl;
   }
   return false;
}
									/*}}}*/
// GlobalError::PopMessage - Pulls a single message out			/*{{{*/
bool GlobalError::PopMessage(std::string &Text)
{
   if (Messages.empty() == true)
      return false;

   Item const msg = Messages.front();
   Messages.pop_front();

   bool const Ret = (msg.Type == ERROR || msg.Type == FATAL);
   Text = msg.Text;
   if (PendingFlag == false || Ret == false)
      return Ret;

   PendingFlag = std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
      return m.Type == ERROR || m.Type == FATAL;
   });
   return Ret;
}
									/*}}}*/
// GlobalError::DumpErrors - Dump all of the errors/warns to a stream	/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold)
{
   for (auto const &m : Messages)
   {
      if (m.Type < threshold)
	 continue;
      Print(out, m);
      out << std::endl;
   }

   Discard();
}
									/*}}}*/
// GlobalError::Discard - Discard					/*{{{*/
void GlobalError::Discard()
{
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
// GlobalError::empty - does our error list include anything?		/*{{{*/
bool GlobalError::empty(MsgType const &threshold) const
{
   if (PendingFlag == true)
      return false;

   return std::none_of(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
      return m.Type >= threshold;
   });
}
									/*}}}*/
// GlobalError::Print - Write one message with its severity prefix	/*{{{*/
/* Continuation lines of a multi-line message are indented below the
   prefix so they stay visually attached to it. */
void GlobalError::Print(std::ostream &out, Item const &i) const
{
   static constexpr auto COLOR_RESET = "\033[0m";
   char const *Color = nullptr;
   char Prefix = 'D';
   switch (i.Type)
   {
   case FATAL:
   case ERROR:
      Prefix = 'E';
      Color = "\033[1;31m";
      break;
   case WARNING:
      Prefix = 'W';
      Color = "\033[1;33m";
      break;
   case NOTICE:
      Prefix = 'N';
      Color = "\033[33m";
      break;
   case DEBUG:
      break;
   }

   if (UseColor == true && Color != nullptr)
      out << Color << Prefix << ": " << COLOR_RESET;
   else
      out << Prefix << ": ";

   auto const Lines = VectorizeString(i.Text, '\n');
   bool First = true;
   for (auto const &L : Lines)
   {
      if (L.empty() == true)
	 continue;
      if (First == false)
	 out << std::endl << "   ";
      out << L;
      First = false;
   }
}
									/*}}}*/
