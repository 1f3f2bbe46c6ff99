// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by the whole library

   Every function that can fail returns a bool (or a null pointer) and
   records what went wrong here. Callers unwind on false and the front
   end decides how to present the collected messages:
     if (Fd.Open(File, FileFd::ReadOnly) == false)
        return false;
     ...
     return _error->Error(_("Syntax error %s:%u:%u: %s"), ...);

   Errors are kept in FIFO order so PopMessage returns the oldest one.
   A single object exists per thread.

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_ERROR_H
#define APPMLIB_ERROR_H

#include <appm-pkg/macros.h>

#include <iostream>
#include <list>
#include <string>
#include <utility>

#include <cstdarg>
#include <cstddef>

class APPM_PUBLIC GlobalError						/*{{{*/
{
public:									/*{{{*/
	/** \brief a message can have one of following severity */
	enum MsgType {
		/** \brief printed instantly in addition to being queued */
		FATAL = 40,
		/** \brief the requested operation could not be completed */
		ERROR = 30,
		/** \brief a problem that may lead to errors later on */
		WARNING = 20,
		/** \brief deprecated input, fallback behavior, … */
		NOTICE = 10,
		/** \brief tracing for developers, printed instantly to std::clog */
		DEBUG = 0
	};

	/** \brief add an Error message including errno details
	 *
	 *  \param Function name of the system call that failed
	 *  \param Description format string for the error message
	 *
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) APPM_PRINTF(3) APPM_COLD;

	/** \brief add a Warning message including errno details
	 *
	 *  \return \b false
	 */
	bool WarningE(const char *Function,const char *Description,...) APPM_PRINTF(3) APPM_COLD;

	bool Fatal(const char *Description,...) APPM_PRINTF(2) APPM_COLD;

	/** \brief add an Error message to the list
	 *
	 *  \param Description Format string for the error message.
	 *
	 *  \return \b false
	 */
	bool Error(const char *Description,...) APPM_PRINTF(2) APPM_COLD;

	/** \brief add a warning message to the list
	 *
	 *  A warning does not fail the current operation and may be
	 *  ignored by the client.
	 *
	 *  \return \b false
	 */
	bool Warning(const char *Description,...) APPM_PRINTF(2) APPM_COLD;

	bool Notice(const char *Description,...) APPM_PRINTF(2) APPM_COLD;
	bool Debug(const char *Description,...) APPM_PRINTF(2) APPM_COLD;

	/** \brief adds a message with the given type
	 *
	 * \param type of the message
	 * \param Description format string for the message
	 */
	bool Insert(MsgType const &type, const char* Description,...) APPM_PRINTF(3) APPM_COLD;

	/** \brief adds an already formatted message with the given type */
	bool Insert(MsgType const &type, std::string const &Text) APPM_COLD;

	/** \brief is an error in the list? */
	inline bool PendingError() const APPM_PURE {return PendingFlag;};

	/** \brief is the list free of messages at or above threshold?
	 *
	 *  \param threshold minimum level considered
	 */
	bool empty(MsgType const &threshold = WARNING) const APPM_PURE;

	/** \brief returns and removes the oldest message in the list
	 *
	 *  \param[out] Text message of the item
	 *
	 *  \return \b true if the message was an error, \b false otherwise
	 */
	bool PopMessage(std::string &Text);

	/** \brief clears the list of messages */
	void Discard();

	/** \brief outputs the list of messages to the given stream
	 *
	 *  All messages are discarded afterwards, even undisplayed ones.
	 *
	 *  \param[out] out output stream to write the messages in
	 *  \param threshold minimum level printed
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING);

	void inline DumpErrors(MsgType const &threshold = WARNING) {
		DumpErrors(std::cerr, threshold);
	}

	/** \brief color the E:/W:/N: prefixes when dumping */
	void SetColor(bool const Enable) { UseColor = Enable; }

	GlobalError();
									/*}}}*/
private:								/*{{{*/
	struct Item {
		std::string Text;
		MsgType Type;

		Item(std::string Text, MsgType const &Type) :
			Text(std::move(Text)), Type(Type) {};
	};

	APPM_HIDDEN void Print(std::ostream &out, Item const &i) const;
	APPM_HIDDEN bool VInsert(MsgType type, const char *Function,
				 const char *Description, va_list &args);

	std::list<Item> Messages;
	bool PendingFlag;
	bool UseColor;
									/*}}}*/
};
									/*}}}*/

// The 'extra-ansi' syntax is used to help with collisions.
APPM_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error APPM_UNUSED;

#endif
