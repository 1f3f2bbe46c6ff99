// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd - file handle with transparent gzip support and atomic
            replacement of the destination on Close()
   FileExists - Returns true if the file exists
   SafeGetCWD - Returns the CWD in a string with overrun protection

   ##################################################################### */
									/*}}}*/
#ifndef APPMLIB_FILEUTL_H
#define APPMLIB_FILEUTL_H

#include <appm-pkg/macros.h>

#include <string>
#include <vector>
#include <sys/stat.h>

class FileFdPrivate;
class APPM_PUBLIC FileFd
{
   friend class FileFdPrivate;
   friend class GzipFileFdPrivate;
   friend class DirectFileFdPrivate;
   protected:
   int iFd;

   enum LocalFlags {AutoClose = (1<<0),Fail = (1<<1),
                    HitEof = (1<<3), Replace = (1<<4), Compressed = (1<<5) };
   unsigned long Flags;
   std::string FileName;
   std::string TemporaryFileName;

   public:
   enum OpenMode {
	ReadOnly = (1 << 0),
	WriteOnly = (1 << 1),
	ReadWrite = ReadOnly | WriteOnly,

	Create = (1 << 2),
	Exclusive = (1 << 3),
	Atomic = Exclusive | (1 << 4),
	Empty = (1 << 5),

	WriteEmpty = ReadWrite | Create | Empty,
	WriteExists = ReadWrite,
	WriteAny = ReadWrite | Create,
	WriteAtomic = ReadWrite | Create | Atomic
   };
   enum CompressMode
   {
      None = 'N',
      Extension = 'E',
      Gzip = 'G'
   };

   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = 0);
   /** read a complete line from the file
    *
    *  Similar to std::getline() the string does \b not include
    *  the newline.
    *
    *  @param To string which will hold the line
    *  @return \b true if a line was read, \b false at the end of the
    *  file or on error (check #Failed to tell them apart)
    */
   bool ReadLine(std::string &To);
   bool Write(const void *From,unsigned long long Size);
   inline bool Write(std::string const &From) { return Write(From.data(), From.size()); }

   bool Open(std::string FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   bool Close();
   bool Sync();

   inline bool IsOpen() {return iFd >= 0;};
   inline bool Failed() {return (Flags & Fail) == Fail;};
   inline void OpFail() {Flags |= Fail;};
   inline bool Eof() {return (Flags & HitEof) == HitEof;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode = 0666);
   FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode = 0666);
   FileFd();
   virtual ~FileFd();

   FileFd(const FileFd &) = delete;
   FileFd & operator=(const FileFd &) = delete;

   private:
   FileFdPrivate * d;
   APPM_HIDDEN bool OpenInternDescriptor(unsigned int const Mode, CompressMode const Compress);

   // private helpers to set Fail flag and call _error->Error
   APPM_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) APPM_PRINTF(3) APPM_COLD;
   APPM_HIDDEN bool FileFdError(const char* Description,...) APPM_PRINTF(2) APPM_COLD;
};

APPM_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
APPM_PUBLIC bool FileExists(std::string File);
APPM_PUBLIC bool RealFileExists(std::string File);
APPM_PUBLIC bool DirectoryExists(std::string const &Path);
APPM_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);

APPM_PUBLIC std::string GetTempDir();
/** \brief home directory of the calling user
 *
 *  $HOME if set, otherwise the passwd entry. Empty if neither is known.
 */
APPM_PUBLIC std::string GetHomeDir();

APPM_PUBLIC std::string SafeGetCWD();
APPM_PUBLIC std::string flNotFile(std::string File);
APPM_PUBLIC std::string flCombine(std::string Dir,std::string File);
APPM_PUBLIC std::string flAbsPath(std::string File);

#endif
