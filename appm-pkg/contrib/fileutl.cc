// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd wraps a file descriptor with error reporting through _error,
   transparent gzip (de)compression via zlib and an atomic write mode
   which writes into a temporary file beside the destination and
   renames it over the destination once everything went fine.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <appm-pkg/error.h>
#include <appm-pkg/fileutl.h>
#include <appm-pkg/macros.h>
#include <appm-pkg/strutl.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <pwd.h>
#include <stdarg.h>
#include <stdio.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif

#include <appmi18n.h>
									/*}}}*/

using namespace std;

// RemoveFile - Unlink a file, a missing file is no error		/*{{{*/
bool RemoveFile(char const * const Function, std::string const &FileName)
{
   if (FileName == "/dev/null")
      return true;
   errno = 0;
   if (unlink(FileName.c_str()) != 0)
   {
      if (errno == ENOENT)
	 return true;

      return _error->WarningE(Function,_("Problem unlinking the file %s"), FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileExists - Check if a file exists					/*{{{*/
// ---------------------------------------------------------------------
/* Beware: Directories are also files! */
bool FileExists(string File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return true;
}
									/*}}}*/
// RealFileExists - Check if a file exists and if it is really a file	/*{{{*/
bool RealFileExists(string File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return S_ISREG(Buf.st_mode);
}
									/*}}}*/
// DirectoryExists - Check if a directory exists and is really one	/*{{{*/
bool DirectoryExists(string const &Path)
{
   struct stat Buf;
   if (stat(Path.c_str(),&Buf) != 0)
      return false;
   return S_ISDIR(Buf.st_mode);
}
									/*}}}*/
// CreateDirectory - poor man's mkdir -p guarded by a parent directory	/*{{{*/
// ---------------------------------------------------------------------
/* All directories needed for Path are created, but only below Parent,
   which has to exist already and has to be a prefix of Path. */
bool CreateDirectory(string const &Parent, string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return false;

   if (DirectoryExists(Path) == true)
      return true;

   if (DirectoryExists(Parent) == false)
      return false;

   // we are not going to create directories "into the blue"
   if (APPM::String::Startswith(Path, Parent) == false)
      return false;

   string progress = Parent;
   for (auto const &d : VectorizeString(Path.substr(Parent.size()), '/'))
   {
      if (d.empty() == true)
	 continue;

      if (progress.back() != '/')
	 progress.append("/");
      progress.append(d);
      if (DirectoryExists(progress) == true)
	 continue;

      if (mkdir(progress.c_str(), 0755) != 0)
	 return _error->Errno("mkdir", _("Unable to create directory %s"), progress.c_str());
   }
   return true;
}
									/*}}}*/
// SafeGetCWD - This is a safer getcwd that returns a dynamic string	/*{{{*/
// ---------------------------------------------------------------------
/* The result always ends in a /, we return / on failure. */
string SafeGetCWD()
{
   char *S = getcwd(nullptr, 0);
   if (S == nullptr)
      return "/";
   string Res(S);
   free(S);
   if (Res.empty() == true || Res.back() != '/')
      Res.append("/");
   return Res;
}
									/*}}}*/
// flNotFile - Strip the file from the directory name			/*{{{*/
// ---------------------------------------------------------------------
/* Result ends in a / */
string flNotFile(string File)
{
   string::size_type Res = File.rfind('/');
   if (Res == string::npos)
      return "./";
   return File.substr(0, Res + 1);
}
									/*}}}*/
// flCombine - Combine a file and a directory				/*{{{*/
// ---------------------------------------------------------------------
/* If the file is an absolute path then it is just returned, otherwise
   the directory is pre-pended to it. */
string flCombine(string Dir,string File)
{
   if (File.empty() == true)
      return string();

   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (File.length() >= 2 && File[0] == '.' && File[1] == '/')
      return File;
   if (Dir[Dir.length()-1] == '/')
      return Dir + File;
   return Dir + '/' + File;
}
									/*}}}*/
// flAbsPath - Return the absolute path of the filename			/*{{{*/
string flAbsPath(string File)
{
   char *p = realpath(File.c_str(), NULL);
   if (p == NULL)
   {
      _error->Errno("realpath", "flAbsPath on %s failed", File.c_str());
      return "";
   }
   std::string AbsPath(p);
   free(p);
   return AbsPath;
}
									/*}}}*/
// GetTempDir - $TMPDIR if usable, /tmp otherwise			/*{{{*/
std::string GetTempDir()
{
   const char *tmpdir = getenv("TMPDIR");

#ifdef P_tmpdir
   if (tmpdir == nullptr)
      tmpdir = P_tmpdir;
#endif

   struct stat st;
   if (tmpdir == nullptr || strlen(tmpdir) == 0 ||
	 stat(tmpdir, &st) != 0 || S_ISDIR(st.st_mode) == false)
      tmpdir = "/tmp";
   else if (geteuid() != 0 && access(tmpdir, R_OK | W_OK | X_OK) != 0)
      tmpdir = "/tmp";

   return string(tmpdir);
}
									/*}}}*/
// GetHomeDir - $HOME or the passwd entry of the user			/*{{{*/
std::string GetHomeDir()
{
   char const * const home = getenv("HOME");
   if (home != nullptr && home[0] != '\0')
      return home;

   struct passwd const * const pw = getpwuid(getuid());
   if (pw == nullptr || pw->pw_dir == nullptr)
      return "";
   return pw->pw_dir;
}
									/*}}}*/

class APPM_HIDDEN FileFdPrivate {						/*{{{*/
protected:
   FileFd * const filefd;
   // bytes read ahead by ReadLine, drained before the next read
   std::string pending;
public:
   explicit FileFdPrivate(FileFd * const pfilefd) : filefd(pfilefd) {}

   virtual bool InternalOpen(int const iFd, unsigned int const Mode) = 0;
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) = 0;
   ssize_t InternalRead(void * const To, unsigned long long const Size)
   {
      if (pending.empty() == false)
      {
	 unsigned long long const n = std::min<unsigned long long>(Size, pending.size());
	 memcpy(To, pending.data(), n);
	 pending.erase(0, n);
	 return n;
      }
      return InternalUnbufferedRead(To, Size);
   }
   virtual bool InternalReadError() { return filefd->FileFdErrno("read",_("Read error")); }
   bool InternalReadLine(std::string &To)
   {
      To.clear();
      char buf[4096];
      while (true)
      {
	 std::string::size_type const nl = pending.find('\n');
	 if (nl != std::string::npos)
	 {
	    To.append(pending, 0, nl);
	    pending.erase(0, nl + 1);
	    return true;
	 }
	 To.append(pending);
	 pending.clear();

	 unsigned long long actual = 0;
	 if (filefd->Read(buf, sizeof(buf), &actual) == false)
	    return false;
	 if (actual == 0)
	    return To.empty() == false;
	 pending.assign(buf, actual);
      }
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) = 0;
   virtual bool InternalWriteError() { return filefd->FileFdErrno("write",_("Write error")); }
   virtual bool InternalFlush() { return true; }
   virtual bool InternalClose(std::string const &FileName) = 0;

   virtual ~FileFdPrivate() {}
};
									/*}}}*/
class APPM_HIDDEN GzipFileFdPrivate: public FileFdPrivate {			/*{{{*/
#ifdef HAVE_ZLIB
public:
   gzFile gz;
   bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 gz = gzdopen(iFd, "w");
      else
	 gz = gzdopen(iFd, "r");
      filefd->Flags |= FileFd::Compressed;
      return gz != nullptr;
   }
   ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      return gzread(gz, To, Size);
   }
   bool InternalReadError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzread: %s (%d: %s)", _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return gzwrite(gz,From,Size);
   }
   bool InternalWriteError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzwrite: %s (%d: %s)", _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   bool InternalFlush() override
   {
      if (gz != nullptr && gzflush(gz, Z_SYNC_FLUSH) != Z_OK)
	 return InternalWriteError();
      return true;
   }
   bool InternalClose(std::string const &FileName) override
   {
      if (gz == nullptr)
	 return true;
      int const e = gzclose(gz);
      gz = nullptr;
      // gzclose() on empty files always fails with "buffer error" here, ignore that
      if (e != 0 && e != Z_BUF_ERROR)
	 return _error->Errno("close",_("Problem closing the gzip file %s"), FileName.c_str());
      return true;
   }

   explicit GzipFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), gz(nullptr) {}
   ~GzipFileFdPrivate() override { InternalClose(""); }
#endif
};
									/*}}}*/
class APPM_HIDDEN DirectFileFdPrivate: public FileFdPrivate			/*{{{*/
{
public:
   bool InternalOpen(int const, unsigned int const) override { return true; }
   ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      return read(filefd->iFd, To, Size);
   }
   ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return write(filefd->iFd, From, Size);
   }
   bool InternalClose(std::string const &) override { return true; }

   explicit DirectFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd) {}
};
									/*}}}*/
// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode) : iFd(-1), Flags(0), d(NULL)
{
   Open(FileName,Mode, None, AccessMode);
}
FileFd::FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode) : iFd(-1), Flags(0), d(NULL)
{
   Open(FileName,Mode, Compress, AccessMode);
}
FileFd::FileFd() : iFd(-1), Flags(AutoClose), d(NULL) {}
									/*}}}*/
// FileFd::Open - Open a file						/*{{{*/
// ---------------------------------------------------------------------
/* The most commonly used open mode combinations are given with Mode.
   With Extension a ".gz" suffix selects gzip, anything else is read
   and written as is. */
bool FileFd::Open(string FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   Close();
   Flags = AutoClose;

   if ((Mode & WriteOnly) != WriteOnly && (Mode & (Atomic | Create | Empty | Exclusive)) != 0)
      return FileFdError("ReadOnly mode for %s doesn't accept additional flags!", FileName.c_str());
   if ((Mode & ReadWrite) == 0)
      return FileFdError("No openmode provided in FileFd::Open for %s", FileName.c_str());

   if (Compress == Extension)
      Compress = APPM::String::Endswith(FileName, ".gz") ? Gzip : None;
#ifndef HAVE_ZLIB
   if (Compress == Gzip)
      return FileFdError(_("Gzip support is not available to open %s"), FileName.c_str());
#endif

   unsigned int OpenMode = Mode;
   if (FileName == "/dev/null")
      OpenMode = OpenMode & ~(Atomic | Exclusive | Create | Empty);

   if ((OpenMode & Atomic) == Atomic)
   {
      Flags |= Replace;
   }
   else if ((OpenMode & (Exclusive | Create)) == (Exclusive | Create))
   {
      // for atomic, this will be done by rename in Close()
      RemoveFile("FileFd::Open", FileName);
   }
   if ((OpenMode & Empty) == Empty)
   {
      struct stat Buf;
      if (lstat(FileName.c_str(),&Buf) == 0 && S_ISLNK(Buf.st_mode))
	 RemoveFile("FileFd::Open", FileName);
   }

   int fileflags = O_CLOEXEC;
   if ((OpenMode & ReadWrite) == ReadWrite)
      fileflags |= O_RDWR;
   else if ((OpenMode & WriteOnly) == WriteOnly)
      fileflags |= O_WRONLY;
   else
      fileflags |= O_RDONLY;
   if ((OpenMode & Create) == Create)
      fileflags |= O_CREAT;
   if ((OpenMode & Empty) == Empty)
      fileflags |= O_TRUNC;
   if ((OpenMode & Exclusive) == Exclusive)
      fileflags |= O_EXCL;

   if ((OpenMode & Atomic) == Atomic)
   {
      std::vector<char> name(FileName.begin(), FileName.end());
      for (char const c : std::string(".XXXXXX"))
	 name.push_back(c);
      name.push_back('\0');

      if ((iFd = mkostemp(name.data(), O_CLOEXEC)) == -1)
	 return FileFdErrno("mkstemp", "Could not create temporary file for %s", FileName.c_str());

      TemporaryFileName = string(name.data());

      // umask() will always set the umask and return the previous value, so
      // we first set the umask and then reset it to the old value
      mode_t const CurrentUmask = umask(0);
      umask(CurrentUmask);
      mode_t const FilePermissions = (AccessMode & ~CurrentUmask);

      if (fchmod(iFd, FilePermissions) == -1)
	 return FileFdErrno("fchmod", "Could not change permissions for temporary file %s", TemporaryFileName.c_str());
   }
   else
      iFd = open(FileName.c_str(), fileflags, AccessMode);

   this->FileName = FileName;
   if (iFd == -1 || OpenInternDescriptor(OpenMode, Compress) == false)
   {
      int const errsv = errno;
      if (iFd != -1)
      {
	 close (iFd);
	 iFd = -1;
      }
      if (TemporaryFileName.empty() == false)
      {
	 RemoveFile("FileFd::Open", TemporaryFileName);
	 TemporaryFileName.clear();
      }
      Flags &= ~Replace;
      errno = errsv;
      return FileFdErrno("open",_("Could not open file %s"), FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileFd::OpenInternDescriptor - Pick the backend for the descriptor	/*{{{*/
bool FileFd::OpenInternDescriptor(unsigned int const Mode, CompressMode const Compress)
{
   if (iFd == -1)
      return false;

   delete d;
   d = nullptr;
#ifdef HAVE_ZLIB
   if (Compress == Gzip)
      d = new GzipFileFdPrivate(this);
#endif
   if (d == nullptr)
      d = new DirectFileFdPrivate(this);
   return d->InternalOpen(iFd, Mode);
}
									/*}}}*/
// FileFd::~File - Closes the file					/*{{{*/
// ---------------------------------------------------------------------
/* If the proper modes are selected then we close the Fd and possibly
   unlink the file on error. */
FileFd::~FileFd()
{
   Close();
   delete d;
   d = NULL;
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
// ---------------------------------------------------------------------
/* We are careful to handle interruption by a signal while reading
   gracefully. With Actual given a short read is no error but marks the
   end of the file. */
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   if (Actual != 0)
      *Actual = 0;
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalRead(To, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    // trick the while-loop into running again
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalReadError();
      }

      To = (char *)To + Res;
      Size -= Res;
      if (Actual != 0)
	 *Actual += Res;
   }

   if (Size == 0)
      return true;

   // Eof handling
   if (Actual != 0)
   {
      Flags |= HitEof;
      return true;
   }

   return FileFdError(_("read, still have %llu to read but none left"), Size);
}
									/*}}}*/
// FileFd::ReadLine - Read a complete line from the file		/*{{{*/
bool FileFd::ReadLine(std::string &To)
{
   To.clear();
   if (d == nullptr || Failed())
      return false;
   return d->InternalReadLine(To);
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalWrite(From, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    // trick the while-loop into running again
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalWriteError();
      }

      From = (char const *)From + Res;
      Size -= Res;
   }

   if (Size == 0)
      return true;

   return FileFdError(_("write, still have %llu to write but couldn't"), Size);
}
									/*}}}*/
// FileFd::Close - Close the file if the close flag is set		/*{{{*/
// ---------------------------------------------------------------------
/* An atomic file is renamed over its destination here unless an
   operation on it failed, in which case the temporary file is dropped. */
bool FileFd::Close()
{
   if (iFd == -1)
      return true;

   bool Res = true;
   if ((Flags & AutoClose) == AutoClose)
   {
      if ((Flags & Compressed) != Compressed && close(iFd) != 0)
	 Res &= _error->Errno("close",_("Problem closing the file %s"), FileName.c_str());
   }

   if (d != NULL)
   {
      Res &= d->InternalClose(FileName);
      delete d;
      d = NULL;
   }

   if ((Flags & Replace) == Replace) {
      if (Failed() == false && Res == true && rename(TemporaryFileName.c_str(), FileName.c_str()) != 0)
	 Res &= _error->Errno("rename",_("Problem renaming the file %s to %s"), TemporaryFileName.c_str(), FileName.c_str());

      if (Failed() == true || Res == false)
	 RemoveFile("FileFd::Close", TemporaryFileName);
      TemporaryFileName.clear();
      Flags &= ~Replace;
   }

   iFd = -1;

   if (Res == false)
      Flags |= Fail;
   return Res;
}
									/*}}}*/
// FileFd::Sync - Sync the file						/*{{{*/
bool FileFd::Sync()
{
   if (d != nullptr && d->InternalFlush() == false)
      return false;
   if (fsync(iFd) != 0)
      return FileFdErrno("sync",_("Problem syncing the file"));
   return true;
}
									/*}}}*/
// FileFd::FileFdErrno - set Fail and call _error->Errno		*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description,...)
{
   Flags |= Fail;
   int const errsv = errno;
   va_list args;
   va_start(args,Description);
   std::string Text;
   vstrprintf(Text, Description, args);
   va_end(args);
   errno = errsv;
   return _error->Errno(Function, "%s", Text.c_str());
}
									/*}}}*/
// FileFd::FileFdError - set Fail and call _error->Error		*{{{*/
bool FileFd::FileFdError(const char *Description,...) {
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   std::string Text;
   vstrprintf(Text, Description, args);
   va_end(args);
   return _error->Insert(GlobalError::ERROR, Text);
}
									/*}}}*/
