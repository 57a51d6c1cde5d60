// file      : libbrdb/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/utility.hxx>

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <cerrno>   // errno
#include <cstdlib>  // exit()
#include <iostream> // cerr

#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)

#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  process_path argv0;

  void
  init_process ()
  {
#ifndef _WIN32
    if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
      fail << "unable to ignore SIGPIPE: "
           << system_error (errno, generic_category ());
#endif
  }

  void
  init (const char* a0)
  {
    argv0 = find_program (path (a0), true /* init */);
  }

  cstrings
  command_line (const char* p, const strings& args)
  {
    cstrings r {p};

    for (const string& a: args)
      r.push_back (a.c_str ());

    r.push_back (nullptr);
    return r;
  }

  process_path
  find_program (const path& p, bool init)
  {
    try
    {
      return process::path_search (p, init);
    }
    catch (const invalid_path& e)
    {
      fail << "invalid program path '" << e.path << "'" << endf;
    }
    catch (const process_error& e)
    {
      fail << "unable to find " << p << ": " << e << endf;
    }
  }

  process
  start_process (const process_env& pe, const cstrings& args, int in, int out)
  {
    if (verb >= 3)
    {
      diag_record dr (text);

      if (pe.env ())
        dr << pe << ' ';

      dr << butl::process_args {args.data (), 0};
    }

    try
    {
      return process (*pe.path,
                      args.data (),
                      in,
                      out,
                      2 /* stderr */,
                      pe.cwd != nullptr ? pe.cwd->string ().c_str () : nullptr,
                      pe.vars);
    }
    catch (const process_error& e)
    {
      // The child could not exec the program. It should exit right away
      // without unwinding our stack (and flushing our buffers).
      //
      if (e.child)
      {
        cerr << "unable to execute " << args[0] << ": " << e << endl;
        exit (1);
      }

      fail << "unable to execute " << args[0] << ": " << e << endf;
    }
  }

  bool
  wait_process (const cstrings& args, process& pr)
  {
    try
    {
      return pr.wait ();
    }
    catch (const process_error& e)
    {
      fail << "unable to wait for " << args[0] << ": " << e << endf;
    }
  }

  bool
  finish_process (const cstrings& args, process& pr, bool f)
  {
    if (wait_process (args, pr))
      return true;

    const butl::process_exit& e (*pr.exit);

    {
      diag_record dr (error);
      dr << args[0] << ' ' << e;

      if (verb == 1 || verb == 2)
        dr << info << "command line: "
           << butl::process_args {args.data (), 0};
    }

    if (f || !e.normal ())
      throw failed ();

    return false;
  }
}
