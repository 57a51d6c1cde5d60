// file      : libbrdb/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_UTILITY_HXX
#define LIBBRDB_UTILITY_HXX

#include <string>     // to_string()
#include <utility>    // move(), make_pair()
#include <cassert>
#include <iterator>   // make_move_iterator()
#include <algorithm>
#include <functional> // cref()

#include <libbutl/utility.hxx> // trim(), lcase(), eof(), etc

#include <libbrdb/types.hxx>
#include <libbrdb/version.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  using std::move;
  using std::cref;
  using std::make_pair;
  using std::make_move_iterator;
  using std::to_string;

  using butl::lcase;
  using butl::ucase;
  using butl::trim;
  using butl::next_word;
  using butl::getenv;
  using butl::eof;

  // Ignore SIGPIPE so that writing to a worker that has already exited
  // results in an io_error rather than in our termination. Should be called
  // once early in main().
  //
  LIBBRDB_SYMEXPORT void
  init_process ();

  // The brdb executable itself, found from argv[0]. It is the default scan
  // worker since the workers are started as brdb --scan-worker.
  //
  LIBBRDB_SYMEXPORT extern process_path argv0;

  LIBBRDB_SYMEXPORT void
  init (const char* argv0);

  // Command line of a child process: the program followed by the arguments
  // and terminated with NULL. Note that the result references the strings.
  //
  LIBBRDB_SYMEXPORT cstrings
  command_line (const char* program, const strings& args);

  // Search for the program. If init is true, then also initialize the
  // recall path (see butl::process::path_search()). Issue diagnostics and
  // throw failed if it cannot be found.
  //
  LIBBRDB_SYMEXPORT process_path
  find_program (const path&, bool init = false);

  // Start the process printing its command line at verbosity level 3 or
  // higher. The in and out values are as for butl::process (-1 for a pipe,
  // -2 for /dev/null). Issue diagnostics and throw failed on error.
  //
  LIBBRDB_SYMEXPORT process
  start_process (const process_env&,
                 const cstrings& args,
                 int in = 0,
                 int out = 1);

  // Wait for the process. Return true if it exited normally with the zero
  // code and false otherwise, in which case no diagnostics is issued.
  //
  LIBBRDB_SYMEXPORT bool
  wait_process (const cstrings& args, process&);

  // Wait for the process and report it as failed unless it exited normally
  // with the zero code (print its command line as well if the verbosity
  // level is 1 or 2). Then throw failed if fail is true or if the process
  // terminated abnormally. Otherwise return false.
  //
  LIBBRDB_SYMEXPORT bool
  finish_process (const cstrings& args, process&, bool fail = true);
}

#endif // LIBBRDB_UTILITY_HXX
