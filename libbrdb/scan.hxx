// file      : libbrdb/scan.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_SCAN_HXX
#define LIBBRDB_SCAN_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>
#include <libbrdb/evaluator.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // Return the paths of fragments (files matching *_defconfig but not
  // hidden) found recursively in the directory, sorted.
  //
  // Issue diagnostics and throw failed if the directory does not exist or
  // cannot be iterated over.
  //
  LIBBRDB_SYMEXPORT paths
  find_fragments (const dir_path&);

  struct scan_result
  {
    board_params_list params;
    strings warnings; // Unique and sorted.
  };

  // Scan fragments in the configuration directory in parallel.
  //
  // A fragment with the same target as an earlier one (the same file name
  // in another subdirectory) is skipped with a warning.
  //
  // The fragments are split into the specified number of consecutive shares
  // (share i is [n*i/jobs, n*(i+1)/jobs)) and each non-empty share is
  // scanned by a separate worker process. The worker is started with the
  // specified arguments, receives its share on stdin (one path per line),
  // and writes the results to stdout (see run_scan_worker() for details).
  //
  // The results are read from all the workers as they become available.
  // The order of parameters from the same worker follows the share order
  // while the order across workers is unspecified.
  //
  // Issue diagnostics and throw failed if any worker fails.
  //
  LIBBRDB_SYMEXPORT scan_result
  scan_fragments (const dir_path& config_dir,
                  size_t jobs,
                  const process_path& worker,
                  const strings& worker_args);

  // The worker side of scan_fragments(): read the fragment paths from the
  // input stream until eof, scan them one by one, and write the results to
  // the output stream. For each fragment the result is zero or more warning
  // lines followed by the parameters line:
  //
  // W <warning>
  // R <arch> <cpu> <soc> <vendor> <board> <target> <config>
  //
  // Where the fields are separated with tabs and the tab, newline, and
  // backslash characters within fields are escaped as \t, \n, and \\.
  //
  // Issue diagnostics and throw failed on errors. Return the exit code.
  //
  LIBBRDB_SYMEXPORT int
  run_scan_worker (const evaluator_config&,
                   bool warn_targets,
                   istream&,
                   ostream&);
}

#endif // LIBBRDB_SCAN_HXX
