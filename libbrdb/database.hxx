// file      : libbrdb/database.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_DATABASE_HXX
#define LIBBRDB_DATABASE_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // The comment block the board database starts with.
  //
  LIBBRDB_SYMEXPORT extern const char database_header[];

  // Write the board database. Each line contains the status, arch, cpu,
  // soc, vendor, board, target, config, and maintainers fields, each padded
  // to the widest value of the field and separated by two spaces. The lines
  // are sorted ignoring case.
  //
  // Issue diagnostics and throw failed if unable to write.
  //
  LIBBRDB_SYMEXPORT void
  write_boards (const board_params_list&, const path& output);

  // Return true if the board database exists and is up to date. That is, it
  // is newer than every fragment in the configuration directory as well as
  // every MAINTAINERS and Kconfig* file in the source tree, and every target
  // it lists still has a fragment.
  //
  // Note that modification times are compared so a file that was only
  // chmod'ed or that was restored with its old modification time does not
  // make the database out of date.
  //
  // The source tree walk is quiet: dangling symlinks are skipped without a
  // warning.
  //
  // Issue diagnostics and throw failed if the existing database cannot be
  // read.
  //
  LIBBRDB_SYMEXPORT bool
  output_is_new (const path& output,
                 const dir_path& config_dir,
                 const dir_path& src_root);

  // Parse every MAINTAINERS file in the source tree and attach status and
  // maintainers to the board parameters. Return the warnings, sorted.
  //
  LIBBRDB_SYMEXPORT strings
  insert_maintainers (const dir_path& src_root, board_params_list&);

  // Scan the fragments (see scan_fragments() for details on the worker
  // arguments) and insert maintainers. Return the board parameters plus the
  // scan warnings followed by the maintainers warnings.
  //
  LIBBRDB_SYMEXPORT pair<board_params_list, strings>
  build_board_list (const dir_path& config_dir,
                    const dir_path& src_root,
                    size_t jobs,
                    const process_path& worker,
                    const strings& worker_args);

  struct build_options
  {
    dir_path config_dir;
    dir_path src_root;
    size_t jobs = 1;
    bool force = false;
    bool quiet = false;

    process_path worker;
    strings worker_args;
  };

  // Generate the board database unless it is up to date (or unless forced)
  // issuing the warnings, if any. Return false if there were warnings.
  //
  LIBBRDB_SYMEXPORT bool
  ensure_board_list (const path& output, const build_options&);
}

#endif // LIBBRDB_DATABASE_HXX
