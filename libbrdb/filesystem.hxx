// file      : libbrdb/filesystem.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_FILESYSTEM_HXX
#define LIBBRDB_FILESYSTEM_HXX

#include <libbutl/filesystem.hxx>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/export.hxx>

// Filesystem queries over the source tree. Unlike their libbutl
// counterparts, these issue diagnostics and throw failed on system errors.
//
namespace brdb
{
  using butl::auto_rmfile;
  using butl::auto_rmdir;

  // Return the modification time of the regular file or
  // timestamp_nonexistent if there is no such file.
  //
  LIBBRDB_SYMEXPORT timestamp
  mtime (const path&);

  LIBBRDB_SYMEXPORT bool
  exists (const path&);

  LIBBRDB_SYMEXPORT bool
  exists (const dir_path&);

  // Call the function for every regular file (or symlink to one) found
  // recursively in the directory, passing the directory path followed by
  // the file path relative to it. Symlinks to directories are not followed.
  // Dangling symlinks and inaccessible entries are skipped, with a warning
  // unless quiet is true.
  //
  LIBBRDB_SYMEXPORT void
  walk_files (const dir_path&,
              const function<void (path&&)>&,
              bool quiet = false);

  // Return the files matching the wildcard pattern (see butl::path_search()
  // for the syntax) searching from the directory if the pattern is
  // relative.
  //
  LIBBRDB_SYMEXPORT paths
  search (const path& pattern, const dir_path& start);
}

#endif // LIBBRDB_FILESYSTEM_HXX
