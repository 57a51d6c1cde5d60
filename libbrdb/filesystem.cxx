// file      : libbrdb/filesystem.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/filesystem.hxx>

#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  timestamp
  mtime (const path& f)
  {
    try
    {
      return file_mtime (f);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat " << f << ": " << e << endf;
    }
  }

  bool
  exists (const path& f)
  {
    try
    {
      return file_exists (f);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d)
  {
    try
    {
      return dir_exists (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat " << d << ": " << e << endf;
    }
  }

  static void
  skip (const path& p, bool symlink)
  {
    warn << "skipping " << (symlink ? "dangling symlink " : "inaccessible ")
         << p;
  }

  void
  walk_files (const dir_path& d, const function<void (path&&)>& f, bool q)
  {
    // Collect the subdirectories and descend after the iteration so that
    // only one directory is open at a time.
    //
    vector<dir_path> sub;

    try
    {
      for (const dir_entry& e: dir_iterator (d, dir_iterator::detect_dangling))
      {
        entry_type t (e.type ());

        if (t == entry_type::regular)
          f (d / e.path ());
        else if (t == entry_type::directory)
        {
          if (e.ltype () == entry_type::directory)
            sub.push_back (d / path_cast<dir_path> (e.path ()));
        }
        else if (t == entry_type::unknown && !q)
          skip (d / e.path (), e.ltype () == entry_type::symlink);
      }
    }
    catch (const system_error& e)
    {
      fail << "unable to iterate over " << d << ": " << e;
    }

    for (const dir_path& s: sub)
      walk_files (s, f, q);
  }

  paths
  search (const path& pattern, const dir_path& start)
  {
    paths r;

    try
    {
      path_search (
        pattern,
        [&r] (path&& p, const string&, bool interm)
        {
          if (!interm)
            r.push_back (move (p));

          return true;
        },
        start,
        path_match_flags::follow_symlinks,
        [] (const dir_entry& de)
        {
          skip (de.base () / de.path (), de.ltype () == entry_type::symlink);
          return true;
        });
    }
    catch (const system_error& e)
    {
      fail << "unable to search for " << pattern << " in " << start << ": "
           << e;
    }

    return r;
  }
}
