// file      : libbrdb/database.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/database.hxx>

#include <sstream>

#include <libbrdb/scan.hxx>
#include <libbrdb/filesystem.hxx>
#include <libbrdb/maintainers.hxx>
#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  const char database_header[] =
    "#\n"
    "# List of boards\n"
    "#   Automatically generated by brdb: don't edit\n"
    "#\n"
    "# Status, Arch, CPU, SoC, Vendor, Board, Target, Config, Maintainers\n"
    "\n";

  void
  write_boards (const board_params_list& ps, const path& f)
  {
    using field = string board_params::*;

    const field fields[] = {
      &board_params::status,
      &board_params::arch,
      &board_params::cpu,
      &board_params::soc,
      &board_params::vendor,
      &board_params::board,
      &board_params::target,
      &board_params::config,
      &board_params::maintainers};

    // First, determine the width of each column.
    //
    size_t ws[9] = {};
    for (const board_params& p: ps)
    {
      for (size_t i (0); i != 9; ++i)
        ws[i] = max (ws[i], (p.*fields[i]).size ());
    }

    // Each line is paired with its lower-case version used as the sort key.
    //
    vector<pair<string, string>> ls;
    ls.reserve (ps.size ());

    for (const board_params& p: ps)
    {
      string l;
      for (size_t i (0); i != 9; ++i)
      {
        const string& v (p.*fields[i]);

        l += "  ";
        l += v;
        l.append (ws[i] - v.size (), ' ');
      }

      trim (l);

      string k (lcase (l.c_str ()));
      ls.emplace_back (move (k), move (l));
    }

    stable_sort (ls.begin (), ls.end (),
                 [] (const pair<string, string>& x,
                     const pair<string, string>& y)
                 {
                   return x.first < y.first;
                 });

    try
    {
      ofdstream ofs (f);

      // Remove the partially written database if anything goes wrong.
      //
      auto_rmfile rm (f);

      ofs << database_header;

      for (size_t i (0); i != ls.size (); ++i)
      {
        if (i != 0)
          ofs << '\n';

        ofs << ls[i].second;
      }

      ofs << '\n';
      ofs.close ();

      rm.cancel ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << f << ": " << e;
    }
  }

  bool
  output_is_new (const path& f,
                 const dir_path& config_dir,
                 const dir_path& src_root)
  {
    tracer trace ("output_is_new");

    timestamp t (mtime (f));

    if (t == timestamp_nonexistent)
      return false;

    if (exists (config_dir))
    {
      for (const path& p: find_fragments (config_dir))
      {
        if (mtime (p) > t)
        {
          l4 ([&]{trace << p << " is newer than " << f;});
          return false;
        }
      }
    }

    bool r (true);
    walk_files (src_root,
                [&r, &t, &f, &trace] (path&& p)
                {
                  if (!r)
                    return;

                  const string& n (p.leaf ().string ());

                  if (n.back () == '~' ||
                      (n.compare (0, 7, "Kconfig") != 0 && n != "MAINTAINERS"))
                    return;

                  if (mtime (p) > t)
                  {
                    l4 ([&]{trace << p << " is newer than " << f;});
                    r = false;
                  }
                },
                true /* quiet */);

    if (!r)
      return false;

    // Detect a board that has been removed since the database was generated.
    //
    try
    {
      ifdstream ifs (f);

      for (string l; !eof (getline (ifs, l)); )
      {
        // Legacy format.
        //
        if (l.find ("Options,") != string::npos)
        {
          l4 ([&]{trace << f << " is in the legacy format";});
          return false;
        }

        if (l.empty () || l[0] == '#')
          continue;

        strings fs;
        {
          istringstream ls (l);
          for (string w; ls >> w && fs.size () != 7; )
            fs.push_back (move (w));
        }

        if (fs.size () != 7)
        {
          l4 ([&]{trace << "malformed line '" << l << "' in " << f;});
          return false;
        }

        path d (config_dir / path (fs[6] + "_defconfig"));

        if (!exists (d))
        {
          l4 ([&]{trace << d << " no longer exists";});
          return false;
        }
      }

      ifs.close ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid target in " << f << ": '" << e.path << "'";
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }

    return true;
  }

  strings
  insert_maintainers (const dir_path& src_root, board_params_list& ps)
  {
    maintainers_database db;

    // Note that the buildman tests carry their own MAINTAINERS files that
    // are not part of the database.
    //
    paths fs;
    walk_files (src_root,
                [&fs] (path&& p)
                {
                  if (p.leaf ().string () == "MAINTAINERS" &&
                      p.directory ().string ().find ("tools/buildman") ==
                      string::npos)
                    fs.push_back (move (p));
                });

    sort (fs.begin (), fs.end ());

    for (const path& f: fs)
      db.parse_file (src_root, f);

    for (board_params& p: ps)
    {
      p.maintainers = db.maintainers (p.target);
      p.status = !p.maintainers.empty () ? db.status (p.target) : unset_value;
    }

    strings r (move (db.warnings));
    sort (r.begin (), r.end ());
    return r;
  }

  pair<board_params_list, strings>
  build_board_list (const dir_path& config_dir,
                    const dir_path& src_root,
                    size_t jobs,
                    const process_path& worker,
                    const strings& worker_args)
  {
    scan_result sr (scan_fragments (config_dir, jobs, worker, worker_args));

    strings mws (insert_maintainers (src_root, sr.params));

    strings& ws (sr.warnings);
    ws.insert (ws.end (),
               make_move_iterator (mws.begin ()),
               make_move_iterator (mws.end ()));

    return make_pair (move (sr.params), move (ws));
  }

  bool
  ensure_board_list (const path& f, const build_options& o)
  {
    if (!o.force && output_is_new (f, o.config_dir, o.src_root))
    {
      if (!o.quiet)
        text << f << " is up to date. Nothing to do.";

      return true;
    }

    pair<board_params_list, strings> r (
      build_board_list (o.config_dir,
                        o.src_root,
                        o.jobs,
                        o.worker,
                        o.worker_args));

    for (const string& w: r.second)
      warn << w;

    write_boards (r.first, f);

    return r.second.empty ();
  }
}
