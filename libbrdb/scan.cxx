// file      : libbrdb/scan.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/scan.hxx>

#include <chrono>

#include <libbrdb/scanner.hxx>
#include <libbrdb/filesystem.hxx>
#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  paths
  find_fragments (const dir_path& d)
  {
    if (!exists (d))
      fail << "configuration directory " << d << " does not exist";

    const string sfx ("_defconfig");

    paths r;
    walk_files (d,
                [&r, &sfx] (path&& f)
                {
                  const string& n (f.leaf ().string ());

                  // Skip hidden files.
                  //
                  size_t m (sfx.size ());

                  if (n[0] != '.'     &&
                      n.size () >= m  &&
                      n.compare (n.size () - m, m, sfx) == 0)
                    r.push_back (move (f));
                });

    sort (r.begin (), r.end ());
    return r;
  }

  // Worker protocol field escaping.
  //
  static void
  write_field (ostream& os, const string& f)
  {
    for (char c: f)
    {
      switch (c)
      {
      case '\\': os << "\\\\"; break;
      case '\t': os << "\\t";  break;
      case '\n': os << "\\n";  break;
      default:   os << c;      break;
      }
    }
  }

  // Split the line into tab-separated fields unescaping them. Return nullopt
  // if the line contains an invalid escape sequence.
  //
  static optional<strings>
  parse_fields (const string& l)
  {
    strings r (1);

    for (size_t i (0), n (l.size ()); i != n; ++i)
    {
      char c (l[i]);

      if (c == '\t')
      {
        r.emplace_back ();
        continue;
      }

      if (c == '\\')
      {
        if (++i == n)
          return nullopt;

        switch (l[i])
        {
        case '\\': c = '\\'; break;
        case 't':  c = '\t'; break;
        case 'n':  c = '\n'; break;
        default:   return nullopt;
        }
      }

      r.back () += c;
    }

    return r;
  }

  int
  run_scan_worker (const evaluator_config& cfg,
                   bool warn_targets,
                   istream& is,
                   ostream& os)
  {
    tracer trace ("run_scan_worker");

    // Read the whole share before producing any output so that the
    // coordinator never blocks writing it.
    //
    paths fs;
    try
    {
      for (string l; !eof (getline (is, l)); )
      {
        if (!l.empty ())
          fs.push_back (path (move (l)));
      }
    }
    catch (const invalid_path& e)
    {
      fail << "invalid fragment path '" << e.path << "'";
    }
    catch (const io_error& e)
    {
      fail << "unable to read fragment list: " << e;
    }

    l5 ([&]{trace << "scanning " << fs.size () << " fragments";});

    unique_ptr<evaluator> e (make_evaluator (cfg));
    fragment_scanner s (*e);

    try
    {
      os.exceptions (ostream::badbit | ostream::failbit);

      for (const path& f: fs)
      {
        auto df = make_diag_frame (
          [&f] (const diag_record& dr)
          {
            dr << info << "while scanning fragment " << f;
          });

        pair<board_params, strings> r (s.scan (f, warn_targets));

        for (const string& w: r.second)
        {
          os << 'W' << '\t';
          write_field (os, w);
          os << '\n';
        }

        const board_params& p (r.first);

        os << 'R';
        for (const string* v: {&p.arch, &p.cpu, &p.soc, &p.vendor,
                               &p.board, &p.target, &p.config})
        {
          os << '\t';
          write_field (os, *v);
        }
        os << '\n';

        os.flush ();
      }
    }
    catch (const io_error& e)
    {
      fail << "unable to write scan results: " << e;
    }

    return 0;
  }

  namespace
  {
    struct worker
    {
      process pr;
      ifdstream is;
      string line; // Partially read line.

      explicit
      worker (process&& p)
          : pr (move (p)),
            is (move (pr.in_ofd),
                fdstream_mode::non_blocking,
                ifdstream::badbit)
      {
      }
    };
  }

  scan_result
  scan_fragments (const dir_path& cd,
                  size_t jobs,
                  const process_path& wp,
                  const strings& wargs)
  {
    tracer trace ("scan_fragments");

    assert (jobs != 0);

    paths fs (find_fragments (cd));
    set<string> warnings;

    // There can only be one database line per target so skip fragments
    // with the same name in different subdirectories, keeping the first
    // one.
    //
    {
      map<string, const path*> ts;
      paths ufs;

      for (path& f: fs)
      {
        if (optional<string> t = fragment_target (f))
        {
          auto i (ts.emplace (move (*t), &f));

          if (!i.second)
          {
            warnings.insert (f.leaf (cd).string () + ": duplicate target " +
                             i.first->first + ", already defined by " +
                             i.first->second->leaf (cd).string ());
            continue;
          }
        }

        ufs.push_back (f);
      }

      fs.swap (ufs);
    }

    size_t n (fs.size ());

    l4 ([&]{trace << n << " fragments in " << cd << ", " << jobs << " jobs";});

    cstrings args (command_line (wp.recall_string (), wargs));

    // Start the workers feeding each its share.
    //
    vector<unique_ptr<worker>> ws;
    for (size_t i (0); i != jobs; ++i)
    {
      size_t b (n * i / jobs);
      size_t be (n * (i + 1) / jobs);

      if (b == be)
        continue;

      process pr (start_process (wp, args, -1 /* stdin */, -1 /* stdout */));
      try
      {
        ofdstream os (move (pr.out_fd));

        for (size_t j (b); j != be; ++j)
          os << fs[j].string () << '\n';

        os.close ();
      }
      catch (const io_error& e)
      {
        // If the worker has failed, then that is the reason we could not
        // write and finish_process() reports it.
        //
        if (wait_process (args, pr))
          fail << "unable to write to " << args[0] << " input: " << e;

        finish_process (args, pr);
      }

      ws.push_back (unique_ptr<worker> (new worker (move (pr))));
    }

    scan_result r;

    auto parse = [&r, &warnings, &args] (const string& l)
    {
      optional<strings> fs (parse_fields (l));

      if (fs && fs->size () == 2 && (*fs)[0] == "W")
      {
        warnings.insert (move ((*fs)[1]));
      }
      else if (fs && fs->size () == 8 && (*fs)[0] == "R")
      {
        strings& v (*fs);

        board_params p;
        p.arch   = move (v[1]);
        p.cpu    = move (v[2]);
        p.soc    = move (v[3]);
        p.vendor = move (v[4]);
        p.board  = move (v[5]);
        p.target = move (v[6]);
        p.config = move (v[7]);

        r.params.push_back (move (p));
      }
      else
        fail << "invalid " << args[0] << " output line '" << l << "'";
    };

    // Drain the results while any worker is running checking their status
    // at least every 30 milliseconds. Once all of them have exited, read
    // whatever is left until eof.
    //
    fdselect_set fds;
    for (const unique_ptr<worker>& w: ws)
      fds.emplace_back (w->is.fd (), w.get ());

    auto running = [&ws, &args] ()
    {
      try
      {
        for (const unique_ptr<worker>& w: ws)
        {
          if (!w->pr.try_wait ())
            return true;
        }

        return false;
      }
      catch (const process_error& e)
      {
        fail << "unable to wait for " << args[0] << ": " << e << endf;
      }
    };

    optional<string> io; // Read error, if any.
    try
    {
      bool run (!ws.empty ());

      for (size_t unread (fds.size ()); unread != 0; )
      {
        for (fdselect_state& s: fds)
        {
          if (s.fd == nullfd)
            continue;

          worker& w (*static_cast<worker*> (s.data));

          while (getline_non_blocking (w.is, w.line))
          {
            if (eof (w.is))
            {
              s.fd = nullfd;
              --unread;
              break;
            }

            parse (w.line);
            w.line.clear ();
          }
        }

        if (unread == 0)
          break;

        if (run)
        {
          ifdselect (fds, chrono::milliseconds (30));
          run = running ();
        }
        else
          ifdselect (fds);
      }

      for (const unique_ptr<worker>& w: ws)
        w->is.close ();
    }
    catch (const io_error& e)
    {
      io = e.what ();
    }

    // Wait for the workers and report the failed ones.
    //
    bool ok (true);
    for (const unique_ptr<worker>& w: ws)
    {
      try
      {
        if (!finish_process (args, w->pr, false /* fail */))
          ok = false;
      }
      catch (const failed&)
      {
        ok = false; // Diagnostics has already been issued.
      }
    }

    if (!ok)
      fail << "unable to scan fragments in " << cd <<
        info << "board parameters are incomplete";

    if (io)
      fail << "io error reading " << args[0] << " output: " << *io;

    r.warnings.assign (warnings.begin (), warnings.end ());
    return r;
  }
}
