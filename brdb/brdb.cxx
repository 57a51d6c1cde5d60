// file      : brdb/brdb.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <limits>
#include <thread>   // thread::hardware_concurrency()
#include <cstring>  // strcmp()
#include <iostream> // cin, cout

#include <libbutl/pager.hxx>
#include <libbutl/default-options.hxx>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/scan.hxx>
#include <libbrdb/board.hxx>
#include <libbrdb/version.hxx>
#include <libbrdb/database.hxx>
#include <libbrdb/selector.hxx>
#include <libbrdb/evaluator.hxx>
#include <libbrdb/diagnostics.hxx>

#include <brdb/brdb-options.hxx>

using namespace butl;
using namespace std;

namespace brdb
{
  int
  main (int argc, char* argv[]);

  // The default options files are numbered from zero by
  // load_default_options() and must come before the command line, which is
  // therefore numbered from the middle of the range.
  //
  static const size_t cmdline_pos (numeric_limits<size_t>::max () / 2);

  // Parse the options and return the selection terms. The two can be
  // interleaved (brdb arm -l works) and everything after -- is a term.
  //
  static strings
  parse_cmdline (int argc, char* argv[], brdb_options& ops)
  {
    strings r;
    cli::argv_file_scanner s (argc, argv, "--options-file", cmdline_pos);

    for (bool opts (true); s.more (); )
    {
      if (opts)
      {
        ops.parse (s);

        if (!s.more ())
          break;

        if (strcmp (s.peek (), "--") == 0)
        {
          s.next ();
          opts = false;
          continue;
        }
      }

      r.push_back (s.next ());
    }

    return r;
  }

  static uint16_t
  verbosity (const brdb_options& o)
  {
    return o.verbose_specified () ? o.verbose () :
           o.V ()                 ? 3           :
           o.v ()                 ? 2           :
           o.quiet ()             ? 0           : 1;
  }

  // Load brdb.options from the .build2/ subdirectories of the home directory
  // and of the working directory hierarchy (plus --default-options) and
  // merge them under the command line options.
  //
  static void
  merge_defaults (brdb_options& ops)
  {
    tracer trace ("merge_defaults");

    uint16_t v (verbosity (ops)); // Diagnostics is not initialized yet.

    if (ops.no_default_options ())
      return;

    if (optional<string> e = getenv ("BRDB_DEF_OPT"))
    {
      if (*e != "true" && *e != "1")
      {
        if (v >= 5)
          trace << "default options disabled with BRDB_DEF_OPT=" << *e;

        return;
      }
    }

    optional<dir_path> extra;
    if (ops.default_options_specified ())
    {
      try
      {
        extra = ops.default_options ();
        extra->complete ().normalize ();
      }
      catch (const invalid_path& e)
      {
        fail << "invalid --default-options value '" << e.path << "'";
      }
    }

    dir_path start;
    try
    {
      start = dir_path::current_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    try
    {
      default_options<brdb_options> d (
        load_default_options<brdb_options,
                             cli::argv_file_scanner,
                             cli::unknown_mode> (
          nullopt /* sys_dir */,
          path::home_directory (),
          extra,
          default_options_files {{path ("brdb.options")}, move (start)},
          [&trace, v] (const path& f, bool remote, bool overridden)
          {
            if (v >= 3)
              trace << (overridden ? "overridden " : "loading ")
                    << (remote ? "remote " : "local ") << f;
          },
          "--options-file",
          cmdline_pos,
          1024 /* max arguments */,
          false /* args */));

      ops = merge_default_options (d, ops);
    }
    catch (const invalid_argument& e)
    {
      fail << "unable to load default options files: " << e;
    }
    catch (const pair<path, system_error>& e)
    {
      fail << "unable to load default options file " << e.first << ": "
           << e.second;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain home directory: " << e;
    }
  }

  // The workers get everything they need on the command line since the
  // default options have already been merged into ours.
  //
  static strings
  worker_arguments (const brdb_options& ops, const evaluator_config& ec)
  {
    strings r {"--scan-worker",
               "--no-default-options",
               "--verbose", to_string (verb),
               "--src-root", ec.src_root.representation ()};

    if (ops.warn_targets ())
      r.push_back ("--warn-targets");

    if (ec.conf)
    {
      r.push_back ("--kconfig-conf");
      r.push_back (ec.conf->string ());
    }

    if (ec.base)
    {
      r.push_back ("--base-config");
      r.push_back (ec.base->string ());
    }

    return r;
  }

  // Split the --board|-b values (comma-separated lists) into board names.
  //
  static strings
  board_names (const strings& vs)
  {
    strings r;
    for (const string& v: vs)
    {
      for (size_t b (0), e (0); next_word (v, b, e, ','); )
      {
        string n (v, b, e - b);

        if (!trim (n).empty ())
          r.push_back (move (n));
      }
    }
    return r;
  }

  // Select the boards from the database and either list them or print
  // their number. Return false if there were warnings.
  //
  static bool
  list_boards (const path& db, const brdb_options& ops, const strings& terms)
  {
    boards bs;
    bs.read (db);

    selection s (
      select_boards (bs, terms, ops.exclude (), board_names (ops.board ())));

    for (const string& w: s.warnings)
      warn << w;

    if (ops.list ())
    {
      if (verb >= 2)
      {
        for (const pair<string, strings>& t: s.terms)
          cout << t.first << ": " << t.second.size () << endl;
      }

      for (const string& t: s.all)
        cout << t << endl;
    }
    else if (verb != 0)
      text << s.all.size () << " boards selected";

    return s.warnings.empty ();
  }

  int
  main (int argc, char* argv[])
  {
    tracer trace ("main");

    try
    {
      init_process ();

      brdb_options ops;
      strings terms;

      try
      {
        terms = parse_cmdline (argc, argv, ops);
        merge_defaults (ops);
      }
      catch (const cli::exception& e)
      {
        fail << e;
      }

      if (ops.version ())
      {
        cout << "brdb " << LIBBRDB_VERSION_ID << endl
             << "libbutl " << LIBBUTL_VERSION_ID << endl
             << "This is free software released under the MIT license."
             << endl;

        return 0;
      }

      uint16_t v (verbosity (ops));

      if (v > 6)
        fail << "invalid --verbose value " << v <<
          info << "expected value between 0 and 6";

      init_diag (v);

      if (ops.help ())
      {
        try
        {
          pager p ("brdb help",
                   verb >= 2,
                   ops.pager_specified () ? &ops.pager () : nullptr,
                   &ops.pager_option ());

          print_brdb_usage (p.stream ());

          // A failed pager has issued its own diagnostics.
          //
          return p.wait () ? 0 : 1;
        }
        catch (const system_error& e)
        {
          fail << "pager failed: " << e;
        }
      }

      if (ops.jobs_specified () && ops.jobs () == 0)
        fail << "invalid --jobs|-j value 0";

      if (ops.scan_worker () && !terms.empty ())
        fail << "unexpected argument '" << terms.front () << "'" <<
          info << "scan worker reads fragment paths from stdin";

      init (argv[0]);

      l5 ([&]{trace << "brdb: " << argv0.effect_string ();});

      evaluator_config ec;
      ec.src_root = ops.src_root ();

      if (ops.kconfig_conf_specified ())
        ec.conf = ops.kconfig_conf ();

      if (ops.base_config_specified ())
        ec.base = ops.base_config ();

      if (ops.scan_worker ())
        return run_scan_worker (ec, ops.warn_targets (), cin, cout);

      build_options bo;
      bo.config_dir = ops.config_dir ();
      bo.src_root = ec.src_root;
      bo.force = ops.force ();
      bo.quiet = verb == 0;
      bo.worker = argv0;
      bo.worker_args = worker_arguments (ops, ec);

      if (ops.jobs_specified ())
        bo.jobs = ops.jobs ();
      else if ((bo.jobs = std::thread::hardware_concurrency ()) == 0)
      {
        warn << "unable to determine the number of hardware threads" <<
          info << "scanning serially, use --jobs|-j to override";

        bo.jobs = 1;
      }

      const path& db (ops.output ());

      bool ok (ensure_board_list (db, bo));

      if (!terms.empty () || !ops.board ().empty () || ops.list ())
      {
        if (!list_boards (db, ops, terms))
          ok = false;
      }

      return ok ? 0 : 2;
    }
    catch (const failed&)
    {
      return 1; // Diagnostics has already been issued.
    }
  }
}

int
main (int argc, char* argv[])
{
  return brdb::main (argc, argv);
}
