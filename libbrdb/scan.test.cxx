// file      : libbrdb/scan.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/scan.hxx>
#include <libbrdb/evaluator.hxx>
#include <libbrdb/filesystem.hxx>
#include <libbrdb/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

// Usage: argv[0]
//        argv[0] --worker <src-root> [--warn-targets|--fail]
//
// In the first form run the test which scans fragments using itself as the
// worker. In the second form act as the worker.
//
namespace brdb
{
  static void
  write (const path& f, const string& s)
  {
    ofdstream os (f);
    os << s;
    os.close ();
  }

  static strings
  targets (const board_params_list& ps)
  {
    strings r;
    for (const board_params& p: ps)
      r.push_back (p.target);

    sort (r.begin (), r.end ());
    return r;
  }

  int
  main (int argc, char* argv[])
  {
    init_process ();
    init_diag (1);
    init (argv[0]);

    try
    {
      if (argc >= 3 && argv[1] == string ("--worker"))
      {
        string o (argc > 3 ? argv[3] : "");

        if (o == "--fail")
        {
          for (string l; getline (cin, l); ) ;
          return 1;
        }

        evaluator_config c;
        c.src_root = dir_path (argv[2]);

        return run_scan_worker (c, o == "--warn-targets", cin, cout);
      }

      dir_path d (dir_path::temp_path ("brdb-scan"));
      dir_path cd (d / dir_path ("configs"));
      butl::try_mkdir_p (cd / dir_path ("sub"));
      auto_rmdir rm (d);

      for (const char* t: {"a", "b", "c", "d", "e"})
      {
        string s ("CONFIG_SYS_ARCH=\"arm\"\n"
                  "CONFIG_SYS_CPU=\"armv8\"\n"
                  "CONFIG_SYS_BOARD=\"");
        s += t;
        s += "\"\n";

        // Board c has no target option.
        //
        if (*t != 'c')
        {
          s += "CONFIG_TARGET_";
          s += ucase (t);
          s += "=y\n";
        }

        write (cd / (string (t) + "_defconfig"), s);
      }

      write (cd / dir_path ("sub") / "f_defconfig",
             "CONFIG_SYS_ARCH=\"sandbox\"\n"
             "CONFIG_TARGET_F=y\n");

      write (cd / ".hidden_defconfig", "");
      write (cd / "x.config", "");

      // Fragments.
      //
      {
        paths fs (find_fragments (cd));

        assert (fs.size () == 6);
        assert (fs[0].leaf ().string () == "a_defconfig");
        assert (fs[5].leaf ().string () == "f_defconfig");
        assert (fs[5].directory ().leaf ().string () == "sub");

        bool f (false);
        try
        {
          find_fragments (d / dir_path ("none"));
        }
        catch (const failed&)
        {
          f = true;
        }
        assert (f);
      }

      process_path wp (find_program (path (argv[0]), true));

      const strings all {"a", "b", "c", "d", "e", "f"};

      // Different number of workers including more workers than fragments.
      //
      for (size_t j: {1, 2, 4, 6, 10})
      {
        scan_result r (
          scan_fragments (cd,
                          j,
                          wp,
                          strings {"--worker",
                                   d.representation (),
                                   "--warn-targets"}));

        assert (targets (r.params) == all);
        assert ((r.warnings == strings {"c_defconfig: no TARGET_C enabled"}));

        for (const board_params& p: r.params)
        {
          if (p.target == "f")
          {
            assert (p.arch == "sandbox");
            assert (p.cpu == "-" && p.board == "-");
          }
          else
          {
            assert (p.arch == "aarch64");
            assert (p.cpu == "armv8");
            assert (p.board == p.target);
            assert (p.soc == "-" && p.config == "-");
          }

          assert (p.status.empty () && p.maintainers.empty ());
        }
      }

      // No warnings requested.
      //
      {
        scan_result r (
          scan_fragments (cd,
                          3,
                          wp,
                          strings {"--worker", d.representation ()}));

        assert (targets (r.params) == all);
        assert (r.warnings.empty ());
      }

      // Same fragment name in a subdirectory.
      //
      {
        path f (cd / dir_path ("sub") / "b_defconfig");
        write (f,
               "CONFIG_SYS_ARCH=\"x86\"\n"
               "CONFIG_TARGET_B=y\n");

        scan_result r (
          scan_fragments (cd,
                          2,
                          wp,
                          strings {"--worker",
                                   d.representation (),
                                   "--warn-targets"}));

        assert (targets (r.params) == all);
        assert ((r.warnings ==
                 strings {"c_defconfig: no TARGET_C enabled",
                          "sub/b_defconfig: duplicate target b, already "
                          "defined by b_defconfig"}));

        for (const board_params& p: r.params)
        {
          if (p.target == "b")
            assert (p.arch == "aarch64");
        }

        butl::try_rmfile (f);
      }

      // Failed worker.
      //
      {
        bool f (false);
        try
        {
          scan_fragments (cd,
                          2,
                          wp,
                          strings {"--worker", d.representation (), "--fail"});
        }
        catch (const failed&)
        {
          f = true;
        }
        assert (f);
      }
    }
    catch (const failed&)
    {
      return 1;
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return brdb::main (argc, argv);
}
