// file      : libbrdb/maintainers.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/filesystem.hxx>
#include <libbrdb/maintainers.hxx>
#include <libbrdb/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace brdb
{
  static void
  touch (const path& f)
  {
    ofdstream os (f);
    os.close ();
  }

  int
  main (int, char* argv[])
  {
    init_diag (1);
    init (argv[0]);

    try
    {
      dir_path d (dir_path::temp_path ("brdb-maintainers"));
      butl::try_mkdir_p (d / dir_path ("configs"));
      auto_rmdir rm (d);

      touch (d / "configs" / "bar_defconfig");
      touch (d / "configs" / "baz_defconfig");
      touch (d / "configs" / "qux_defconfig");
      touch (d / "configs" / "orphan_defconfig");
      touch (d / "configs" / "qux.config");

      // Records.
      //
      {
        istringstream is (
          "BAR BOARD\n"
          "M:\tJane Doe <jd@example.org>\n"
          "#M:\tJohn Roe <jr@example.org>\n"
          "S:\tMaintained\n"
          "F:\tboard/bar/\n"
          "F:\tconfigs/bar_defconfig\n"
          "\n"
          "BA BOARDS\n"
          "M:\tAnn Poe <ap@example.org>\n"
          "S:\tSupported\n"
          "N:\tba\n"
          "\n"
          "ORPHAN BOARD\n"
          "M:\tOld Hand <oh@example.org>\n"
          "S:\tOrphan (since 2020.01)\n"
          "F:\tconfigs/orphan_defconfig\n"
          "\n"
          "QUX BOARD\n"
          "M:\t-\n"
          "S:\tOdd Fixes\n"
          "F:\tconfigs/qux*\n");

        maintainers_database db;
        db.parse (is, path_name ("MAINTAINERS"), d);

        // The later N: record overrides bar.
        //
        assert (db.entries.size () == 4);

        assert (db.maintainers ("bar") == "Ann Poe <ap@example.org>");
        assert (db.status ("bar") == "Active");

        assert (db.maintainers ("baz") == "Ann Poe <ap@example.org>");

        assert (db.maintainers ("orphan").empty ());
        assert (db.status ("orphan") == "Orphan");

        // Only the fragment matches the pattern.
        //
        assert (db.maintainers ("qux").empty ());
        assert (db.status ("qux") == "-");

        assert (db.maintainers ("none").empty ());
        assert (db.status ("none") == "-");

        assert ((db.warnings == strings {
                   "no maintainers for 'orphan'",
                   "no maintainers for 'qux'",
                   "Odd Fixes: unknown status for 'qux'",
                   "no maintainers for 'none'",
                   "no status info for 'none'"}));
      }

      // Multiple maintainers, no status.
      //
      {
        istringstream is (
          "M:\tJane Doe <jd@example.org>\n"
          "#M:\tJohn Roe <jr@example.org>\n"
          "F:\tconfigs/bar_defconfig\n");

        maintainers_database db;
        db.parse (is, path_name ("MAINTAINERS"), d);

        assert (db.maintainers ("bar") ==
                "Jane Doe <jd@example.org>:John Roe <jr@example.org>");
        assert (db.status ("bar") == "-");
        assert ((db.warnings == strings {"-: unknown status for 'bar'"}));
      }

      // Status, no maintainers.
      //
      {
        istringstream is (
          "BAR BOARD\n"
          "F:\tconfigs/bar_defconfig\n"
          "S:\tMaintained\n");

        maintainers_database db;
        db.parse (is, path_name ("MAINTAINERS"), d);

        assert (db.status ("bar") == "Active");
        assert (db.maintainers ("bar").empty ());
        assert ((db.warnings == strings {"no maintainers for 'bar'"}));
      }

      // Invalid regex.
      //
      {
        istringstream is ("N:\tba(\n");

        maintainers_database db;

        bool f (false);
        try
        {
          db.parse (is, path_name ("MAINTAINERS"), d);
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
