// file      : libbrdb/evaluator.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/evaluator.hxx>
#include <libbrdb/filesystem.hxx>
#include <libbrdb/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace brdb
{
  static void
  write (const path& f, const string& s)
  {
    ofdstream os (f);
    os << s;
    os.close ();
  }

  int
  main (int, char* argv[])
  {
    init_diag (1);
    init (argv[0]);

    try
    {
      // The .config format.
      //
      {
        istringstream is (
          "#\n"
          "# Automatically generated file; DO NOT EDIT.\n"
          "#\n"
          "CONFIG_SYS_ARCH=\"arm\"\n"
          "CONFIG_SYS_CPU=\"arm\\\\v\\\"8\\\"\"\n"
          "CONFIG_TARGET_FOO=y\n"
          "# CONFIG_TARGET_BAR is not set\n"
          "  CONFIG_NR_DRAM_BANKS=4  \n"
          "CONFIG_BROKEN=\"x\n"
          "SOMETHING=else\n"
          "CONFIG_=1\n"
          "CONFIG_TARGET_FOO=n\n");

        config_values vs;
        vs.parse (is, path_name ("<stdin>"));

        assert (vs.values ().size () == 6);

        assert (*vs.find ("SYS_ARCH") == "arm");
        assert (*vs.find ("SYS_CPU") == "arm\\v\"8\"");
        assert (*vs.find ("TARGET_BAR") == "n");
        assert (*vs.find ("NR_DRAM_BANKS") == "4");
        assert (*vs.find ("BROKEN") == "\"x"); // Left as is.
        assert (vs.find ("SOMETHING") == nullptr);

        // Reassignment keeps the position.
        //
        assert (vs.values ()[2].first == "TARGET_FOO");
        assert (vs.values ()[2].second == "n");
      }

      // Fragment on top of the base configuration.
      //
      {
        dir_path d (dir_path::temp_path ("brdb-evaluator"));
        butl::try_mkdir_p (d);
        auto_rmdir rm (d);

        write (d / "base.config",
               "CONFIG_SYS_ARCH=\"arm\"\n"
               "CONFIG_SYS_CPU=\"armv7\"\n"
               "CONFIG_TARGET_ONE=y\n");

        path f (d / "two_defconfig");
        write (f,
               "CONFIG_SYS_CPU=\"armv8\"\n"
               "# CONFIG_TARGET_ONE is not set\n"
               "CONFIG_TARGET_TWO=y\n");

        evaluator_config c;
        c.src_root = d;
        c.base = path ("base.config"); // Relative to the source root.

        unique_ptr<evaluator> e (make_evaluator (c));
        assert (dynamic_cast<defconfig_evaluator*> (e.get ()) != nullptr);

        e->load (f);

        assert (e->value ("SYS_ARCH") == "arm");
        assert (e->value ("SYS_CPU") == "armv8");
        assert (e->value ("SYS_SOC").empty ());
        assert (!e->lookup ("SYS_SOC"));
        assert (e->flag ("TARGET_TWO"));
        assert (!e->flag ("TARGET_ONE"));

        strings ts;
        e->symbols ("TARGET_",
                    [&ts] (const string& n, const string& v)
                    {
                      ts.push_back (n + '=' + v);
                    });

        assert ((ts == strings {"TARGET_ONE=n", "TARGET_TWO=y"}));

        // Loading another fragment starts from the base again.
        //
        path g (d / "three_defconfig");
        write (g, "CONFIG_SYS_SOC=\"imx8\"\n");

        e->load (g);

        assert (e->value ("SYS_CPU") == "armv7");
        assert (e->value ("SYS_SOC") == "imx8");
        assert (e->flag ("TARGET_ONE"));
        assert (!e->lookup ("TARGET_TWO"));
      }

      // Unreadable fragment.
      //
      {
        defconfig_evaluator e ((evaluator_config ()));

        bool f (false);
        try
        {
          e.load (path ("/nonexistent/none_defconfig"));
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
