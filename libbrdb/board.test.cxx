// file      : libbrdb/board.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>
#include <libbrdb/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace brdb
{
  int
  main (int, char* argv[])
  {
    init_diag (1);
    init (argv[0]);

    try
    {
      // Read back.
      //
      {
        istringstream is (
          "#\n"
          "# List of boards\n"
          "#\n"
          "\n"
          "Active  arm      armv7  mx6    freescale  mx6sabre  mx6sabresd  mx6sabresd  Jane Doe <jd@example.org>\n"
          "   \n"
          "-       sandbox  -      -      -          sandbox   sandbox     -\n"
          "Orphan  x86\n");

        boards bs;
        bs.read (is);

        assert (bs.size () == 3);

        const board& b (bs.list ()[0]);
        assert (b.status == "Active");
        assert (b.arch == "arm");
        assert (b.cpu == "armv7");
        assert (b.soc == "mx6");
        assert (b.vendor == "freescale");
        assert (b.board_name == "mx6sabre");
        assert (b.target == "mx6sabresd");
        assert (b.config == "mx6sabresd"); // Extra fields are ignored.

        const board& s (bs.list ()[1]);
        assert (s.status.empty ());
        assert (s.cpu.empty () && s.soc.empty () && s.vendor.empty ());
        assert (s.target == "sandbox");
        assert (s.config.empty ());

        const board& o (bs.list ()[2]);
        assert (o.status == "Orphan" && o.arch == "x86");
        assert (o.target.empty () && o.config.empty ()); // Padded.
      }

      // Hand-edited database with a repeated target.
      //
      {
        istringstream is (
          "Active  arm  armv7  -  acme  foo  foo  foo\n"
          "Orphan  x86  -      -  acme  foo  foo  foo\n"
          "-       arm\n"
          "-       x86\n");

        boards bs;
        bs.read (is);

        assert (bs.size () == 4);
        assert (bs.find ("foo")->status == "Active");
        assert (bs.dict ().size () == 2); // foo and the empty target.
        assert ((bs.selected_names (strings {"foo"}) ==
                 strings {"foo", "foo"}));
      }

      // Properties.
      //
      {
        board b ("Active", "arm", "armv8", "imx8", "nxp", "evk", "imx8_evk",
                 "imx8");

        strings ps (b.props ());
        assert ((ps == strings {"imx8_evk", "arm", "armv8", "evk", "nxp",
                                "imx8"}));
      }

      // Lookup and selection helpers.
      //
      {
        boards bs;
        bs.add (board ("", "arm", "", "", "", "", "a", ""));
        bs.add (board ("", "x86", "", "", "", "", "b", ""));
        bs.add (board ("", "arm", "", "", "", "", "c", ""));

        assert (bs.find ("b") != nullptr && bs.find ("b")->arch == "x86");
        assert (bs.find ("d") == nullptr);

        assert (bs.dict ().size () == 3);

        // Database order, not selection order.
        //
        assert ((bs.selected_names (strings {"c", "a", "z"}) ==
                 strings {"a", "c"}));

        assert (bs.selected (strings {}).empty ());
        assert (bs.selected_dict (strings {"b"}).count ("b") == 1);
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
