// file      : libbrdb/selector.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>
#include <libbrdb/selector.hxx>
#include <libbrdb/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace brdb
{
  static strings
  texts (const terms& ts)
  {
    strings r;
    for (const term& t: ts)
      r.push_back (t.text ());
    return r;
  }

  int
  main (int, char* argv[])
  {
    init_diag (1);
    init (argv[0]);

    try
    {
      // Terms.
      //
      {
        assert ((texts (build_terms (strings {"arm & freescale sandbox",
                                              "tegra"})) ==
                 strings {"arm&freescale", "sandbox", "tegra"}));

        assert ((texts (build_terms (strings {"arm&freescale&mx6"})) ==
                 strings {"arm&freescale&mx6"}));

        assert ((texts (build_terms (strings {"arm&", "x86"})) ==
                 strings {"arm&x86"}));

        // Leading & starts a new term.
        //
        assert ((texts (build_terms (strings {"& arm"})) ==
                 strings {"arm"}));

        assert (build_terms (strings {}).empty ());
        assert (build_terms (strings {"  "}).empty ());
      }

      boards bs;
      bs.add (board ("Active", "arm", "armv7", "socX", "vendorA", "one",
                     "one_a", "one"));
      bs.add (board ("Active", "arm", "armv7", "socY", "vendorA", "two",
                     "two_a", "two"));
      bs.add (board ("Active", "arm", "armv8", "socX", "vendorB", "three",
                     "three_b", "three"));
      bs.add (board ("Active", "sandbox", "", "", "", "sandbox",
                     "sandbox", "sandbox"));

      // First matching term wins.
      //
      {
        selection s (select_boards (bs,
                                    strings {"vendorA & socX", "vendorB"}));

        assert ((s.all == strings {"one_a", "three_b"}));
        assert (s.terms.size () == 2);
        assert ((*s.find ("vendorA&socX") == strings {"one_a"}));
        assert ((*s.find ("vendorB") == strings {"three_b"}));
        assert (s.find ("vendorA") == nullptr);
        assert (s.warnings.empty ());
      }

      {
        selection s (select_boards (bs, strings {"arm", "armv8"}));

        assert ((s.all == strings {"one_a", "two_a", "three_b"}));
        assert ((*s.find ("arm") == strings {"one_a", "two_a", "three_b"}));
        assert (s.find ("armv8")->empty ());
      }

      // Same terms share the bucket.
      //
      {
        selection s (select_boards (bs, strings {"sandbox", "sandbox"}));

        assert (s.terms.size () == 1);
        assert ((*s.find ("sandbox") == strings {"sandbox"}));
      }

      // Matches the beginning of a property.
      //
      {
        selection s (select_boards (bs, strings {"thr"}));
        assert ((s.all == strings {"three_b"}));

        s = select_boards (bs, strings {"hree"});
        assert (s.all.empty ());

        s = select_boards (bs, strings {".*_b"});
        assert ((s.all == strings {"three_b"}));
      }

      // Exclusions.
      //
      {
        selection s (select_boards (bs, strings {"arm"}, strings {"socX"}));
        assert ((s.all == strings {"two_a"}));
        assert ((*s.find ("arm") == strings {"two_a"}));

        s = select_boards (bs, strings {}, strings {"arm", "sandbox"});
        assert (s.all.empty ());
      }

      // Everything.
      //
      {
        selection s (select_boards (bs, strings {}));
        assert (s.all.size () == 4 && s.terms.empty ());
      }

      // Board names.
      //
      {
        selection s (select_boards (bs,
                                    strings {},
                                    strings {"sandbox"},
                                    strings {"sandbox", "two_a", "zz", "aa"}));

        assert ((s.all == strings {"two_a"}));

        // Note that excluded boards still count as found.
        //
        assert ((s.warnings == strings {"Boards not found: aa, zz"}));

        // Ignored if there are terms.
        //
        s = select_boards (bs,
                           strings {"sandbox"},
                           strings {},
                           strings {"one_a"});
        assert ((s.all == strings {"sandbox"}));
        assert ((s.warnings == strings {"Boards not found: one_a"}));
      }

      // Invalid regex.
      //
      {
        bool f (false);
        try
        {
          select_boards (bs, strings {"arm("});
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
