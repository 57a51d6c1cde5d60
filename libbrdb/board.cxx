// file      : libbrdb/board.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/board.hxx>

#include <sstream>

#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  const string unset_value ("-");

  // board
  //
  board::
  board (string s,
         string a,
         string c,
         string so,
         string v,
         string b,
         string t,
         string cf)
      : status (move (s)),
        arch (move (a)),
        cpu (move (c)),
        soc (move (so)),
        vendor (move (v)),
        board_name (move (b)),
        target (move (t)),
        config (move (cf))
  {
  }

  strings board::
  props () const
  {
    return strings {target, arch, cpu, board_name, vendor, soc};
  }

  // boards
  //
  void boards::
  add (board b)
  {
    boards_.push_back (move (b));
  }

  void boards::
  read (const path& f)
  {
    try
    {
      ifdstream ifs (f);
      read (ifs);
      ifs.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }
  }

  void boards::
  read (istream& is)
  {
    for (string l; !eof (getline (is, l)); )
    {
      if (!l.empty () && l[0] == '#')
        continue;

      strings fs;
      {
        istringstream ls (l);
        for (string w; ls >> w; )
          fs.push_back (w == unset_value ? string () : move (w));
      }

      if (fs.empty ())
        continue;

      fs.resize (8);

      add (board (move (fs[0]), move (fs[1]), move (fs[2]), move (fs[3]),
                  move (fs[4]), move (fs[5]), move (fs[6]), move (fs[7])));
    }
  }

  const board* boards::
  find (const string& t) const
  {
    for (const board& b: boards_)
    {
      if (b.target == t)
        return &b;
    }

    return nullptr;
  }

  map<string, reference_wrapper<const board>> boards::
  dict () const
  {
    map<string, reference_wrapper<const board>> r;

    for (const board& b: boards_)
      r.emplace (b.target, cref (b));

    return r;
  }

  vector<reference_wrapper<const board>> boards::
  selected (const strings& ts) const
  {
    set<string> s (ts.begin (), ts.end ());

    vector<reference_wrapper<const board>> r;
    for (const board& b: boards_)
    {
      if (s.find (b.target) != s.end ())
        r.push_back (cref (b));
    }

    return r;
  }

  map<string, reference_wrapper<const board>> boards::
  selected_dict (const strings& ts) const
  {
    map<string, reference_wrapper<const board>> r;

    for (const board& b: selected (ts))
      r.emplace (b.target, cref (b));

    return r;
  }

  strings boards::
  selected_names (const strings& ts) const
  {
    strings r;

    for (const board& b: selected (ts))
      r.push_back (b.target);

    return r;
  }
}
