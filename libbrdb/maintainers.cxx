// file      : libbrdb/maintainers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/maintainers.hxx>

#include <libbrdb/filesystem.hxx>
#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  static const string fragment_suffix ("_defconfig");
  static const dir_path configs_dir ("configs");

  // If the path (relative to the source root) is configs/<target>_defconfig,
  // then return the target (which may contain directory components).
  //
  static optional<string>
  configs_target (const path& p)
  {
    if (!p.sub (configs_dir))
      return nullopt;

    string t (p.leaf (configs_dir).string ());
    size_t n (t.size ()), m (fragment_suffix.size ());

    if (n < m || t.compare (n - m, m, fragment_suffix) != 0)
      return nullopt;

    t.resize (n - m);
    return t;
  }

  string maintainers_database::
  status (const string& t)
  {
    auto i (entries.find (t));

    if (i == entries.end ())
    {
      warnings.push_back ("no status info for '" + t + "'");
      return "-";
    }

    const string& s (i->second.status);

    if (s.compare (0, 10, "Maintained") == 0 ||
        s.compare (0, 9, "Supported") == 0)
      return "Active";

    if (s.compare (0, 6, "Orphan") == 0)
      return "Orphan";

    warnings.push_back (s + ": unknown status for '" + t + "'");
    return "-";
  }

  string maintainers_database::
  maintainers (const string& t)
  {
    auto i (entries.find (t));

    if (i != entries.end ())
    {
      const entry& e (i->second);

      if (e.status.compare (0, 6, "Orphan") != 0)
      {
        const strings& ms (e.maintainers);

        if (ms.size () > 1 || (!ms.empty () && ms[0] != "-"))
        {
          string r;
          for (const string& m: ms)
          {
            if (!r.empty ())
              r += ':';

            r += m;
          }
          return r;
        }
      }
    }

    warnings.push_back ("no maintainers for '" + t + "'");
    return string ();
  }

  const strings& maintainers_database::
  fragment_names (const dir_path& src_root)
  {
    auto i (fragment_names_.find (src_root));
    if (i != fragment_names_.end ())
      return i->second;

    strings r;

    dir_path d (src_root / configs_dir);
    if (exists (d))
    {
      walk_files (d,
                  [&r, &src_root] (path&& f)
                  {
                    optional<string> t (configs_target (f.leaf (src_root)));

                    if (t)
                      r.push_back (move (*t));
                  });

      sort (r.begin (), r.end ());
    }

    return fragment_names_.emplace (src_root, move (r)).first->second;
  }

  void maintainers_database::
  parse_file (const dir_path& src_root, const path& f)
  {
    try
    {
      ifdstream ifs (f);
      parse (ifs, path_name (f), src_root);
      ifs.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }
  }

  void maintainers_database::
  parse (istream& is, const path_name& in, const dir_path& sr)
  {
    tracer trace ("maintainers_database::parse");

    // Wildcard patterns are searched for starting from the source root and
    // the fragments are walked from it, so make it absolute.
    //
    dir_path src_root (sr);
    try
    {
      src_root.complete ().normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid source root '" << e.path << "'";
    }

    strings targets;
    strings maintainers;
    string status ("-");

    auto add_targets = [this, &targets, &maintainers, &status] ()
    {
      for (string& t: targets)
        entries[move (t)] = entry {status, maintainers};

      targets.clear ();
      maintainers.clear ();
      status = "-";
    };

    location l (in, 0);
    for (string s; !eof (getline (is, s)); )
    {
      ++l.line;

      if (s.empty ())
      {
        add_targets ();
        continue;
      }

      // Commented out maintainers are still maintainers.
      //
      if (s.compare (0, 3, "#M:") == 0)
        s.erase (0, 1);

      if (s.size () < 2 || s[1] != ':')
        continue;

      string rest (s, 2);
      trim (rest);

      switch (s[0])
      {
      case 'M':
        {
          maintainers.push_back (move (rest));
          break;
        }
      case 'S':
        {
          status = move (rest);
          break;
        }
      case 'F':
        {
          paths ps;
          try
          {
            ps = search (path (rest), src_root);
          }
          catch (const invalid_path& e)
          {
            fail (l) << "invalid file pattern '" << e.path << "'";
          }

          for (const path& p: ps)
          {
            if (optional<string> t = configs_target (p))
            {
              l6 ([&]{trace << l << ": " << *t << " matches " << rest;});
              targets.push_back (move (*t));
            }
          }

          break;
        }
      case 'N':
        {
          regex re;
          try
          {
            re = regex (rest);
          }
          catch (const regex_error& e)
          {
            fail (l) << "invalid regex '" << rest << "'" << e;
          }

          for (const string& t: fragment_names (src_root))
          {
            if (regex_search (t, re))
            {
              l6 ([&]{trace << l << ": " << t << " matches " << rest;});
              targets.push_back (t);
            }
          }

          break;
        }
      default:
        break;
      }
    }

    add_targets ();
  }
}
