// file      : libbrdb/evaluator.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/evaluator.hxx>

#include <libbrdb/filesystem.hxx>
#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  // config_values
  //
  void config_values::
  assign (string n, string v)
  {
    auto i (index_.find (n));

    if (i != index_.end ())
      values_[i->second].second = move (v);
    else
    {
      index_.emplace (n, values_.size ());
      values_.emplace_back (move (n), move (v));
    }
  }

  const string* config_values::
  find (const string& n) const
  {
    auto i (index_.find (n));
    return i != index_.end () ? &values_[i->second].second : nullptr;
  }

  // Unquote and unescape the double-quoted value. Return nullopt if the value
  // is not properly quoted.
  //
  static optional<string>
  unquote (const string& v)
  {
    size_t n (v.size ());

    if (n < 2 || v[0] != '"' || v[n - 1] != '"')
      return nullopt;

    string r;
    for (size_t i (1); i != n - 1; ++i)
    {
      char c (v[i]);

      if (c == '\\')
      {
        if (++i == n - 1)
          return nullopt;

        c = v[i];
      }
      else if (c == '"')
        return nullopt;

      r += c;
    }

    return r;
  }

  void config_values::
  parse (istream& is, const path_name& in)
  {
    tracer trace ("config_values::parse");

    const char prefix[] = "CONFIG_";
    const size_t pn (sizeof (prefix) - 1);

    const char unset[] = " is not set";
    const size_t un (sizeof (unset) - 1);

    location l (in, 0);
    for (string s; !eof (getline (is, s)); )
    {
      ++l.line;

      trim (s);

      if (s.empty ())
        continue;

      // # CONFIG_<NAME> is not set
      //
      if (s[0] == '#')
      {
        if (s.size () > 2 + pn + un                    &&
            s.compare (0, 2, "# ") == 0                &&
            s.compare (2, pn, prefix) == 0             &&
            s.compare (s.size () - un, un, unset) == 0)
        {
          assign (string (s, 2 + pn, s.size () - un - 2 - pn), "n");
        }

        continue;
      }

      // CONFIG_<NAME>=<value>
      //
      size_t p (s.find ('='));

      if (p == string::npos || p <= pn || s.compare (0, pn, prefix) != 0)
      {
        l4 ([&]{trace << l << ": ignoring line '" << s << "'";});
        continue;
      }

      string n (s, pn, p - pn);
      string v (s, p + 1);

      if (!v.empty () && v[0] == '"')
      {
        if (optional<string> u = unquote (v))
          v = move (*u);
        else
          l4 ([&]{trace << l << ": invalid quoting in value of " << n;});
      }

      assign (move (n), move (v));
    }
  }

  void config_values::
  parse (const path& f)
  {
    try
    {
      ifdstream ifs (f);
      parse (ifs, path_name (f));
      ifs.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }
  }

  // evaluator
  //
  evaluator::
  ~evaluator ()
  {
  }

  string evaluator::
  value (const string& n) const
  {
    optional<string> r (lookup (n));
    return r ? move (*r) : string ();
  }

  bool evaluator::
  flag (const string& n) const
  {
    return value (n) == "y";
  }

  static void
  symbols (const config_values& vs,
           const string& p,
           const function<void (const string&, const string&)>& f)
  {
    for (const pair<string, string>& v: vs.values ())
    {
      if (v.first.compare (0, p.size (), p) == 0)
        f (v.first, v.second);
    }
  }

  // defconfig_evaluator
  //
  defconfig_evaluator::
  defconfig_evaluator (const evaluator_config& c)
  {
    if (c.base)
    {
      path f (*c.base);

      if (f.relative ())
        f = c.src_root / f;

      base_.parse (f);
    }
  }

  void defconfig_evaluator::
  load (const path& f)
  {
    values_ = base_;
    values_.parse (f);
  }

  optional<string> defconfig_evaluator::
  lookup (const string& n) const
  {
    const string* v (values_.find (n));
    return v != nullptr ? optional<string> (*v) : nullopt;
  }

  void defconfig_evaluator::
  symbols (const string& p,
           const function<void (const string&, const string&)>& f) const
  {
    brdb::symbols (values_, p, f);
  }

  // conf_evaluator
  //
  conf_evaluator::
  conf_evaluator (const evaluator_config& c)
      : config_ (c), conf_ (find_program (*c.conf, true /* init */))
  {
  }

  void conf_evaluator::
  load (const path& fragment)
  {
    // The conf program runs in the source root so the fragment path should
    // be absolute.
    //
    path f (fragment);

    try
    {
      f.complete ().normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid fragment path '" << e.path << "'";
    }

    dir_path src_root (config_.src_root);

    try
    {
      src_root.complete ().normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid source root '" << e.path << "'";
    }

    // Note that the temporary file is removed when we leave this scope,
    // including on failure.
    //
    auto_rmfile tmp;
    try
    {
      tmp = auto_rmfile (path::temp_path ("brdb-config"));
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain temporary file: " << e;
    }

    strings vars {
      "srctree=" + src_root.string (),
      "UBOOTVERSION=" + config_.version,
      "KCONFIG_OBJDIR=" + config_.obj_dir.string (),
      "KCONFIG_CONFIG=" + tmp.path.string ()};

    cstrings vs;
    for (const string& v: vars)
      vs.push_back (v.c_str ());
    vs.push_back (nullptr);

    string d ("--defconfig=" + f.string ());

    cstrings args {conf_.recall_string (), d.c_str (), "Kconfig", nullptr};

    process_env pe (conf_, src_root, vs.data ());

    // Redirect stdout to /dev/null since conf reports where the
    // configuration has been written to.
    //
    process pr (start_process (pe, args, 0, -2 /* stdout */));
    finish_process (args, pr);

    values_.clear ();
    values_.parse (tmp.path);
  }

  optional<string> conf_evaluator::
  lookup (const string& n) const
  {
    const string* v (values_.find (n));
    return v != nullptr ? optional<string> (*v) : nullopt;
  }

  void conf_evaluator::
  symbols (const string& p,
           const function<void (const string&, const string&)>& f) const
  {
    brdb::symbols (values_, p, f);
  }

  unique_ptr<evaluator>
  make_evaluator (const evaluator_config& c)
  {
    if (c.conf)
      return unique_ptr<evaluator> (new conf_evaluator (c));

    return unique_ptr<evaluator> (new defconfig_evaluator (c));
  }
}
