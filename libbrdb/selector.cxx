// file      : libbrdb/selector.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/selector.hxx>

#include <sstream>

#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  // expr
  //
  expr::
  expr (string x)
      : text_ (move (x))
  {
    try
    {
      regex_ = regex (text_);
    }
    catch (const regex_error& e)
    {
      fail << "invalid regex '" << text_ << "'" << e;
    }
  }

  bool expr::
  matches (const strings& ps) const
  {
    for (const string& p: ps)
    {
      // Match at the beginning but not necessarily the whole property.
      //
      if (regex_search (p, regex_, regex_constants::match_continuous))
        return true;
    }

    return false;
  }

  // term
  //
  bool term::
  matches (const strings& ps) const
  {
    for (const expr& e: exprs_)
    {
      if (!e.matches (ps))
        return false;
    }

    return true;
  }

  string term::
  text () const
  {
    string r;
    for (const expr& e: exprs_)
    {
      if (!r.empty ())
        r += '&';

      r += e.text ();
    }
    return r;
  }

  terms
  build_terms (const strings& args)
  {
    // First split the arguments into symbols which are either expressions or
    // the & operator.
    //
    strings syms;
    for (const string& a: args)
    {
      istringstream is (a);
      for (string w; is >> w; )
      {
        // Note that trailing & is preserved (so it can join the next word)
        // while an empty piece in between is not.
        //
        for (size_t b (0), e; ; b = e + 1)
        {
          e = w.find ('&', b);

          if (e != b && b != w.size ())
            syms.push_back (string (w, b, e == string::npos ? e : e - b));

          if (e == string::npos)
            break;

          syms.push_back ("&");
        }
      }
    }

    terms r;
    bool oper (false);

    for (string& s: syms)
    {
      if (s == "&")
        oper = true;
      else if (oper && !r.empty ())
      {
        r.back ().add (move (s));
        oper = false;
      }
      else
      {
        r.push_back (term ());
        r.back ().add (move (s));
        oper = false;
      }
    }

    return r;
  }

  selection
  select_boards (const boards& bs,
                 const strings& args,
                 const strings& exclude,
                 const strings& names)
  {
    tracer trace ("select_boards");

    selection r;

    terms ts (build_terms (args));

    // Note that terms with the same representation share the bucket.
    //
    for (const term& t: ts)
    {
      string s (t.text ());

      if (r.find (s) == nullptr)
        r.terms.emplace_back (move (s), strings ());
    }

    vector<expr> xs;
    for (const string& x: exclude)
      xs.emplace_back (x);

    set<string> found;

    for (const board& b: bs)
    {
      strings ps (b.props ());

      const term* mt (nullptr);
      bool sel (false);

      if (!ts.empty ())
      {
        for (const term& t: ts)
        {
          if (t.matches (ps))
          {
            mt = &t;
            sel = true;
            break;
          }
        }
      }
      else if (!names.empty ())
      {
        if (find (names.begin (), names.end (), b.target) != names.end ())
        {
          sel = true;
          found.insert (b.target);
        }
      }
      else
        sel = true;

      // Exclusions always win.
      //
      if (sel)
      {
        for (const expr& x: xs)
        {
          if (x.matches (ps))
          {
            l5 ([&]{trace << b.target << " excluded by " << x.text ();});
            sel = false;
            break;
          }
        }
      }

      if (sel)
      {
        if (mt != nullptr)
        {
          string s (mt->text ());

          for (pair<string, strings>& t: r.terms)
          {
            if (t.first == s)
            {
              t.second.push_back (b.target);
              break;
            }
          }
        }

        r.all.push_back (b.target);
      }
    }

    if (!names.empty ())
    {
      set<string> rem;
      for (const string& n: names)
      {
        if (found.find (n) == found.end ())
          rem.insert (n);
      }

      if (!rem.empty ())
      {
        string w ("Boards not found: ");
        for (auto i (rem.begin ()); i != rem.end (); ++i)
        {
          if (i != rem.begin ())
            w += ", ";

          w += *i;
        }

        r.warnings.push_back (move (w));
      }
    }

    return r;
  }
}
