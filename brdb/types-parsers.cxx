// file      : brdb/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <brdb/types-parsers.hxx>

#include <brdb/brdb-options.hxx> // cli::scanner, cli::invalid_value

namespace brdb
{
  namespace cli
  {
    template <typename P>
    void path_parser<P>::
    parse (P& x, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      const char* v (s.next ());

      try
      {
        x = P (v);
      }
      catch (const invalid_path&)
      {
        throw invalid_value (o, v);
      }

      if (x.empty ())
        throw invalid_value (o, v);

      xs = true;
    }

    template struct path_parser<path>;
    template struct path_parser<dir_path>;
  }
}
