// file      : brdb/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// Parsers for the option value types that cli does not know about. Included
// into the generated brdb-options.cxx.
//

#ifndef BRDB_TYPES_PARSERS_HXX
#define BRDB_TYPES_PARSERS_HXX

#include <libbrdb/types.hxx>

namespace brdb
{
  namespace cli
  {
    class scanner;

    template <typename T>
    struct parser;

    // Reject empty and invalid paths.
    //
    template <typename P>
    struct path_parser
    {
      static void
      parse (P&, bool& specified, scanner&);

      static void
      merge (P& b, const P& a) {b = a;}
    };

    template <>
    struct parser<path>: path_parser<path> {};

    template <>
    struct parser<dir_path>: path_parser<dir_path> {};
  }
}

#endif // BRDB_TYPES_PARSERS_HXX
