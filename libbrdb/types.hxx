// file      : libbrdb/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_TYPES_HXX
#define LIBBRDB_TYPES_HXX

#include <map>
#include <set>
#include <regex>
#include <vector>
#include <string>
#include <memory>     // unique_ptr
#include <utility>    // pair
#include <cstddef>    // size_t
#include <cstdint>    // uint16_t, uint64_t
#include <istream>
#include <ostream>
#include <exception>
#include <stdexcept>
#include <functional> // function, reference_wrapper
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/regex.hxx>    // operator<<(ostream, regex_error)
#include <libbutl/path-io.hxx>  // operator<<(ostream, path)
#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/timestamp.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  using std::uint16_t;
  using std::uint64_t;
  using std::size_t;

  using std::pair;
  using std::string;
  using std::function;
  using std::reference_wrapper;
  using std::unique_ptr;

  using std::map;
  using std::set;
  using std::vector;

  using strings = vector<string>;
  using cstrings = vector<const char*>; // Command lines, NULL-terminated.

  using std::istream;
  using std::ostream;
  using std::endl;

  using std::regex;
  using std::regex_error;

  using std::invalid_argument;
  using std::system_error;
  using io_error = std::ios_base::failure;

  using butl::optional;
  using butl::nullopt;

  // Fragments, MAINTAINERS files, and the database are all addressed with
  // libbutl paths. Diagnostics prints them as specified by the user (that
  // is, they are never completed for printing).
  //
  using butl::path;
  using butl::dir_path;
  using butl::path_name;
  using butl::path_name_view;
  using butl::path_cast;
  using butl::invalid_path;

  using paths = vector<path>;

  using butl::timestamp;
  using butl::system_clock;
  using butl::timestamp_nonexistent;

  // Worker and conf processes.
  //
  using butl::process;
  using butl::process_env;
  using butl::process_path;
  using butl::process_error;

  using butl::nullfd;
  using butl::ifdstream;
  using butl::ofdstream;
  using butl::fdstream_mode;
  using butl::fdselect_state;
  using butl::fdselect_set;

  // Position in a configuration or MAINTAINERS file for diagnostics. Note
  // that the file name is referenced, not copied.
  //
  struct location
  {
    path_name_view file;
    uint64_t line = 0;

    location () = default;

    location (const path_name_view& f, uint64_t l): file (f), line (l) {}

    bool
    empty () const {return file.null ();}
  };

  // Print as <file>:<line> or nothing if empty.
  //
  inline ostream&
  operator<< (ostream& o, const location& l)
  {
    if (!l.empty ())
    {
      if (l.file.name != nullptr && *l.file.name)
        o << **l.file.name;
      else
        o << *l.file.path;

      o << ':' << l.line;
    }

    return o;
  }
}

#endif // LIBBRDB_TYPES_HXX
