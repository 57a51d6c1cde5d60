// file      : libbrdb/maintainers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_MAINTAINERS_HXX
#define LIBBRDB_MAINTAINERS_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // Board status and maintainers database built from MAINTAINERS files.
  //
  // A MAINTAINERS file consists of records separated by empty lines. Within
  // a record the following lines are recognized (the rest is ignored):
  //
  // M: <maintainer>   add maintainer (#M: is treated the same)
  // S: <status>       set status (the last one wins)
  // F: <pattern>      wildcard pattern relative to the source root; every
  //                   matching configs/<target>_defconfig adds the target
  // N: <regex>        every configs/<target>_defconfig with the regex
  //                   matching (anywhere) in <target> adds the target
  //
  // At the end of a record every target it adds is bound to its status
  // (- if unspecified) and maintainers, overriding any previous binding.
  //
  class LIBBRDB_SYMEXPORT maintainers_database
  {
  public:
    struct entry
    {
      string status;
      strings maintainers;
    };

    map<string, entry> entries;

    // Warnings issued by the status() and maintainers() queries.
    //
    strings warnings;

    // Return Active if the target's status starts with Maintained or
    // Supported and Orphan if it starts with Orphan. Otherwise, including if
    // there is no entry for the target, record a warning and return -.
    //
    string
    status (const string& target);

    // Return the target's colon-separated maintainers. If there is no entry
    // for the target, it is orphaned, or it has no maintainers (or just -),
    // then record a warning and return empty string.
    //
    string
    maintainers (const string& target);

    // Parse the MAINTAINERS file. Issue diagnostics and throw failed if the
    // file cannot be read or contains an invalid regex.
    //
    void
    parse_file (const dir_path& src_root, const path& file);

    // As above but read from a stream. The name is only used for
    // diagnostics.
    //
    void
    parse (istream&, const path_name&, const dir_path& src_root);

  private:
    // Return the names of fragments in src_root/configs (relative to it and
    // without the _defconfig suffix), caching them.
    //
    const strings&
    fragment_names (const dir_path& src_root);

    map<dir_path, strings> fragment_names_;
  };
}

#endif // LIBBRDB_MAINTAINERS_HXX
