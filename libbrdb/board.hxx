// file      : libbrdb/board.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_BOARD_HXX
#define LIBBRDB_BOARD_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // The value recorded for a parameter that is not set (empty).
  //
  LIBBRDB_SYMEXPORT extern const string unset_value;

  // Board parameters extracted from a fragment (arch through config) plus
  // the ownership information attached while merging (status and
  // maintainers). The target is the fragment file name without the
  // _defconfig suffix.
  //
  struct board_params
  {
    string arch;
    string cpu;
    string soc;
    string vendor;
    string board;
    string target;
    string config;

    string status;
    string maintainers; // Colon-separated.
  };

  using board_params_list = vector<board_params>;

  // A board as read back from the database. Fields that were recorded as
  // unset are empty.
  //
  class LIBBRDB_SYMEXPORT board
  {
  public:
    string status;
    string arch;
    string cpu;
    string soc;
    string vendor;
    string board_name;
    string target;
    string config;

    board () = default;

    board (string status,
           string arch,
           string cpu,
           string soc,
           string vendor,
           string board_name,
           string target,
           string config);

    // Properties matched by the selection expressions, in the matching
    // order: target, arch, cpu, board name, vendor, and soc.
    //
    strings
    props () const;
  };

  // The list of boards in the database order.
  //
  class LIBBRDB_SYMEXPORT boards
  {
  public:
    using boards_type = vector<board>;
    using const_iterator = boards_type::const_iterator;

    // Add a board. A board with the same target as an existing one (which
    // can only come from a hand-edited database) is still added but find()
    // and dict() only see the first one.
    //
    void
    add (board);

    // Read boards from the database file. Comment lines (starting with #)
    // and empty lines are skipped. Each remaining line is split into
    // whitespace-separated fields with the unset value (-) mapped to empty,
    // missing fields are empty, and extra fields are ignored.
    //
    // Issue diagnostics and throw failed if the file cannot be read.
    //
    void
    read (const path&);

    // As above but read from a stream.
    //
    void
    read (istream&);

    const boards_type&
    list () const {return boards_;}

    size_t
    size () const {return boards_.size ();}

    bool
    empty () const {return boards_.empty ();}

    const_iterator begin () const {return boards_.begin ();}
    const_iterator end () const {return boards_.end ();}

    // Return the board with the specified target or NULL if there is none.
    //
    const board*
    find (const string& target) const;

    // Return the target to board map.
    //
    map<string, reference_wrapper<const board>>
    dict () const;

    // Return the boards (or their targets) that are in the specified list
    // of selected targets, in the database order.
    //
    vector<reference_wrapper<const board>>
    selected (const strings& targets) const;

    map<string, reference_wrapper<const board>>
    selected_dict (const strings& targets) const;

    strings
    selected_names (const strings& targets) const;

  private:
    boards_type boards_;
  };
}

#endif // LIBBRDB_BOARD_HXX
