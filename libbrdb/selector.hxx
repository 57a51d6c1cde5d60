// file      : libbrdb/selector.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_SELECTOR_HXX
#define LIBBRDB_SELECTOR_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // A regular expression matched against the beginning of board properties.
  //
  class LIBBRDB_SYMEXPORT expr
  {
  public:
    // Issue diagnostics and throw failed if the regex is invalid.
    //
    explicit
    expr (string);

    const string&
    text () const {return text_;}

    // Return true if any of the properties matches.
    //
    bool
    matches (const strings& props) const;

  private:
    string text_;
    regex regex_;
  };

  // A list of expressions all of which must match.
  //
  class LIBBRDB_SYMEXPORT term
  {
  public:
    void
    add (string e) {exprs_.emplace_back (move (e));}

    bool
    matches (const strings& props) const;

    const vector<expr>&
    exprs () const {return exprs_;}

    // Return the expressions joined with &.
    //
    string
    text () const;

  private:
    vector<expr> exprs_;
  };

  using terms = vector<term>;

  // Convert the selection arguments into terms.
  //
  // Each argument is split into whitespace-separated words and each word
  // into &-separated expressions. An expression that follows & is added to
  // the current term while any other expression starts a new one. For
  // example:
  //
  // "arm & freescale sandbox", "tegra"
  //
  // Produces three terms: arm&freescale, sandbox, and tegra.
  //
  LIBBRDB_SYMEXPORT terms
  build_terms (const strings& args);

  // The selection result.
  //
  struct selection
  {
    // All the selected targets in the board order.
    //
    strings all;

    // Targets selected by each term, in the term order.
    //
    vector<pair<string, strings>> terms;

    strings warnings;

    // Return the targets selected by the term or NULL if there is no such
    // term.
    //
    const strings*
    find (const string& term) const
    {
      for (const pair<string, strings>& t: terms)
      {
        if (t.first == term)
          return &t.second;
      }
      return nullptr;
    }
  };

  // Select boards.
  //
  // If there are terms, then a board is selected by the first term that
  // matches its properties. Otherwise, if there are board names, then a
  // board is selected if its target is in the list. Otherwise, all the
  // boards are selected. A board matching any of the exclusion expressions
  // is never selected.
  //
  // Warn about the board names that were not found. Issue diagnostics and
  // throw failed if any of the regexes is invalid.
  //
  LIBBRDB_SYMEXPORT selection
  select_boards (const boards&,
                 const strings& args,
                 const strings& exclude = strings (),
                 const strings& names = strings ());
}

#endif // LIBBRDB_SELECTOR_HXX
