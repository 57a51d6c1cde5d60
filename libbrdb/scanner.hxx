// file      : libbrdb/scanner.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_SCANNER_HXX
#define LIBBRDB_SCANNER_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/board.hxx>
#include <libbrdb/evaluator.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // Extract the board parameters from fragments using the evaluator.
  //
  class LIBBRDB_SYMEXPORT fragment_scanner
  {
  public:
    explicit
    fragment_scanner (evaluator& e): evaluator_ (e) {}

    // Load the fragment and return its parameters (status and maintainers
    // are left empty) plus warnings. Unset parameters are recorded as the
    // unset value.
    //
    // If warn_targets is true, then warn if the fragment enables more than
    // one TARGET_* symbol or none at all.
    //
    // Issue diagnostics and throw failed if the fragment file name does not
    // end with _defconfig or if the fragment cannot be loaded.
    //
    pair<board_params, strings>
    scan (const path& fragment, bool warn_targets);

  private:
    evaluator& evaluator_;
  };

  // Return the target name for the fragment (its file name without the
  // _defconfig suffix) or nullopt if the file name doesn't end with the
  // suffix (or the suffix is all there is).
  //
  LIBBRDB_SYMEXPORT optional<string>
  fragment_target (const path& fragment);

  // Normalize the architecture name: arm with the armv8 CPU becomes aarch64
  // while riscv becomes riscv32 if ARCH_RV32I is enabled and riscv64
  // otherwise. Already normalized parameters are left unchanged.
  //
  LIBBRDB_SYMEXPORT void
  normalize_arch (board_params&, const evaluator&);
}

#endif // LIBBRDB_SCANNER_HXX
