// file      : libbrdb/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_DIAGNOSTICS_HXX
#define LIBBRDB_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  using butl::diag_record;
  using butl::diag_frame;
  using butl::diag_stream;
  using butl::diag_epilogue;

  // Thrown after the error has been reported. The handler should not issue
  // any further diagnostics for it.
  //
  class failed: public std::exception {};

  // Diagnostics verbosity level (see the --verbose option for details). The
  // scan workers are started with the same level as the driver.
  //
  LIBBRDB_SYMEXPORT extern uint16_t verb;

  LIBBRDB_SYMEXPORT void
  init_diag (uint16_t verbosity);

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Record prologue in the following form (each part is optional):
  //
  // <file>:<line>: <kind>: <name>:
  //
  struct LIBBRDB_SYMEXPORT prologue_base
  {
    prologue_base (const char* kind, const char* name, const location& l)
        : kind_ (kind), name_ (name), loc_ (l) {}

    void
    operator() (const diag_record&) const;

  private:
    const char* kind_;
    const char* name_;
    const location loc_;
  };
  using prologue = butl::diag_prologue<prologue_base>;

  // The error, warn, info, and text marks. Diagnostics frames (see
  // make_diag_frame()) are applied to everything except text and trace.
  //
  struct mark_base
  {
    explicit
    mark_base (const char* kind,
               diag_epilogue* epilogue = &diag_frame::apply,
               const char* name = nullptr)
        : kind_ (kind), name_ (name), epilogue_ (epilogue) {}

    prologue
    operator() (const location& l = location ()) const
    {
      return prologue (epilogue_, kind_, name_, l);
    }

  private:
    const char* kind_;
    const char* name_;
    diag_epilogue* epilogue_;
  };
  using mark = butl::diag_mark<mark_base>;

  LIBBRDB_SYMEXPORT extern const mark error;
  LIBBRDB_SYMEXPORT extern const mark warn;
  LIBBRDB_SYMEXPORT extern const mark info;
  LIBBRDB_SYMEXPORT extern const mark text;

  // Named after the function it traces, for example:
  //
  // tracer trace ("scan_fragments");
  // l4 ([&]{trace << n << " fragments";});
  //
  struct trace_mark_base: mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : mark_base ("trace", nullptr /* no frames */, name) {}
  };
  using tracer = butl::diag_mark<trace_mark_base>;

  // Issue an error and throw failed once the record is complete.
  //
  struct fail_mark_base: mark_base
  {
    fail_mark_base ()
        : mark_base ("error",
                     [] (const diag_record& r, butl::diag_writer* w)
                     {
                       diag_frame::apply (r);
                       r.flush (w);
                       throw failed ();
                     }) {}
  };
  using fail_mark = butl::diag_mark<fail_mark_base>;

  // As fail but for use at the end of an expression in a function that must
  // return a value, for example:
  //
  // fail << "unable to read " << f << endf;
  //
  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // Throwing with the record still incomplete would suppress it.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = butl::diag_noreturn_end<fail_end_base>;

  LIBBRDB_SYMEXPORT extern const fail_mark fail;
  LIBBRDB_SYMEXPORT extern const fail_end  endf;

  // Add context to the errors issued while the frame is alive, for example:
  //
  // auto df = make_diag_frame (
  //   [&f] (const diag_record& dr) {dr << info << "while scanning " << f;});
  //
  template <typename F>
  struct diag_frame_impl: diag_frame
  {
    explicit
    diag_frame_impl (F f): diag_frame (&thunk), func_ (move (f)) {}

  private:
    static void
    thunk (const diag_frame& f, const diag_record& r)
    {
      static_cast<const diag_frame_impl&> (f).func_ (r);
    }

    const F func_;
  };

  template <typename F>
  inline diag_frame_impl<F>
  make_diag_frame (F f)
  {
    return diag_frame_impl<F> (move (f));
  }
}

#endif // LIBBRDB_DIAGNOSTICS_HXX
