// file      : libbrdb/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/diagnostics.hxx>

using namespace std;

namespace brdb
{
  uint16_t verb = 1;

  void
  init_diag (uint16_t v)
  {
    verb = v;
  }

  void prologue_base::
  operator() (const diag_record& r) const
  {
    if (!loc_.empty ())
      r << loc_ << ": ";

    if (kind_ != nullptr)
      r << kind_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const mark      error ("error");
  const mark      warn  ("warning");
  const mark      info  ("info");
  const mark      text  (nullptr, nullptr);
  const fail_mark fail;
  const fail_end  endf;
}
