// file      : libbrdb/scanner.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbrdb/scanner.hxx>

#include <libbrdb/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace brdb
{
  static const string fragment_suffix ("_defconfig");

  optional<string>
  fragment_target (const path& f)
  {
    const string& l (f.leaf ().string ());

    // Note that the suffix must be the first occurrence, not just trailing.
    //
    size_t p (l.find (fragment_suffix));

    if (p == string::npos ||
        p == 0            ||
        p + fragment_suffix.size () != l.size ())
      return nullopt;

    return string (l, 0, p);
  }

  void
  normalize_arch (board_params& ps, const evaluator& e)
  {
    if (ps.arch == "arm" && ps.cpu == "armv8")
      ps.arch = "aarch64";
    else if (ps.arch == "riscv")
      ps.arch = e.flag ("ARCH_RV32I") ? "riscv32" : "riscv64";
  }

  pair<board_params, strings> fragment_scanner::
  scan (const path& f, bool warn_targets)
  {
    tracer trace ("fragment_scanner::scan");

    const path l (f.leaf ());

    optional<string> t (fragment_target (f));
    if (!t)
      fail << "invalid fragment name " << l <<
        info << "expected <target>" << fragment_suffix;

    l5 ([&]{trace << "scanning " << f;});

    evaluator_.load (f);

    pair<board_params, strings> r;
    board_params& ps (r.first);
    strings& ws (r.second);

    auto value = [this] (const char* n)
    {
      string v (evaluator_.value (n));
      return v.empty () ? unset_value : v;
    };

    ps.arch   = value ("SYS_ARCH");
    ps.cpu    = value ("SYS_CPU");
    ps.soc    = value ("SYS_SOC");
    ps.vendor = value ("SYS_VENDOR");
    ps.board  = value ("SYS_BOARD");
    ps.config = value ("SYS_CONFIG_NAME");

    // Check there is exactly one TARGET_* symbol enabled.
    //
    if (warn_targets)
    {
      string target;

      evaluator_.symbols (
        "TARGET_",
        [&l, &ws, &target] (const string& n, const string& v)
        {
          if (v != "y")
            return;

          string tn (lcase (n.c_str () + 7));

          if (!target.empty ())
            ws.push_back (l.string () + ": duplicate TARGET_xxx: " +
                          target + " and " + tn);
          else
            target = move (tn);
        });

      if (target.empty ())
      {
        string n (ucase (t->c_str ()));
        replace (n.begin (), n.end (), '-', '_');

        ws.push_back (l.string () + ": no TARGET_" + n + " enabled");
      }
    }

    ps.target = move (*t);

    normalize_arch (ps, evaluator_);

    return r;
  }
}
