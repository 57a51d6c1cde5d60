// file      : libbrdb/evaluator.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBRDB_EVALUATOR_HXX
#define LIBBRDB_EVALUATOR_HXX

#include <libbrdb/types.hxx>
#include <libbrdb/utility.hxx>

#include <libbrdb/export.hxx>

namespace brdb
{
  // Evaluator configuration.
  //
  // The source root is where the top-level Kconfig file resides. The version
  // and object directory are passed to the Kconfig machinery as the
  // UBOOTVERSION and KCONFIG_OBJDIR environment variables. If conf is
  // specified, then fragments are evaluated by running this Kconfig conf
  // program. Otherwise, they are evaluated directly on top of the optional
  // base configuration file.
  //
  struct evaluator_config
  {
    dir_path src_root;
    string version = "dummy";
    dir_path obj_dir;
    optional<path> conf;
    optional<path> base;
  };

  // Configuration symbol values (names without the CONFIG_ prefix) in the
  // order of their first assignment.
  //
  class LIBBRDB_SYMEXPORT config_values
  {
  public:
    using values_type = vector<pair<string, string>>;

    // Assign the value overriding the previous one, if any (the symbol
    // keeps its original position).
    //
    void
    assign (string name, string value);

    const string*
    find (const string& name) const;

    const values_type&
    values () const {return values_;}

    void
    clear () {values_.clear (); index_.clear ();}

    // Parse assignments in the Kconfig .config format:
    //
    // CONFIG_<NAME>=<value>
    // # CONFIG_<NAME> is not set
    //
    // A double-quoted value is unquoted and unescaped and the "is not set"
    // form assigns n. Other lines are ignored.
    //
    void
    parse (istream&, const path_name&);

    // As above but read from the file, issuing diagnostics and throwing
    // failed if it cannot be read.
    //
    void
    parse (const path&);

  private:
    values_type values_;
    map<string, size_t> index_;
  };

  // Fragment evaluator interface.
  //
  // After a fragment is loaded, answer symbol value queries for the
  // resulting configuration. The load() function issues diagnostics and
  // throws failed on errors while the query functions never fail.
  //
  class LIBBRDB_SYMEXPORT evaluator
  {
  public:
    virtual
    ~evaluator ();

    virtual void
    load (const path& fragment) = 0;

    // Return the symbol value or nullopt if the symbol is undefined.
    //
    virtual optional<string>
    lookup (const string& name) const = 0;

    // Call the function for every symbol with the specified name prefix
    // passing its name and value, in the symbol definition order.
    //
    virtual void
    symbols (const string& prefix,
             const function<void (const string&, const string&)>&) const = 0;

    // Return the symbol value or empty string if the symbol is undefined.
    //
    string
    value (const string& name) const;

    // Return true if the symbol value is y.
    //
    bool
    flag (const string& name) const;
  };

  // Evaluate the fragment by applying its assignments on top of the base
  // configuration, if any.
  //
  class LIBBRDB_SYMEXPORT defconfig_evaluator: public evaluator
  {
  public:
    explicit
    defconfig_evaluator (const evaluator_config&);

    virtual void
    load (const path&) override;

    virtual optional<string>
    lookup (const string&) const override;

    virtual void
    symbols (const string&,
             const function<void (const string&,
                                  const string&)>&) const override;

  private:
    config_values base_;
    config_values values_;
  };

  // Evaluate the fragment by running the Kconfig conf program in the source
  // root:
  //
  // conf --defconfig=<fragment> Kconfig
  //
  // The resulting configuration is written to a temporary file passed to
  // conf with the KCONFIG_CONFIG environment variable and removed after
  // being parsed.
  //
  class LIBBRDB_SYMEXPORT conf_evaluator: public evaluator
  {
  public:
    explicit
    conf_evaluator (const evaluator_config&);

    virtual void
    load (const path&) override;

    virtual optional<string>
    lookup (const string&) const override;

    virtual void
    symbols (const string&,
             const function<void (const string&,
                                  const string&)>&) const override;

  private:
    const evaluator_config& config_;
    process_path conf_;
    config_values values_;
  };

  // Return conf_evaluator if the conf program is specified and
  // defconfig_evaluator otherwise. The configuration should outlive the
  // evaluator.
  //
  LIBBRDB_SYMEXPORT unique_ptr<evaluator>
  make_evaluator (const evaluator_config&);
}

#endif // LIBBRDB_EVALUATOR_HXX
