#ifndef MORCEAU_CHECK_HH
# define MORCEAU_CHECK_HH

# include <iosfwd>
# include <string>
# include <vector>

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <morceau/Types.hh>
# include <morceau/io/Backend.hh>

namespace morceau
{
  /// The part set a directory is expected to hold.
  class CheckConfig:
    public elle::Printable
  {
  public:
    typedef CheckConfig Self;

  /*-------------.
  | Construction |
  `-------------*/
  public:
    CheckConfig();

  /*--------.
  | Setters |
  `--------*/
  public:
    Self&
    in_dir(boost::filesystem::path path);
    /// The size of the original file.
    Self&
    file_size(FileSize size);
    /// The number of parts the original file was split into.
    Self&
    part_count(PartCount count);

  /*-----------.
  | Attributes |
  `-----------*/
  public:
    ELLE_ATTRIBUTE_R(boost::optional<boost::filesystem::path>, in_dir);
    ELLE_ATTRIBUTE_R(boost::optional<FileSize>, file_size);
    ELLE_ATTRIBUTE_R(boost::optional<PartCount>, part_count);

  public:
    /// \throw InvalidInput if any attribute is unset.
    void
    validate() const;

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };

  /// Whether a directory holds a complete part set.
  struct CheckResult:
    public elle::Printable
  {
    struct Failure:
      public elle::Printable
    {
      enum class Kind
      {
        /// Some expected parts are absent.
        missing,
        /// All parts are there but their sizes do not add up.
        size,
      };

      Failure(Kind kind,
              std::string message,
              std::vector<PartIndex> missing = {});

      Kind kind;
      std::string message;
      /// The absent indices, ascending. Empty unless kind is missing.
      std::vector<PartIndex> missing;

      virtual
      void
      print(std::ostream& stream) const override;
    };

    CheckResult();
    CheckResult(Failure failure);

    bool success;
    boost::optional<Failure> error;

    virtual
    void
    print(std::ostream& stream) const override;
  };

  std::ostream&
  operator <<(std::ostream& out, CheckResult::Failure::Kind kind);

  /// Check a directory holds parts 0 to n - 1 adding up to the file size.
  ///
  /// Only directory metadata are read. Parts beyond the expected count are
  /// ignored. An incomplete part set is reported in the result, not thrown.
  class Checker:
    public elle::Printable
  {
  /*-------------.
  | Construction |
  `-------------*/
  public:
    Checker(CheckConfig config,
            io::Backend& backend = io::blocking());
    ELLE_ATTRIBUTE_R(CheckConfig, config);
  private:
    ELLE_ATTRIBUTE(io::Backend&, backend);

  /*----.
  | Run |
  `----*/
  public:
    /// \throw NotFound if the directory does not exist.
    /// \throw InvalidInput if the configuration is incomplete or the input is
    ///        not a directory.
    /// \throw PermissionDenied, IOError on system failures.
    CheckResult
    run();

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };

  CheckResult
  check(CheckConfig const& config,
        io::Backend& backend = io::blocking());
}

#endif
