#ifndef MORCEAU_MERGE_HH
# define MORCEAU_MERGE_HH

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <morceau/Types.hh>
# include <morceau/io/Backend.hh>

namespace morceau
{
  /// Where to find the parts and where to rebuild the file.
  class MergeConfig:
    public elle::Printable
  {
  public:
    typedef MergeConfig Self;

  /*-------------.
  | Construction |
  `-------------*/
  public:
    MergeConfig();

  /*--------.
  | Setters |
  `--------*/
  public:
    /// The directory holding the parts.
    Self&
    in_dir(boost::filesystem::path path);
    /// The rebuilt file, created or truncated.
    Self&
    out_file(boost::filesystem::path path);
    /// The maximum amount of memory used to stream a part.
    Self&
    buffer_capacity(FileSize capacity);

  /*-----------.
  | Attributes |
  `-----------*/
  public:
    ELLE_ATTRIBUTE_R(boost::optional<boost::filesystem::path>, in_dir);
    ELLE_ATTRIBUTE_R(boost::optional<boost::filesystem::path>, out_file);
    ELLE_ATTRIBUTE_R(FileSize, buffer_capacity);

  public:
    /// \throw InvalidInput if a path is unset or the capacity is zero.
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

  /// The outcome of a successful merge.
  struct MergeResult:
    public elle::Printable
  {
    MergeResult();

    /// Bytes written to the output file.
    FileSize total_size;
    PartCount part_count;

    virtual
    void
    print(std::ostream& stream) const override;
  };

  /// Concatenate the parts of a directory, in index order, into a file.
  ///
  /// The part set is validated before the output file is touched: it must
  /// hold parts 0 to n - 1, with n > 0, without gap nor duplicate. Entries
  /// that are not parts are ignored. An output written partially before a
  /// failure is left on disk.
  class Merger:
    public elle::Printable
  {
  /*-------------.
  | Construction |
  `-------------*/
  public:
    Merger(MergeConfig config,
           io::Backend& backend = io::blocking());
    ELLE_ATTRIBUTE_R(MergeConfig, config);
  private:
    ELLE_ATTRIBUTE(io::Backend&, backend);

  /*----.
  | Run |
  `----*/
  public:
    /// \throw NotFound if the input directory does not exist.
    /// \throw InvalidInput if the configuration is invalid, the input is not
    ///        a directory, the output is a directory or the output is one of
    ///        the parts.
    /// \throw Corrupt if parts are missing or duplicated.
    /// \throw PermissionDenied, IOError on system failures.
    MergeResult
    run();

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };

  MergeResult
  merge(MergeConfig const& config,
        io::Backend& backend = io::blocking());
}

#endif
