#ifndef MORCEAU_SPLIT_HH
# define MORCEAU_SPLIT_HH

# include <vector>

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <morceau/Types.hh>
# include <morceau/io/Backend.hh>

namespace morceau
{
  /// What to split, where, and how.
  ///
  /// \code{.cc}
  ///
  /// auto res = morceau::split(morceau::SplitConfig()
  ///                             .in_file("video.mkv")
  ///                             .out_dir("video.parts")
  ///                             .chunk_size(1024 * 1024));
  ///
  /// \endcode
  class SplitConfig:
    public elle::Printable
  {
  public:
    typedef SplitConfig Self;

  /*-------------.
  | Construction |
  `-------------*/
  public:
    SplitConfig();

  /*--------.
  | Setters |
  `--------*/
  public:
    /// The file to split.
    Self&
    in_file(boost::filesystem::path path);
    /// The directory receiving the parts, created if needed.
    Self&
    out_dir(boost::filesystem::path path);
    /// The size of every part but the last.
    Self&
    chunk_size(FileSize size);
    /// The maximum amount of memory used to stream a part.
    Self&
    buffer_capacity(FileSize capacity);

  /*-----------.
  | Attributes |
  `-----------*/
  public:
    ELLE_ATTRIBUTE_R(boost::optional<boost::filesystem::path>, in_file);
    ELLE_ATTRIBUTE_R(boost::optional<boost::filesystem::path>, out_dir);
    ELLE_ATTRIBUTE_R(FileSize, chunk_size);
    ELLE_ATTRIBUTE_R(FileSize, buffer_capacity);

  public:
    /// \throw InvalidInput if a path is unset or a size is zero.
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

  /// The outcome of a successful split.
  struct SplitResult:
    public elle::Printable
  {
    SplitResult();

    /// Bytes read from the input file.
    FileSize total_size;
    PartCount part_count;
    /// The parts, in index order.
    std::vector<boost::filesystem::path> part_paths;

    virtual
    void
    print(std::ostream& stream) const override;
  };

  /// Split a file into parts of a fixed size.
  ///
  /// The input is streamed: memory usage is bounded by the buffer capacity
  /// whatever the input size. An empty input yields a single empty part.
  /// Parts written before a failure are left on disk.
  class Splitter:
    public elle::Printable
  {
  /*-------------.
  | Construction |
  `-------------*/
  public:
    Splitter(SplitConfig config,
             io::Backend& backend = io::blocking());
    ELLE_ATTRIBUTE_R(SplitConfig, config);
  private:
    ELLE_ATTRIBUTE(io::Backend&, backend);

  /*----.
  | Run |
  `----*/
  public:
    /// \throw NotFound if the input file does not exist.
    /// \throw InvalidInput if the configuration is invalid, the input is not
    ///        a regular file, the output is not a directory or the input is
    ///        one of the parts already in it.
    /// \throw PermissionDenied, IOError on system failures.
    SplitResult
    run();
  private:
    void
    _prepare();

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };

  SplitResult
  split(SplitConfig const& config,
        io::Backend& backend = io::blocking());
}

#endif
