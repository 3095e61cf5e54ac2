#ifndef MORCEAU_PART_HH
# define MORCEAU_PART_HH

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
  /// A part file found on disk.
  ///
  /// Parts are named `part_<index>`, the index being the zero-based position
  /// of the part in the original file. The name is the only information
  /// shared between the splitter and the merger.
  class Part:
    public elle::Printable
  {
  /*------.
  | Types |
  `------*/
  public:
    typedef Part Self;
    typedef std::vector<Part> Parts;

  /*-------------.
  | Construction |
  `-------------*/
  public:
    Part(PartIndex index,
         boost::filesystem::path path,
         FileSize size);
    ELLE_ATTRIBUTE_R(PartIndex, index);
    ELLE_ATTRIBUTE_R(boost::filesystem::path, path);
    ELLE_ATTRIBUTE_R(FileSize, size);

  /*-------.
  | Naming |
  `-------*/
  public:
    static std::string const prefix;
    /// The file name of the part at \a index.
    static
    std::string
    name(PartIndex index);
    /// The index encoded in \a filename, if it names a part.
    ///
    /// Leading zeros are accepted, so `part_007` is index 7.
    static
    boost::optional<PartIndex>
    index_of(std::string const& filename);

  /*-----------.
  | Collection |
  `-----------*/
  public:
    /// The parts among \a entries, sorted by index.
    static
    Parts
    collect(io::Backend::Entries const& entries);
    /// Check \a parts are indexed 0 to n - 1 without gap nor duplicate.
    ///
    /// \throw Corrupt if they are not.
    static
    void
    check_contiguous(Parts const& parts);

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };
}

#endif
