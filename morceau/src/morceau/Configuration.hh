#ifndef MORCEAU_CONFIGURATION_HH
# define MORCEAU_CONFIGURATION_HH

# include <iosfwd>
# include <string>

# include <boost/optional.hpp>

# include <elle/Printable.hh>
# include <elle/attribute.hh>

# include <morceau/Types.hh>
# include <morceau/io/Backend.hh>

namespace morceau
{
  /// Defaults for the tools, read from the environment.
  ///
  /// MORCEAU_CHUNK_SIZE       part size in bytes.
  /// MORCEAU_BUFFER_CAPACITY  streaming buffer bound in bytes.
  /// MORCEAU_MODE             "blocking" or "cooperative".
  /// MORCEAU_LOG_FILE         where to write logs instead of stderr.
  class Configuration:
    public elle::Printable
  {
  /*------.
  | Types |
  `------*/
  public:
    typedef Configuration Self;

    enum class Mode
    {
      blocking,
      cooperative,
    };

  /*-------------.
  | Construction |
  `-------------*/
  public:
    /// Read the environment.
    ///
    /// \throw InvalidInput on malformed values.
    Configuration();

    ELLE_ATTRIBUTE_RW(FileSize, chunk_size);
    ELLE_ATTRIBUTE_RW(FileSize, buffer_capacity);
    ELLE_ATTRIBUTE_RW(Mode, mode);
    ELLE_ATTRIBUTE_R(boost::optional<std::string>, log_file);

  public:
    /// The backend matching the mode.
    io::Backend&
    backend() const;

  /*----------.
  | Printable |
  `----------*/
  public:
    virtual
    void
    print(std::ostream& stream) const override;
  };

  std::ostream&
  operator <<(std::ostream& out, Configuration::Mode mode);

  /// \throw InvalidInput unless \a name is "blocking" or "cooperative".
  Configuration::Mode
  mode_from_string(std::string const& name);

  /// Parse a byte count, strictly positive unless \a positive is false.
  ///
  /// \throw InvalidInput if \a value is not one.
  FileSize
  size_from_string(std::string const& name,
                   std::string const& value,
                   bool positive = true);
}

#endif
