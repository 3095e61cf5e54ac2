#ifndef MORCEAU_ERROR_HH
# define MORCEAU_ERROR_HH

# include <iosfwd>
# include <string>

# include <boost/filesystem/path.hpp>
# include <boost/system/error_code.hpp>

# include <elle/Error.hh>
# include <elle/attribute.hh>

namespace morceau
{
  /// Any failure of a split, merge or check operation.
  class Error
    : public elle::Error
  {
  /*------.
  | Types |
  `------*/
  public:
    typedef Error Self;
    typedef elle::Error Super;

    enum class Kind
    {
      not_found,
      permission_denied,
      invalid_input,
      io,
      corrupt,
    };

  /*-------------.
  | Construction |
  `-------------*/
  public:
    Error(Kind kind, std::string const& message);
    ELLE_ATTRIBUTE_R(Kind, kind);
  };

  std::ostream&
  operator <<(std::ostream& out, Error::Kind kind);

  /// A file or directory that should exist does not.
  class NotFound
    : public Error
  {
  public:
    NotFound(std::string const& message);
  };

  class PermissionDenied
    : public Error
  {
  public:
    PermissionDenied(std::string const& message);
  };

  /// The configuration or the paths it names are unusable.
  class InvalidInput
    : public Error
  {
  public:
    InvalidInput(std::string const& message);
  };

  class IOError
    : public Error
  {
  public:
    IOError(std::string const& message);
  };

  /// The part set is incomplete or inconsistent.
  class Corrupt
    : public Error
  {
  public:
    Corrupt(std::string const& message);
  };

  /// Throw the error matching a system error on \a path.
  ///
  /// ENOENT and ENOTDIR map to NotFound, EACCES, EPERM and EROFS to
  /// PermissionDenied, anything else to IOError.
  void
  raise(std::string const& action,
        boost::filesystem::path const& path,
        boost::system::error_code const& error);

  /// Same as above with the current errno.
  void
  raise_errno(std::string const& action,
              boost::filesystem::path const& path);
}

#endif
