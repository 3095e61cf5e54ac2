#include <cerrno>
#include <ostream>

#include <elle/printf.hh>

#include <morceau/Error.hh>

namespace morceau
{
  /*-------------.
  | Construction |
  `-------------*/

  Error::Error(Kind kind, std::string const& message)
    : Super(message)
    , _kind(kind)
  {}

  NotFound::NotFound(std::string const& message)
    : Error(Kind::not_found, message)
  {}

  PermissionDenied::PermissionDenied(std::string const& message)
    : Error(Kind::permission_denied, message)
  {}

  InvalidInput::InvalidInput(std::string const& message)
    : Error(Kind::invalid_input, message)
  {}

  IOError::IOError(std::string const& message)
    : Error(Kind::io, message)
  {}

  Corrupt::Corrupt(std::string const& message)
    : Error(Kind::corrupt, message)
  {}

  std::ostream&
  operator <<(std::ostream& out, Error::Kind kind)
  {
    switch (kind)
    {
      case Error::Kind::not_found:
        return out << "not found";
      case Error::Kind::permission_denied:
        return out << "permission denied";
      case Error::Kind::invalid_input:
        return out << "invalid input";
      case Error::Kind::io:
        return out << "I/O error";
      case Error::Kind::corrupt:
        return out << "corrupt";
    }
    return out << "unknown error kind";
  }

  /*-------------.
  | System error |
  `-------------*/

  void
  raise(std::string const& action,
        boost::filesystem::path const& path,
        boost::system::error_code const& error)
  {
    auto message =
      elle::sprintf("unable to %s %s: %s", action, path, error.message());
    switch (error.value())
    {
      case ENOENT:
      case ENOTDIR:
        throw NotFound(message);
      case EACCES:
      case EPERM:
      case EROFS:
        throw PermissionDenied(message);
      default:
        throw IOError(message);
    }
  }

  void
  raise_errno(std::string const& action,
              boost::filesystem::path const& path)
  {
    int const error = errno;
    raise(action, path,
          boost::system::error_code(error, boost::system::system_category()));
  }
}
