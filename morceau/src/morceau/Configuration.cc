#include <ostream>

#include <boost/lexical_cast.hpp>

#include <elle/log.hh>
#include <elle/os/getenv.hh>
#include <elle/printf.hh>

#include <morceau/Configuration.hh>
#include <morceau/Error.hh>

ELLE_LOG_COMPONENT("morceau.Configuration");

namespace morceau
{
  /*-------------.
  | Construction |
  `-------------*/

  Configuration::Configuration()
    : _chunk_size(default_chunk_size)
    , _buffer_capacity(default_buffer_capacity)
    , _mode(Mode::cooperative)
    , _log_file()
  {
    auto chunk_size = elle::os::getenv("MORCEAU_CHUNK_SIZE", "");
    if (!chunk_size.empty())
      this->_chunk_size = size_from_string("MORCEAU_CHUNK_SIZE", chunk_size);
    auto capacity = elle::os::getenv("MORCEAU_BUFFER_CAPACITY", "");
    if (!capacity.empty())
      this->_buffer_capacity =
        size_from_string("MORCEAU_BUFFER_CAPACITY", capacity);
    auto mode = elle::os::getenv("MORCEAU_MODE", "");
    if (!mode.empty())
      this->_mode = mode_from_string(mode);
    auto log_file = elle::os::getenv("MORCEAU_LOG_FILE", "");
    if (!log_file.empty())
      this->_log_file = log_file;
    ELLE_DEBUG("%s: loaded", *this);
  }

  io::Backend&
  Configuration::backend() const
  {
    switch (this->_mode)
    {
      case Mode::blocking:
        return io::blocking();
      case Mode::cooperative:
        return io::cooperative();
    }
    throw InvalidInput(elle::sprintf("unknown mode %s", this->_mode));
  }

  /*----------.
  | Printable |
  `----------*/

  void
  Configuration::print(std::ostream& stream) const
  {
    stream << "Configuration(chunk size: " << this->_chunk_size
           << ", buffer capacity: " << this->_buffer_capacity
           << ", mode: " << this->_mode << ")";
  }

  std::ostream&
  operator <<(std::ostream& out, Configuration::Mode mode)
  {
    switch (mode)
    {
      case Configuration::Mode::blocking:
        return out << "blocking";
      case Configuration::Mode::cooperative:
        return out << "cooperative";
    }
    return out << "unknown mode";
  }

  Configuration::Mode
  mode_from_string(std::string const& name)
  {
    if (name == "blocking")
      return Configuration::Mode::blocking;
    if (name == "cooperative")
      return Configuration::Mode::cooperative;
    throw InvalidInput(elle::sprintf("unknown mode: %s", name));
  }

  FileSize
  size_from_string(std::string const& name,
                   std::string const& value,
                   bool positive)
  {
    // lexical_cast wraps negative values around.
    if (value.empty() || value[0] == '-')
      throw InvalidInput(elle::sprintf("invalid %s: %s", name, value));
    FileSize res = 0;
    try
    {
      res = boost::lexical_cast<FileSize>(value);
    }
    catch (boost::bad_lexical_cast const&)
    {
      throw InvalidInput(elle::sprintf("invalid %s: %s", name, value));
    }
    if (positive && res == 0)
      throw InvalidInput(elle::sprintf("%s must be positive", name));
    return res;
  }
}
