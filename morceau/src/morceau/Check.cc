#include <ostream>
#include <unordered_map>

#include <elle/log.hh>
#include <elle/printf.hh>

#include <morceau/Check.hh>
#include <morceau/Error.hh>
#include <morceau/Part.hh>

ELLE_LOG_COMPONENT("morceau.Checker");

namespace morceau
{
  /*-------.
  | Config |
  `-------*/

  CheckConfig::CheckConfig()
    : _in_dir()
    , _file_size()
    , _part_count()
  {}

  CheckConfig&
  CheckConfig::in_dir(boost::filesystem::path path)
  {
    this->_in_dir = std::move(path);
    return *this;
  }

  CheckConfig&
  CheckConfig::file_size(FileSize size)
  {
    this->_file_size = size;
    return *this;
  }

  CheckConfig&
  CheckConfig::part_count(PartCount count)
  {
    this->_part_count = count;
    return *this;
  }

  void
  CheckConfig::validate() const
  {
    if (!this->_in_dir)
      throw InvalidInput("input directory is not set");
    if (!this->_file_size)
      throw InvalidInput("file size is not set");
    if (!this->_part_count)
      throw InvalidInput("part count is not set");
  }

  void
  CheckConfig::print(std::ostream& stream) const
  {
    stream << "CheckConfig(";
    if (this->_in_dir)
      stream << *this->_in_dir;
    else
      stream << "<unset>";
    if (this->_file_size)
      stream << ", " << *this->_file_size << " bytes";
    if (this->_part_count)
      stream << ", " << *this->_part_count << " parts";
    stream << ")";
  }

  /*-------.
  | Result |
  `-------*/

  CheckResult::Failure::Failure(Kind kind,
                                std::string message,
                                std::vector<PartIndex> missing)
    : kind(kind)
    , message(std::move(message))
    , missing(std::move(missing))
  {}

  void
  CheckResult::Failure::print(std::ostream& stream) const
  {
    stream << this->kind << ": " << this->message;
  }

  CheckResult::CheckResult()
    : success(true)
    , error()
  {}

  CheckResult::CheckResult(Failure failure)
    : success(false)
    , error(std::move(failure))
  {}

  void
  CheckResult::print(std::ostream& stream) const
  {
    if (this->success)
      stream << "CheckResult(success)";
    else
      stream << "CheckResult(" << *this->error << ")";
  }

  std::ostream&
  operator <<(std::ostream& out, CheckResult::Failure::Kind kind)
  {
    switch (kind)
    {
      case CheckResult::Failure::Kind::missing:
        return out << "missing";
      case CheckResult::Failure::Kind::size:
        return out << "size";
    }
    return out << "unknown failure";
  }

  /*-------------.
  | Construction |
  `-------------*/

  Checker::Checker(CheckConfig config,
                   io::Backend& backend)
    : _config(std::move(config))
    , _backend(backend)
  {}

  /*----.
  | Run |
  `----*/

  CheckResult
  Checker::run()
  {
    ELLE_TRACE_SCOPE("%s: run", *this);
    this->_config.validate();
    auto const& in_dir = *this->_config.in_dir();
    auto const file_size = *this->_config.file_size();
    auto const part_count = *this->_config.part_count();
    auto type = this->_backend.type(in_dir);
    if (type == io::Backend::FileType::missing)
      throw NotFound(elle::sprintf("input directory %s not found", in_dir));
    if (type != io::Backend::FileType::directory)
      throw InvalidInput(
        elle::sprintf("input %s is a %s, not a directory", in_dir, type));
    // First occurrence wins, as in the merge order.
    std::unordered_map<PartIndex, FileSize> sizes;
    for (auto const& part: Part::collect(this->_backend.list(in_dir)))
      sizes.insert(std::make_pair(part.index(), part.size()));
    std::vector<PartIndex> missing;
    FileSize actual_size = 0;
    for (PartIndex index = 0; index < part_count; ++index)
    {
      auto it = sizes.find(index);
      if (it == sizes.end())
        missing.push_back(index);
      else
        actual_size += it->second;
    }
    if (!missing.empty())
    {
      ELLE_DEBUG("%s: %s parts missing", *this, missing.size());
      return CheckResult(
        CheckResult::Failure(
          CheckResult::Failure::Kind::missing,
          elle::sprintf("%s of %s parts missing", missing.size(), part_count),
          std::move(missing)));
    }
    if (actual_size != file_size)
    {
      ELLE_DEBUG("%s: size mismatch: %s", *this, actual_size);
      return CheckResult(
        CheckResult::Failure(
          CheckResult::Failure::Kind::size,
          elle::sprintf("parts hold %s bytes instead of %s",
                        actual_size, file_size)));
    }
    return CheckResult();
  }

  /*----------.
  | Printable |
  `----------*/

  void
  Checker::print(std::ostream& stream) const
  {
    stream << "Checker(" << this->_config << ")";
  }

  CheckResult
  check(CheckConfig const& config,
        io::Backend& backend)
  {
    return Checker(config, backend).run();
  }
}
