#include <algorithm>

#include <elle/Buffer.hh>
#include <elle/log.hh>
#include <elle/printf.hh>

#include <morceau/Error.hh>
#include <morceau/Merge.hh>
#include <morceau/Part.hh>

ELLE_LOG_COMPONENT("morceau.Merger");

namespace morceau
{
  /*-------.
  | Config |
  `-------*/

  MergeConfig::MergeConfig()
    : _in_dir()
    , _out_file()
    , _buffer_capacity(default_buffer_capacity)
  {}

  MergeConfig&
  MergeConfig::in_dir(boost::filesystem::path path)
  {
    this->_in_dir = std::move(path);
    return *this;
  }

  MergeConfig&
  MergeConfig::out_file(boost::filesystem::path path)
  {
    this->_out_file = std::move(path);
    return *this;
  }

  MergeConfig&
  MergeConfig::buffer_capacity(FileSize capacity)
  {
    this->_buffer_capacity = capacity;
    return *this;
  }

  void
  MergeConfig::validate() const
  {
    if (!this->_in_dir)
      throw InvalidInput("input directory is not set");
    if (!this->_out_file)
      throw InvalidInput("output file is not set");
    if (this->_buffer_capacity == 0)
      throw InvalidInput("buffer capacity must be positive");
  }

  void
  MergeConfig::print(std::ostream& stream) const
  {
    stream << "MergeConfig(";
    if (this->_in_dir)
      stream << *this->_in_dir;
    else
      stream << "<unset>";
    stream << " -> ";
    if (this->_out_file)
      stream << *this->_out_file;
    else
      stream << "<unset>";
    stream << ")";
  }

  /*-------.
  | Result |
  `-------*/

  MergeResult::MergeResult()
    : total_size(0)
    , part_count(0)
  {}

  void
  MergeResult::print(std::ostream& stream) const
  {
    stream << "MergeResult(" << this->total_size << " bytes, "
           << this->part_count << " parts)";
  }

  /*-------------.
  | Construction |
  `-------------*/

  Merger::Merger(MergeConfig config,
                 io::Backend& backend)
    : _config(std::move(config))
    , _backend(backend)
  {}

  /*----.
  | Run |
  `----*/

  MergeResult
  Merger::run()
  {
    ELLE_TRACE_SCOPE("%s: run", *this);
    this->_config.validate();
    auto const& in_dir = *this->_config.in_dir();
    auto const& out_file = *this->_config.out_file();
    auto input_type = this->_backend.type(in_dir);
    if (input_type == io::Backend::FileType::missing)
      throw NotFound(elle::sprintf("input directory %s not found", in_dir));
    if (input_type != io::Backend::FileType::directory)
      throw InvalidInput(
        elle::sprintf("input %s is a %s, not a directory",
                      in_dir, input_type));
    auto parts = Part::collect(this->_backend.list(in_dir));
    if (parts.empty())
      throw Corrupt(elle::sprintf("no part found in %s", in_dir));
    Part::check_contiguous(parts);
    ELLE_DEBUG("%s: found %s parts", *this, parts.size());
    auto output_type = this->_backend.type(out_file);
    if (output_type == io::Backend::FileType::directory)
      throw InvalidInput(
        elle::sprintf("output %s is a directory", out_file));
    if (output_type != io::Backend::FileType::missing)
      for (auto const& part: parts)
        if (this->_backend.equivalent(part.path(), out_file))
          throw InvalidInput(
            elle::sprintf("output %s would overwrite %s",
                          out_file, part.path()));
    auto parent = out_file.parent_path();
    if (!parent.empty() &&
        this->_backend.type(parent) == io::Backend::FileType::missing)
      this->_backend.create_directories(parent);
    auto output = this->_backend.open_write(out_file);
    auto largest = std::max_element(
      parts.begin(), parts.end(),
      [] (Part const& lhs, Part const& rhs)
      {
        return lhs.size() < rhs.size();
      });
    elle::Buffer buffer(
      std::max<FileSize>(
        1, std::min(largest->size(), this->_config.buffer_capacity())));
    MergeResult res;
    for (auto const& part: parts)
    {
      ELLE_DEBUG_SCOPE("%s: append %s", *this, part);
      auto input = this->_backend.open_read(part.path());
      while (true)
      {
        auto read = input->read(
          elle::WeakBuffer(buffer.mutable_contents(), buffer.size()));
        if (read == 0)
          break;
        output->write(elle::ConstWeakBuffer(buffer.contents(), read));
        res.total_size += read;
      }
      ++res.part_count;
    }
    output->close();
    ELLE_TRACE("%s: done: %s", *this, res);
    return res;
  }

  /*----------.
  | Printable |
  `----------*/

  void
  Merger::print(std::ostream& stream) const
  {
    stream << "Merger(" << this->_config << ")";
  }

  MergeResult
  merge(MergeConfig const& config,
        io::Backend& backend)
  {
    return Merger(config, backend).run();
  }
}
