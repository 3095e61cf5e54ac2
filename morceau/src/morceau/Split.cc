#include <algorithm>

#include <elle/Buffer.hh>
#include <elle/log.hh>
#include <elle/printf.hh>

#include <morceau/Error.hh>
#include <morceau/Part.hh>
#include <morceau/Split.hh>

ELLE_LOG_COMPONENT("morceau.Splitter");

namespace morceau
{
  /*-------.
  | Config |
  `-------*/

  SplitConfig::SplitConfig()
    : _in_file()
    , _out_dir()
    , _chunk_size(default_chunk_size)
    , _buffer_capacity(default_buffer_capacity)
  {}

  SplitConfig&
  SplitConfig::in_file(boost::filesystem::path path)
  {
    this->_in_file = std::move(path);
    return *this;
  }

  SplitConfig&
  SplitConfig::out_dir(boost::filesystem::path path)
  {
    this->_out_dir = std::move(path);
    return *this;
  }

  SplitConfig&
  SplitConfig::chunk_size(FileSize size)
  {
    this->_chunk_size = size;
    return *this;
  }

  SplitConfig&
  SplitConfig::buffer_capacity(FileSize capacity)
  {
    this->_buffer_capacity = capacity;
    return *this;
  }

  void
  SplitConfig::validate() const
  {
    if (!this->_in_file)
      throw InvalidInput("input file is not set");
    if (!this->_out_dir)
      throw InvalidInput("output directory is not set");
    if (this->_chunk_size == 0)
      throw InvalidInput("chunk size must be positive");
    if (this->_buffer_capacity == 0)
      throw InvalidInput("buffer capacity must be positive");
  }

  void
  SplitConfig::print(std::ostream& stream) const
  {
    stream << "SplitConfig(";
    if (this->_in_file)
      stream << *this->_in_file;
    else
      stream << "<unset>";
    stream << " -> ";
    if (this->_out_dir)
      stream << *this->_out_dir;
    else
      stream << "<unset>";
    stream << ", chunk size: " << this->_chunk_size << ")";
  }

  /*-------.
  | Result |
  `-------*/

  SplitResult::SplitResult()
    : total_size(0)
    , part_count(0)
    , part_paths()
  {}

  void
  SplitResult::print(std::ostream& stream) const
  {
    stream << "SplitResult(" << this->total_size << " bytes, "
           << this->part_count << " parts)";
  }

  /*-------------.
  | Construction |
  `-------------*/

  Splitter::Splitter(SplitConfig config,
                     io::Backend& backend)
    : _config(std::move(config))
    , _backend(backend)
  {}

  /*----.
  | Run |
  `----*/

  /// Read \a size bytes into \a buffer unless the input ends before.
  static
  FileSize
  fill(io::Source& source, elle::Buffer& buffer, FileSize size)
  {
    FileSize res = 0;
    while (res < size)
    {
      auto read = source.read(
        elle::WeakBuffer(buffer.mutable_contents() + res, size - res));
      if (read == 0)
        break;
      res += read;
    }
    return res;
  }

  void
  Splitter::_prepare()
  {
    this->_config.validate();
    auto const& in_file = *this->_config.in_file();
    auto const& out_dir = *this->_config.out_dir();
    auto input_type = this->_backend.type(in_file);
    if (input_type == io::Backend::FileType::missing)
      throw NotFound(elle::sprintf("input file %s not found", in_file));
    if (input_type != io::Backend::FileType::regular)
      throw InvalidInput(
        elle::sprintf("input %s is a %s, not a regular file",
                      in_file, input_type));
    auto output_type = this->_backend.type(out_dir);
    if (output_type == io::Backend::FileType::missing)
      this->_backend.create_directories(out_dir);
    else if (output_type != io::Backend::FileType::directory)
      throw InvalidInput(
        elle::sprintf("output %s is a %s, not a directory",
                      out_dir, output_type));
    else
      for (auto const& part: Part::collect(this->_backend.list(out_dir)))
        if (this->_backend.equivalent(part.path(), in_file))
          throw InvalidInput(
            elle::sprintf("input %s would be overwritten by %s",
                          in_file, part.path()));
  }

  SplitResult
  Splitter::run()
  {
    ELLE_TRACE_SCOPE("%s: run", *this);
    this->_prepare();
    auto const& out_dir = *this->_config.out_dir();
    FileSize const chunk_size = this->_config.chunk_size();
    auto input = this->_backend.open_read(*this->_config.in_file());
    elle::Buffer buffer(
      std::min(chunk_size, this->_config.buffer_capacity()));
    SplitResult res;
    bool end = false;
    while (!end)
    {
      // The part is only created once we know it has content, except for the
      // single part of an empty input.
      auto read = fill(*input, buffer, buffer.size());
      end = read < buffer.size();
      if (read == 0 && res.part_count > 0)
        break;
      auto path = out_dir / Part::name(res.part_count);
      ELLE_DEBUG_SCOPE("%s: write part %s", *this, path);
      auto output = this->_backend.open_write(path);
      FileSize size = 0;
      while (true)
      {
        if (read > 0)
        {
          output->write(elle::ConstWeakBuffer(buffer.contents(), read));
          size += read;
        }
        if (end || size == chunk_size)
          break;
        auto wanted = std::min<FileSize>(buffer.size(), chunk_size - size);
        read = fill(*input, buffer, wanted);
        end = read < wanted;
      }
      output->close();
      ELLE_DUMP("%s: part %s holds %s bytes", *this, res.part_count, size);
      res.part_paths.push_back(path);
      res.total_size += size;
      ++res.part_count;
    }
    ELLE_TRACE("%s: done: %s", *this, res);
    return res;
  }

  /*----------.
  | Printable |
  `----------*/

  void
  Splitter::print(std::ostream& stream) const
  {
    stream << "Splitter(" << this->_config << ")";
  }

  SplitResult
  split(SplitConfig const& config,
        io::Backend& backend)
  {
    return Splitter(config, backend).run();
  }
}
