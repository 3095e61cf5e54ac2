#include <algorithm>

#include <boost/lexical_cast.hpp>

#include <elle/log.hh>
#include <elle/printf.hh>

#include <morceau/Error.hh>
#include <morceau/Part.hh>

ELLE_LOG_COMPONENT("morceau.Part");

namespace morceau
{
  /*-------------.
  | Construction |
  `-------------*/

  Part::Part(PartIndex index,
             boost::filesystem::path path,
             FileSize size)
    : _index(index)
    , _path(std::move(path))
    , _size(size)
  {}

  /*-------.
  | Naming |
  `-------*/

  std::string const Part::prefix("part_");

  std::string
  Part::name(PartIndex index)
  {
    return Part::prefix + boost::lexical_cast<std::string>(index);
  }

  boost::optional<PartIndex>
  Part::index_of(std::string const& filename)
  {
    if (filename.size() <= Part::prefix.size() ||
        filename.compare(0, Part::prefix.size(), Part::prefix) != 0)
      return boost::none;
    auto digits = filename.substr(Part::prefix.size());
    // lexical_cast would accept a sign.
    if (!std::all_of(digits.begin(), digits.end(),
                     [] (char c) { return c >= '0' && c <= '9'; }))
      return boost::none;
    try
    {
      return boost::lexical_cast<PartIndex>(digits);
    }
    catch (boost::bad_lexical_cast const&)
    {
      ELLE_DEBUG("ignore %s: index out of range", filename);
      return boost::none;
    }
  }

  /*-----------.
  | Collection |
  `-----------*/

  Part::Parts
  Part::collect(io::Backend::Entries const& entries)
  {
    Parts res;
    for (auto const& entry: entries)
    {
      if (!entry.regular)
        continue;
      auto index = Part::index_of(entry.name);
      if (!index)
      {
        ELLE_DUMP("ignore foreign entry %s", entry.name);
        continue;
      }
      res.emplace_back(*index, entry.path, entry.size);
    }
    // Stable so duplicates keep the listing order in error messages.
    std::stable_sort(res.begin(), res.end(),
                     [] (Part const& lhs, Part const& rhs)
                     {
                       return lhs.index() < rhs.index();
                     });
    return res;
  }

  void
  Part::check_contiguous(Parts const& parts)
  {
    PartIndex expected = 0;
    for (auto const& part: parts)
    {
      if (part.index() < expected)
        throw Corrupt(
          elle::sprintf("duplicate part %s: %s", part.index(), part.path()));
      if (part.index() > expected)
        throw Corrupt(
          elle::sprintf("missing part %s before %s", expected, part.path()));
      ++expected;
    }
  }

  /*----------.
  | Printable |
  `----------*/

  void
  Part::print(std::ostream& stream) const
  {
    stream << "Part(" << this->_index << ", " << this->_path << ", "
           << this->_size << " bytes)";
  }
}
