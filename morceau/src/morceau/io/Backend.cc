#include <ostream>

#include <morceau/io/Backend.hh>
#include <morceau/io/Blocking.hh>
#include <morceau/io/Cooperative.hh>

namespace morceau
{
  namespace io
  {
    Source::~Source()
    {}

    Sink::~Sink()
    {}

    Backend::~Backend()
    {}

    std::ostream&
    operator <<(std::ostream& out, Backend::FileType type)
    {
      switch (type)
      {
        case Backend::FileType::missing:
          return out << "missing";
        case Backend::FileType::regular:
          return out << "regular file";
        case Backend::FileType::directory:
          return out << "directory";
        case Backend::FileType::other:
          return out << "special file";
      }
      return out << "unknown file type";
    }

    Backend&
    blocking()
    {
      static Blocking backend;
      return backend;
    }

    Backend&
    cooperative()
    {
      static Cooperative backend(blocking());
      return backend;
    }
  }
}
