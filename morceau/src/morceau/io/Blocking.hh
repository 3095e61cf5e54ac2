#ifndef MORCEAU_IO_BLOCKING_HH
# define MORCEAU_IO_BLOCKING_HH

# include <morceau/io/Backend.hh>

namespace morceau
{
  namespace io
  {
    /// Filesystem access through plain system calls in the calling thread.
    class Blocking:
      public Backend
    {
    public:
      typedef Blocking Self;
      typedef Backend Super;

    /*-----------.
    | Filesystem |
    `-----------*/
    public:
      virtual
      FileType
      type(boost::filesystem::path const& path) override;
      virtual
      void
      create_directories(boost::filesystem::path const& path) override;
      virtual
      Entries
      list(boost::filesystem::path const& path) override;
      virtual
      bool
      equivalent(boost::filesystem::path const& lhs,
                 boost::filesystem::path const& rhs) override;
      virtual
      std::unique_ptr<Source>
      open_read(boost::filesystem::path const& path) override;
      virtual
      std::unique_ptr<Sink>
      open_write(boost::filesystem::path const& path) override;

    /*----------.
    | Printable |
    `----------*/
    public:
      virtual
      void
      print(std::ostream& stream) const override;
    };
  }
}

#endif
