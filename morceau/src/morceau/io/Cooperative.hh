#ifndef MORCEAU_IO_COOPERATIVE_HH
# define MORCEAU_IO_COOPERATIVE_HH

# include <functional>

# include <elle/attribute.hh>

# include <morceau/io/Backend.hh>

namespace morceau
{
  namespace io
  {
    /// Filesystem access from reactor threads.
    ///
    /// Every primitive of the underlying backend is run in a system thread
    /// with reactor::background, suspending only the calling reactor thread.
    /// Other threads of the scheduler keep running meanwhile, and the calling
    /// thread may be terminated between two primitives. Must be used from a
    /// reactor thread.
    class Cooperative:
      public Backend
    {
    public:
      typedef Cooperative Self;
      typedef Backend Super;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      Cooperative(Backend& backend);
    private:
      ELLE_ATTRIBUTE(Backend&, backend);

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

    /*-----------.
    | Background |
    `-----------*/
    public:
      /// Run \a action in a system thread and wait for it.
      ///
      /// Exceptions thrown by \a action are rethrown in the caller. If the
      /// caller is terminated meanwhile, \a action still runs to completion:
      /// it must own, by value or shared pointer, everything it touches.
      ///
      /// \throw InvalidInput if not called from a reactor thread.
      static
      void
      run(std::function<void ()> action);

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
