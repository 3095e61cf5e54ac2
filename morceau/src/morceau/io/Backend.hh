#ifndef MORCEAU_IO_BACKEND_HH
# define MORCEAU_IO_BACKEND_HH

# include <iosfwd>
# include <memory>
# include <string>
# include <vector>

# include <boost/filesystem/path.hpp>

# include <elle/Buffer.hh>
# include <elle/Printable.hh>

# include <morceau/Types.hh>

namespace morceau
{
  namespace io
  {
    /// A sequential byte input.
    class Source
    {
    public:
      virtual
      ~Source();
      /// Read at most buffer.size() bytes into \a buffer.
      ///
      /// May return less than requested before the end of input. Returns
      /// zero at the end of input only.
      virtual
      FileSize
      read(elle::WeakBuffer buffer) = 0;
    };

    /// A sequential byte output.
    class Sink
    {
    public:
      virtual
      ~Sink();
      /// Write the whole of \a buffer.
      virtual
      void
      write(elle::ConstWeakBuffer buffer) = 0;
      /// Flush and release the output, reporting any deferred error.
      ///
      /// A sink destroyed without being closed is released silently.
      virtual
      void
      close() = 0;
    };

    /// The filesystem primitives split, merge and check are built upon.
    ///
    /// Every primitive reports failures with morceau::Error subclasses.
    class Backend:
      public elle::Printable
    {
    /*------.
    | Types |
    `------*/
    public:
      typedef Backend Self;

      enum class FileType
      {
        missing,
        regular,
        directory,
        other,
      };

      struct Entry
      {
        std::string name;
        boost::filesystem::path path;
        bool regular;
        /// Size in bytes, zero unless regular.
        FileSize size;
      };
      typedef std::vector<Entry> Entries;

    /*-------------.
    | Construction |
    `-------------*/
    public:
      virtual
      ~Backend();

    /*-----------.
    | Filesystem |
    `-----------*/
    public:
      /// The type of \a path, following symbolic links.
      virtual
      FileType
      type(boost::filesystem::path const& path) = 0;
      /// Create \a path and its missing parents.
      virtual
      void
      create_directories(boost::filesystem::path const& path) = 0;
      /// The entries of directory \a path, in no particular order.
      virtual
      Entries
      list(boost::filesystem::path const& path) = 0;
      /// Whether \a lhs and \a rhs are the same file, following links.
      ///
      /// False if either does not exist.
      virtual
      bool
      equivalent(boost::filesystem::path const& lhs,
                 boost::filesystem::path const& rhs) = 0;
      virtual
      std::unique_ptr<Source>
      open_read(boost::filesystem::path const& path) = 0;
      /// Open \a path for writing, creating or truncating it.
      virtual
      std::unique_ptr<Sink>
      open_write(boost::filesystem::path const& path) = 0;
    };

    std::ostream&
    operator <<(std::ostream& out, Backend::FileType type);

    /// The backend performing I/O in the calling thread.
    Backend&
    blocking();
    /// The backend suspending the calling reactor thread on I/O.
    Backend&
    cooperative();
  }
}

#endif
