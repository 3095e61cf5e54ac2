#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <boost/filesystem/operations.hpp>

#include <elle/attribute.hh>
#include <elle/log.hh>

#include <morceau/Error.hh>
#include <morceau/io/Blocking.hh>

ELLE_LOG_COMPONENT("morceau.io.Blocking");

namespace morceau
{
  namespace io
  {
    /*------------------.
    | File descriptors |
    `------------------*/

    /// Owner of an open file descriptor.
    class FileDescriptor
    {
    public:
      FileDescriptor(boost::filesystem::path const& path, int flags):
        _path(path),
        _fd(-1)
      {
        do
          this->_fd = ::open(path.c_str(), flags | O_CLOEXEC, 0666);
        while (this->_fd < 0 && errno == EINTR);
        if (this->_fd < 0)
          raise_errno("open", path);
        ELLE_DEBUG("open %s as %s", path, this->_fd);
      }

      FileDescriptor(FileDescriptor const&) = delete;

      ~FileDescriptor()
      {
        if (this->_fd >= 0)
        {
          ELLE_DEBUG("release %s", this->_fd);
          ::close(this->_fd);
        }
      }

      void
      close()
      {
        if (this->_fd < 0)
          return;
        int fd = this->_fd;
        this->_fd = -1;
        ELLE_DEBUG("close %s", fd);
        if (::close(fd) != 0 && errno != EINTR)
          raise_errno("close", this->_path);
      }

      ELLE_ATTRIBUTE_R(boost::filesystem::path, path);
      ELLE_ATTRIBUTE_R(int, fd);
    };

    class FileSource:
      public Source
    {
    public:
      FileSource(boost::filesystem::path const& path):
        _file(path, O_RDONLY)
      {}

      virtual
      FileSize
      read(elle::WeakBuffer buffer) override
      {
        while (true)
        {
          auto res = ::read(this->_file.fd(),
                            buffer.mutable_contents(), buffer.size());
          if (res >= 0)
          {
            ELLE_DUMP("read %s bytes from %s", res, this->_file.path());
            return res;
          }
          if (errno != EINTR)
            raise_errno("read", this->_file.path());
        }
      }

    private:
      FileDescriptor _file;
    };

    class FileSink:
      public Sink
    {
    public:
      FileSink(boost::filesystem::path const& path):
        _file(path, O_WRONLY | O_CREAT | O_TRUNC)
      {}

      virtual
      void
      write(elle::ConstWeakBuffer buffer) override
      {
        auto data = buffer.contents();
        auto remaining = buffer.size();
        // write(2) may be partial.
        while (remaining > 0)
        {
          auto res = ::write(this->_file.fd(), data, remaining);
          if (res < 0)
          {
            if (errno == EINTR)
              continue;
            raise_errno("write", this->_file.path());
          }
          ELLE_DUMP("wrote %s bytes to %s", res, this->_file.path());
          data += res;
          remaining -= res;
        }
      }

      virtual
      void
      close() override
      {
        this->_file.close();
      }

    private:
      FileDescriptor _file;
    };

    /*-----------.
    | Filesystem |
    `-----------*/

    Backend::FileType
    Blocking::type(boost::filesystem::path const& path)
    {
      boost::system::error_code error;
      auto status = boost::filesystem::status(path, error);
      if (status.type() == boost::filesystem::status_error)
        raise("stat", path, error);
      switch (status.type())
      {
        case boost::filesystem::file_not_found:
          return FileType::missing;
        case boost::filesystem::regular_file:
          return FileType::regular;
        case boost::filesystem::directory_file:
          return FileType::directory;
        default:
          return FileType::other;
      }
    }

    void
    Blocking::create_directories(boost::filesystem::path const& path)
    {
      ELLE_TRACE("create directory %s", path);
      boost::system::error_code error;
      boost::filesystem::create_directories(path, error);
      if (error)
        raise("create directory", path, error);
    }

    Backend::Entries
    Blocking::list(boost::filesystem::path const& path)
    {
      ELLE_TRACE_SCOPE("list %s", path);
      boost::system::error_code error;
      boost::filesystem::directory_iterator it(path, error);
      if (error)
        raise("list", path, error);
      Entries res;
      boost::filesystem::directory_iterator end;
      while (it != end)
      {
        auto const& entry = it->path();
        Entry e{entry.filename().string(), entry, false, 0};
        e.regular = this->type(entry) == FileType::regular;
        if (e.regular)
        {
          e.size = boost::filesystem::file_size(entry, error);
          if (error)
            raise("stat", entry, error);
        }
        ELLE_DUMP("found %s (%s bytes)", e.name, e.size);
        res.push_back(std::move(e));
        it.increment(error);
        if (error)
          raise("list", path, error);
      }
      return res;
    }

    bool
    Blocking::equivalent(boost::filesystem::path const& lhs,
                         boost::filesystem::path const& rhs)
    {
      if (this->type(lhs) == FileType::missing ||
          this->type(rhs) == FileType::missing)
        return false;
      boost::system::error_code error;
      auto res = boost::filesystem::equivalent(lhs, rhs, error);
      if (error)
        raise("compare", lhs, error);
      return res;
    }

    std::unique_ptr<Source>
    Blocking::open_read(boost::filesystem::path const& path)
    {
      return std::unique_ptr<Source>(new FileSource(path));
    }

    std::unique_ptr<Sink>
    Blocking::open_write(boost::filesystem::path const& path)
    {
      return std::unique_ptr<Sink>(new FileSink(path));
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Blocking::print(std::ostream& stream) const
    {
      stream << "Blocking";
    }
  }
}
