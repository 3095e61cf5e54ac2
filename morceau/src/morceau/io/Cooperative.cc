#include <cstring>
#include <exception>
#include <memory>

#include <elle/Exception.hh>
#include <elle/log.hh>

#include <reactor/scheduler.hh>

#include <morceau/Error.hh>
#include <morceau/io/Cooperative.hh>

ELLE_LOG_COMPONENT("morceau.io.Cooperative");

namespace morceau
{
  namespace io
  {
    class CooperativeSource:
      public Source
    {
    public:
      CooperativeSource(std::shared_ptr<Source> source):
        _source(std::move(source)),
        _chunk()
      {}

      virtual
      FileSize
      read(elle::WeakBuffer buffer) override
      {
        if (!this->_chunk || this->_chunk->size() < buffer.size())
          this->_chunk = std::make_shared<elle::Buffer>(buffer.size());
        auto source = this->_source;
        auto chunk = this->_chunk;
        auto size = buffer.size();
        auto res = std::make_shared<FileSize>(0);
        Cooperative::run(
          [source, chunk, size, res]
          {
            *res = source->read(
              elle::WeakBuffer(chunk->mutable_contents(), size));
          });
        std::memcpy(buffer.mutable_contents(), chunk->contents(), *res);
        return *res;
      }

    private:
      std::shared_ptr<Source> _source;
      /// Read into by the background job, which may outlive the caller.
      std::shared_ptr<elle::Buffer> _chunk;
    };

    class CooperativeSink:
      public Sink
    {
    public:
      CooperativeSink(std::shared_ptr<Sink> sink):
        _sink(std::move(sink))
      {}

      virtual
      void
      write(elle::ConstWeakBuffer buffer) override
      {
        auto sink = this->_sink;
        auto data =
          std::make_shared<elle::Buffer>(buffer.contents(), buffer.size());
        Cooperative::run(
          [sink, data]
          {
            sink->write(elle::ConstWeakBuffer(data->contents(), data->size()));
          });
      }

      virtual
      void
      close() override
      {
        auto sink = this->_sink;
        Cooperative::run([sink] { sink->close(); });
      }

    private:
      std::shared_ptr<Sink> _sink;
    };

    /*-------------.
    | Construction |
    `-------------*/

    Cooperative::Cooperative(Backend& backend):
      _backend(backend)
    {}

    /*-----------.
    | Filesystem |
    `-----------*/

    Backend::FileType
    Cooperative::type(boost::filesystem::path const& path)
    {
      auto backend = &this->_backend;
      auto res = std::make_shared<FileType>(FileType::missing);
      Cooperative::run([backend, path, res] { *res = backend->type(path); });
      return *res;
    }

    void
    Cooperative::create_directories(boost::filesystem::path const& path)
    {
      auto backend = &this->_backend;
      Cooperative::run([backend, path] { backend->create_directories(path); });
    }

    Backend::Entries
    Cooperative::list(boost::filesystem::path const& path)
    {
      auto backend = &this->_backend;
      auto res = std::make_shared<Entries>();
      Cooperative::run([backend, path, res] { *res = backend->list(path); });
      return std::move(*res);
    }

    bool
    Cooperative::equivalent(boost::filesystem::path const& lhs,
                            boost::filesystem::path const& rhs)
    {
      auto backend = &this->_backend;
      auto res = std::make_shared<bool>(false);
      Cooperative::run(
        [backend, lhs, rhs, res] { *res = backend->equivalent(lhs, rhs); });
      return *res;
    }

    std::unique_ptr<Source>
    Cooperative::open_read(boost::filesystem::path const& path)
    {
      auto backend = &this->_backend;
      auto source = std::make_shared<std::unique_ptr<Source>>();
      Cooperative::run(
        [backend, path, source] { *source = backend->open_read(path); });
      return std::unique_ptr<Source>(
        new CooperativeSource(std::shared_ptr<Source>(std::move(*source))));
    }

    std::unique_ptr<Sink>
    Cooperative::open_write(boost::filesystem::path const& path)
    {
      auto backend = &this->_backend;
      auto sink = std::make_shared<std::unique_ptr<Sink>>();
      Cooperative::run(
        [backend, path, sink] { *sink = backend->open_write(path); });
      return std::unique_ptr<Sink>(
        new CooperativeSink(std::shared_ptr<Sink>(std::move(*sink))));
    }

    /*-----------.
    | Background |
    `-----------*/

    void
    Cooperative::run(std::function<void ()> action)
    {
      auto scheduler = reactor::Scheduler::scheduler();
      if (scheduler == nullptr || scheduler->current() == nullptr)
        throw InvalidInput("cooperative I/O outside of a reactor thread");
      auto exception = std::make_shared<std::exception_ptr>();
      reactor::background(
        [action, exception]
        {
          try
          {
            action();
          }
          catch (...)
          {
            *exception = std::current_exception();
          }
        });
      if (*exception)
      {
        ELLE_DEBUG("background operation failed: %s",
                   elle::exception_string(*exception));
        std::rethrow_exception(*exception);
      }
    }

    /*----------.
    | Printable |
    `----------*/

    void
    Cooperative::print(std::ostream& stream) const
    {
      stream << "Cooperative(" << this->_backend << ")";
    }
  }
}
