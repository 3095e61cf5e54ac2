#include <fstream>
#include <iostream>

#include <signal.h>

#include <boost/program_options.hpp>

#include <elle/Exception.hh>
#include <elle/log.hh>
#include <elle/log/TextLogger.hh>
#include <elle/printf.hh>

#include <reactor/scheduler.hh>
#include <reactor/thread.hh>

#include <morceau/Check.hh>
#include <morceau/Configuration.hh>
#include <morceau/Error.hh>
#include <morceau/Merge.hh>
#include <morceau/Part.hh>
#include <morceau/Split.hh>

ELLE_LOG_COMPONENT("morceau");

static
void
mandatory(boost::program_options::variables_map const& options,
          std::string const& option)
{
  if (!options.count(option))
    throw elle::Exception(
      elle::sprintf("missing mandatory option: %s", option));
}

static
boost::program_options::options_description
allowed_options()
{
  using namespace boost::program_options;
  options_description options("Allowed options");
  options.add_options()
    ("help,h", "display the help")
    ("command", value<std::string>(), "split, merge or check")
    ("input,i", value<std::string>(),
     "the file to split, or the directory holding the parts")
    ("output,o", value<std::string>(),
     "the directory receiving the parts, or the file to rebuild")
    ("chunk-size,c", value<std::string>(), "the size of a part in bytes")
    ("buffer-capacity,b", value<std::string>(),
     "the maximum size of the streaming buffer in bytes")
    ("size,s", value<std::string>(),
     "the expected size of the original file (check)")
    ("count,n", value<std::string>(),
     "the expected number of parts (check)")
    ("mode,m", value<std::string>(), "blocking or cooperative I/O");
  return options;
}

static
boost::program_options::variables_map
parse_options(int argc, char** argv)
{
  using namespace boost::program_options;
  auto options = allowed_options();
  positional_options_description positional;
  positional.add("command", 1);
  variables_map vm;
  try
  {
    store(command_line_parser(argc, argv)
          .options(options)
          .positional(positional)
          .run(),
          vm);
    notify(vm);
  }
  catch (error const& e)
  {
    throw elle::Exception(elle::sprintf("command line error: %s", e.what()));
  }
  return vm;
}

static
void
usage(char const* name)
{
  std::cout << "Usage: " << name << " split|merge|check [options]"
            << std::endl;
  std::cout << std::endl;
  std::cout << allowed_options();
  std::cout << std::endl;
}

static
int
run(boost::program_options::variables_map const& options,
    morceau::Configuration const& config)
{
  mandatory(options, "command");
  mandatory(options, "input");
  auto const command = options["command"].as<std::string>();
  auto const input = options["input"].as<std::string>();
  auto& backend = config.backend();
  ELLE_TRACE_SCOPE("%s %s with %s", command, input, config);
  if (command == "split")
  {
    mandatory(options, "output");
    auto res = morceau::split(
      morceau::SplitConfig()
        .in_file(input)
        .out_dir(options["output"].as<std::string>())
        .chunk_size(config.chunk_size())
        .buffer_capacity(config.buffer_capacity()),
      backend);
    std::cout << res << std::endl;
    for (auto const& path: res.part_paths)
      std::cout << "  " << path.string() << std::endl;
    return 0;
  }
  else if (command == "merge")
  {
    mandatory(options, "output");
    auto res = morceau::merge(
      morceau::MergeConfig()
        .in_dir(input)
        .out_file(options["output"].as<std::string>())
        .buffer_capacity(config.buffer_capacity()),
      backend);
    std::cout << res << std::endl;
    return 0;
  }
  else if (command == "check")
  {
    mandatory(options, "size");
    mandatory(options, "count");
    auto res = morceau::check(
      morceau::CheckConfig()
        .in_dir(input)
        .file_size(morceau::size_from_string(
                     "size", options["size"].as<std::string>(), false))
        .part_count(morceau::size_from_string(
                      "count", options["count"].as<std::string>())),
      backend);
    std::cout << res << std::endl;
    if (res.error)
      for (auto index: res.error->missing)
        std::cout << "  missing " << morceau::Part::name(index) << std::endl;
    return res.success ? 0 : 1;
  }
  else
    throw morceau::InvalidInput(elle::sprintf("unknown command: %s", command));
}

int
main(int argc, char** argv)
{
  signal(SIGPIPE, SIG_IGN);
  try
  {
    auto options = parse_options(argc, argv);
    if (options.count("help"))
    {
      usage(argv[0]);
      return 0;
    }
    morceau::Configuration config;
    if (config.log_file())
    {
      static std::ofstream log(config.log_file().get(),
                               std::fstream::trunc | std::fstream::out);
      elle::log::logger(
        std::unique_ptr<elle::log::Logger>(new elle::log::TextLogger(log)));
    }
    if (options.count("chunk-size"))
      config.chunk_size(morceau::size_from_string(
                          "chunk size",
                          options["chunk-size"].as<std::string>()));
    if (options.count("buffer-capacity"))
      config.buffer_capacity(morceau::size_from_string(
                               "buffer capacity",
                               options["buffer-capacity"].as<std::string>()));
    if (options.count("mode"))
      config.mode(
        morceau::mode_from_string(options["mode"].as<std::string>()));
    reactor::Scheduler sched;
    sched.signal_handle(
      SIGINT,
      [&sched]
      {
        sched.terminate();
      });
    reactor::VThread<int> main(
      sched,
      "morceau",
      [&] () -> int
      {
        try
        {
          return run(options, config);
        }
        catch (std::runtime_error const& e)
        {
          ELLE_TRACE("%s failed: %s", argv[0], e.what());
          std::cerr << argv[0] << ": " << e.what() << "." << std::endl;
          return 1;
        }
      });
    sched.run();
    return main.result();
  }
  catch (std::runtime_error const& e)
  {
    std::cerr << argv[0] << ": " << e.what() << "." << std::endl;
    return 1;
  }
}
