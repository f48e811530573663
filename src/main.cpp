#include <iostream>
#include <optional>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <remex/config.h>
#include <remex/errors.h>
#include <remex/payload.h>
#include <remex/dispatcher.h>
#include "remex/utils.h"

namespace {

struct Options {
  fs::path config_file;
  long timeout;
  std::string module, function;
  nlohmann::json argument;
  std::optional<fs::path> program;
};

Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  Options ret;
  argparse::ArgumentParser parser(argc ? argv[0] : "remex-run");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("remex.ini"))
    .help("Path of the execution configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>().default_value(300000L)
    .help("Deadline of the call in milliseconds");
  parser.add_argument("--module")
    .default_value(std::string(""))
    .help("Import path of the module defining the function");
  parser.add_argument("--function")
    .default_value(std::string(""))
    .help("Name of the function to call");
  parser.add_argument("--arg")
    .default_value(std::string("{}"))
    .help("JSON argument passed to the function");
  parser.add_argument("--program")
    .help("Run a prepared entrypoint instead of generating one");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  ret.config_file = parser.get<std::string>("--config");
  ret.timeout = parser.get<long>("--timeout");
  ret.module = parser.get<std::string>("--module");
  ret.function = parser.get<std::string>("--function");
  if (auto program = parser.present("--program")) ret.program = *program;
  ret.argument = nlohmann::json::parse(parser.get<std::string>("--arg"), nullptr, false);
  if (ret.argument.is_discarded()) {
    spdlog::error("--arg is not valid JSON");
    exit(1);
  }
  if (ret.timeout <= 0) {
    spdlog::error("--timeout must be positive");
    exit(1);
  }
  if (!ret.program && (ret.module.empty() || ret.function.empty())) {
    std::cerr << "Either --program or both --module and --function are required" << std::endl;
    std::cerr << parser;
    exit(1);
  }
  return ret;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  Options opt = ParseArgs(argc, argv);
  try {
    ExecutionConfig config = LoadExecutionConfig(opt.config_file);
    std::shared_ptr<const PayloadGenerator> generator;
    if (opt.program) {
      auto program = ReadFileToString(*opt.program);
      if (!program) {
        spdlog::error("Cannot read {}", opt.program->string());
        return 1;
      }
      generator = std::make_shared<StaticPayloadGenerator>(std::move(*program));
    } else {
      generator = std::make_shared<PythonPayloadGenerator>();
    }
    Dispatcher dispatcher(DefaultBackendTable(), generator);
    WorkItem work;
    work.module = opt.module;
    work.function = opt.function;
    work.argument = std::move(opt.argument);
    auto result = dispatcher.Call<nlohmann::json>(config, work, opt.timeout);
    std::cout << result.dump() << std::endl;
  } catch (const RemoteApplicationError& e) {
    spdlog::error("Remote {} raised: {}", e.error_type(), e.error_message());
    return 1;
  } catch (const ExecutionError& e) {
    spdlog::error("{}: {}", FailureKindName(e.kind()), e.what());
    return 1;
  } catch (const RemexError& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
