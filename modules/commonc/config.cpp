#include <proofagg/common/config.hpp>

#include <boost/asio/ip/host_name.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>
#include <thread>

#include <unistd.h>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace pagg {
Config::Config()
  : m_optionsCLI("CLI-only options")
  , m_optionsCommon("CLI and config file options") {
  m_generatedLocalName =
    boost::asio::ip::host_name() + "_" + std::to_string(getpid());

  uint32_t threadCount = std::thread::hardware_concurrency();
  if(threadCount == 0) {
    threadCount = 1;
  }

  set(LocalName, m_generatedLocalName);
  set(ConfigFile, std::string(""));
  set(ThreadCount, threadCount);
  set(DatabasePath, std::string("proofagg.sqlite"));
  set(ObjectStoreMode, std::string("file"));
  set(ObjectStorePath, std::string("artifacts"));
  set(KeysPath, std::string("keys"));
  set(PollingIntervalMS, uint64_t(1000));
  set(MaxJobs, uint64_t(0));
  set(ProcessingTimeoutMS, uint64_t(60 * 60 * 1000));
  set(MaxAttempts, uint32_t(3));
  set(SchedulerCapacity, uint64_t(1) << 14);
  set(SchedulerDependencyCount, uint32_t(13));

  /* CLI ONLY OPTIONS
   * --------------------------------------- */
  // clang-format off
  m_optionsCLI.add_options()
    ("help", "produce help message")
    (GetConfigNameFromEnum(Config::ConfigFile),
         po::value<std::string>()->value_name("string"), "config file (INI format) with further options")
    ;
  // clang-format on

  /* COMMON OPTIONS
   * --------------------------------------- */
  // clang-format off
  m_optionsCommon.add_options()
    (GetConfigNameFromEnum(Config::LocalName),
         po::value<std::string>()->default_value(m_generatedLocalName)->value_name("string"), "local name of this witness generator instance")
    (GetConfigNameFromEnum(Config::ThreadCount),
         po::value<uint32_t>()->default_value(threadCount)->value_name("int"),
         "number of worker threads to run compute steps on")
    (GetConfigNameFromEnum(Config::DatabasePath),
         po::value<std::string>()->default_value(getString(DatabasePath).data())->value_name("string"),
         "path of the SQLite job ledger")
    (GetConfigNameFromEnum(Config::ObjectStoreMode),
         po::value<std::string>()->default_value(getString(ObjectStoreMode).data())->value_name("file|memory"),
         "object store backend")
    (GetConfigNameFromEnum(Config::ObjectStorePath),
         po::value<std::string>()->default_value(getString(ObjectStorePath).data())->value_name("string"),
         "root directory of the file object store")
    (GetConfigNameFromEnum(Config::KeysPath),
         po::value<std::string>()->default_value(getString(KeysPath).data())->value_name("string"),
         "directory containing the verification parameter files")
    (GetConfigNameFromEnum(Config::PollingIntervalMS),
         po::value<uint64_t>()->default_value(getUint64(PollingIntervalMS))->value_name("int"),
         "milliseconds to wait before polling the queue again when no job is ready")
    (GetConfigNameFromEnum(Config::MaxJobs),
         po::value<uint64_t>()->default_value(getUint64(MaxJobs))->value_name("int"),
         "stop after processing this many jobs or when the queue is empty. 0 means run until interrupted.")
    (GetConfigNameFromEnum(Config::ProcessingTimeoutMS),
         po::value<uint64_t>()->default_value(getUint64(ProcessingTimeoutMS))->value_name("int"),
         "milliseconds after which a claimed job that did not finish is taken back. 0 never takes jobs back.")
    (GetConfigNameFromEnum(Config::MaxAttempts),
         po::value<uint32_t>()->default_value(getUint32(MaxAttempts))->value_name("int"),
         "retry failed and taken back jobs until they were attempted this often. 0 never retries.")
    (GetConfigNameFromEnum(Config::SchedulerCapacity),
         po::value<uint64_t>()->default_value(getUint64(SchedulerCapacity))->value_name("int"),
         "capacity constant of the scheduler circuit")
    (GetConfigNameFromEnum(Config::SchedulerDependencyCount),
         po::value<uint32_t>()->default_value(getUint32(SchedulerDependencyCount))->value_name("int"),
         "number of node-round proofs every scheduler job consumes")
    ("debug,d", po::bool_switch(&m_debugMode)->default_value(false)->value_name("bool"), "debug mode (activate DEBG output)")
    ("trace,t", po::bool_switch(&m_traceMode)->default_value(false)->value_name("bool"), "trace mode (activate TRCE output)")
    ("info,i", po::bool_switch(&m_infoMode)->default_value(false)->value_name("bool"), "info mode (more information)")
    ("log-to-stdout", po::bool_switch(&m_useSTDOUTForLogging)->default_value(false)->value_name("bool"), "use stdout for logging")
    ;
  // clang-format on
}

Config::~Config() {}

bool
Config::parseParameters(int argc, char** argv) {
  static char* argv_default[] = { (char*)"", nullptr };
  if(argc == 0 && argv == nullptr) {
    argc = 1;
    argv = argv_default;
  }

  po::options_description cliGroup;
  cliGroup.add(m_optionsCommon).add(m_optionsCLI);
  try {
    po::store(po::command_line_parser(argc, argv).options(cliGroup).run(),
              m_vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse CLI Parameters! Error: " << e.what()
              << std::endl;
    return false;
  }

  if(m_vm.count("help")) {
    m_helpRequested = true;
    std::cout << m_optionsCLI << std::endl;
    std::cout << m_optionsCommon << std::endl;
    return false;
  }

  if(m_vm.count(GetConfigNameFromEnum(ConfigFile))) {
    set(ConfigFile,
        m_vm[GetConfigNameFromEnum(ConfigFile)].as<std::string>());
    if(!parseConfigFile(getString(ConfigFile))) {
      return false;
    }
  }

  try {
    po::notify(m_vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not process parameters! Error: " << e.what()
              << std::endl;
    return false;
  }

  return processCommonParameters(m_vm);
}

bool
Config::parseConfigFile(std::string_view filePath) {
  std::string path(filePath);
  if(!fs::exists(path)) {
    std::cerr << "Config file \"" << path << "\" does not exist!" << std::endl;
    return false;
  }

  std::ifstream file(path);
  if(!file) {
    std::cerr << "Could not open config file \"" << path << "\"!"
              << std::endl;
    return false;
  }

  try {
    po::store(po::parse_config_file(file, m_optionsCommon), m_vm);
    po::notify(m_vm);
  } catch(const std::exception& e) {
    std::cerr << "Could not parse config file \"" << path
              << "\"! Error: " << e.what() << std::endl;
    return false;
  }

  return processCommonParameters(m_vm);
}

std::string
Config::getKeyAsString(Key key) const {
  const ConfigVariant& v = get(key);
  switch(v.index()) {
    case 0:
      return std::to_string(std::get<uint16_t>(v));
    case 1:
      return std::to_string(std::get<uint32_t>(v));
    case 2:
      return std::to_string(std::get<uint64_t>(v));
    case 3:
      return std::to_string(std::get<int32_t>(v));
    case 4:
      return std::to_string(std::get<int64_t>(v));
    case 5:
      return std::get<std::string>(v);
    default:
      return "Unknown Type!";
  }
}

template<typename T>
inline void
conditionallySetConfigOptionToArray(
  const boost::program_options::variables_map& vm,
  Config::ConfigVariant* arr,
  Config::Key key) {
  if(vm.count(GetConfigNameFromEnum(key))) {
    arr[key] = vm[GetConfigNameFromEnum(key)].as<T>();
  }
}

bool
Config::processCommonParameters(
  const boost::program_options::variables_map& vm) {
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::LocalName);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::ThreadCount);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::DatabasePath);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::ObjectStoreMode);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::ObjectStorePath);
  conditionallySetConfigOptionToArray<std::string>(
    vm, m_config.data(), Config::KeysPath);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::PollingIntervalMS);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::MaxJobs);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::ProcessingTimeoutMS);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::MaxAttempts);
  conditionallySetConfigOptionToArray<uint64_t>(
    vm, m_config.data(), Config::SchedulerCapacity);
  conditionallySetConfigOptionToArray<uint32_t>(
    vm, m_config.data(), Config::SchedulerDependencyCount);

  if(getUint32(ThreadCount) == 0) {
    std::cerr << "At least one worker thread is required!" << std::endl;
    return false;
  }

  if(getUint64(SchedulerCapacity) == 0) {
    std::cerr << "The scheduler circuit needs a capacity above 0!"
              << std::endl;
    return false;
  }

  if(getUint32(SchedulerDependencyCount) == 0) {
    std::cerr << "Every scheduler job needs at least one dependency!"
              << std::endl;
    return false;
  }

  const std::string& mode = get<std::string>(ObjectStoreMode);
  if(mode != "file" && mode != "memory") {
    std::cerr << "Unknown object store \"" << mode
              << "\"! Use \"file\" or \"memory\"." << std::endl;
    return false;
  }

  return true;
}
}
