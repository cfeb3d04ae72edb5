#ifndef PROOFAGG_CONFIG_HPP
#define PROOFAGG_CONFIG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace pagg {

/** @brief Process-wide configuration, read from the command line and an
 * optional config file.
 *
 * Constructed once at startup and passed by reference to everything that
 * needs it.
 */
class Config {
  public:
  /** Configuration variable differentiator enumeration.
   */
  enum Key {
    LocalName,
    ConfigFile,
    ThreadCount,
    DatabasePath,
    ObjectStoreMode,
    ObjectStorePath,
    KeysPath,
    PollingIntervalMS,
    MaxJobs,
    ProcessingTimeoutMS,
    MaxAttempts,
    SchedulerCapacity,
    SchedulerDependencyCount,

    _KEY_COUNT
  };

  using ConfigVariant =
    std::variant<uint16_t, uint32_t, uint64_t, int32_t, int64_t, std::string>;

  /** @brief Constructor
   */
  Config();
  /** @brief Destructor.
   */
  ~Config();

  /** @brief Parse command line parameters and also process a provided
   * configuration file.
   *
   * @return True if program execution may continue, false if program should be
   * terminated.
   */
  bool parseParameters(int argc = 0, char* argv[] = nullptr);
  /** @brief Process a configuration file in INI format. Values already given
   * on the command line are not overwritten.
   *
   * @return True if the file could be read and parsed.
   */
  bool parseConfigFile(std::string_view filePath);

  std::string getKeyAsString(Key key) const;

  template<typename T>
  inline T& get(Key key) {
    return std::get<T>(m_config[key]);
  }
  template<typename T>
  inline const T& get(Key key) const {
    return std::get<T>(m_config[key]);
  }
  inline std::string_view getString(Key key) const {
    const std::string& str = get<std::string>(key);
    return std::string_view{ str.c_str(), str.size() };
  }
  inline uint16_t getUint16(Key key) const { return get<uint16_t>(key); }
  inline uint32_t getUint32(Key key) const { return get<uint32_t>(key); }
  inline uint64_t getUint64(Key key) const { return get<uint64_t>(key); }
  inline int32_t getInt32(Key key) const { return get<int32_t>(key); }
  inline int64_t getInt64(Key key) const { return get<int64_t>(key); }

  inline ConfigVariant& get(Key key) { return m_config[key]; }
  inline const ConfigVariant& get(Key key) const { return m_config[key]; }
  inline void set(Key key, ConfigVariant&& val) { m_config[key] = val; }

  ConfigVariant& operator[](Key key) { return get(key); }

  /** @brief Check if debug mode is active. */
  inline bool isDebugMode() const { return m_debugMode; }
  /** @brief Check if trace mode is active. */
  inline bool isTraceMode() const { return m_traceMode; }
  /** @brief Check if info mode is active. */
  inline bool isInfoMode() const { return m_infoMode; }
  /** @brief Check if STDOUT should be used for logging instead of CLOG. */
  inline bool useSTDOUTForLogging() const { return m_useSTDOUTForLogging; }
  /** @brief True if parseParameters() stopped after printing the help. */
  inline bool helpRequested() const { return m_helpRequested; }

  inline void setDebugMode(bool v) { m_debugMode = v; }
  inline void setTraceMode(bool v) { m_traceMode = v; }
  inline void setInfoMode(bool v) { m_infoMode = v; }

  private:
  bool processCommonParameters(
    const boost::program_options::variables_map& map);

  using ConfigArray =
    std::array<ConfigVariant, static_cast<std::size_t>(_KEY_COUNT)>;
  ConfigArray m_config;

  boost::program_options::options_description m_optionsCLI;
  boost::program_options::options_description m_optionsCommon;

  boost::program_options::variables_map m_vm;

  bool m_debugMode = false;
  bool m_traceMode = false;
  bool m_infoMode = false;
  bool m_useSTDOUTForLogging = false;
  bool m_helpRequested = false;

  std::string m_generatedLocalName;
};

constexpr const char*
GetConfigNameFromEnum(Config::Key key) {
  switch(key) {
    case Config::LocalName:
      return "local-name";
    case Config::ConfigFile:
      return "config";
    case Config::ThreadCount:
      return "threads";
    case Config::DatabasePath:
      return "database";
    case Config::ObjectStoreMode:
      return "object-store";
    case Config::ObjectStorePath:
      return "object-store-path";
    case Config::KeysPath:
      return "keys-path";
    case Config::PollingIntervalMS:
      return "polling-interval-ms";
    case Config::MaxJobs:
      return "max-jobs";
    case Config::ProcessingTimeoutMS:
      return "processing-timeout-ms";
    case Config::MaxAttempts:
      return "max-attempts";
    case Config::SchedulerCapacity:
      return "scheduler-capacity";
    case Config::SchedulerDependencyCount:
      return "scheduler-dependency-count";
    default:
      return "";
  }
}
}

#endif
