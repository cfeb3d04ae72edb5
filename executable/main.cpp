#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/operations.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <locale>
#include <memory>

#include <proofagg/blob/file_object_store.hpp>
#include <proofagg/blob/memory_object_store.hpp>
#include <proofagg/common/config.hpp>
#include <proofagg/common/log.h>
#include <proofagg/engine/job_processor.hpp>
#include <proofagg/engine/metrics.hpp>
#include <proofagg/engine/service.hpp>
#include <proofagg/queue/dependency_resolver.hpp>
#include <proofagg/queue/sqlite_ledger.hpp>
#include <proofagg/runner/runner.hpp>
#include <proofagg/scheduler/scheduler_stage.hpp>

using namespace pagg;

struct ProgramRuntimeHelper {
  ProgramRuntimeHelper() {}
  ~ProgramRuntimeHelper() {
    using namespace std::chrono;
    using day_t = duration<long, std::ratio<3600 * 24>>;

    auto end = steady_clock::now();

    auto dur = end - start;
    auto d = duration_cast<day_t>(dur);
    auto h = duration_cast<hours>(dur -= d);
    auto m = duration_cast<minutes>(dur -= h);
    auto s = duration_cast<seconds>(dur -= m);

    auto totalSeconds = duration_cast<duration<float>>(end - start);

    pagg_log(PAGG_GENERAL,
             PAGG_DEBUG,
             "Wall-clock runtime: {}s ({}d, {}h, {}min, {}s)",
             totalSeconds.count(),
             d.count(),
             h.count(),
             m.count(),
             s.count());
  }

  std::chrono::steady_clock::time_point start =
    std::chrono::steady_clock::now();
};

static void
applyLogSeverity(const Config& config) {
  if(config.isTraceMode()) {
    pagg_log_set_severity(PAGG_TRACE);
  } else if(config.isDebugMode()) {
    pagg_log_set_severity(PAGG_DEBUG);
  } else if(config.isInfoMode()) {
    pagg_log_set_severity(PAGG_INFO);
  }
}

static std::unique_ptr<blob::ObjectStore>
createObjectStore(const Config& config) {
  if(config.getString(Config::ObjectStoreMode) == "memory") {
    pagg_log(PAGG_GENERAL,
             PAGG_LOCALWARNING,
             "Using the in-memory object store, artifacts are lost on exit.");
    return std::make_unique<blob::MemoryObjectStore>();
  }
  boost::filesystem::path root(
    std::string(config.getString(Config::ObjectStorePath)));
  pagg_log(
    PAGG_GENERAL, PAGG_DEBUG, "Using file object store at {}.", root.string());
  return std::make_unique<blob::FileObjectStore>(root);
}

int
main(int argc, char* argv[]) {
  // Workaround for wonky locales.
  try {
    std::locale loc("");
  } catch(const std::exception& e) {
    setenv("LC_ALL", "C", 1);
  }

  Config config;
  if(!config.parseParameters(argc, argv)) {
    return config.helpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if(pagg_log_init(config.useSTDOUTForLogging()) != PAGG_OK) {
    return EXIT_FAILURE;
  }
  applyLogSeverity(config);
  const std::string localName(config.getString(Config::LocalName));
  pagg_log_set_local_name(localName.c_str());

  ProgramRuntimeHelper runtimeHelper;

  std::shared_ptr<const VerificationParameters> parameters;
  const boost::filesystem::path keysPath(
    std::string(config.getString(Config::KeysPath)));
  if(LoadVerificationParameters(keysPath, parameters) != PAGG_OK) {
    pagg_log(PAGG_GENERAL,
             PAGG_FATAL,
             "Could not load verification parameters from {}!",
             keysPath.string());
    return EXIT_FAILURE;
  }

  queue::SQLiteLedger ledger(
    std::string(config.getString(Config::DatabasePath)));
  pagg_status s = ledger.open();
  if(s != PAGG_OK) {
    pagg_log(PAGG_GENERAL,
             PAGG_FATAL,
             "Could not open job ledger {}! Status: {}",
             ledger.path(),
             s);
    return EXIT_FAILURE;
  }

  std::unique_ptr<blob::ObjectStore> store = createObjectStore(config);

  queue::DependencyResolver resolver(ledger);
  resolver.setExpectedCount(
    AggregationRound::Scheduler,
    config.getUint32(Config::SchedulerDependencyCount));

  SchedulerStage stage(
    *store, parameters, config.getUint64(Config::SchedulerCapacity));

  runner::Runner runner(config);
  runner.start();

  engine::Service service;
  engine::LogMetricsSink metrics;

  engine::JobProcessorSettings settings;
  settings.name = localName + "_" + SchedulerStage::ServiceName;
  settings.pollingInterval =
    std::chrono::milliseconds(config.getUint64(Config::PollingIntervalMS));
  settings.maxJobs = config.getUint64(Config::MaxJobs);
  settings.processingTimeout =
    std::chrono::milliseconds(config.getUint64(Config::ProcessingTimeoutMS));
  settings.maxAttempts = config.getUint32(Config::MaxAttempts);

  engine::JobProcessor<SchedulerStage> processor(
    stage, service, runner, ledger, resolver, *store, metrics, settings);
  processor.getFinishedSignal().connect([&service]() {
    pagg_log(PAGG_GENERAL, PAGG_DEBUG, "Processor finished.");
    service.requestStop();
  });

  // A second interrupt stops the io loop at once. A compute step still running
  // on a worker is waited for, but its result is not saved. The job stays
  // claimed until requeueStuckJobs takes it back.
  boost::asio::signal_set signals(service.ioContext(), SIGINT, SIGTERM);
  std::function<void(const boost::system::error_code&, int)> onSignal =
    [&](const boost::system::error_code& ec, int signal) {
      if(ec)
        return;
      if(processor.finished() || service.stopped())
        return;
      static bool exitRequested = false;
      if(exitRequested) {
        pagg_log(PAGG_GENERAL,
                 PAGG_LOCALWARNING,
                 "Received signal {} again, abandoning the current job.",
                 signal);
        service.requestStop();
        return;
      }
      exitRequested = true;
      pagg_log(PAGG_GENERAL,
               PAGG_INFO,
               "Received signal {}, finishing the current job before "
               "exiting.",
               signal);
      processor.stop();
      signals.async_wait(onSignal);
    };
  signals.async_wait(onSignal);

  // Sigpipe would exit the whole application! Errors are handled where the
  // write happens.
  signal(SIGPIPE, SIG_IGN);

  processor.start();
  service.run();

  pagg_log(PAGG_GENERAL, PAGG_DEBUG, "Waiting for worker threads to exit.");
  runner.stop();

  pagg_log(PAGG_GENERAL,
           PAGG_INFO,
           "Stopped {} after {} jobs, {} succeeded and {} failed.",
           settings.name,
           processor.claimedJobs(),
           processor.succeededJobs(),
           processor.failedJobs());

  return EXIT_SUCCESS;
}
