#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include <pthread.h>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BisectionEngine.hpp"
#include "core/DiffOptions.hpp"
#include "dal/AccessorFactory.hpp"
#include "output/IDiffFormatter.hpp"
#include "output/JsonFormatter.hpp"
#include "output/TextFormatter.hpp"

// Run sequence: configuration, accessors, engine, report. The diff report
// goes to stdout, logs to stderr. SIGINT/SIGTERM cancel the run and the
// partial report is still written.

namespace {

xdiff::common::TableRef makeTableRef(const xdiff::common::Config& cfgApp,
                                     const std::string& sTable) {
  xdiff::common::TableRef tr;
  tr.sTablePath = sTable;
  tr.sKeyColumn = cfgApp.sKeyColumn;
  tr.keyType = cfgApp.keyType;
  tr.iKeyScale = cfgApp.iKeyScale;
  tr.vColumns = cfgApp.vColumns;
  return tr;
}

xdiff::core::DiffOptions makeOptions(const xdiff::common::Config& cfgApp) {
  xdiff::core::DiffOptions doOptions;
  doOptions.iBisectionFactor = cfgApp.iBisectionFactor;
  doOptions.iBisectionThreshold = cfgApp.iBisectionThreshold;
  doOptions.iMaxDepth = cfgApp.iMaxDepth;
  doOptions.iThreads = cfgApp.iThreads;
  doOptions.iLeftMaxInFlight = cfgApp.iDb1PoolSize;
  doOptions.iRightMaxInFlight = cfgApp.iDb2PoolSize;
  doOptions.iMaxRetries = cfgApp.iMaxRetries;
  doOptions.durRetryBackoff = std::chrono::milliseconds(cfgApp.iRetryBackoffMs);
  doOptions.durRetryBackoffMax = std::chrono::milliseconds(cfgApp.iRetryBackoffMaxMs);
  doOptions.bSkipFailedSegments = cfgApp.bSkipFailedSegments;
  return doOptions;
}

}  // namespace

int main() {
  // Block SIGINT/SIGTERM in every thread; the watcher below receives them.
  sigset_t sigSet;
  sigemptyset(&sigSet);
  sigaddset(&sigSet, SIGINT);
  sigaddset(&sigSet, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigSet, nullptr);

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = xdiff::common::Config::load();

    xdiff::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = xdiff::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Open both accessors ──────────────────────────────────────
    auto upLeft = xdiff::dal::AccessorFactory::create(cfgApp.sDb1Url, cfgApp.iDb1PoolSize);
    auto upRight = xdiff::dal::AccessorFactory::create(cfgApp.sDb2Url, cfgApp.iDb2PoolSize);
    spLog->info("Step 2: Accessors ready (left={}, pool={}; right={}, pool={})", upLeft->name(),
                cfgApp.iDb1PoolSize, upRight->name(), cfgApp.iDb2PoolSize);

    // ── Step 3: Start the diff ───────────────────────────────────────────
    const auto trLeft = makeTableRef(cfgApp, cfgApp.sTable1);
    const auto trRight = makeTableRef(cfgApp, cfgApp.sTable2);

    xdiff::core::BisectionEngine beEngine(*upLeft, *upRight, makeOptions(cfgApp));
    auto upStream = beEngine.diff(trLeft, trRight);
    spLog->info("Step 3: Diff started (factor={}, threshold={}, max depth={})",
                cfgApp.iBisectionFactor, cfgApp.iBisectionThreshold, cfgApp.iMaxDepth);

    // ── Step 4: Watch for SIGINT/SIGTERM ─────────────────────────────────
    std::jthread thSignals([&sigSet, &upStream](std::stop_token stToken) {
      const timespec tsPoll{0, 200'000'000};
      while (!stToken.stop_requested()) {
        const int iSignal = sigtimedwait(&sigSet, nullptr, &tsPoll);
        if (iSignal == SIGINT || iSignal == SIGTERM) {
          xdiff::common::Logger::get()->warn("Received signal {}, cancelling diff", iSignal);
          upStream->cancel();
          return;
        }
      }
    });
    spLog->info("Step 4: Signal watcher started");

    // ── Step 5: Write the report ─────────────────────────────────────────
    std::unique_ptr<xdiff::output::IDiffFormatter> upFormatter;
    if (cfgApp.sOutputFormat == "json") {
      upFormatter = std::make_unique<xdiff::output::JsonFormatter>(std::cout, cfgApp.bStats);
    } else {
      upFormatter = std::make_unique<xdiff::output::TextFormatter>(std::cout, cfgApp.bStats);
    }
    upFormatter->begin(trLeft, trRight);

    std::exception_ptr epFailure;
    try {
      for (const auto& drRecord : *upStream) {
        upFormatter->write(drRecord);
      }
    } catch (const std::exception&) {
      epFailure = std::current_exception();
    }
    upStream->wait();

    thSignals.request_stop();
    thSignals.join();

    const auto state = upStream->state();
    upFormatter->finish(upStream->stats(), state);
    spLog->info("Step 5: Report written (status={})", xdiff::core::toString(state));

    if (epFailure) std::rethrow_exception(epFailure);
    return EXIT_SUCCESS;
  } catch (const xdiff::common::AppError& ex) {
    std::cerr << "[fatal] " << ex._sErrorCode << ": " << ex.what() << "\n";
    return ex._iExitCode == 0 ? EXIT_FAILURE : ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] diff failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
