#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/directory/account_directory.hpp>
#include <tally/ledger/ledger_store.hpp>
#include <tally/mirror/cash_bank_registers.hpp>
#include <tally/mirror/mirror_adapter.hpp>
#include <tally/projection/balance_projector.hpp>
#include <tally/reconciliation/reconciler.hpp>
#include <tally/reconciliation/reconciliation_service.hpp>
#include <tally/reconciliation/warning_log.hpp>
#include <tally/schema/amount.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void print_report(const tally::reconciliation::reconciliation_report& report) {
  spdlog::info("Trial balance: debit {} credit {} over {} lines",
               tally::schema::format_amount(report.trial_balance.total_debit),
               tally::schema::format_amount(report.trial_balance.total_credit),
               report.trial_balance.line_count);
  for (const auto& warning : report.outstanding) {
    spdlog::warn("Outstanding: [{}] {}", tally::schema::to_string(warning.type),
                 warning.message);
  }
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto interval_seconds = uint64_t{};
  auto retention_days = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"tallyd"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "tally.db"),
      "RocksDB directory holding the ledger")(
      "reconcile-interval,i",
      boost::program_options::value<uint64_t>(&interval_seconds)
          ->default_value(300),
      "Seconds between reconciliation passes; 0 runs one pass and exits")(
      "warning-retention-days,r",
      boost::program_options::value<uint64_t>(&retention_days)
          ->default_value(30),
      "Days a resolved consistency warning is kept before it is pruned")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file,f",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "tally.log"),
      "Log file, appended to")(
      "seed-default-chart,s",
      "Define the standard chart of accounts before reconciling");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tallyd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto exit_code = 0;
  try {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
            db_path);
    auto directory = tally::directory::account_directory{storage};
    if (vm.contains("seed-default-chart")) {
      auto seeded =
          tally::directory::seed(directory, tally::directory::default_chart());
      if (!seeded.ok()) {
        spdlog::critical("Seeding the chart of accounts failed: {} {}",
                         seeded.log, seeded.info);
        spdlog::shutdown();
        return 1;
      }
    }

    auto ledger = tally::ledger::ledger_store{storage};
    auto projector =
        tally::projection::balance_projector{storage, directory, ledger};
    auto registers = tally::mirror::cash_bank_registers{storage, directory};
    auto mirrors = tally::mirror::mirror_adapter{projector};
    mirrors.add_target(registers);
    auto warnings = tally::reconciliation::warning_log{storage};
    auto options = tally::reconciliation::reconciler_options{};
    options.resolved_retention = std::chrono::hours{
        static_cast<std::chrono::hours::rep>(24 * retention_days)};
    auto reconciler = tally::reconciliation::reconciler{
        directory, ledger, projector, mirrors, warnings, options};

    if (interval_seconds == 0) {
      auto report = reconciler.reconcile(shutdown_requested());
      print_report(report);
      exit_code = report.outstanding.empty() ? 0 : 1;
    } else {
      auto service = tally::reconciliation::reconciliation_service{
          reconciler, std::chrono::seconds{interval_seconds}};
      service.start();
      while (!shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
      }
      service.stop();
      if (auto report = service.last_report()) {
        print_report(*report);
      }
    }
  } catch (const std::exception& e) {
    spdlog::critical("tallyd failed: {}", e.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
