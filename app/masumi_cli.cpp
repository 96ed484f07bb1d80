#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>
#include <boost/thread/thread.hpp>
#include <rapidjson/document.h>

#include "api/transport/impl/http/beast_http_client.hpp"
#include "application/service_config.hpp"
#include "base/logger.hpp"
#include "payment/content_hasher.hpp"
#include "payment/payment_request.hpp"
#include "payment/purchase_request.hpp"

namespace
{
  namespace po = boost::program_options;
  using masumi::application::ServiceConfig;
  using masumi::payment::ServiceClient;

  struct Arguments
  {
    std::string command;
    std::string input;
    std::string agent;
    std::string purchaser;
    std::string unit;
    uint64_t amount = 0;
    int64_t payByTime = 0;
    int64_t submitByTime = 0;
    int64_t unlockTime = 0;
    int64_t disputeUnlockTime = 0;
    std::string id;
    std::string outputHash;
    std::string sellerVkey;
    uint64_t intervalMs = 0;
    int durationSec = 0;
  };

  int reportFailure(const masumi::payment::Failure &failure)
  {
    std::cerr << "Error: " << masumi::payment::Describe(failure) << "\n";
    return EXIT_FAILURE;
  }

  bool parseInput(const std::string &text, rapidjson::Document &document)
  {
    document.Parse(text.c_str(), text.size());
    if (document.HasParseError())
    {
      std::cerr << "Error: --input is not valid JSON\n";
      return false;
    }
    return true;
  }

  masumi::payment::TimeWindows windowsFrom(const Arguments &args)
  {
    masumi::payment::TimeWindows windows;
    windows.pay_by_time = args.payByTime;
    windows.submit_result_time = args.submitByTime;
    windows.unlock_time = args.unlockTime;
    windows.external_dispute_unlock_time = args.disputeUnlockTime;
    return windows;
  }

  std::vector<masumi::payment::Amount> amountsFrom(const Arguments &args)
  {
    if (args.unit.empty() && args.amount == 0)
    {
      return {};
    }
    return { masumi::payment::Amount{ args.amount, args.unit } };
  }

  masumi::payment::PaymentRequest::Params paymentParams(const ServiceConfig &config, const Arguments &args)
  {
    masumi::payment::PaymentRequest::Params params;
    params.agent_identifier = args.agent;
    params.identifier_from_purchaser = args.purchaser;
    params.network = config.network;
    params.payment_contract_address = config.payment_contract_address;
    params.payment_type = config.payment_type;
    params.status_page_limit = config.status_page_limit;
    return params;
  }

  void printSnapshot(const masumi::payment::StatusSnapshot &snapshot)
  {
    std::cout << snapshot.blockchain_identifier
              << " state=" << masumi::payment::ToString(snapshot.State())
              << " onChainState=" << (snapshot.on_chain_state.empty() ? "-" : snapshot.on_chain_state)
              << " nextAction=" << snapshot.requested_action;
    if (snapshot.result_hash)
    {
      std::cout << " resultHash=" << *snapshot.result_hash;
    }
    std::cout << std::endl;
  }

  bool requireId(const Arguments &args)
  {
    if (args.id.empty())
    {
      std::cerr << "Error: --id is required for " << args.command << "\n";
      return false;
    }
    return true;
  }

  int runHash(const Arguments &args)
  {
    auto digest = masumi::payment::ContentHasher::DigestJson(args.input);
    if (!digest)
    {
      return reportFailure(digest.error());
    }
    std::cout << digest.value() << std::endl;
    return EXIT_SUCCESS;
  }

  int runCreatePayment(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    rapidjson::Document input;
    if (!parseInput(args.input, input))
    {
      return EXIT_FAILURE;
    }
    auto request = masumi::payment::PaymentRequest::New(client, paymentParams(config, args), input);
    auto created = request->Create(windowsFrom(args), amountsFrom(args));
    if (!created)
    {
      return reportFailure(created.error());
    }
    std::cout << "blockchainIdentifier: " << created.value() << "\n"
              << "inputHash: " << request->InputHash() << std::endl;
    return EXIT_SUCCESS;
  }

  int runStatus(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    if (!requireId(args))
    {
      return EXIT_FAILURE;
    }
    auto request = masumi::payment::PaymentRequest::New(client, paymentParams(config, args), rapidjson::Value());
    request->Track(args.id);
    auto snapshot = request->CheckStatus(args.id);
    if (!snapshot)
    {
      return reportFailure(snapshot.error());
    }
    printSnapshot(snapshot.value());
    return EXIT_SUCCESS;
  }

  int runComplete(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    if (!requireId(args))
    {
      return EXIT_FAILURE;
    }
    auto request = masumi::payment::PaymentRequest::New(client, paymentParams(config, args), rapidjson::Value());
    request->Track(args.id);
    auto snapshot = request->CheckStatus(args.id);
    if (!snapshot)
    {
      return reportFailure(snapshot.error());
    }
    auto receipt = request->Complete(args.id, args.outputHash);
    if (!receipt)
    {
      return reportFailure(receipt.error());
    }
    std::cout << "Result submitted for " << receipt.value().blockchain_identifier
              << ", next action " << receipt.value().requested_action << std::endl;
    return EXIT_SUCCESS;
  }

  int runPurchase(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    rapidjson::Document input;
    if (!parseInput(args.input, input))
    {
      return EXIT_FAILURE;
    }
    masumi::payment::PurchaseRequest::Params params;
    params.blockchain_identifier = args.id;
    params.seller_vkey = args.sellerVkey;
    params.agent_identifier = args.agent;
    params.identifier_from_purchaser = args.purchaser;
    params.time_windows = windowsFrom(args);
    params.amounts = amountsFrom(args);
    params.network = config.network;
    params.payment_type = config.payment_type;
    params.status_page_limit = config.status_page_limit;

    auto purchase = masumi::payment::PurchaseRequest::New(client, std::move(params), input);
    auto receipt = purchase->Create();
    if (!receipt)
    {
      return reportFailure(receipt.error());
    }
    std::cout << "purchaseId: " << receipt.value().id << "\n"
              << "inputHash: " << purchase->InputHash() << std::endl;
    return EXIT_SUCCESS;
  }

  int runRefund(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    if (!requireId(args))
    {
      return EXIT_FAILURE;
    }
    masumi::payment::RefundBody body;
    body.blockchain_identifier = args.id;
    body.network = config.network;
    auto receipt = client->RequestRefund(body);
    if (!receipt)
    {
      return reportFailure(receipt.error());
    }
    std::cout << "Refund requested, next action " << receipt.value().requested_action << std::endl;
    return EXIT_SUCCESS;
  }

  int runMonitor(const std::shared_ptr<ServiceClient> &client, const ServiceConfig &config, const Arguments &args)
  {
    if (!requireId(args))
    {
      return EXIT_FAILURE;
    }
    auto request = masumi::payment::PaymentRequest::New(client, paymentParams(config, args), rapidjson::Value());
    request->Track(args.id);

    auto interval = std::chrono::milliseconds(config.monitor_interval_ms);
    auto handle = request->StartStatusMonitoring(printSnapshot, interval);
    boost::this_thread::sleep_for(boost::chrono::seconds(args.durationSec));
    handle->Stop();

    std::cout << "Polls: " << handle->PollCount() << std::endl;
    return EXIT_SUCCESS;
  }
}

int main(int argc, char *argv[])
{
  Arguments args;
  std::string configPath;
  std::string verbosity;

  po::options_description desc("Usage: masumi_cli <command> [options]\n"
                               "Commands: hash, create-payment, status, complete, purchase, refund, monitor\n"
                               "Options");
  po::positional_options_description positional;
  positional.add("command", 1);
  po::variables_map vm;
  try
  {
    desc.add_options()
      ("help,h", "print help")
      ("command", po::value<std::string>(&args.command), "Command to run")
      ("config", po::value<std::string>(&configPath), "JSON config file, the environment is used without it")
      ("verbosity", po::value<std::string>(&verbosity), "Log level: trace, debug, info, warn, error, critical, off")
      ("input", po::value<std::string>(&args.input), "Input data as JSON text")
      ("agent", po::value<std::string>(&args.agent), "Agent identifier")
      ("purchaser", po::value<std::string>(&args.purchaser), "Identifier from purchaser, 15-26 hex characters")
      ("amount", po::value<uint64_t>(&args.amount), "Price quantity")
      ("unit", po::value<std::string>(&args.unit), "Price unit")
      ("pay-by", po::value<int64_t>(&args.payByTime), "Pay-by time, Unix ms")
      ("submit-by", po::value<int64_t>(&args.submitByTime), "Result submission deadline, Unix ms")
      ("unlock", po::value<int64_t>(&args.unlockTime), "Unlock time, Unix ms")
      ("dispute-unlock", po::value<int64_t>(&args.disputeUnlockTime), "External dispute unlock time, Unix ms")
      ("id", po::value<std::string>(&args.id), "Blockchain identifier")
      ("output-hash", po::value<std::string>(&args.outputHash), "Hash of the delivered result, 64 hex characters")
      ("seller-vkey", po::value<std::string>(&args.sellerVkey), "Seller verification key")
      ("interval", po::value<uint64_t>(&args.intervalMs), "Monitor interval in ms, config value when absent")
      ("duration", po::value<int>(&args.durationSec)->default_value(60), "Monitor run duration in seconds")
      ;

    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
    po::notify(vm);
  }
  catch (std::exception &e)
  {
    std::cerr << "Error parsing arguments: " << e.what() << "\n";
    std::cout << desc << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help") || args.command.empty())
  {
    std::cout << desc << "\n";
    return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  auto logger = masumi::base::createLogger("MasumiCli");

  if (args.command == "hash")
  {
    return runHash(args);
  }

  ServiceConfig config = masumi::application::overlay(ServiceConfig::Defaults(),
                                                      masumi::application::loadConfigFromEnvironment());
  if (!configPath.empty())
  {
    auto fromFile = masumi::application::loadConfigFile(configPath);
    if (!fromFile)
    {
      std::cerr << "Error: " << fromFile.error().message() << "\n";
      return EXIT_FAILURE;
    }
    config = masumi::application::overlay(config, fromFile.value());
  }
  if (!verbosity.empty())
  {
    config.log_level = verbosity;
  }
  if (vm.count("interval"))
  {
    config.monitor_interval_ms = args.intervalMs;
  }
  if (!masumi::base::setLogLevel(config.log_level))
  {
    std::cerr << "Error: unknown log level " << config.log_level << "\n";
    return EXIT_FAILURE;
  }
  if (auto valid = masumi::application::validateConfig(config); !valid)
  {
    std::cerr << "Error: " << valid.error().message() << "\n";
    return EXIT_FAILURE;
  }

  auto http = masumi::api::BeastHttpClient::New(config.payment_service_url);
  if (!http)
  {
    std::cerr << "Error: " << http.error().message() << "\n";
    return EXIT_FAILURE;
  }
  auto client = std::make_shared<ServiceClient>(http.value(), config.payment_api_key);
  logger->debug("Running {} against {} on {}", args.command, config.payment_service_url, config.network);

  if (args.command == "create-payment")
  {
    return runCreatePayment(client, config, args);
  }
  if (args.command == "status")
  {
    return runStatus(client, config, args);
  }
  if (args.command == "complete")
  {
    return runComplete(client, config, args);
  }
  if (args.command == "purchase")
  {
    return runPurchase(client, config, args);
  }
  if (args.command == "refund")
  {
    return runRefund(client, config, args);
  }
  if (args.command == "monitor")
  {
    return runMonitor(client, config, args);
  }

  std::cerr << "Unknown command: " << args.command << "\n";
  std::cout << desc << "\n";
  return EXIT_FAILURE;
}
