#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <boxrunner/job.h>
#include "stream_io.h"

namespace fs = std::filesystem;

namespace {

constexpr double kConnectTimeout = 10;

void ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) {
    spdlog::info("No configuration file {}; using defaults", std::string(conf_path));
    return;
  }
  tortellini::ini ini;
  fin >> ini;
  kBrokerUrl = ini[""]["broker_url"] | kBrokerUrl;
  kBrokerLogin = ini[""]["broker_login"] | kBrokerLogin;
  kBrokerPasscode = ini[""]["broker_passcode"] | kBrokerPasscode;
  kBrokerVhost = ini[""]["broker_vhost"] | kBrokerVhost;
  kInboundStream = ini[""]["inbound_stream"] | kInboundStream;
  kOutboundStream = ini[""]["outbound_stream"] | kOutboundStream;
  kMaxStreamBytes = ini[""]["max_stream_bytes"] | kMaxStreamBytes;
  kPublishTimeout = ini[""]["publish_timeout_sec"] | kPublishTimeout;
}

// Wait on the outbound stream for the result carrying submit_id
bool WaitResult(StreamClient& client, const std::string& submit_id) {
  Delivery delivery;
  while (client.NextDelivery(delivery)) {
    if (!client.Ack(delivery)) spdlog::warn("Failed acknowledging delivery {}", delivery.ack_id);
    try {
      nlohmann::json result = nlohmann::json::parse(delivery.body);
      if (result.at("submit_id").get<std::string>() != submit_id) continue;
      std::cout << result.dump(2) << std::endl;
      return true;
    } catch (nlohmann::json::exception& err) {
      spdlog::warn("Ignoring malformed result: {}", err.what());
    }
  }
  spdlog::error("Connection lost before the result of {} arrived", submit_id);
  return false;
}

} // namespace

int main(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "boxrunner-submit");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/boxrunner.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--wait")
    .default_value(false)
    .implicit_value(true)
    .help("Print the matching result from the outbound stream");
  parser.add_argument("--broker-url")
    .help("WebSocket STOMP endpoint of the broker");
  parser.add_argument("job")
    .help("Job file in JSON");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  ParseConfig(parser.get<std::string>("--config"));
  if (auto val = parser.present("--broker-url")) kBrokerUrl = val.value();
  bool wait = parser.get<bool>("--wait");

  std::string job_file = parser.get<std::string>("job");
  std::ifstream fin(job_file);
  if (!fin) {
    spdlog::error("Cannot open job file {}", job_file);
    return 1;
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  Job job;
  if (!ParseJob(ss.str(), job)) {
    spdlog::error("Invalid job file {}", job_file);
    return 1;
  }

  StreamClient client(kBrokerUrl);
  if (!client.Open(kConnectTimeout)) {
    spdlog::error("Cannot connect to broker {}", kBrokerUrl);
    return 1;
  }
  // subscribe first; the result is only delivered if it is appended after this point
  if (wait && !client.Subscribe(kOutboundStream, 1, kConnectTimeout)) return 1;
  if (!client.SendConfirmed(kInboundStream, ss.str(), kPublishTimeout)) {
    spdlog::error("Broker did not confirm job {}", job.submit_id);
    return 1;
  }
  spdlog::info("Job {} submitted to {}", job.submit_id, kInboundStream);
  if (wait && !WaitResult(client, job.submit_id)) return 1;
  return 0;
}
