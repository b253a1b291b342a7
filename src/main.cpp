#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <boxrunner/logger.h>
#include <boxrunner/paths.h>
#include <boxrunner/runtime.h>
#include <boxrunner/workspace.h>
#include <boxrunner/dispatcher.h>
#include "boxrunner/utils.h"
#include "stream_io.h"

namespace {

constexpr double kConnectTimeout = 10;

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t");
  return str.substr(l, r - l + 1);
}

// "gcc=gcc:14.2, java=openjdk:21"
bool ParseProfiles(const std::string& str) {
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(',', pos);
    if (next == std::string::npos) next = str.size();
    std::string item = Trim(str.substr(pos, next - pos));
    pos = next + 1;
    if (item.empty()) continue;
    size_t eq = item.find('=');
    if (eq == std::string::npos) {
      spdlog::error("Invalid profile entry \"{}\"; expected profile=image", item);
      return false;
    }
    std::string profile = Trim(item.substr(0, eq)), image = Trim(item.substr(eq + 1));
    if (profile.empty() || image.empty()) {
      spdlog::error("Invalid profile entry \"{}\"; expected profile=image", item);
      return false;
    }
    kProfileImages[profile] = image;
  }
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kBrokerUrl = ini[""]["broker_url"] | kBrokerUrl;
  kBrokerLogin = ini[""]["broker_login"] | kBrokerLogin;
  kBrokerPasscode = ini[""]["broker_passcode"] | kBrokerPasscode;
  kBrokerVhost = ini[""]["broker_vhost"] | kBrokerVhost;
  kInboundStream = ini[""]["inbound_stream"] | kInboundStream;
  kOutboundStream = ini[""]["outbound_stream"] | kOutboundStream;
  kMaxStreamBytes = ini[""]["max_stream_bytes"] | kMaxStreamBytes;
  kPrefetch = ini[""]["prefetch"] | kPrefetch;
  kPublishTimeout = ini[""]["publish_timeout_sec"] | kPublishTimeout;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string template_dir = ini[""]["template_dir"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  if (template_dir.size()) kTemplateDir = template_dir;
  kRuntimeCommand = ini[""]["runtime_command"] | kRuntimeCommand;
  kRuntimeEntry = ini[""]["runtime_entry"] | kRuntimeEntry;
  kAllowUnlistedProfiles = ini[""]["allow_unlisted_profiles"] | kAllowUnlistedProfiles;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  std::string profiles = ini[""]["profiles"] | "";
  return ParseProfiles(profiles);
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "boxrunner");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/boxrunner.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel jobs (0 for unlimited)");
  parser.add_argument("--broker-url")
    .help("WebSocket STOMP endpoint of the broker");
  parser.add_argument("--template-dir")
    .help("Baseline directory copied into every workspace");
  parser.add_argument("--workspace-root")
    .help("Directory under which workspaces are created");

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
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present("--broker-url")) {
    kBrokerUrl = val.value();
  }
  if (auto val = parser.present("--template-dir")) {
    kTemplateDir = val.value();
  }
  if (auto val = parser.present("--workspace-root")) {
    kWorkspaceRoot = val.value();
  }
  if (kMaxParallel < 0) {
    spdlog::error("Invalid parallel value {}", kMaxParallel);
    exit(1);
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  if (!CheckTemplate()) return 1;
  if (!CreateDirs(kWorkspaceRoot)) {
    spdlog::error("Cannot create workspace root {}", kWorkspaceRoot.c_str());
    return 1;
  }

  StreamClient client(kBrokerUrl);
  if (!client.Open(kConnectTimeout)) {
    spdlog::error("Cannot connect to broker {}", kBrokerUrl);
    return 1;
  }
  if (!client.DeclareStream(kOutboundStream, kConnectTimeout) ||
      !client.Subscribe(kInboundStream, kPrefetch, kConnectTimeout)) {
    return 1;
  }
  spdlog::warn("Runner started: consuming {} publishing to {} parallel={}",
               kInboundStream, kOutboundStream, kMaxParallel);

  StreamPublisher publisher(client, kOutboundStream);
  {
    Dispatcher dispatcher(publisher, kMaxParallel);
    ConsumeLoop(client, dispatcher);
    // results can no longer be published
    dispatcher.CancelAll();
    spdlog::warn("Waiting for {} running jobs", dispatcher.InFlight());
    dispatcher.WaitIdle();
    DispatchStats stats = dispatcher.Stats();
    spdlog::warn("Runner stopped: received={} malformed={} published={} dropped={}",
                 stats.received, stats.malformed, stats.published, stats.dropped);
  }
  return 1;
}
