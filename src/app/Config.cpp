#include "app/Config.hpp"

#include <cstdlib>
#include <getopt.h>

#include <arpa/inet.h>

namespace App {
namespace {
constexpr size_t kMinPassphrase = 8;
constexpr size_t kMaxPassphrase = 63;

enum LongOnly {
  kOptNoDhcpGateway = 1000,
  kOptNoDhcpDns,
  kOptNoDhcpRouterOption,
  kOptWifiDirect,
  kOptConnectTimeoutRetries,
  kOptStayAlive,
  kOptLogLevel,
  kOptForgetAll,
  kOptForgetNetwork,
  kOptListNetworks,
  kOptListConnected,
  kOptListSaved,
  kOptConnect,
  kOptPassphrase,
};

const struct option kLongOptions[] = {
    {"portal-interface", required_argument, nullptr, 'i'},
    {"portal-ssid", required_argument, nullptr, 's'},
    {"portal-passphrase", required_argument, nullptr, 'p'},
    {"portal-gateway", required_argument, nullptr, 'g'},
    {"portal-dhcp-range", required_argument, nullptr, 'd'},
    {"portal-listening-port", required_argument, nullptr, 'o'},
    {"activity-timeout", required_argument, nullptr, 'a'},
    {"ui-directory", required_argument, nullptr, 'u'},
    {"no-dhcp-gateway", no_argument, nullptr, kOptNoDhcpGateway},
    {"no-dhcp-dns", no_argument, nullptr, kOptNoDhcpDns},
    {"no-dhcp-router-option", no_argument, nullptr, kOptNoDhcpRouterOption},
    {"wifi-direct", no_argument, nullptr, kOptWifiDirect},
    {"connect-timeout-retries", required_argument, nullptr, kOptConnectTimeoutRetries},
    {"stay-alive", no_argument, nullptr, kOptStayAlive},
    {"log-level", required_argument, nullptr, kOptLogLevel},
    {"forget-all", no_argument, nullptr, kOptForgetAll},
    {"forget-network", required_argument, nullptr, kOptForgetNetwork},
    {"list-networks", no_argument, nullptr, kOptListNetworks},
    {"list-connected", no_argument, nullptr, kOptListConnected},
    {"list-saved", no_argument, nullptr, kOptListSaved},
    {"connect", required_argument, nullptr, kOptConnect},
    {"passphrase", required_argument, nullptr, kOptPassphrase},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

bool parseInt(const std::string& text, int minValue, int maxValue, int& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0' || value < minValue || value > maxValue) return false;
  out = static_cast<int>(value);
  return true;
}

bool parseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    out = true;
    return true;
  }
  if (text.empty() || text == "0" || text == "false" || text == "no" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

bool isIpv4(const std::string& text) {
  struct in_addr addr;
  return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

bool splitRange(const std::string& range, std::string& start, std::string& end) {
  size_t comma = range.find(',');
  if (comma == std::string::npos) return false;
  start = range.substr(0, comma);
  end = range.substr(comma + 1);
  return isIpv4(start) && isIpv4(end);
}

// Raw string settings before validation; environment first, then the command line.
struct RawSettings {
  std::string range = WIFI_PORTAL_DEFAULT_DHCP_RANGE;
  std::string port;
  std::string timeout;
  std::string retries;
};

Util::ActionResult applyEnvironment(const EnvLookup& env, Config& out, RawSettings& raw) {
  auto get = [&](const char* name, std::string& target) {
    const char* value = env ? env(name) : nullptr;
    if (value && *value) target = value;
  };
  auto getFlag = [&](const char* name, bool& target) -> bool {
    const char* value = env ? env(name) : nullptr;
    if (!value) return true;
    return parseBool(value, target);
  };

  get("PORTAL_INTERFACE", out.interfaceName);
  get("PORTAL_SSID", out.ssid);
  get("PORTAL_PASSPHRASE", out.passphrase);
  get("PORTAL_GATEWAY", out.gateway);
  get("PORTAL_DHCP_RANGE", raw.range);
  get("PORTAL_LISTENING_PORT", raw.port);
  get("ACTIVITY_TIMEOUT", raw.timeout);
  get("UI_DIRECTORY", out.uiDirectory);
  get("CONNECT_TIMEOUT_RETRIES", raw.retries);
  get("LOG_LEVEL", out.logLevel);

  struct {
    const char* name;
    bool* target;
  } flags[] = {
      {"NO_DHCP_GATEWAY", &out.noDhcpGateway},
      {"NO_DHCP_DNS", &out.noDhcpDns},
      {"NO_DHCP_ROUTER_OPTION", &out.noDhcpRouterOption},
      {"WIFI_DIRECT", &out.wifiDirect},
      {"STAY_ALIVE", &out.stayAlive},
  };
  for (const auto& flag : flags) {
    if (!getFlag(flag.name, *flag.target)) {
      return Util::failure(std::string("Invalid boolean in ") + flag.name);
    }
  }
  return Util::success();
}

Util::ActionResult validate(Config& out, const RawSettings& raw) {
  if (!raw.port.empty() && !parseInt(raw.port, 1, 65535, out.listeningPort)) {
    return Util::failure("Invalid listening port: " + raw.port);
  }
  if (!raw.timeout.empty() && !parseInt(raw.timeout, 0, 86400 * 365, out.activityTimeoutSec)) {
    return Util::failure("Invalid activity timeout: " + raw.timeout);
  }
  if (!raw.retries.empty() && !parseInt(raw.retries, 0, 10, out.connectTimeoutRetries)) {
    return Util::failure("Invalid connect timeout retries: " + raw.retries);
  }
  if (out.ssid.empty() || out.ssid.size() > 32) {
    return Util::failure("Portal SSID must be 1-32 bytes");
  }
  if (!out.passphrase.empty() &&
      (out.passphrase.size() < kMinPassphrase || out.passphrase.size() > kMaxPassphrase)) {
    return Util::failure("Portal passphrase must be 8-63 characters");
  }
  if (!isIpv4(out.gateway)) {
    return Util::failure("Invalid gateway address: " + out.gateway);
  }
  if (!splitRange(raw.range, out.dhcpRangeStart, out.dhcpRangeEnd)) {
    return Util::failure("Invalid DHCP range (expected start,end): " + raw.range);
  }
  if ((out.command == OneShotCommand::ForgetNetwork || out.command == OneShotCommand::Connect) &&
      out.commandSsid.empty()) {
    return Util::failure("Missing SSID for one-shot command");
  }
  if (!out.commandPassphrase.empty() && out.command != OneShotCommand::Connect) {
    return Util::failure("--passphrase is only valid with --connect");
  }
  return Util::success();
}
}  // namespace

Util::ActionResult loadConfig(int argc, char* const argv[], const EnvLookup& env, Config& out) {
  out = Config();
  RawSettings raw;
  Util::ActionResult envResult = applyEnvironment(env, out, raw);
  if (!envResult.ok) return envResult;

  auto setCommand = [&](OneShotCommand command) -> bool {
    if (out.command != OneShotCommand::None && out.command != command) return false;
    out.command = command;
    return true;
  };

  optind = 0;  // full reinitialisation (GNU)
  opterr = 0;
  int opt = 0;
  while ((opt = getopt_long(argc, argv, ":i:s:p:g:d:o:a:u:h", kLongOptions, nullptr)) != -1) {
    switch (opt) {
      case 'i': out.interfaceName = optarg; break;
      case 's': out.ssid = optarg; break;
      case 'p': out.passphrase = optarg; break;
      case 'g': out.gateway = optarg; break;
      case 'd': raw.range = optarg; break;
      case 'o': raw.port = optarg; break;
      case 'a': raw.timeout = optarg; break;
      case 'u': out.uiDirectory = optarg; break;
      case 'h': out.helpRequested = true; break;
      case kOptNoDhcpGateway: out.noDhcpGateway = true; break;
      case kOptNoDhcpDns: out.noDhcpDns = true; break;
      case kOptNoDhcpRouterOption: out.noDhcpRouterOption = true; break;
      case kOptWifiDirect: out.wifiDirect = true; break;
      case kOptConnectTimeoutRetries: raw.retries = optarg; break;
      case kOptStayAlive: out.stayAlive = true; break;
      case kOptLogLevel: out.logLevel = optarg; break;
      case kOptPassphrase: out.commandPassphrase = optarg; break;
      case kOptForgetNetwork:
      case kOptConnect:
        if (!setCommand(opt == kOptConnect ? OneShotCommand::Connect
                                           : OneShotCommand::ForgetNetwork)) {
          return Util::failure("Only one one-shot command may be given");
        }
        out.commandSsid = optarg;
        break;
      case kOptForgetAll:
      case kOptListNetworks:
      case kOptListConnected:
      case kOptListSaved: {
        OneShotCommand command = opt == kOptForgetAll      ? OneShotCommand::ForgetAll
                                 : opt == kOptListNetworks ? OneShotCommand::ListNetworks
                                 : opt == kOptListConnected ? OneShotCommand::ListConnected
                                                            : OneShotCommand::ListSaved;
        if (!setCommand(command)) return Util::failure("Only one one-shot command may be given");
        break;
      }
      case ':':
        return Util::failure(std::string("Missing value for ") + argv[optind - 1]);
      default:
        return Util::failure(std::string("Unknown option ") + argv[optind - 1]);
    }
  }
  if (optind < argc) {
    return Util::failure(std::string("Unexpected argument ") + argv[optind]);
  }
  if (out.helpRequested) return Util::success();
  return validate(out, raw);
}

Net::HotspotConfig makeHotspotConfig(const Config& config, const std::string& interfaceName) {
  Net::HotspotConfig hotspot;
  hotspot.ssid = config.ssid;
  hotspot.passphrase = config.passphrase;
  hotspot.gateway = config.gateway;
  hotspot.dhcpRangeStart = config.dhcpRangeStart;
  hotspot.dhcpRangeEnd = config.dhcpRangeEnd;
  hotspot.interfaceName = interfaceName;
  hotspot.mode = config.wifiDirect ? Net::HotspotMode::WifiDirect : Net::HotspotMode::Standard;
  hotspot.noDhcpGateway = config.noDhcpGateway;
  hotspot.noDhcpDns = config.noDhcpDns;
  hotspot.noDhcpRouterOption = config.noDhcpRouterOption;
  return hotspot;
}

std::string usage(const char* program) {
  std::string text = "Usage: ";
  text += program;
  text +=
      " [options]\n"
      "  -i, --portal-interface <name>       wifi interface (default: detect)\n"
      "  -s, --portal-ssid <ssid>            hotspot SSID (default: " WIFI_PORTAL_DEFAULT_SSID ")\n"
      "  -p, --portal-passphrase <pass>      hotspot WPA2 passphrase (default: open)\n"
      "  -g, --portal-gateway <ip>           gateway address (default: " WIFI_PORTAL_DEFAULT_GATEWAY ")\n"
      "  -d, --portal-dhcp-range <a,b>       DHCP range (default: " WIFI_PORTAL_DEFAULT_DHCP_RANGE ")\n"
      "  -o, --portal-listening-port <port>  HTTP port (default: 80)\n"
      "  -a, --activity-timeout <sec>        exit after inactivity, 0 disables (default: 0)\n"
      "  -u, --ui-directory <dir>            static UI files (default: " WIFI_PORTAL_DEFAULT_UI_DIRECTORY ")\n"
      "      --no-dhcp-gateway               do not advertise a gateway\n"
      "      --no-dhcp-dns                   do not advertise DNS or answer all names\n"
      "      --no-dhcp-router-option         advertise an empty router option\n"
      "      --wifi-direct                   run as a WiFi Direct group owner\n"
      "      --connect-timeout-retries <n>   retries after a connect timeout (default: 1)\n"
      "      --stay-alive                    keep running after a successful connect\n"
      "      --log-level <level>             trace, debug, info, warn, error (default: info)\n"
      "\n"
      "One-shot commands:\n"
      "      --list-networks | --list-connected | --list-saved\n"
      "      --forget-all | --forget-network <ssid>\n"
      "      --connect <ssid> [--passphrase <pass>]\n"
      "  -h, --help\n";
  return text;
}

}  // namespace App
