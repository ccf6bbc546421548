// NetworkManagerClient command sequences against a scripted nmcli.

#include <unity.h>

#include "../mocks/FakeProcessRunner.hpp"
#include "net/NetworkManagerClient.hpp"

using Fakes::FakeProcessRunner;
using Net::NetworkManagerClient;

namespace {
const char kListConnections[] = "nmcli -t -f UUID,TYPE,NAME connection show";
const char kConnectivity[] = "nmcli networking connectivity check";
const char kScanList[] =
    "nmcli -t -f SSID,SECURITY,SIGNAL,FREQ device wifi list ifname wlan0 --rescan no";

FakeProcessRunner* runner = nullptr;
NetworkManagerClient* client = nullptr;

Net::NmClientOptions fastOptions() {
  Net::NmClientOptions options;
  options.emptyScanRetries = 2;
  options.emptyScanDelay = std::chrono::milliseconds(0);
  options.connectivityWait = std::chrono::milliseconds(0);
  options.pollInterval = std::chrono::milliseconds(0);
  return options;
}

std::string showProfile(const std::string& uuid) {
  return "nmcli -t -f 802-11-wireless,802-11-wireless-security connection show uuid " + uuid;
}

void scriptProfile(const std::string& uuid, const std::string& ssid, const std::string& mode,
                   const std::string& keyMgmt) {
  runner->respond(showProfile(uuid), "802-11-wireless.ssid:" + ssid +
                                         "\n802-11-wireless.mode:" + mode +
                                         "\n802-11-wireless-security.key-mgmt:" + keyMgmt + "\n");
}
}  // namespace

void setUp(void) {
  runner = new FakeProcessRunner();
  client = new NetworkManagerClient(*runner, fastOptions());
}

void tearDown(void) {
  delete client;
  delete runner;
}

// ============================================================================
// Parsing
// ============================================================================

void test_split_fields_handles_escapes(void) {
  std::vector<std::string> fields = NetworkManagerClient::splitFields("Cafe\\: Free:WPA2:70");

  TEST_ASSERT_EQUAL(3, fields.size());
  TEST_ASSERT_EQUAL_STRING("Cafe: Free", fields[0].c_str());
  TEST_ASSERT_EQUAL_STRING("WPA2", fields[1].c_str());
  TEST_ASSERT_EQUAL_STRING("70", fields[2].c_str());
}

void test_split_fields_keeps_empty_columns(void) {
  std::vector<std::string> fields = NetworkManagerClient::splitFields(":WPA2:");

  TEST_ASSERT_EQUAL(3, fields.size());
  TEST_ASSERT_EQUAL_STRING("", fields[0].c_str());
  TEST_ASSERT_EQUAL_STRING("", fields[2].c_str());
}

void test_parse_scan_output(void) {
  std::vector<Net::ScanResult> results = NetworkManagerClient::parseScanOutput(
      "B:WPA2:40:2412 MHz\n"
      "A:WPA1 WPA2:90:5180 MHz\n"
      "C::90:2437 MHz\n"
      ":WPA2:99:2412 MHz\n"
      "A:WPA2:20:2462 MHz\n");

  TEST_ASSERT_EQUAL(3, results.size());
  TEST_ASSERT_EQUAL_STRING("A", results[0].ssid.c_str());
  TEST_ASSERT_EQUAL_STRING("5GHz", results[0].frequencyBand.c_str());
  TEST_ASSERT_EQUAL(Net::Security::WpaPersonal, results[0].security);
  TEST_ASSERT_EQUAL_STRING("C", results[1].ssid.c_str());
  TEST_ASSERT_EQUAL(Net::Security::Open, results[1].security);
  TEST_ASSERT_EQUAL_STRING("B", results[2].ssid.c_str());
}

void test_exit_code_classification(void) {
  Util::CommandOutput out;
  out.launched = true;
  out.exitCode = 3;
  TEST_ASSERT_EQUAL(Net::ConnectError::Timeout, NetworkManagerClient::classifyExit(out));
  out.exitCode = 4;
  TEST_ASSERT_EQUAL(Net::ConnectError::Rejected, NetworkManagerClient::classifyExit(out));
  out.exitCode = 10;
  TEST_ASSERT_EQUAL(Net::ConnectError::NotFound, NetworkManagerClient::classifyExit(out));
  out.exitCode = 8;
  TEST_ASSERT_EQUAL(Net::ConnectError::BusUnavailable, NetworkManagerClient::classifyExit(out));
  out.exitCode = 0;
  out.timedOut = true;
  TEST_ASSERT_EQUAL(Net::ConnectError::Timeout, NetworkManagerClient::classifyExit(out));
}

// ============================================================================
// Availability and scanning
// ============================================================================

void test_is_available(void) {
  runner->respond("nmcli -t -f RUNNING general", "running\n");
  TEST_ASSERT_TRUE(client->isAvailable());
}

void test_is_available_when_nmcli_missing(void) {
  runner->respondNotLaunched("nmcli -t -f RUNNING general");
  TEST_ASSERT_FALSE(client->isAvailable());
}

void test_detect_wifi_interface(void) {
  runner->respond("nmcli -t -f DEVICE,TYPE,STATE device status",
                  "eth0:ethernet:connected\nwlan1:wifi:unmanaged\nwlan0:wifi:disconnected\n");
  TEST_ASSERT_EQUAL_STRING("wlan0", client->detectWifiInterface().c_str());
}

void test_scan_rescans_then_reads_list(void) {
  runner->respond(kScanList, "Home:WPA2:60:2412 MHz\n");

  std::vector<Net::ScanResult> results = client->scan("wlan0");

  TEST_ASSERT_EQUAL(1, results.size());
  TEST_ASSERT_TRUE(runner->called("nmcli --wait 10 device wifi rescan ifname wlan0"));
  TEST_ASSERT_EQUAL(1, runner->countPrefix(kScanList));
}

void test_scan_retries_empty_list(void) {
  runner->respond(kScanList, "");
  runner->respond(kScanList, "");
  runner->respond(kScanList, "Late:WPA2:50:2412 MHz\n");

  std::vector<Net::ScanResult> results = client->scan("wlan0");

  TEST_ASSERT_EQUAL(1, results.size());
  TEST_ASSERT_EQUAL(3, runner->countPrefix(kScanList));
}

void test_scan_uses_cached_list_when_rescan_times_out(void) {
  runner->respondTimeout("nmcli --wait 10 device wifi rescan ifname wlan0");
  runner->respond(kScanList, "Cached:WPA2:55:2412 MHz\n");

  std::vector<Net::ScanResult> results = client->scan("wlan0");

  TEST_ASSERT_EQUAL(1, results.size());
  TEST_ASSERT_EQUAL_STRING("Cached", results[0].ssid.c_str());
}

// ============================================================================
// Connect
// ============================================================================

void test_connect_new_network(void) {
  runner->respond(kListConnections, "u-1:802-11-wireless:Office\n");
  scriptProfile("u-1", "Office", "infrastructure", "wpa-psk");
  runner->respond(kConnectivity, "full\n");

  Net::ConnectionRequest request;
  request.ssid = "Home WiFi";
  request.passphrase = "mypassword";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_EQUAL(Net::ConnectError::None, result.error);
  TEST_ASSERT_TRUE(runner->called(
      "nmcli --wait 30 device wifi connect Home WiFi password mypassword ifname wlan0"));
  TEST_ASSERT_TRUE(runner->called(kConnectivity));
}

void test_connect_uses_saved_profile(void) {
  runner->respond(kListConnections, "u-7:802-11-wireless:Home WiFi\n");
  scriptProfile("u-7", "Home WiFi", "infrastructure", "wpa-psk");
  runner->respond(kConnectivity, "limited\n");

  Net::ConnectionRequest request;
  request.ssid = "Home WiFi";
  request.passphrase = "ignored-pass";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_TRUE(runner->called("nmcli --wait 30 connection up uuid u-7 ifname wlan0"));
  TEST_ASSERT_EQUAL(0, runner->countPrefix("nmcli --wait 30 device wifi connect"));
}

void test_connect_ignores_access_point_profiles(void) {
  runner->respond(kListConnections, "ap-1:802-11-wireless:wifi-portal-ap\n");
  scriptProfile("ap-1", "Home WiFi", "ap", "");

  Net::ConnectionRequest request;
  request.ssid = "Home WiFi";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_TRUE(runner->called("nmcli --wait 30 device wifi connect Home WiFi ifname wlan0"));
}

void test_connect_rejected_removes_new_profile(void) {
  runner->respond(kListConnections, "");
  runner->respond(kListConnections, "u-9:802-11-wireless:Home WiFi\n");
  scriptProfile("u-9", "Home WiFi", "infrastructure", "wpa-psk");
  runner->respond("nmcli --wait 30 device wifi connect Home WiFi password wrongpass ifname wlan0",
                  "Error: Connection activation failed: Secrets were required.\n", 4);

  Net::ConnectionRequest request;
  request.ssid = "Home WiFi";
  request.passphrase = "wrongpass";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_FALSE(result.ok);
  TEST_ASSERT_EQUAL(Net::ConnectError::Rejected, result.error);
  TEST_ASSERT_TRUE(runner->called("nmcli connection delete uuid u-9"));
}

void test_connect_timeout_classified(void) {
  runner->respond(kListConnections, "");
  runner->respond("nmcli --wait 30 device wifi connect Slow ifname wlan0", "Error: timeout\n", 3);

  Net::ConnectionRequest request;
  request.ssid = "Slow";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_FALSE(result.ok);
  TEST_ASSERT_EQUAL(Net::ConnectError::Timeout, result.error);
}

void test_connect_enterprise_builds_peap_profile(void) {
  runner->respond(kListConnections, "");
  runner->respond(kListConnections, "e-1:802-11-wireless:Corp\n");
  scriptProfile("e-1", "Corp", "infrastructure", "wpa-eap");

  Net::ConnectionRequest request;
  request.ssid = "Corp";
  request.identity = "alice";
  request.passphrase = "secret123";
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_TRUE(runner->called(
      "nmcli connection add type wifi ifname wlan0 con-name Corp ssid Corp wifi-sec.key-mgmt "
      "wpa-eap 802-1x.eap peap 802-1x.phase2-auth mschapv2 802-1x.identity alice "
      "802-1x.password secret123"));
  TEST_ASSERT_TRUE(runner->called("nmcli --wait 30 connection up uuid e-1 ifname wlan0"));
}

void test_connect_rejects_invalid_ssid(void) {
  Net::ConnectionRequest request;
  request.ssid = std::string(33, 'x');
  Net::ConnectResult result = client->connect("wlan0", request);

  TEST_ASSERT_FALSE(result.ok);
  TEST_ASSERT_EQUAL(Net::ConnectError::InvalidRequest, result.error);
  TEST_ASSERT_EQUAL(0, runner->calls.size());
}

// ============================================================================
// Saved profiles
// ============================================================================

static void scriptSavedProfiles() {
  runner->respond(kListConnections,
                  "u-1:802-11-wireless:Office\n"
                  "u-2:802-11-wireless:Home\n"
                  "u-3:802-11-ethernet:Wired connection 1\n"
                  "ap-1:802-11-wireless:wifi-portal-ap\n"
                  "u-4:802-11-wireless:Home 1\n");
  scriptProfile("u-1", "Office", "infrastructure", "wpa-eap");
  scriptProfile("u-2", "Home", "infrastructure", "wpa-psk");
  scriptProfile("ap-1", "WiFi Connect", "ap", "");
  scriptProfile("u-4", "Home", "infrastructure", "wpa-psk");
}

void test_list_saved_skips_access_points_and_duplicates(void) {
  scriptSavedProfiles();

  std::vector<Net::NetworkProfile> saved;
  TEST_ASSERT_TRUE(client->listSaved(saved));

  TEST_ASSERT_EQUAL(2, saved.size());
  TEST_ASSERT_EQUAL_STRING("Home", saved[0].ssid.c_str());
  TEST_ASSERT_EQUAL(Net::Security::WpaPersonal, saved[0].security);
  TEST_ASSERT_EQUAL_STRING("Office", saved[1].ssid.c_str());
  TEST_ASSERT_EQUAL(Net::Security::Enterprise, saved[1].security);
}

void test_forget_removes_every_matching_profile(void) {
  scriptSavedProfiles();

  TEST_ASSERT_EQUAL(2, client->forget("Home"));
  TEST_ASSERT_TRUE(runner->called("nmcli connection delete uuid u-2"));
  TEST_ASSERT_TRUE(runner->called("nmcli connection delete uuid u-4"));
  TEST_ASSERT_FALSE(runner->called("nmcli connection delete uuid u-1"));
}

void test_forget_all_counts_deleted_profiles(void) {
  scriptSavedProfiles();
  runner->respond("nmcli connection delete uuid u-1", "Error: not allowed\n", 1);

  TEST_ASSERT_EQUAL(2, client->forgetAll());
  TEST_ASSERT_FALSE(runner->called("nmcli connection delete uuid ap-1"));
}

void test_forget_reports_unreadable_profiles(void) {
  runner->respond(kListConnections, "Error: NetworkManager is not running.\n", 8);
  TEST_ASSERT_EQUAL(-1, client->forget("Home"));
}

// ============================================================================
// Status and access point
// ============================================================================

void test_current_connection(void) {
  runner->respond("nmcli -t -f UUID,TYPE,DEVICE,STATE,NAME connection show --active",
                  "e-0:802-3-ethernet:eth0:activated:Wired\n"
                  "u-2:802-11-wireless:wlan0:activated:Home\n");
  scriptProfile("u-2", "Home", "infrastructure", "wpa-psk");
  runner->respond("nmcli -t -f IN-USE,SIGNAL device wifi list ifname wlan0 --rescan no",
                  " :40\n*:72\n");
  runner->respond("nmcli -t -f IP4.ADDRESS device show wlan0", "IP4.ADDRESS[1]:192.168.1.50/24\n");

  Net::ConnectedInfo info;
  TEST_ASSERT_TRUE(client->currentConnection("wlan0", info));
  TEST_ASSERT_EQUAL_STRING("Home", info.ssid.c_str());
  TEST_ASSERT_EQUAL_STRING("wlan0", info.interfaceName.c_str());
  TEST_ASSERT_EQUAL(72, info.signalStrength);
  TEST_ASSERT_EQUAL_STRING("192.168.1.50", info.ipAddress.c_str());
}

void test_current_connection_ignores_hotspot(void) {
  runner->respond("nmcli -t -f UUID,TYPE,DEVICE,STATE,NAME connection show --active",
                  "ap-1:802-11-wireless:wlan0:activated:wifi-portal-ap\n");
  scriptProfile("ap-1", "WiFi Connect", "ap", "");

  Net::ConnectedInfo info;
  TEST_ASSERT_FALSE(client->currentConnection("wlan0", info));
}

void test_activate_access_point_with_passphrase(void) {
  Net::HotspotConfig config;
  config.ssid = "WiFi Connect";
  config.passphrase = "portalpass";
  config.gateway = "192.168.42.1";
  config.interfaceName = "wlan0";

  Util::ActionResult result = client->activateAccessPoint(config);

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_TRUE(runner->called(
      "nmcli connection add type wifi ifname wlan0 con-name wifi-portal-ap autoconnect no ssid "
      "WiFi Connect 802-11-wireless.mode ap 802-11-wireless.band bg ipv4.method manual "
      "ipv4.addresses 192.168.42.1/24 ipv6.method ignore wifi-sec.key-mgmt wpa-psk wifi-sec.psk "
      "portalpass"));
  TEST_ASSERT_TRUE(runner->called("nmcli --wait 30 connection up id wifi-portal-ap ifname wlan0"));
}

void test_activate_access_point_failure_deletes_profile(void) {
  Net::HotspotConfig config;
  config.ssid = "WiFi Connect";
  config.gateway = "192.168.42.1";
  config.interfaceName = "wlan0";
  runner->respond("nmcli --wait 30 connection up id wifi-portal-ap ifname wlan0",
                  "Error: no device\n", 4);

  Util::ActionResult result = client->activateAccessPoint(config);

  TEST_ASSERT_FALSE(result.ok);
  TEST_ASSERT_TRUE(runner->called("nmcli connection delete id wifi-portal-ap"));
}

void test_remove_access_points(void) {
  scriptSavedProfiles();

  Util::ActionResult result = client->removeAccessPoints("WiFi Connect");

  TEST_ASSERT_TRUE(result.ok);
  TEST_ASSERT_TRUE(runner->called("nmcli connection delete uuid ap-1"));
  TEST_ASSERT_EQUAL(1, runner->countPrefix("nmcli connection delete"));
}

void test_access_point_active(void) {
  runner->respond("nmcli -t -f UUID,TYPE,DEVICE,STATE,NAME connection show --active",
                  "ap-1:802-11-wireless:wlan0:activated:wifi-portal-ap\n");
  TEST_ASSERT_TRUE(client->isAccessPointActive("wlan0"));
  TEST_ASSERT_FALSE(client->isAccessPointActive("wlan1"));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();

  RUN_TEST(test_split_fields_handles_escapes);
  RUN_TEST(test_split_fields_keeps_empty_columns);
  RUN_TEST(test_parse_scan_output);
  RUN_TEST(test_exit_code_classification);

  RUN_TEST(test_is_available);
  RUN_TEST(test_is_available_when_nmcli_missing);
  RUN_TEST(test_detect_wifi_interface);
  RUN_TEST(test_scan_rescans_then_reads_list);
  RUN_TEST(test_scan_retries_empty_list);
  RUN_TEST(test_scan_uses_cached_list_when_rescan_times_out);

  RUN_TEST(test_connect_new_network);
  RUN_TEST(test_connect_uses_saved_profile);
  RUN_TEST(test_connect_ignores_access_point_profiles);
  RUN_TEST(test_connect_rejected_removes_new_profile);
  RUN_TEST(test_connect_timeout_classified);
  RUN_TEST(test_connect_enterprise_builds_peap_profile);
  RUN_TEST(test_connect_rejects_invalid_ssid);

  RUN_TEST(test_list_saved_skips_access_points_and_duplicates);
  RUN_TEST(test_forget_removes_every_matching_profile);
  RUN_TEST(test_forget_all_counts_deleted_profiles);
  RUN_TEST(test_forget_reports_unreadable_profiles);

  RUN_TEST(test_current_connection);
  RUN_TEST(test_current_connection_ignores_hotspot);
  RUN_TEST(test_activate_access_point_with_passphrase);
  RUN_TEST(test_activate_access_point_failure_deletes_profile);
  RUN_TEST(test_remove_access_points);
  RUN_TEST(test_access_point_active);

  return UNITY_END();
}
