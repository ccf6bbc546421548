// Scan list normalisation and the security/band helpers.

#include <unity.h>

#include "net/WifiTypes.hpp"

using Net::ScanResult;
using Net::Security;

void setUp(void) {}
void tearDown(void) {}

static ScanResult entry(const char* ssid, int signal) {
  ScanResult r;
  r.ssid = ssid;
  r.signalStrength = signal;
  return r;
}

// ============================================================================
// Ordering
// ============================================================================

void test_sort_by_signal_then_ssid(void) {
  std::vector<ScanResult> raw = {entry("B", 40), entry("A", 90), entry("C", 90)};

  std::vector<ScanResult> sorted = Net::normalizeScanResults(raw);

  TEST_ASSERT_EQUAL(3, sorted.size());
  TEST_ASSERT_EQUAL_STRING("A", sorted[0].ssid.c_str());
  TEST_ASSERT_EQUAL(90, sorted[0].signalStrength);
  TEST_ASSERT_EQUAL_STRING("C", sorted[1].ssid.c_str());
  TEST_ASSERT_EQUAL(90, sorted[1].signalStrength);
  TEST_ASSERT_EQUAL_STRING("B", sorted[2].ssid.c_str());
  TEST_ASSERT_EQUAL(40, sorted[2].signalStrength);
}

void test_hidden_networks_dropped(void) {
  std::vector<ScanResult> raw = {entry("", 99), entry("Visible", 10)};

  std::vector<ScanResult> sorted = Net::normalizeScanResults(raw);

  TEST_ASSERT_EQUAL(1, sorted.size());
  TEST_ASSERT_EQUAL_STRING("Visible", sorted[0].ssid.c_str());
}

void test_duplicates_keep_strongest(void) {
  std::vector<ScanResult> raw = {entry("Mesh", 30), entry("Mesh", 75), entry("Mesh", 50)};

  std::vector<ScanResult> sorted = Net::normalizeScanResults(raw);

  TEST_ASSERT_EQUAL(1, sorted.size());
  TEST_ASSERT_EQUAL(75, sorted[0].signalStrength);
}

void test_empty_input(void) {
  TEST_ASSERT_EQUAL(0, Net::normalizeScanResults({}).size());
}

// ============================================================================
// Helpers
// ============================================================================

void test_frequency_bands(void) {
  TEST_ASSERT_EQUAL_STRING("2.4GHz", Net::frequencyBand(2412));
  TEST_ASSERT_EQUAL_STRING("2.4GHz", Net::frequencyBand(2484));
  TEST_ASSERT_EQUAL_STRING("5GHz", Net::frequencyBand(5180));
  TEST_ASSERT_EQUAL_STRING("6GHz", Net::frequencyBand(5955));
  TEST_ASSERT_EQUAL_STRING("unknown", Net::frequencyBand(0));
}

void test_security_from_scan_flags(void) {
  TEST_ASSERT_EQUAL(Security::Open, Net::securityFromScan(""));
  TEST_ASSERT_EQUAL(Security::Open, Net::securityFromScan("--"));
  TEST_ASSERT_EQUAL(Security::WpaPersonal, Net::securityFromScan("WPA1 WPA2"));
  TEST_ASSERT_EQUAL(Security::WpaPersonal, Net::securityFromScan("WPA3"));
  TEST_ASSERT_EQUAL(Security::Enterprise, Net::securityFromScan("WPA2 802.1X"));
}

void test_security_from_key_mgmt(void) {
  TEST_ASSERT_EQUAL(Security::Open, Net::securityFromKeyMgmt(""));
  TEST_ASSERT_EQUAL(Security::WpaPersonal, Net::securityFromKeyMgmt("wpa-psk"));
  TEST_ASSERT_EQUAL(Security::WpaPersonal, Net::securityFromKeyMgmt("sae"));
  TEST_ASSERT_EQUAL(Security::Enterprise, Net::securityFromKeyMgmt("wpa-eap"));
}

void test_ssid_length_limits(void) {
  TEST_ASSERT_FALSE(Net::isValidSsid(""));
  TEST_ASSERT_TRUE(Net::isValidSsid("Home WiFi"));
  TEST_ASSERT_TRUE(Net::isValidSsid(std::string(32, 'x')));
  TEST_ASSERT_FALSE(Net::isValidSsid(std::string(33, 'x')));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();

  RUN_TEST(test_sort_by_signal_then_ssid);
  RUN_TEST(test_hidden_networks_dropped);
  RUN_TEST(test_duplicates_keep_strongest);
  RUN_TEST(test_empty_input);
  RUN_TEST(test_frequency_bands);
  RUN_TEST(test_security_from_scan_flags);
  RUN_TEST(test_security_from_key_mgmt);
  RUN_TEST(test_ssid_length_limits);

  return UNITY_END();
}
