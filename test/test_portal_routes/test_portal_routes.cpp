// Portal route handling with a scripted orchestrator answering the channel.

#include <unity.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <ArduinoJson.h>

#include "../mocks/FakeNetwork.hpp"
#include "app/ActivityWatchdog.hpp"
#include "app/PortalServer.hpp"

using App::HttpRequest;
using App::HttpResponse;
using App::Intent;
using App::IntentKind;
using App::IntentResult;
using std::chrono::milliseconds;

namespace {

// Answers every submitted intent with `reply` until stopped.
class Responder {
 public:
  explicit Responder(App::IntentChannel& channel) : m_channel(channel) {
    m_thread = std::thread([this]() {
      while (!m_stop.load()) {
        Intent intent;
        if (!m_channel.next(intent, milliseconds(10))) continue;
        IntentResult result;
        {
          std::lock_guard<std::mutex> lock(m_mutex);
          received.push_back(intent);
          result = reply;
        }
        m_channel.complete(intent, result);
      }
    });
  }

  ~Responder() {
    m_stop.store(true);
    m_thread.join();
  }

  Intent last() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return received.empty() ? Intent() : received.back();
  }

  size_t count() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return received.size();
  }

  IntentResult reply;
  std::vector<Intent> received;

 private:
  App::IntentChannel& m_channel;
  std::mutex m_mutex;
  std::atomic<bool> m_stop{false};
  std::thread m_thread;
};

struct Portal {
  std::shared_ptr<Fakes::World> world = std::make_shared<Fakes::World>();
  Fakes::FakeNetwork network{world};
  App::IntentChannel channel;
  App::StatusBoard status;
  std::unique_ptr<App::PortalServer> server;

  explicit Portal(milliseconds submitTimeout = milliseconds(2000),
                  App::ActivityWatchdog* watchdog = nullptr) {
    App::PortalOptions options;
    options.gateway = "192.168.42.1";
    options.interfaceName = "wlan0";
    options.submitTimeout = submitTimeout;
    server = std::make_unique<App::PortalServer>(options, network, channel, status, watchdog);
  }

  HttpResponse get(const std::string& target) {
    HttpRequest request;
    request.method = "GET";
    App::splitTarget(target, request.path, request.query);
    return server->handle(request);
  }

  HttpResponse post(const std::string& path, const std::string& body,
                    const std::string& contentType = "application/json") {
    HttpRequest request;
    request.method = "POST";
    request.path = path;
    request.body = body;
    request.contentType = contentType;
    return server->handle(request);
  }
};

JsonDocument parse(const HttpResponse& response) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, response.body);
  TEST_ASSERT_FALSE_MESSAGE(err, response.body.c_str());
  return doc;
}

Net::ScanResult scanned(const std::string& ssid, int signal) {
  Net::ScanResult result;
  result.ssid = ssid;
  result.security = Net::Security::WpaPersonal;
  result.signalStrength = signal;
  result.frequencyBand = "5GHz";
  return result;
}

IntentResult failure(const std::string& error, const std::string& message) {
  IntentResult result;
  result.error = error;
  result.message = message;
  return result;
}
}  // namespace

void setUp(void) {}

void tearDown(void) {}

// ============================================================================
// Read-only routes
// ============================================================================

void test_index_serves_embedded_page(void) {
  Portal portal;
  HttpResponse response = portal.get("/");

  TEST_ASSERT_EQUAL(200, response.status);
  TEST_ASSERT_EQUAL_STRING("text/html", response.contentType.c_str());
  TEST_ASSERT_TRUE(response.body.find("<title>WiFi Setup</title>") != std::string::npos);
}

void test_list_networks_uses_cached_scan(void) {
  Portal portal;
  App::StatusSnapshot snapshot;
  snapshot.networks = {scanned("Home", 80)};
  portal.status.publish(snapshot);

  HttpResponse response = portal.get("/list-networks");
  JsonDocument doc = parse(response);

  TEST_ASSERT_EQUAL(200, response.status);
  TEST_ASSERT_EQUAL(1, doc["networks"].size());
  TEST_ASSERT_EQUAL_STRING("Home", doc["networks"][0]["ssid"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("wpa", doc["networks"][0]["security"].as<const char*>());
  TEST_ASSERT_EQUAL(80, doc["networks"][0]["signal_strength"].as<int>());
  TEST_ASSERT_EQUAL_STRING("5GHz", doc["networks"][0]["frequency"].as<const char*>());
}

void test_list_networks_without_cache_rescans(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply.success = true;
  responder.reply.networks = {scanned("Office", 60), scanned("Cafe", 30)};

  HttpResponse response = portal.get("/list-networks?use_cache=false");
  JsonDocument doc = parse(response);

  TEST_ASSERT_EQUAL(200, response.status);
  TEST_ASSERT_EQUAL(2, doc["networks"].size());
  TEST_ASSERT_EQUAL(IntentKind::Rescan, responder.last().kind);
}

void test_list_connected_null_when_disconnected(void) {
  Portal portal;
  JsonDocument doc = parse(portal.get("/list-connected"));
  TEST_ASSERT_TRUE(doc["connected"].isNull());
}

void test_list_connected_reports_connection(void) {
  Portal portal;
  portal.world->connectedSsid = "Home";

  JsonDocument doc = parse(portal.get("/list-connected"));

  TEST_ASSERT_EQUAL_STRING("Home", doc["connected"]["ssid"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("wlan0", doc["connected"]["interface"].as<const char*>());
  TEST_ASSERT_EQUAL(70, doc["connected"]["signal_strength"].as<int>());
}

void test_list_saved(void) {
  Portal portal;
  Net::NetworkProfile home;
  home.ssid = "Home";
  home.security = Net::Security::WpaPersonal;
  portal.network.saved = {home};

  JsonDocument doc = parse(portal.get("/list-saved"));

  TEST_ASSERT_EQUAL(1, doc["saved_networks"].size());
  TEST_ASSERT_EQUAL_STRING("Home", doc["saved_networks"][0]["ssid"].as<const char*>());
}

void test_health_reflects_network_manager(void) {
  Portal portal;
  TEST_ASSERT_EQUAL(200, portal.get("/health").status);

  portal.network.available = false;
  HttpResponse down = portal.get("/health");
  TEST_ASSERT_EQUAL(503, down.status);
  TEST_ASSERT_EQUAL_STRING("unavailable", parse(down)["error"].as<const char*>());
}

void test_status_reports_phase_and_last_error(void) {
  Portal portal;
  JsonDocument idle = parse(portal.get("/status"));
  TEST_ASSERT_EQUAL_STRING("init", idle["state"].as<const char*>());
  TEST_ASSERT_TRUE(idle["last_error"].isNull());

  App::StatusSnapshot snapshot;
  snapshot.phase = App::Phase::HotspotUp;
  snapshot.hotspotActive = true;
  snapshot.lastError = "rejected";
  snapshot.lastMessage = "Secrets were required";
  portal.status.publish(snapshot);

  JsonDocument doc = parse(portal.get("/status"));
  TEST_ASSERT_EQUAL_STRING("hotspot_up", doc["state"].as<const char*>());
  TEST_ASSERT_TRUE(doc["hotspot_active"].as<bool>());
  TEST_ASSERT_EQUAL_STRING("rejected", doc["last_error"].as<const char*>());
}

void test_unknown_get_redirects_to_portal(void) {
  Portal portal;
  HttpResponse response = portal.get("/generate_204");

  TEST_ASSERT_EQUAL(302, response.status);
  TEST_ASSERT_EQUAL_STRING("http://192.168.42.1/", response.location.c_str());
}

void test_static_rejects_parent_paths(void) {
  Portal portal;
  TEST_ASSERT_EQUAL(404, portal.get("/static/../etc/passwd").status);
}

void test_wrong_method_on_post_route(void) {
  Portal portal;
  HttpResponse response = portal.get("/connect");
  TEST_ASSERT_EQUAL(405, response.status);
  TEST_ASSERT_EQUAL(404, portal.post("/nowhere", "{}").status);
}

// ============================================================================
// Mutating routes
// ============================================================================

void test_connect_json_body(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply.success = true;
  responder.reply.message = "Connected to Home";

  HttpResponse response =
      portal.post("/connect", R"({"ssid":"Home","passphrase":"secret123"})");
  JsonDocument doc = parse(response);

  TEST_ASSERT_EQUAL(200, response.status);
  TEST_ASSERT_TRUE(doc["success"].as<bool>());
  Intent sent = responder.last();
  TEST_ASSERT_EQUAL(IntentKind::Connect, sent.kind);
  TEST_ASSERT_EQUAL_STRING("Home", sent.request.ssid.c_str());
  TEST_ASSERT_EQUAL_STRING("secret123", sent.request.passphrase.c_str());
}

void test_connect_form_body_with_identity(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply.success = true;

  HttpResponse response = portal.post("/connect", "ssid=Corp+Net&passphrase=p%40ss&identity=alice",
                                      "application/x-www-form-urlencoded");

  TEST_ASSERT_EQUAL(200, response.status);
  Intent sent = responder.last();
  TEST_ASSERT_EQUAL_STRING("Corp Net", sent.request.ssid.c_str());
  TEST_ASSERT_EQUAL_STRING("p@ss", sent.request.passphrase.c_str());
  TEST_ASSERT_TRUE(sent.request.isEnterprise());
}

void test_connect_rejects_bad_input(void) {
  Portal portal;
  TEST_ASSERT_EQUAL(400, portal.post("/connect", "{not json").status);
  TEST_ASSERT_EQUAL(400, portal.post("/connect", R"({"passphrase":"x"})").status);
  TEST_ASSERT_EQUAL(400, portal.post("/connect", R"({"ssid":"")" + std::string(33, 'a') + "\"}").status);
}

void test_connect_failure_maps_error_to_status(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply = failure("rejected", "Secrets were required");

  HttpResponse response = portal.post("/connect", R"({"ssid":"Home","passphrase":"wrong"})");
  JsonDocument doc = parse(response);

  TEST_ASSERT_EQUAL(500, response.status);
  TEST_ASSERT_FALSE(doc["success"].as<bool>());
  TEST_ASSERT_EQUAL_STRING("rejected", doc["error"].as<const char*>());

  responder.reply = failure("timeout", "Activation timed out");
  TEST_ASSERT_EQUAL(504, portal.post("/connect", R"({"ssid":"Home"})").status);
}

void test_forget_accepts_network_name(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply = failure("not_found", "No saved network named 'Office'");

  HttpResponse response = portal.post("/forget-network", R"({"network_name":"Office"})");

  TEST_ASSERT_EQUAL(404, response.status);
  TEST_ASSERT_EQUAL_STRING("Office", responder.last().ssid.c_str());
  TEST_ASSERT_EQUAL(400, portal.post("/forget-network", "{}").status);
}

void test_forget_all(void) {
  Portal portal;
  Responder responder(portal.channel);
  responder.reply.success = true;
  responder.reply.message = "Forgot 2 saved network(s)";

  JsonDocument doc = parse(portal.post("/forget-all", ""));

  TEST_ASSERT_EQUAL_STRING("Forgot 2 saved network(s)", doc["message"].as<const char*>());
  TEST_ASSERT_EQUAL(IntentKind::ForgetAll, responder.last().kind);
}

void test_submit_without_answer_times_out(void) {
  Portal portal(milliseconds(50));

  HttpResponse response = portal.post("/forget-all", "");

  TEST_ASSERT_EQUAL(504, response.status);
  TEST_ASSERT_EQUAL_STRING("timeout", parse(response)["error"].as<const char*>());
}

void test_concurrent_submit_is_busy(void) {
  Portal portal(milliseconds(2000));
  HttpResponse first;
  std::thread slow([&]() { first = portal.post("/forget-all", ""); });

  // Hold the first intent without answering it.
  Intent held;
  TEST_ASSERT_TRUE(portal.channel.next(held, milliseconds(2000)));

  HttpResponse second = portal.post("/connect", R"({"ssid":"Home"})");
  TEST_ASSERT_EQUAL(409, second.status);
  TEST_ASSERT_EQUAL_STRING("busy", parse(second)["error"].as<const char*>());

  IntentResult done;
  done.success = true;
  portal.channel.complete(held, done);
  slow.join();
  TEST_ASSERT_EQUAL(200, first.status);
}

void test_closed_channel_reports_shutting_down(void) {
  Portal portal;
  portal.channel.close();

  HttpResponse response = portal.post("/forget-all", "");

  TEST_ASSERT_EQUAL(503, response.status);
  TEST_ASSERT_EQUAL_STRING("shutting_down", parse(response)["error"].as<const char*>());
}

// ============================================================================
// Activity
// ============================================================================

void test_requests_keep_watchdog_from_firing(void) {
  std::atomic<int> fired{0};
  App::ActivityWatchdog watchdog(milliseconds(300), [&fired]() { ++fired; });
  Portal portal(milliseconds(2000), &watchdog);
  watchdog.arm();

  for (int i = 0; i < 8; ++i) {
    std::this_thread::sleep_for(milliseconds(100));
    TEST_ASSERT_EQUAL(200, portal.get("/health").status);
  }
  TEST_ASSERT_EQUAL(0, fired.load());

  std::this_thread::sleep_for(milliseconds(700));
  TEST_ASSERT_EQUAL(1, fired.load());
  watchdog.stop();
}

int main(int argc, char** argv) {
  UNITY_BEGIN();

  RUN_TEST(test_index_serves_embedded_page);
  RUN_TEST(test_list_networks_uses_cached_scan);
  RUN_TEST(test_list_networks_without_cache_rescans);
  RUN_TEST(test_list_connected_null_when_disconnected);
  RUN_TEST(test_list_connected_reports_connection);
  RUN_TEST(test_list_saved);
  RUN_TEST(test_health_reflects_network_manager);
  RUN_TEST(test_status_reports_phase_and_last_error);
  RUN_TEST(test_unknown_get_redirects_to_portal);
  RUN_TEST(test_static_rejects_parent_paths);
  RUN_TEST(test_wrong_method_on_post_route);

  RUN_TEST(test_connect_json_body);
  RUN_TEST(test_connect_form_body_with_identity);
  RUN_TEST(test_connect_rejects_bad_input);
  RUN_TEST(test_connect_failure_maps_error_to_status);
  RUN_TEST(test_forget_accepts_network_name);
  RUN_TEST(test_forget_all);
  RUN_TEST(test_submit_without_answer_times_out);
  RUN_TEST(test_concurrent_submit_is_busy);
  RUN_TEST(test_closed_channel_reports_shutting_down);

  RUN_TEST(test_requests_keep_watchdog_from_firing);

  return UNITY_END();
}
