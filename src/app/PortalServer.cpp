/**
 * @file PortalServer.cpp
 * @brief Route handlers and the embedded fallback page.
 */
#include "app/PortalServer.hpp"

#include <fstream>
#include <sstream>

#include <ArduinoJson.h>
#include <spdlog/spdlog.h>

#include "app/JsonViews.hpp"

namespace App {
namespace {

const char kIndexHtml[] = R"HTML(
<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8" />
  <meta name="viewport" content="width=device-width, initial-scale=1" />
  <title>WiFi Setup</title>
  <style>
    body { font-family: Arial, sans-serif; margin: 24px; background: #f7f7f7; }
    h1 { margin: 0 0 12px; }
    .panel { background: white; padding: 16px; border-radius: 8px; box-shadow: 0 1px 3px rgba(0,0,0,0.12); margin-bottom: 16px; }
    ul { list-style: none; padding: 0; margin: 0; }
    li { padding: 6px 8px; border-bottom: 1px solid #eee; cursor: pointer; display: flex; justify-content: space-between; }
    li:hover { background: #f0f0f0; }
    input[type="text"], input[type="password"] { width: 100%; padding: 6px; margin: 4px 0 8px; box-sizing: border-box; }
    button { margin: 4px 4px 4px 0; padding: 6px 10px; }
    .muted { color: #666; font-size: 0.9em; }
    .error { color: #b00020; }
  </style>
</head>
<body>
  <h1>WiFi Setup</h1>
  <div class="panel">
    <h3>Networks</h3>
    <button id="refresh">Refresh</button>
    <button id="rescan">Rescan</button>
    <ul id="networks"></ul>
  </div>
  <div class="panel">
    <h3>Connect</h3>
    <label>SSID<input type="text" id="ssid" /></label>
    <label>Passphrase<input type="password" id="passphrase" /></label>
    <label>Identity <span class="muted">(enterprise networks only)</span><input type="text" id="identity" /></label>
    <button id="connect">Connect</button>
    <div id="message" class="muted"></div>
  </div>
  <div class="panel">
    <h3>Saved networks</h3>
    <ul id="saved"></ul>
    <button id="forgetAll">Forget all</button>
  </div>
<script>
const $ = (id) => document.getElementById(id);

function show(text, isError) {
  $('message').textContent = text;
  $('message').className = isError ? 'error' : 'muted';
}

async function post(path, body) {
  const res = await fetch(path, {
    method: 'POST',
    headers: { 'Content-Type': 'application/json' },
    body: JSON.stringify(body || {})
  });
  return res.json();
}

async function loadNetworks(useCache) {
  const res = await fetch('list-networks?use_cache=' + (useCache ? 'true' : 'false'));
  const data = await res.json();
  const list = $('networks');
  list.innerHTML = '';
  (data.networks || []).forEach((n) => {
    const li = document.createElement('li');
    li.textContent = n.ssid;
    const meta = document.createElement('span');
    meta.className = 'muted';
    meta.textContent = n.signal_strength + '% ' + n.security + ' ' + n.frequency;
    li.appendChild(meta);
    li.onclick = () => { $('ssid').value = n.ssid; };
    list.appendChild(li);
  });
}

async function loadSaved() {
  const res = await fetch('list-saved');
  const data = await res.json();
  const list = $('saved');
  list.innerHTML = '';
  (data.saved_networks || []).forEach((n) => {
    const li = document.createElement('li');
    li.textContent = n.ssid;
    const btn = document.createElement('button');
    btn.textContent = 'Forget';
    btn.onclick = async () => {
      const r = await post('forget-network', { ssid: n.ssid });
      show(r.message, !r.success);
      loadSaved();
    };
    li.appendChild(btn);
    list.appendChild(li);
  });
}

async function loadStatus() {
  const res = await fetch('status');
  const data = await res.json();
  if (data.last_error) show('Last attempt failed: ' + data.last_message, true);
}

$('refresh').onclick = () => loadNetworks(true);
$('rescan').onclick = () => loadNetworks(false);
$('connect').onclick = async () => {
  show('Connecting...', false);
  const body = { ssid: $('ssid').value, passphrase: $('passphrase').value };
  if ($('identity').value) body.identity = $('identity').value;
  try {
    const r = await post('connect', body);
    show(r.message, !r.success);
  } catch (e) {
    show('Connection in progress; the hotspot is down while the device joins the network.', false);
  }
};
$('forgetAll').onclick = async () => {
  const r = await post('forget-all', {});
  show(r.message, !r.success);
  loadSaved();
};

loadNetworks(true);
loadSaved();
loadStatus();
</script>
</body>
</html>
)HTML";

std::string toBody(const JsonDocument& doc) {
  std::string body;
  serializeJson(doc, body);
  return body;
}

HttpResponse jsonResponse(int status, const JsonDocument& doc) {
  HttpResponse response;
  response.status = status;
  response.body = toBody(doc);
  return response;
}

HttpResponse errorResponse(int status, const std::string& error, const std::string& message) {
  JsonDocument doc;
  doc["error"] = error;
  doc["message"] = message;
  return jsonResponse(status, doc);
}

int statusForError(const std::string& error) {
  if (error == "invalid_request") return 400;
  if (error == "not_found") return 404;
  if (error == "busy") return 409;
  if (error == "timeout") return 504;
  if (error == "unavailable" || error == "shutting_down") return 503;
  return 500;
}

HttpResponse resultResponse(const IntentResult& result) {
  JsonDocument doc;
  doc["success"] = result.success;
  doc["message"] = result.message;
  if (!result.success) doc["error"] = result.error;
  return jsonResponse(result.success ? 200 : statusForError(result.error), doc);
}

// Reads a JSON object or a form-encoded body into string fields.
bool readFields(const HttpRequest& request, std::map<std::string, std::string>& out) {
  out.clear();
  const std::string& body = request.body;
  size_t first = body.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return true;

  bool isJson = request.contentType.find("json") != std::string::npos || body[first] == '{';
  if (!isJson) {
    out = parseFormEncoded(body);
    return true;
  }

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, body);
  if (err || !doc.is<JsonObject>()) return false;
  for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
    if (kv.value().is<const char*>()) out[kv.key().c_str()] = kv.value().as<const char*>();
  }
  return true;
}

std::string field(const std::map<std::string, std::string>& fields, const char* key) {
  auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

const char* contentTypeFor(const std::string& path) {
  size_t dot = path.rfind('.');
  std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
  if (ext == "html" || ext == "htm") return "text/html";
  if (ext == "js") return "application/javascript";
  if (ext == "css") return "text/css";
  if (ext == "json") return "application/json";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "svg") return "image/svg+xml";
  if (ext == "ico") return "image/x-icon";
  if (ext == "woff2") return "font/woff2";
  if (ext == "txt") return "text/plain";
  return "application/octet-stream";
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buf;
  buf << in.rdbuf();
  out = buf.str();
  return true;
}

bool isFalse(const std::string& value) {
  return value == "false" || value == "0" || value == "no";
}

}  // namespace

PortalServer::PortalServer(PortalOptions options, Net::NetworkControl& network,
                           IntentChannel& channel, const StatusBoard& status,
                           ActivityWatchdog* watchdog)
    : m_options(std::move(options)),
      m_network(network),
      m_channel(channel),
      m_status(status),
      m_watchdog(watchdog) {}

HttpResponse PortalServer::handle(const HttpRequest& request) {
  if (m_watchdog) m_watchdog->touch();
  spdlog::debug("[Portal] {} {}", request.method, request.path);

  const std::string& path = request.path;
  bool get = request.method == "GET" || request.method == "HEAD";
  bool post = request.method == "POST";

  if (get && (path == "/" || path == "/index.html")) return handleIndex();
  if (get && path == "/list-networks") return handleListNetworks(request);
  if (get && path == "/list-connected") return handleListConnected();
  if (get && path == "/list-saved") return handleListSaved();
  if (get && path == "/health") return handleHealth();
  if (get && path == "/status") return handleStatus();
  if (get && path.compare(0, 8, "/static/") == 0) return handleStatic(path);
  if (post && path == "/connect") return handleConnect(request);
  if (post && path == "/forget-network") return handleForget(request);
  if (post && path == "/forget-all") return handleForgetAll();

  if (path == "/connect" || path == "/forget-network" || path == "/forget-all") {
    return errorResponse(405, "invalid_request", "Method not allowed");
  }
  if (get) return redirectToPortal();
  return errorResponse(404, "not_found", "Not found");
}

HttpResponse PortalServer::redirectToPortal() const {
  HttpResponse response;
  response.status = 302;
  response.contentType = "text/plain";
  response.location = "http://" + m_options.gateway + "/";
  response.body = "Redirecting to the portal";
  return response;
}

HttpResponse PortalServer::handleIndex() {
  HttpResponse response;
  response.contentType = "text/html";
  if (!m_options.uiDirectory.empty() &&
      readFile(m_options.uiDirectory + "/index.html", response.body)) {
    return response;
  }
  response.body = kIndexHtml;
  return response;
}

HttpResponse PortalServer::handleStatic(const std::string& path) {
  if (path.find("..") != std::string::npos || m_options.uiDirectory.empty()) {
    return errorResponse(404, "not_found", "Not found");
  }
  HttpResponse response;
  if (!readFile(m_options.uiDirectory + path, response.body)) {
    return errorResponse(404, "not_found", "Not found");
  }
  response.contentType = contentTypeFor(path);
  return response;
}

HttpResponse PortalServer::submit(Intent intent, IntentResult& result, bool& completed) {
  completed = false;
  SubmitStatus status = m_channel.submit(intent, m_options.submitTimeout, result);
  switch (status) {
    case SubmitStatus::Completed:
      completed = true;
      return HttpResponse();
    case SubmitStatus::Busy:
      return errorResponse(409, "busy", "Another request is in progress");
    case SubmitStatus::TimedOut:
      return errorResponse(504, "timeout", "Timed out waiting for the result");
    case SubmitStatus::Closed:
    default:
      return errorResponse(503, "shutting_down", "Portal is shutting down");
  }
}

HttpResponse PortalServer::handleListNetworks(const HttpRequest& request) {
  auto it = request.query.find("use_cache");
  bool useCache = it == request.query.end() || !isFalse(it->second);

  JsonDocument doc;
  if (useCache) {
    std::shared_ptr<const StatusSnapshot> snapshot = m_status.snapshot();
    networksToJson(doc["networks"].to<JsonArray>(), snapshot->networks);
    return jsonResponse(200, doc);
  }

  Intent intent;
  intent.kind = IntentKind::Rescan;
  IntentResult result;
  bool completed = false;
  HttpResponse refused = submit(intent, result, completed);
  if (!completed) return refused;
  if (!result.success) return resultResponse(result);
  networksToJson(doc["networks"].to<JsonArray>(), result.networks);
  return jsonResponse(200, doc);
}

HttpResponse PortalServer::handleListConnected() {
  JsonDocument doc;
  Net::ConnectedInfo info;
  if (m_network.currentConnection(m_options.interfaceName, info)) {
    connectedToJson(doc["connected"].to<JsonObject>(), info);
  } else {
    doc["connected"] = nullptr;
  }
  return jsonResponse(200, doc);
}

HttpResponse PortalServer::handleListSaved() {
  std::vector<Net::NetworkProfile> saved;
  if (!m_network.listSaved(saved)) {
    return errorResponse(503, "unavailable", "NetworkManager is not reachable");
  }
  JsonDocument doc;
  savedToJson(doc["saved_networks"].to<JsonArray>(), saved);
  return jsonResponse(200, doc);
}

HttpResponse PortalServer::handleConnect(const HttpRequest& request) {
  std::map<std::string, std::string> fields;
  if (!readFields(request, fields)) {
    return errorResponse(400, "invalid_request", "Invalid JSON");
  }
  Intent intent;
  intent.kind = IntentKind::Connect;
  intent.request.ssid = field(fields, "ssid");
  intent.request.passphrase = field(fields, "passphrase");
  intent.request.identity = field(fields, "identity");
  if (!Net::isValidSsid(intent.request.ssid)) {
    return errorResponse(400, "invalid_request", "SSID must be 1-32 bytes");
  }
  spdlog::info("[Portal] Connect requested for '{}'.", intent.request.ssid);

  IntentResult result;
  bool completed = false;
  HttpResponse refused = submit(intent, result, completed);
  return completed ? resultResponse(result) : refused;
}

HttpResponse PortalServer::handleForget(const HttpRequest& request) {
  std::map<std::string, std::string> fields;
  if (!readFields(request, fields)) {
    return errorResponse(400, "invalid_request", "Invalid JSON");
  }
  Intent intent;
  intent.kind = IntentKind::Forget;
  intent.ssid = field(fields, "ssid");
  if (intent.ssid.empty()) intent.ssid = field(fields, "network_name");
  if (intent.ssid.empty()) {
    return errorResponse(400, "invalid_request", "Missing ssid");
  }

  IntentResult result;
  bool completed = false;
  HttpResponse refused = submit(intent, result, completed);
  return completed ? resultResponse(result) : refused;
}

HttpResponse PortalServer::handleForgetAll() {
  Intent intent;
  intent.kind = IntentKind::ForgetAll;
  IntentResult result;
  bool completed = false;
  HttpResponse refused = submit(intent, result, completed);
  return completed ? resultResponse(result) : refused;
}

HttpResponse PortalServer::handleHealth() {
  if (!m_network.isAvailable()) {
    return errorResponse(503, "unavailable", "NetworkManager not available");
  }
  JsonDocument doc;
  doc["status"] = "ok";
  doc["message"] = "NetworkManager is running";
  return jsonResponse(200, doc);
}

HttpResponse PortalServer::handleStatus() {
  std::shared_ptr<const StatusSnapshot> snapshot = m_status.snapshot();
  JsonDocument doc;
  doc["state"] = phaseToString(snapshot->phase);
  doc["hotspot_active"] = snapshot->hotspotActive;
  if (snapshot->lastError.empty()) {
    doc["last_error"] = nullptr;
  } else {
    doc["last_error"] = snapshot->lastError;
  }
  doc["last_message"] = snapshot->lastMessage;
  if (!snapshot->connectedSsid.empty()) doc["connected_ssid"] = snapshot->connectedSsid;
  return jsonResponse(200, doc);
}

}  // namespace App
