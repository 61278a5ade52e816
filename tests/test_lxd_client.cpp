/**
 * @file test_lxd_client.cpp
 * @brief Tests for lxd_client.hpp - REST envelope handling over a fake transport.
 */

#include "recon/lxd_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

using recon::Json;
using recon::LxdClient;
using recon::http::Request;
using recon::http::Response;

namespace {

/** Replays queued responses and keeps every request it was given. */
class ScriptedTransport final : public recon::HttpTransport {
 public:
  struct Shared {
    std::vector<Request> requests;
    std::deque<recon::Result<Response>> replies;
  };

  explicit ScriptedTransport(Shared& shared) : shared_(shared) {}

  recon::Result<Response> RoundTrip(const Request& req) override {
    shared_.requests.push_back(req);
    if (shared_.replies.empty()) {
      return recon::Result<Response>::error(
          recon::MakeError(recon::ErrorKind::kTransport, "no scripted reply"));
    }
    recon::Result<Response> r = shared_.replies.front();
    shared_.replies.pop_front();
    return r;
  }

 private:
  Shared& shared_;
};

Response Reply(int32_t status, const Json& body) {
  Response r;
  r.status = status;
  r.body = body.dump();
  return r;
}

Json Sync(Json metadata = Json::object()) {
  return Json{{"type", "sync"}, {"status", "Success"}, {"status_code", 200},
              {"metadata", std::move(metadata)}};
}

Json Async(const char* op) {
  return Json{{"type", "async"}, {"status", "Operation created"},
              {"status_code", 100}, {"operation", op}};
}

Json ErrorBody(int32_t code, const char* msg) {
  return Json{{"type", "error"}, {"error", msg}, {"error_code", code}};
}

struct Fixture {
  ScriptedTransport::Shared io;

  LxdClient Make(bool debug = false, const char* endpoint = "/instances") {
    LxdClient::Options opts;
    opts.debug = debug;
    opts.instances_endpoint = endpoint;
    return LxdClient(std::unique_ptr<recon::HttpTransport>(
                         new ScriptedTransport(io)),
                     opts);
  }

  void Push(int32_t status, const Json& body) {
    io.replies.push_back(recon::Result<Response>::success(Reply(status, body)));
  }

  Json SentBody(size_t i) const { return Json::parse(io.requests.at(i).body); }
};

}  // namespace

// ============================================================================
// Fetch
// ============================================================================

TEST_CASE("Fetch maps a running instance", "[lxd][fetch]") {
  Fixture f;
  f.Push(200, Sync({{"name", "web1"}, {"status", "Running"},
                    {"config", {{"limits.cpu", "2"}}}}));
  LxdClient client = f.Make();

  auto r = client.Fetch("web1");
  REQUIRE(r.has_value());
  REQUIRE(r.value().status == recon::InstanceStatus::kStarted);
  REQUIRE(r.value().metadata["config"]["limits.cpu"] == "2");
  REQUIRE(f.io.requests[0].method == "GET");
  REQUIRE(f.io.requests[0].path == "/1.0/instances/web1");
  REQUIRE(f.io.requests[0].body.empty());
}

TEST_CASE("Fetch treats 404 as absent", "[lxd][fetch]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "Instance not found"));
  LxdClient client = f.Make();
  auto r = client.Fetch("ghost");
  REQUIRE(r.has_value());
  REQUIRE(!r.value().exists());
  REQUIRE(r.value().metadata.is_null());
}

TEST_CASE("Fetch surfaces other API errors", "[lxd][fetch]") {
  Fixture f;
  f.Push(403, ErrorBody(403, "not authorized"));
  LxdClient client = f.Make();
  auto r = client.Fetch("web1");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind == recon::ErrorKind::kApi);
  REQUIRE(r.get_error().status_code == 403);
  REQUIRE(r.get_error().message == "not authorized");
}

TEST_CASE("Fetch rejects unknown statuses", "[lxd][fetch]") {
  Fixture f;
  f.Push(200, Sync({{"status", "Error"}}));
  LxdClient client = f.Make();
  auto r = client.Fetch("web1");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().message.find("Error") != std::string::npos);
}

TEST_CASE("Fetch encodes the name and honours the endpoint", "[lxd][fetch]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "not found"));
  LxdClient client = f.Make(false, "/containers");
  REQUIRE(client.Fetch("my box").has_value());
  REQUIRE(f.io.requests[0].path == "/1.0/containers/my%20box");
}

TEST_CASE("Transport and body failures", "[lxd][errors]") {
  Fixture f;
  LxdClient client = f.Make();

  auto none = client.Fetch("web1");  // no scripted reply
  REQUIRE(!none.has_value());
  REQUIRE(none.get_error().kind == recon::ErrorKind::kTransport);

  Response html;
  html.status = 502;
  html.body = "<html>bad gateway</html>";
  f.io.replies.push_back(recon::Result<Response>::success(html));
  auto bad = client.Fetch("web1");
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error().kind == recon::ErrorKind::kTransport);
  REQUIRE(bad.get_error().status_code == 502);
}

// ============================================================================
// FetchState
// ============================================================================

TEST_CASE("FetchState extracts device addresses", "[lxd][state]") {
  Fixture f;
  f.Push(200, Sync(Json::parse(R"({
    "status": "Running",
    "network": {
      "eth0": {"addresses": [
        {"family": "inet", "address": "10.0.0.5", "netmask": "24"},
        {"family": "inet6", "address": "fd42::5", "netmask": "64"}]},
      "lo": {"addresses": [{"family": "inet", "address": "127.0.0.1"}]},
      "eth1": {"addresses": []}
    }})")));
  LxdClient client = f.Make();

  auto r = client.FetchState("web1");
  REQUIRE(r.has_value());
  REQUIRE(f.io.requests[0].path == "/1.0/instances/web1/state");
  const recon::NetworkState& net = r.value();
  REQUIRE(net.size() == 3);
  REQUIRE(net.at("eth0").size() == 2);
  REQUIRE(net.at("eth0")[0].family == "inet");
  REQUIRE(net.at("eth0")[0].address == "10.0.0.5");
  REQUIRE(net.at("eth1").empty());
}

TEST_CASE("FetchState tolerates 404 and missing network", "[lxd][state]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "not found"));
  f.Push(200, Sync({{"status", "Stopped"}, {"network", nullptr}}));
  LxdClient client = f.Make();
  auto a = client.FetchState("web1");
  REQUIRE(a.has_value());
  REQUIRE(a.value().empty());
  auto b = client.FetchState("web1");
  REQUIRE(b.has_value());
  REQUIRE(b.value().empty());
}

// ============================================================================
// Mutations
// ============================================================================

TEST_CASE("Create posts the body and follows the operation", "[lxd][create]") {
  Fixture f;
  f.Push(202, Async("/1.0/operations/abc"));
  f.Push(200, Sync({{"id", "abc"}, {"status", "Success"}}));
  LxdClient client = f.Make();

  Json body = {{"name", "web1"}, {"source", {{"type", "image"}}}};
  auto st = client.Create(body, "node 2");
  REQUIRE(st.has_value());
  REQUIRE(f.io.requests.size() == 2);
  REQUIRE(f.io.requests[0].method == "POST");
  REQUIRE(f.io.requests[0].path == "/1.0/instances?target=node%202");
  REQUIRE(f.SentBody(0) == body);
  REQUIRE(f.io.requests[1].method == "GET");
  REQUIRE(f.io.requests[1].path == "/1.0/operations/abc/wait");
}

TEST_CASE("Create without target has no query", "[lxd][create]") {
  Fixture f;
  f.Push(200, Sync());
  LxdClient client = f.Make();
  REQUIRE(client.Create(Json::object(), "").has_value());
  REQUIRE(f.io.requests[0].path == "/1.0/instances");
}

TEST_CASE("Failed operation carries its error", "[lxd][operation]") {
  Fixture f;
  f.Push(202, Async("/1.0/operations/op1"));
  f.Push(200, Sync({{"status", "Failure"},
                    {"err", "Failed to run: forkstart"}}));
  LxdClient client = f.Make();
  auto st = client.SetState("web1", recon::StateAction::kStart, 30, false);
  REQUIRE(!st.has_value());
  REQUIRE(st.get_error().kind == recon::ErrorKind::kApi);
  REQUIRE(st.get_error().message == "Failed to run: forkstart");
}

TEST_CASE("Failed operation without message names the status",
          "[lxd][operation]") {
  Fixture f;
  f.Push(202, Async("/1.0/operations/op2"));
  f.Push(200, Sync({{"status", "Cancelled"}}));
  LxdClient client = f.Make();
  auto st = client.Delete("web1");
  REQUIRE(!st.has_value());
  REQUIRE(st.get_error().message.find("Cancelled") != std::string::npos);
}

TEST_CASE("Async reply without operation is an error", "[lxd][operation]") {
  Fixture f;
  f.Push(202, Json{{"type", "async"}});
  LxdClient client = f.Make();
  auto st = client.Delete("web1");
  REQUIRE(!st.has_value());
  REQUIRE(st.get_error().kind == recon::ErrorKind::kApi);
}

TEST_CASE("SetState body carries action, timeout and force", "[lxd][state]") {
  Fixture f;
  f.Push(200, Sync());
  f.Push(200, Sync());
  LxdClient client = f.Make();

  REQUIRE(client.SetState("web1", recon::StateAction::kStop, 60, true)
              .has_value());
  REQUIRE(client.SetState("web1", recon::StateAction::kFreeze, 30, false)
              .has_value());

  REQUIRE(f.io.requests[0].method == "PUT");
  REQUIRE(f.io.requests[0].path == "/1.0/instances/web1/state");
  REQUIRE(f.SentBody(0) ==
          Json{{"action", "stop"}, {"timeout", 60}, {"force", true}});
  REQUIRE(f.SentBody(1) == Json{{"action", "freeze"}, {"timeout", 30}});
}

TEST_CASE("Update and Delete requests", "[lxd][mutate]") {
  Fixture f;
  f.Push(200, Sync());
  f.Push(200, Sync());
  LxdClient client = f.Make();

  Json body = {{"config", {{"limits.cpu", "2"}}}, {"profiles", {"default"}}};
  REQUIRE(client.Update("web1", body).has_value());
  REQUIRE(client.Delete("web1").has_value());

  REQUIRE(f.io.requests[0].method == "PUT");
  REQUIRE(f.io.requests[0].path == "/1.0/instances/web1");
  REQUIRE(f.SentBody(0) == body);
  REQUIRE(f.io.requests[1].method == "DELETE");
  REQUIRE(f.io.requests[1].path == "/1.0/instances/web1");
}

TEST_CASE("Authenticate posts a client certificate request", "[lxd][auth]") {
  Fixture f;
  f.Push(200, Sync());
  f.Push(403, ErrorBody(403, "not authorized"));
  LxdClient client = f.Make();

  REQUIRE(client.Authenticate("s3cret").has_value());
  REQUIRE(f.io.requests[0].method == "POST");
  REQUIRE(f.io.requests[0].path == "/1.0/certificates");
  REQUIRE(f.SentBody(0) == Json{{"type", "client"}, {"password", "s3cret"}});

  auto bad = client.Authenticate("wrong");
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error().status_code == 403);
}

TEST_CASE("Error envelope without error_code uses the HTTP status",
          "[lxd][errors]") {
  Fixture f;
  f.Push(500, Json{{"type", "error"}});
  LxdClient client = f.Make();
  auto st = client.Delete("web1");
  REQUIRE(!st.has_value());
  REQUIRE(st.get_error().status_code == 500);
  REQUIRE(st.get_error().message == "request failed with code 500");
}

// ============================================================================
// Debug logs
// ============================================================================

TEST_CASE("Debug mode records every request", "[lxd][debug]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "not found"));
  f.Push(202, Async("/1.0/operations/x"));
  f.Push(200, Sync({{"status", "Success"}}));
  LxdClient client = f.Make(true);

  REQUIRE(client.Fetch("web1").has_value());
  REQUIRE(client.Create(Json{{"name", "web1"}}, "").has_value());

  Json logs = client.DebugLogs();
  REQUIRE(logs.size() == 3);
  REQUIRE(logs[0]["type"] == "sent request");
  REQUIRE(logs[0]["request"]["method"] == "GET");
  REQUIRE(logs[0]["request"]["url"] == "/1.0/instances/web1");
  REQUIRE(logs[0]["request"]["json"].is_null());
  REQUIRE(logs[0]["response"]["json"]["error_code"] == 404);
  REQUIRE(logs[1]["request"]["json"]["name"] == "web1");
  REQUIRE(logs[2]["request"]["url"] == "/1.0/operations/x/wait");
}

TEST_CASE("Debug logs stay empty by default", "[lxd][debug]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "not found"));
  LxdClient client = f.Make();
  REQUIRE(client.Fetch("web1").has_value());
  REQUIRE(client.DebugLogs().empty());
}

TEST_CASE("404 outside a fetch is a not-found error", "[lxd][errors]") {
  Fixture f;
  f.Push(404, ErrorBody(404, "Instance not found"));
  LxdClient client = f.Make();
  auto st = client.Delete("ghost");
  REQUIRE(!st.has_value());
  REQUIRE(st.get_error().kind == recon::ErrorKind::kNotFound);
  REQUIRE(st.get_error().status_code == 404);
  REQUIRE(st.get_error().message == "Instance not found");
}
