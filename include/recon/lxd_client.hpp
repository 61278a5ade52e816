/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


/**
 * @file lxd_client.hpp
 * @brief ControlPlane implementation speaking the LXD REST API (/1.0).
 *
 * Response envelope handling:
 *   - "sync":  returned as-is;
 *   - "async": followed by GET <operation>/wait, which must report
 *              metadata.status == "Success";
 *   - "error": ErrorKind::kNotFound for code 404, ErrorKind::kApi
 *              otherwise. Fetch and FetchState report 404 as absent.
 *
 * In debug mode every request/response pair is recorded and exposed
 * through DebugLogs().
 */

#ifndef RECON_LXD_CLIENT_HPP_
#define RECON_LXD_CLIENT_HPP_

#include "recon/control_plane.hpp"
#include "recon/http.hpp"
#include "recon/http_transport.hpp"
#include "recon/instance.hpp"
#include "recon/log.hpp"
#include "recon/vocabulary.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace recon {

class LxdClient final : public ControlPlane {
 public:
  struct Options {
    std::string instances_endpoint = "/instances";
    bool debug = false;
  };

  LxdClient(std::unique_ptr<HttpTransport> transport, Options options)
      : transport_(std::move(transport)), options_(std::move(options)),
        logs_(Json::array()) {}

  // --------------------------------------------------------------------------
  // ControlPlane
  // --------------------------------------------------------------------------

  Result<ObservedInstance> Fetch(const std::string& name) override {
    Result<Json> r = Do("GET", InstancePath(name), nullptr);
    if (!r && r.get_error().kind == ErrorKind::kNotFound) {
      return Result<ObservedInstance>::success(ObservedInstance());
    }
    return and_then(r, &LxdClient::ParseInstance);
  }

  Result<NetworkState> FetchState(const std::string& name) override {
    Result<Json> r = Do("GET", InstancePath(name) + "/state", nullptr);
    if (!r && r.get_error().kind == ErrorKind::kNotFound) {
      return Result<NetworkState>::success(NetworkState());
    }
    return and_then(r, &LxdClient::ParseNetwork);
  }

  Status Create(const Json& body, const std::string& target) override {
    std::string path = BasePath();
    if (!target.empty()) path += "?target=" + http::UrlEncode(target);
    return ToStatus(Do("POST", path, &body));
  }

  Status SetState(const std::string& name, StateAction action,
                  uint32_t timeout_s, bool force) override {
    Json body = {{"action", StateActionName(action)}, {"timeout", timeout_s}};
    if (force) body["force"] = true;
    return ToStatus(Do("PUT", InstancePath(name) + "/state", &body));
  }

  Status Delete(const std::string& name) override {
    return ToStatus(Do("DELETE", InstancePath(name), nullptr));
  }

  Status Update(const std::string& name, const Json& body) override {
    return ToStatus(Do("PUT", InstancePath(name), &body));
  }

  Status Authenticate(const std::string& secret) override {
    Json body = {{"type", "client"}, {"password", secret}};
    return ToStatus(Do("POST", "/1.0/certificates", &body));
  }

  Json DebugLogs() const override { return logs_; }

  // --------------------------------------------------------------------------
  // Raw access
  // --------------------------------------------------------------------------

  /**
   * @brief Issue one request and resolve the LXD envelope.
   *
   * An error envelope with code 404 becomes ErrorKind::kNotFound, any other
   * one ErrorKind::kApi.
   *
   * @param body  JSON body, nullptr for none.
   */
  Result<Json> Do(const std::string& method, const std::string& path,
                  const Json* body) {
    http::Request req;
    req.method = method;
    req.path = path;
    if (body != nullptr) req.body = body->dump();

    Result<http::Response> resp = transport_->RoundTrip(req);
    if (!resp) return Result<Json>::error(resp.get_error());

    Json j = Json::parse(resp.value().body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return Result<Json>::error(MakeError(
          ErrorKind::kTransport,
          "invalid JSON in response to " + method + " " + path +
              " (HTTP " + std::to_string(resp.value().status) + ")",
          resp.value().status));
    }
    Record(method, path, body, j);

    const std::string type = StringField(j, "type");
    if (type == "error") {
      int32_t code = resp.value().status;
      auto ec = j.find("error_code");
      if (ec != j.end() && ec->is_number_integer()) {
        code = ec->get<int32_t>();
      }
      std::string msg = StringField(j, "error");
      if (msg.empty()) msg = "request failed with code " + std::to_string(code);
      RECON_LOG_DEBUG("lxd", "%s %s: %d %s", method.c_str(), path.c_str(),
                      code, msg.c_str());
      return Result<Json>::error(MakeError(
          code == 404 ? ErrorKind::kNotFound : ErrorKind::kApi, msg, code));
    }
    if (type == "async") {
      const std::string op = StringField(j, "operation");
      if (op.empty()) {
        return Result<Json>::error(MakeError(
            ErrorKind::kApi, "async response without operation",
            resp.value().status));
      }
      return WaitOperation(op);
    }
    return Result<Json>::success(std::move(j));
  }

 private:
  static Result<ObservedInstance> ParseInstance(const Json& j) {
    auto meta = j.find("metadata");
    if (meta == j.end() || !meta->is_object()) {
      return Result<ObservedInstance>::error(
          MakeError(ErrorKind::kApi, "instance response without metadata"));
    }
    const std::string status = StringField(*meta, "status");
    std::optional<InstanceStatus> st = StatusFromApi(status);
    if (!st) {
      return Result<ObservedInstance>::error(MakeError(
          ErrorKind::kApi, "unexpected instance status '" + status + "'"));
    }
    ObservedInstance obs;
    obs.status = *st;
    obs.metadata = *meta;
    return Result<ObservedInstance>::success(std::move(obs));
  }

  static Result<NetworkState> ParseNetwork(const Json& j) {
    NetworkState net;
    auto meta = j.find("metadata");
    if (meta == j.end() || !meta->is_object()) {
      return Result<NetworkState>::success(std::move(net));
    }
    auto network = meta->find("network");
    if (network == meta->end() || !network->is_object()) {
      return Result<NetworkState>::success(std::move(net));
    }
    for (auto dev = network->begin(); dev != network->end(); ++dev) {
      std::vector<InterfaceAddress>& list = net[dev.key()];
      if (!dev->is_object()) continue;
      auto addrs = dev->find("addresses");
      if (addrs == dev->end() || !addrs->is_array()) continue;
      for (const Json& a : *addrs) {
        InterfaceAddress ia;
        ia.family = StringField(a, "family");
        ia.address = StringField(a, "address");
        list.push_back(std::move(ia));
      }
    }
    return Result<NetworkState>::success(std::move(net));
  }

  Result<Json> WaitOperation(const std::string& operation) {
    Result<Json> r = Do("GET", operation + "/wait", nullptr);
    if (!r) return r;
    const Json& j = r.value();
    auto meta = j.find("metadata");
    const std::string status =
        (meta != j.end()) ? StringField(*meta, "status") : std::string();
    if (status != "Success") {
      std::string msg =
          (meta != j.end()) ? StringField(*meta, "err") : std::string();
      if (msg.empty()) msg = "operation " + operation + " ended with status '" +
                             status + "'";
      return Result<Json>::error(MakeError(ErrorKind::kApi, msg));
    }
    return r;
  }

  void Record(const std::string& method, const std::string& path,
              const Json* body, const Json& response) {
    if (!options_.debug) return;
    Json request = {{"method", method}, {"url", path}};
    request["json"] = (body != nullptr) ? *body : Json();
    Json entry = {{"type", "sent request"},
                  {"request", std::move(request)},
                  {"response", {{"json", response}}}};
    logs_.push_back(std::move(entry));
  }

  std::string BasePath() const { return "/1.0" + options_.instances_endpoint; }

  std::string InstancePath(const std::string& name) const {
    return BasePath() + "/" + http::UrlEncode(name);
  }

  static std::string StringField(const Json& j, const char* key) {
    if (!j.is_object()) return std::string();
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
  }

  static Status ToStatus(const Result<Json>& r) {
    if (!r) return Status::error(r.get_error());
    return Ok();
  }

  std::unique_ptr<HttpTransport> transport_;
  Options options_;
  Json logs_;
};

}  // namespace recon

#endif  // RECON_LXD_CLIENT_HPP_
