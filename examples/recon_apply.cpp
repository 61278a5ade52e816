// Copyright (c) 2024 liudegui. MIT License.
//
// recon_apply: converge one LXD instance toward a JSON instance description.
//
//   recon_apply [--check] [--settings FILE] [--verbose] SPEC.json
//
// Prints the reconciliation result as JSON on stdout. Exit code 0 on
// success, 1 on reconciliation failure, 2 on usage or input errors.

#include "recon/http.hpp"
#include "recon/http_transport.hpp"
#include "recon/interrupt.hpp"
#include "recon/log.hpp"
#include "recon/lxd_client.hpp"
#include "recon/reconciler.hpp"
#include "recon/settings.hpp"
#include "recon/spec_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

static constexpr int kExitOk = 0;
static constexpr int kExitFailed = 1;
static constexpr int kExitUsage = 2;

// ============================================================================
// Command line
// ============================================================================

struct Args {
  bool check = false;
  bool verbose = false;
  const char* settings_path = nullptr;
  const char* spec_path = nullptr;
};

static void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s [--check] [--settings FILE] [--verbose] SPEC.json\n"
               "  --check     report planned actions without applying them\n"
               "  --settings  client settings file (.json, .ini, .yaml)\n"
               "  --verbose   debug logging and request log in the result\n",
               prog);
}

static bool ParseArgs(int argc, char* argv[], Args& out) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--check") == 0) {
      out.check = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      out.verbose = true;
    } else if (std::strcmp(argv[i], "--settings") == 0) {
      if (i + 1 >= argc) return false;
      out.settings_path = argv[++i];
    } else if (argv[i][0] == '-') {
      return false;
    } else if (out.spec_path == nullptr) {
      out.spec_path = argv[i];
    } else {
      return false;
    }
  }
  return out.spec_path != nullptr;
}

static int FailInput(const recon::Error& err) {
  RECON_LOG_ERROR("main", "%s: %s", recon::ErrorKindName(err.kind),
                  err.message.c_str());
  recon::Json j = recon::Json::object();
  j["failed"] = true;
  j["changed"] = false;
  j["msg"] = err.message;
  std::printf("%s\n", j.dump(2).c_str());
  return kExitUsage;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  recon::log::Init();

  recon::MultiSettings store;
  if (args.settings_path != nullptr) {
    recon::Status st = store.LoadFile(args.settings_path);
    if (!st) return FailInput(st.get_error());
  }
  recon::Result<recon::ClientSettings> resolved =
      recon::ResolveClientSettings(store, std::getenv("HOME"));
  if (!resolved) return FailInput(resolved.get_error());
  recon::ClientSettings settings = std::move(resolved).value();
  if (args.verbose) settings.debug = true;
  recon::log::SetLevel(args.verbose ? recon::log::Level::kDebug
                                    : settings.log_level);

  recon::Result<recon::DesiredSpec> spec =
      recon::LoadDesiredSpecFile(args.spec_path);
  if (!spec) return FailInput(spec.get_error());

  recon::InterruptGuard interrupt;
  recon::or_else(interrupt.Install(), [](const recon::Error& e) {
    RECON_LOG_WARN("main", "interrupt handler not installed: %s",
                   e.message.c_str());
  });

  recon::TransportOptions transport_opts;
  transport_opts.client_cert = settings.client_cert;
  transport_opts.client_key = settings.client_key;
  transport_opts.server_cert = settings.server_cert;
  transport_opts.connect_timeout_ms = settings.connect_timeout_ms;
  transport_opts.request_timeout_ms = settings.request_timeout_ms;
  transport_opts.cancel = &interrupt.Flag();
  recon::Result<std::unique_ptr<recon::HttpTransport>> transport =
      recon::and_then(recon::http::ParseEndpoint(settings.url),
                      [&transport_opts](const recon::http::Endpoint& ep) {
                        return recon::CurlTransport::Create(ep, transport_opts);
                      });
  if (!transport) return FailInput(transport.get_error());

  recon::LxdClient::Options client_opts;
  client_opts.instances_endpoint = settings.instances_endpoint;
  client_opts.debug = settings.debug;
  recon::LxdClient client(std::move(transport).value(), client_opts);

  recon::Reconciler::Options rec_opts;
  rec_opts.dry_run = args.check;
  rec_opts.trust_password = settings.trust_password;
  rec_opts.cancel = &interrupt.Flag();
  recon::Reconciler reconciler(client, rec_opts);

  RECON_LOG_INFO("main", "%s: desired %s via %s%s", spec.value().name.c_str(),
                 recon::DesiredStateName(spec.value().state),
                 settings.url.c_str(), args.check ? " (check)" : "");
  recon::ReconcileResult result = reconciler.Reconcile(spec.value());
  std::printf("%s\n", result.ToJson().dump(2).c_str());

  recon::log::Shutdown();
  return result.ok ? kExitOk : kExitFailed;
}
