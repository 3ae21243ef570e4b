#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "capture.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "load_source.hpp"
#include "metrics.hpp"
#include "resource_cache.hpp"
#include "stream_json.hpp"
#include "stream_registry.hpp"
#include "util.hpp"

using nlohmann::json;

namespace {

httplib::Server* g_server = nullptr;

void handle_signal(int) {
  if (g_server) g_server->stop();
}

int http_status_for(ErrorCode c) {
  switch (c) {
    case ErrorCode::InvalidConfig: return 400;
    case ErrorCode::NotFound: return 404;
    case ErrorCode::InvalidState: return 409;
    case ErrorCode::ResourceExhausted: return 429;
    default: return 500;
  }
}

void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(2), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& code,
                const std::string& message) {
  send_json(res, json{{"error", code}, {"message", message}}, status);
}

// Wraps a route so StreamError and malformed JSON turn into HTTP errors.
template <typename Fn>
httplib::Server::Handler guarded(Fn fn) {
  return [fn](const httplib::Request& req, httplib::Response& res) {
    try {
      fn(req, res);
    } catch (const StreamError& e) {
      if (e.code() != ErrorCode::NotFound) spdlog::warn("{} {}: {}", req.method, req.path, e.what());
      send_error(res, http_status_for(e.code()), to_string(e.code()), e.what());
    } catch (const json::exception& e) {
      send_error(res, 400, "bad_request", e.what());
    } catch (const std::logic_error& e) {
      send_error(res, 400, "bad_request", e.what());
    }
  };
}

void register_routes(httplib::Server& svr, StreamRegistry& registry, ResourceCache& cache,
                     PerformanceMode default_mode) {
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/presets", [](const httplib::Request&, httplib::Response& res) {
    json out = json::object();
    for (auto m : all_performance_modes()) {
      StreamConfig c = preset_config(m);
      out[to_string(m)] = c;
      out[to_string(m)]["cache_size"] = recommended_cache_size(c.target_fps);
    }
    send_json(res, out);
  });

  svr.Get("/streams", guarded([&](const httplib::Request&, httplib::Response& res) {
    json out = json::array();
    for (const auto& i : registry.list_info()) out.push_back(i);
    send_json(res, out);
  }));

  svr.Post("/streams", guarded([&, default_mode](const httplib::Request& req,
                                                 httplib::Response& res) {
    const json body = req.body.empty() ? json::object() : json::parse(req.body);
    const std::string id = registry.create(parse_stream_request(body, default_mode));
    if (body.value("start", false)) registry.start(id);
    send_json(res, json{{"id", id}}, 201);
  }));

  svr.Get(R"(/streams/([^/]+))", guarded([&](const httplib::Request& req, httplib::Response& res) {
    auto info = registry.info(req.matches[1]);
    if (!info) throw StreamError(ErrorCode::NotFound, "no such stream: " + req.matches[1].str());
    send_json(res, *info);
  }));

  svr.Post(R"(/streams/([^/]+)/start)",
           guarded([&](const httplib::Request& req, httplib::Response& res) {
             registry.start(req.matches[1]);
             send_json(res, json{{"started", true}});
           }));

  svr.Post(R"(/streams/([^/]+)/stop)",
           guarded([&](const httplib::Request& req, httplib::Response& res) {
             registry.stop(req.matches[1]);
             send_json(res, json{{"stopped", true}});
           }));

  svr.Post(R"(/streams/([^/]+)/quality)",
           guarded([&](const httplib::Request& req, httplib::Response& res) {
             const json body = json::parse(req.body);
             const int requested = body.at("quality").get<int>();
             const int applied = registry.set_quality(req.matches[1], requested);
             send_json(res, json{{"quality", applied}, {"requested", requested}});
           }));

  svr.Get(R"(/streams/([^/]+)/metrics)",
          guarded([&](const httplib::Request& req, httplib::Response& res) {
            auto snap = registry.metrics(req.matches[1]);
            if (!snap) throw StreamError(ErrorCode::NotFound, "no such stream: " + req.matches[1].str());
            send_json(res, *snap);
          }));

  svr.Get(R"(/streams/([^/]+)/next)",
          guarded([&](const httplib::Request& req, httplib::Response& res) {
            int timeout_ms = 1000;
            if (req.has_param("timeout_ms")) timeout_ms = std::stoi(req.get_param_value("timeout_ms"));
            auto ch = registry.subscribe(req.matches[1]);
            auto notice = ch->pop(std::chrono::milliseconds(std::clamp(timeout_ms, 0, 30000)));
            ch->close();
            if (!notice) {
              res.status = 204;
              return;
            }
            send_json(res, *notice);
          }));

  svr.Get("/resources", guarded([&](const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("uri")) throw StreamError(ErrorCode::InvalidConfig, "missing uri");
    const std::string uri = req.get_param_value("uri");
    const Encoding enc =
        parse_encoding(req.has_param("encoding") ? req.get_param_value("encoding") : "binary");
    auto payload = cache.get_encoded(uri, enc);
    if (!payload) throw StreamError(ErrorCode::NotFound, "resource evicted or unknown: " + uri);
    if (enc == Encoding::BASE64) {
      send_json(res, json{{"uri", uri}, {"mime_type", payload->mime_type},
                          {"encoding", "base64"}, {"data", payload->body}});
    } else {
      res.set_content(payload->body, payload->mime_type.c_str());
    }
  }));

  svr.Get("/cache/stats", [&](const httplib::Request&, httplib::Response& res) {
    send_json(res, cache.stats());
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    std::ostringstream os;
    for (const auto& c : registry.list()) {
      if (auto snap = registry.metrics(c.id)) os << prometheus_text(c.id, *snap);
    }
    const CacheStats cs = cache.stats();
    os << "framerelay_cache_entries " << cs.entries << "\n";
    os << "framerelay_cache_evictions_total " << cs.evictions << "\n";
    os << "framerelay_cache_misses_total " << cs.misses << "\n";
    res.set_content(os.str(), "text/plain; version=0.0.4");
  });
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"FrameRelay-RT: paced screen-frame streaming with adaptive quality"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string log_level;
  cli_app.add_option("-l,--log-level", log_level, "Override log level (trace|debug|info|warn|error)");

  int port = 0;
  cli_app.add_option("-p,--port", port, "Override HTTP port");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FrameRelay-RT v1.0.0" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }
  if (!log_level.empty()) app.log_level = log_level;
  if (app.sample_cpu_load) app.registry.scheduler.load_source = std::make_shared<ProcStatLoadSource>();
  if (port > 0) app.server.port = port;
  spdlog::set_level(spdlog::level::from_str(app.log_level));
  spdlog::info("FrameRelay-RT starting (config: {})", cfg_path);

  ResourceCache cache(app.cache);
  auto source = std::make_shared<SyntheticFrameSource>(app.capture);
  auto encoder = std::make_shared<OpenCVEncoder>();
  StreamRegistry registry(app.registry, cache, source, encoder);

  httplib::Server svr;
  register_routes(svr, registry, cache, app.default_mode);

  g_server = &svr;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  spdlog::info("HTTP server listening on {}:{} (cache {} entries, max {} streams)", app.server.host,
               app.server.port, app.cache.max_entries, app.registry.limits.max_streams);
  const bool listened = svr.listen(app.server.host, app.server.port);
  if (!listened) spdlog::error("Failed to bind {}:{}", app.server.host, app.server.port);

  g_server = nullptr;
  registry.stop_all();
  spdlog::info("Shutdown complete.");
  return listened ? 0 : 1;
}
