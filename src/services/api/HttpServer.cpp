#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

#include "JsonCodec.hpp"
#include "core/geofence/Coordinates.hpp"
#include "core/storage/ContentDigest.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/vault/ProvenanceVault.hpp"

using nlohmann::json;

namespace docguard::api {

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (auto it = req.params.find(k); it != req.params.end()) return it->second;
  return def;
}

static void reply(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void fail(httplib::Response& res, int status, const std::string& kind, const std::string& msg) {
  reply(res, status, json{{"error", kind}, {"message", msg}});
}

static int status_for(RegistryError e) {
  switch (e) {
    case RegistryError::AlreadyExists:  return 409;
    case RegistryError::InvalidPointer: return 422;
    case RegistryError::StorageFailure: return 500;
  }
  return 500;
}

static int status_for(AccessError e) {
  switch (e) {
    case AccessError::NotFound:       return 404;
    case AccessError::Unauthorized:   return 403;
    case AccessError::InvalidGrantee: return 422;
    case AccessError::SelfRevocation: return 422;
    case AccessError::StorageFailure: return 500;
  }
  return 500;
}

static int status_for(GeofenceError e) {
  return e == GeofenceError::NotFound ? 404 : 500;
}

static std::optional<json> parse_body(const httplib::Request& req, httplib::Response& res) {
  json j = json::parse(req.body, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) {
    fail(res, 400, "BadRequest", "body must be a JSON object");
    return std::nullopt;
  }
  return j;
}

static std::string string_field(const json& j, const char* k) {
  if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
  return {};
}

// -------- server --------

void run_http_server(ProvenanceVault& vault,
                     LocalFSBackend& fs,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /upload
  // Body: raw bytes of the file
  // Metadata: X-DocGuard-Meta: <JSON>   (or)  query params of the same names
  //   uploader, signature, storage_pointer?, has_location_lock?, latitude?,
  //   longitude?, radius?
  svr.Post("/upload", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;

    const auto& bytes = req.body;
    if (bytes.empty()) { fail(res, 400, "BadRequest", "empty body"); return; }

    json j = json::object();
    const std::string meta_json = req.get_header_value("X-DocGuard-Meta");
    if (!meta_json.empty()) {
      j = json::parse(meta_json, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        fail(res, 400, "BadRequest", "invalid JSON in metadata"); return;
      }
    }

    auto get_s = [&](const char* k, const std::string& def = std::string()) {
      if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
      return param_or(req, k, def);
    };
    auto get_b = [&](const char* k) {
      if (j.contains(k) && j[k].is_boolean()) return j[k].get<bool>();
      return get_s(k) == "true";
    };
    auto get_deg = [&](const char* k) -> std::optional<int32_t> {
      if (j.contains(k)) return microDegreesFrom(j[k]);
      auto s = param_or(req, k);
      if (s.empty()) return 0;
      return parseMicroDegrees(s);
    };

    UploadRequest up;
    auto uploader  = parsePrincipal(get_s("uploader"));
    auto signature = parseHexBytes(get_s("signature"));
    if (!uploader || !signature || signature->empty()) {
      fail(res, 422, "BadRequest", "uploader and signature required"); return;
    }
    up.uploader  = *uploader;
    up.signature = std::move(*signature);

    up.hasLocationLock = get_b("has_location_lock");
    auto lat = get_deg("latitude");
    auto lon = get_deg("longitude");
    if (!lat || !lon) { fail(res, 422, "BadRequest", "invalid latitude/longitude"); return; }
    up.latitude  = *lat;
    up.longitude = *lon;
    std::optional<uint32_t> radius = up.radiusMeters;
    if (j.contains("radius")) radius = radiusFrom(j["radius"]);
    else if (auto r = param_or(req, "radius"); !r.empty()) radius = parseRadius(r);
    if (!radius) { fail(res, 422, "BadRequest", "radius must be an integer in [0, 4294967295]"); return; }
    up.radiusMeters = *radius;

    try {
      up.fileHash = sha256Digest(std::string_view(bytes));
      up.storagePointer = get_s("storage_pointer");
      if (up.storagePointer.empty() && !vault.exists(up.fileHash))
        up.storagePointer = fs.put(up.fileHash, std::string_view(bytes));
    } catch (const std::exception& e) {
      spdlog::error("content store failed: {}", e.what());
      fail(res, 500, "StorageFailure", "content store failed");
      return;
    }

    auto out = vault.upload(up);
    if (!out) {
      fail(res, status_for(out.kind()), to_string(out.kind()), out.error().message);
      return;
    }
    json body = recordToJson(out.value());
    body["status"] = "success";
    reply(res, 201, body);
  });

  // GET /files/:hash -> record, or {} when unknown
  svr.Get(R"(/files/([0-9a-fA-Fx]+))", [&](const httplib::Request& req, httplib::Response& res) {
    auto h = parseFileHash(req.matches[1].str());
    std::optional<FileRecord> rec;
    if (h) rec = vault.getRecord(*h);
    reply(res, 200, rec ? recordToJson(*rec) : json::object());
  });

  // GET /audit?from=&to=&limit=&kind=&file=
  svr.Get("/audit", [&](const httplib::Request& req, httplib::Response& res) {
    EventQuery q;
    if (auto s = param_or(req, "from"); !s.empty()) {
      auto v = parseInteger(s);
      if (!v) { fail(res, 400, "BadRequest", "from must be an integer"); return; }
      q.fromTime = *v;
    }
    if (auto s = param_or(req, "to"); !s.empty()) {
      auto v = parseInteger(s);
      if (!v) { fail(res, 400, "BadRequest", "to must be an integer"); return; }
      q.toTime = *v;
    }
    if (auto s = param_or(req, "limit"); !s.empty()) {
      q.limit = parseLimit(s);
      if (!q.limit) { fail(res, 400, "BadRequest", "limit must be a non-negative integer"); return; }
    }
    if (auto s = param_or(req, "kind"); !s.empty()) {
      q.kind = parseEventKind(s);
      if (!q.kind) { fail(res, 400, "BadRequest", "unknown event kind"); return; }
    }
    if (auto s = param_or(req, "file"); !s.empty()) {
      q.fileHash = parseFileHash(s);
      if (!q.fileHash) { fail(res, 400, "BadRequest", "invalid file hash"); return; }
    }
    reply(res, 200, json{{"status", "success"}, {"data", eventsToJson(vault.queryEvents(q))}});
  });

  // POST /access/grant, /access/revoke  {fileHash, caller, grantee}
  auto access_route = [&](bool grant) {
    return [&, grant](const httplib::Request& req, httplib::Response& res) {
      if (!check_api_key(req, apiKey, res)) return;
      auto body = parse_body(req, res);
      if (!body) return;
      auto h       = parseFileHash(string_field(*body, "fileHash"));
      auto caller  = parsePrincipal(string_field(*body, "caller"));
      auto grantee = parsePrincipal(string_field(*body, "grantee"));
      if (!h || !caller || !grantee) {
        fail(res, 400, "BadRequest", "fileHash, caller and grantee required"); return;
      }
      auto out = grant ? vault.grantAccess(*h, *caller, *grantee)
                       : vault.revokeAccess(*h, *caller, *grantee);
      if (!out) { fail(res, status_for(out.kind()), to_string(out.kind()), out.error().message); return; }
      reply(res, 200, json{{"status", "success"}});
    };
  };
  svr.Post("/access/grant",  access_route(true));
  svr.Post("/access/revoke", access_route(false));

  // GET /access/:hash/:address
  svr.Get(R"(/access/([0-9a-fA-Fx]+)/([0-9a-fA-Fx]+))", [&](const httplib::Request& req, httplib::Response& res) {
    auto h = parseFileHash(req.matches[1].str());
    auto p = parsePrincipal(req.matches[2].str());
    bool allowed = h && p && vault.canAccess(*h, *p);
    reply(res, 200, json{{"fileHash", req.matches[1].str()},
                         {"address", req.matches[2].str()},
                         {"canAccess", allowed}});
  });

  // POST /verify-location  {fileHash, latitude, longitude}
  svr.Post("/verify-location", [&](const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req, res);
    if (!body) return;
    auto h = parseFileHash(string_field(*body, "fileHash"));
    if (!h || !body->contains("latitude") || !body->contains("longitude")) {
      fail(res, 400, "BadRequest", "Missing fileHash, latitude, or longitude"); return;
    }
    auto lat = microDegreesFrom((*body)["latitude"]);
    auto lon = microDegreesFrom((*body)["longitude"]);
    if (!lat || !lon) { fail(res, 422, "BadRequest", "invalid latitude/longitude"); return; }

    auto out = vault.verifyLocation(*h, *lat, *lon);
    if (!out) { fail(res, status_for(out.kind()), to_string(out.kind()), out.error().message); return; }
    reply(res, 200, json{{"fileHash", toHex(*h)},
                         {"latitude", formatDegrees(*lat)},
                         {"longitude", formatDegrees(*lon)},
                         {"isValidLocation", out.value()}});
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace docguard::api
