#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#include "core/Error.hpp"
#include "core/config/Config.hpp"
#include "core/transfer/TransferEngine.hpp"
#include "core/util/Ids.hpp"
#include "core/util/MimeTypes.hpp"

using nlohmann::json;

namespace ifs {

// -------- helpers --------

static json record_json(const FileRecord& r) {
  json j = {
    {"id", r.id},
    {"original_name", r.original_name},
    {"stored_name", r.stored_name},
    {"file_size", r.file_size},
    {"mime_type", r.mime_type},
    {"upload_time", formatIsoMillis(r.upload_time)},
    {"upload_time_ms", r.upload_time},
    {"is_video", r.is_video},
    {"has_thumbnail", r.thumbnail_path.has_value()},
    {"video_duration", nullptr},
    {"video_resolution", nullptr}
  };
  if (r.video_duration)   j["video_duration"] = *r.video_duration;
  if (r.video_resolution) j["video_resolution"] = *r.video_resolution;
  return j;
}

static json session_json(const SessionStatus& s) {
  json ranges = json::array();
  for (const auto& r : s.ranges) ranges.push_back({r.first, r.second});
  return {
    {"session_id", s.session_id},
    {"filename", s.original_name},
    {"expected_size", s.expected_size},
    {"received_bytes", s.received_bytes},
    {"next_offset", s.next_offset},
    {"complete", s.complete},
    {"received_ranges", ranges},
    {"created_at", formatIsoMillis(s.created_at)},
    {"expires_in_ms", s.expires_in_ms}
  };
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, const Error& e) {
  const int status = httpStatusFor(e.kind());
  if (status >= 500) spdlog::error("{}: {}", errorKindName(e.kind()), e.what());
  else               spdlog::debug("{}: {}", errorKindName(e.kind()), e.what());
  send_json(res, status, {{"error", errorKindName(e.kind())}, {"message", e.what()}});
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static uint64_t parse_u64(const std::string& text, const char* what) {
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw Error::validation(std::string(what) + " must be a non-negative integer");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw Error::validation(std::string(what) + " is out of range");
  }
}

// Streams the request body into the engine in pieces of at most chunk_size
// bytes, starting at offset. Returns the offset after the last byte.
static uint64_t ingest_body(TransferEngine& engine, const std::string& sid, uint64_t offset,
                            const httplib::ContentReader& content_reader) {
  const size_t chunk = static_cast<size_t>(engine.limits().chunk_size);
  std::string buf;
  uint64_t pos = offset;
  std::optional<Error> failure;

  auto flush = [&]() {
    engine.ingest(sid, pos, buf);
    pos += buf.size();
    buf.clear();
  };

  bool ok = content_reader([&](const char* data, size_t len) {
    try {
      while (len > 0) {
        size_t take = std::min(len, chunk - buf.size());
        buf.append(data, take);
        data += take;
        len  -= take;
        if (buf.size() == chunk) flush();
      }
      return true;
    } catch (const Error& e) {
      failure = e;
      return false;
    }
  });

  if (failure) throw *failure;
  if (!ok) throw Error::io("client disconnected during upload");
  if (!buf.empty()) flush();
  return pos;
}

static void serve_file(TransferEngine& engine, const httplib::Request& req,
                       httplib::Response& res, bool inline_disposition) {
  const std::string id = req.matches[1];
  auto rec = engine.getFile(id);
  if (!rec) throw Error::notFound("file not found: " + id);

  struct DownloadState {
    std::optional<RangeReader> reader;
    uint64_t pos = 0;
    std::string buf;
  };
  auto state = std::make_shared<DownloadState>();

  res.set_header("Accept-Ranges", "bytes");
  res.set_header("Content-Disposition", contentDisposition(rec->original_name, inline_disposition));

  // httplib slices the body for Range requests and picks 200/206/416; the
  // provider only has to produce bytes from whatever offset it is asked for.
  res.set_content_provider(
    static_cast<size_t>(rec->file_size), rec->mime_type,
    [&engine, id, state](size_t offset, size_t length, httplib::DataSink& sink) {
      try {
        if (!state->reader || state->pos != offset) {
          state->reader.emplace(engine.readRange(id, offset, offset + length));
          state->pos = offset;
        }
        if (!state->reader->next(state->buf)) return false;
        state->pos += state->buf.size();
        return sink.write(state->buf.data(), state->buf.size());
      } catch (const std::exception& e) {
        spdlog::warn("download of {} aborted: {}", id, e.what());
        return false;
      }
    });
}

// Wraps a handler so typed errors become JSON responses.
template <typename Fn>
static auto guarded(Fn fn) {
  return [fn](const httplib::Request& req, httplib::Response& res) {
    try {
      fn(req, res);
    } catch (const Error& e) {
      send_error(res, e);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      send_json(res, 500, {{"error", "internal"}, {"message", e.what()}});
    }
  };
}

// -------- server --------

bool run_http_server(TransferEngine& engine, const Config& cfg) {
  httplib::Server svr;

  svr.set_payload_max_length(static_cast<size_t>(cfg.storage.max_file_size));
  svr.set_read_timeout(static_cast<time_t>(cfg.storage.request_timeout.count()), 0);
  svr.set_write_timeout(static_cast<time_t>(cfg.storage.request_timeout.count()), 0);

  // Permissive CORS for browser clients on the intranet
  svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Range");
    res.set_header("Access-Control-Expose-Headers", "Content-Range, Content-Length, Accept-Ranges");
  });
  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, {{"status", "ok"}, {"service", "internal-file-server"}});
  });

  svr.Get("/api/info", [&cfg, &engine](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, {
      {"name", "Internal File Server"},
      {"max_file_size", cfg.storage.max_file_size},
      {"chunk_size", cfg.storage.chunk_size},
      {"session_timeout_s", cfg.storage.request_timeout.count()},
      {"video_formats", cfg.video.supported_formats},
      {"active_uploads", engine.activeUploads()}
    });
  });

  // POST /api/uploads   {"filename": "...", "size": N}
  svr.Post("/api/uploads", guarded([&](const httplib::Request& req, httplib::Response& res) {
    json j;
    try { j = json::parse(req.body); }
    catch (const json::parse_error&) { throw Error::validation("body must be JSON"); }
    if (!j.is_object() || !j.contains("filename") || !j["filename"].is_string()) {
      throw Error::validation("filename is required");
    }
    if (!j.contains("size") || !j["size"].is_number_unsigned()) {
      throw Error::validation("size must be a non-negative integer");
    }
    const std::string sid = engine.beginUpload(j["filename"].get<std::string>(),
                                               j["size"].get<uint64_t>());
    send_json(res, 201, session_json(engine.uploadStatus(sid)));
  }));

  svr.Get(R"(/api/uploads/([0-9a-f-]+))", guarded([&](const httplib::Request& req, httplib::Response& res) {
    send_json(res, 200, session_json(engine.uploadStatus(req.matches[1])));
  }));

  // PUT /api/uploads/{sid}?offset=N   body = bytes starting at N
  svr.Put(R"(/api/uploads/([0-9a-f-]+))",
          [&](const httplib::Request& req, httplib::Response& res,
              const httplib::ContentReader& content_reader) {
    try {
      const std::string sid = req.matches[1];
      const uint64_t offset = parse_u64(param_or(req, "offset", "0"), "offset");
      ingest_body(engine, sid, offset, content_reader);
      send_json(res, 200, session_json(engine.uploadStatus(sid)));
    } catch (const Error& e) {
      send_error(res, e);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      send_json(res, 500, {{"error", "internal"}, {"message", e.what()}});
    }
  });

  svr.Post(R"(/api/uploads/([0-9a-f-]+)/complete)", guarded([&](const httplib::Request& req, httplib::Response& res) {
    send_json(res, 201, record_json(engine.finalize(req.matches[1])));
  }));

  svr.Delete(R"(/api/uploads/([0-9a-f-]+))", guarded([&](const httplib::Request& req, httplib::Response& res) {
    engine.abort(req.matches[1]);
    res.status = 204;
  }));

  // POST /api/files?filename=...   body = whole file, streamed
  svr.Post("/api/files",
           [&](const httplib::Request& req, httplib::Response& res,
               const httplib::ContentReader& content_reader) {
    std::string sid;
    try {
      const std::string name = param_or(req, "filename", req.get_header_value("X-Filename"));
      const uint64_t size = parse_u64(req.get_header_value("Content-Length"), "Content-Length");
      sid = engine.beginUpload(name, size);
      ingest_body(engine, sid, 0, content_reader);
      send_json(res, 201, record_json(engine.finalize(sid)));
    } catch (const Error& e) {
      if (!sid.empty() && e.kind() != ErrorKind::NotFound) {
        try { engine.abort(sid); }
        catch (const Error& abortErr) { spdlog::debug("abort {}: {}", sid, abortErr.what()); }
      }
      send_error(res, e);
    } catch (const std::exception& e) {
      if (!sid.empty()) {
        try { engine.abort(sid); }
        catch (const Error& abortErr) { spdlog::debug("abort {}: {}", sid, abortErr.what()); }
      }
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      send_json(res, 500, {{"error", "internal"}, {"message", e.what()}});
    }
  });

  svr.Get("/api/files", guarded([&](const httplib::Request& req, httplib::Response& res) {
    const int limit  = static_cast<int>(parse_u64(param_or(req, "limit", "50"), "limit"));
    const int offset = static_cast<int>(parse_u64(param_or(req, "offset", "0"), "offset"));
    const bool videos = param_or(req, "videos_only") == "true" || param_or(req, "videos_only") == "1";
    json files = json::array();
    for (const auto& r : engine.listFiles(limit, offset, videos)) files.push_back(record_json(r));
    send_json(res, 200, {{"files", files}, {"limit", limit}, {"offset", offset}});
  }));

  svr.Get("/api/stats", guarded([&](const httplib::Request&, httplib::Response& res) {
    const auto s = engine.stats();
    send_json(res, 200, {
      {"total_files", s.total_files},
      {"total_size", s.total_size},
      {"video_count", s.video_count}
    });
  }));

  svr.Get(R"(/api/files/([0-9a-f-]+))", guarded([&](const httplib::Request& req, httplib::Response& res) {
    auto rec = engine.getFile(req.matches[1]);
    if (!rec) throw Error::notFound("file not found: " + std::string(req.matches[1]));
    send_json(res, 200, record_json(*rec));
  }));

  svr.Get(R"(/api/files/([0-9a-f-]+)/download)", guarded([&](const httplib::Request& req, httplib::Response& res) {
    serve_file(engine, req, res, false);
  }));

  svr.Get(R"(/api/files/([0-9a-f-]+)/stream)", guarded([&](const httplib::Request& req, httplib::Response& res) {
    serve_file(engine, req, res, true);
  }));

  svr.Get(R"(/api/files/([0-9a-f-]+)/thumbnail)", guarded([&](const httplib::Request& req, httplib::Response& res) {
    auto rec = engine.getFile(req.matches[1]);
    if (!rec || !rec->thumbnail_path) throw Error::notFound("no thumbnail for " + std::string(req.matches[1]));
    std::ifstream in(*rec->thumbnail_path, std::ios::binary);
    if (!in) throw Error::notFound("thumbnail missing on disk");
    std::ostringstream buf; buf << in.rdbuf();
    res.status = 200;
    res.set_content(buf.str(), "image/jpeg");
  }));

  svr.Delete(R"(/api/files/([0-9a-f-]+))", guarded([&](const httplib::Request& req, httplib::Response& res) {
    engine.remove(req.matches[1]);
    res.status = 204;
  }));

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      send_json(res, 404, {{"error", "not_found"}, {"message", "no such endpoint"}});
    }
  });

  spdlog::info("HTTP server listening on http://{}", cfg.serverAddress());
  if (!svr.listen(cfg.server.address, cfg.server.port)) {
    spdlog::error("Failed to bind {}", cfg.serverAddress());
    return false;
  }
  return true;
}

} // namespace ifs
