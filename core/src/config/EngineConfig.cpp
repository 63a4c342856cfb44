#include "vc/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <cstdio>

namespace vc {

namespace {

// Reads typed members, remembering the first failure.
class ConfigReader {
public:
  explicit ConfigReader(Error& err) : err_(err) {}

  bool ok() const { return ok_; }

  void fail(const std::string& message) {
    if (!ok_) return;
    ok_ = false;
    err_ = makeError("BAD_CONFIG", message);
  }

  // nullptr when absent; a present non-object fails.
  const rapidjson::Value* object(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return nullptr;
    if (!it->value.IsObject()) {
      fail(std::string("'") + key + "' must be an object");
      return nullptr;
    }
    return &it->value;
  }

  void number(const rapidjson::Value& obj, const char* key, double& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsNumber()) {
      fail(std::string("'") + key + "' must be a number");
      return;
    }
    out = it->value.GetDouble();
  }

  void integer(const rapidjson::Value& obj, const char* key, int& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsInt()) {
      fail(std::string("'") + key + "' must be an integer");
      return;
    }
    out = it->value.GetInt();
  }

  void count(const rapidjson::Value& obj, const char* key, std::size_t& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsUint64()) {
      fail(std::string("'") + key + "' must be a non-negative integer");
      return;
    }
    out = static_cast<std::size_t>(it->value.GetUint64());
  }

  void millis(const rapidjson::Value& obj, const char* key, TimeMs& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsInt64()) {
      fail(std::string("'") + key + "' must be an integer millisecond count");
      return;
    }
    out = it->value.GetInt64();
  }

  void boolean(const rapidjson::Value& obj, const char* key, bool& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsBool()) {
      fail(std::string("'") + key + "' must be a boolean");
      return;
    }
    out = it->value.GetBool();
  }

  void text(const rapidjson::Value& obj, const char* key, std::string& out) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return;
    if (!it->value.IsString()) {
      fail(std::string("'") + key + "' must be a string");
      return;
    }
    out = it->value.GetString();
  }

  // "HH:MM" as minutes after midnight.
  void clock(const rapidjson::Value& obj, const char* key, int& out) {
    std::string s;
    if (!obj.HasMember(key)) return;
    text(obj, key, s);
    if (!ok_) return;
    int h = -1, m = -1;
    char tail = 0;
    if (std::sscanf(s.c_str(), "%d:%d%c", &h, &m, &tail) != 2 ||
        h < 0 || h > 24 || m < 0 || m > 59 || h * 60 + m > 24 * 60) {
      fail(std::string("'") + key + "' must be HH:MM");
      return;
    }
    out = h * 60 + m;
  }

private:
  Error& err_;
  bool ok_{true};
};

void readViewport(ConfigReader& r, const rapidjson::Value& v, ViewportConfig& c) {
  r.millis(v, "minTimeSpanMs", c.minTimeSpan);
  r.millis(v, "maxTimeSpanMs", c.maxTimeSpan);
  r.millis(v, "loadMarginMs", c.loadMargin);
  r.number(v, "negligibleSpanMs", c.negligibleSpanMs);
  r.number(v, "bufferRatio", c.bufferRatio);
  r.count(v, "loadBatchSize", c.loadBatchSize);
  r.count(v, "maxBlocks", c.blocks.maxBlocks);
  r.text(v, "defaultTimeframe", c.defaultTimeframe);
  r.number(v, "priceMargin", c.autoScale.priceMargin);
  r.number(v, "volumeHeadroom", c.autoScale.volumeHeadroom);
  r.boolean(v, "includeZero", c.autoScale.includeZero);

  if (const auto* m = r.object(v, "momentum")) {
    r.number(*m, "threshold", c.momentumThreshold);
    r.number(*m, "floor", c.momentumFloor);
    r.number(*m, "decay", c.momentumDecay);
    r.number(*m, "frameMs", c.frameMs);
  }
  if (const auto* w = r.object(v, "wheel")) {
    r.number(*w, "sensitivity", c.wheelSensitivity);
    r.number(*w, "easing", c.smoothZoomFactor);
    r.number(*w, "epsilon", c.smoothZoomEpsilon);
  }
}

void readLod(ConfigReader& r, const rapidjson::Value& arr, LodPolicyConfig& c) {
  if (!arr.IsArray()) {
    r.fail("'lod' must be an array");
    return;
  }
  LodPolicyConfig parsed;
  parsed.levels.clear();
  for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
    const auto& e = arr[i];
    if (!e.IsObject() || !e.HasMember("barsPerPixelThreshold") ||
        !e.HasMember("aggregationFactor")) {
      r.fail("each 'lod' tier needs barsPerPixelThreshold and aggregationFactor");
      return;
    }
    LODLevel level;
    level.level = static_cast<int>(i);
    int factor = 1;
    r.integer(e, "level", level.level);
    r.number(e, "barsPerPixelThreshold", level.barsPerPixelThreshold);
    r.integer(e, "aggregationFactor", factor);
    r.text(e, "description", level.description);
    if (!r.ok()) return;
    if (factor < 1) {
      r.fail("'aggregationFactor' must be >= 1");
      return;
    }
    level.aggregationFactor = static_cast<std::uint32_t>(factor);
    parsed.levels.push_back(level);
  }
  c = parsed;
}

void readTimeAxis(ConfigReader& r, const rapidjson::Value& v, TimeAxisConfig& c) {
  r.integer(v, "minTicks", c.minTicks);
  r.integer(v, "maxTicks", c.maxTicks);
  r.number(v, "pixelsPerTick", c.pixelsPerTick);
  r.count(v, "maxSeparators", c.maxSeparators);
  if (const auto* s = r.object(v, "session")) {
    r.clock(*s, "open", c.session.openMinute);
    r.clock(*s, "breakStart", c.session.breakStartMinute);
    r.clock(*s, "breakEnd", c.session.breakEndMinute);
    r.clock(*s, "close", c.session.closeMinute);
  }
}

void readPriceAxis(ConfigReader& r, const rapidjson::Value& v, PriceAxisConfig& c) {
  r.number(v, "minTickSpacingPx", c.minTickSpacingPx);
  std::string scale;
  r.text(v, "scale", scale);
  if (scale.empty()) return;
  if (scale == "linear") {
    c.mode = ScaleMode::Linear;
  } else if (scale == "log") {
    c.mode = ScaleMode::Log;
  } else {
    r.fail("'scale' must be \"linear\" or \"log\"");
  }
}

void readCollision(ConfigReader& r, const rapidjson::Value& v, CollisionConfig& c) {
  r.number(v, "minSpacingPx", c.minSpacingPx);
  r.number(v, "targetDensity", c.targetDensity);
  r.number(v, "initialSpacingPx", c.initialSpacingPx);
  r.number(v, "growStepPx", c.growStepPx);
  r.number(v, "shrinkStepPx", c.shrinkStepPx);
  r.integer(v, "maxIterations", c.maxIterations);
}

void readDebug(ConfigReader& r, const rapidjson::Value& v, DebugToggles& d) {
  r.boolean(v, "logRange", d.logRange);
  r.boolean(v, "logLoads", d.logLoads);
  r.boolean(v, "logLod", d.logLod);
  r.boolean(v, "logIndicators", d.logIndicators);
}

std::string clockText(int minutes) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
  return buf;
}

bool fail(Error& err, const char* message) {
  err = makeError("BAD_CONFIG", message);
  return false;
}

} // namespace

bool validateEngineConfig(const EngineConfig& cfg, Error& err) {
  const ViewportConfig& v = cfg.viewport;
  if (v.minTimeSpan <= 0) return fail(err, "minTimeSpanMs must be positive");
  if (v.minTimeSpan > v.maxTimeSpan) return fail(err, "minTimeSpanMs exceeds maxTimeSpanMs");
  if (v.loadMargin < 0) return fail(err, "loadMarginMs must not be negative");
  if (!(v.bufferRatio >= 1.0)) return fail(err, "bufferRatio must be >= 1");
  if (v.loadBatchSize == 0) return fail(err, "loadBatchSize must be positive");
  if (v.blocks.maxBlocks == 0) return fail(err, "maxBlocks must be positive");
  if (!findTimeframe(v.defaultTimeframe)) return fail(err, "defaultTimeframe is not a preset");
  if (!(v.autoScale.priceMargin >= 0) || !(v.autoScale.volumeHeadroom >= 0))
    return fail(err, "padding ratios must not be negative");
  if (!(v.momentumDecay > 0 && v.momentumDecay < 1))
    return fail(err, "momentum decay must be in (0, 1)");
  if (!(v.momentumFloor > 0) || !(v.momentumThreshold >= v.momentumFloor))
    return fail(err, "momentum threshold must be >= floor > 0");
  if (!(v.frameMs > 0)) return fail(err, "frameMs must be positive");
  if (!(v.smoothZoomFactor > 0 && v.smoothZoomFactor <= 1))
    return fail(err, "wheel easing must be in (0, 1]");
  if (!(v.smoothZoomEpsilon > 0)) return fail(err, "wheel epsilon must be positive");

  const auto& levels = v.lod.levels;
  if (levels.empty()) return fail(err, "lod needs at least one tier");
  for (std::size_t i = 1; i < levels.size(); ++i) {
    if (!(levels[i].barsPerPixelThreshold > levels[i - 1].barsPerPixelThreshold))
      return fail(err, "lod thresholds must be strictly ascending");
  }

  const TimeAxisConfig& t = cfg.timeAxis;
  if (t.minTicks < 1 || t.maxTicks < t.minTicks)
    return fail(err, "time axis band must satisfy 1 <= minTicks <= maxTicks");
  if (!(t.pixelsPerTick > 0)) return fail(err, "pixelsPerTick must be positive");
  const MarketSession& s = t.session;
  if (!(s.openMinute <= s.breakStartMinute && s.breakStartMinute <= s.breakEndMinute &&
        s.breakEndMinute <= s.closeMinute && s.openMinute < s.closeMinute))
    return fail(err, "session times must be ordered open <= break <= close");

  if (!(cfg.priceAxis.minTickSpacingPx > 0))
    return fail(err, "minTickSpacingPx must be positive");

  const CollisionConfig& c = cfg.collision;
  if (!(c.minSpacingPx >= 0) || !(c.initialSpacingPx >= 0))
    return fail(err, "label spacing must not be negative");
  if (!(c.targetDensity > 0 && c.targetDensity <= 1))
    return fail(err, "targetDensity must be in (0, 1]");
  if (!(c.growStepPx > 0) || !(c.shrinkStepPx > 0))
    return fail(err, "spacing steps must be positive");
  if (c.maxIterations < 1) return fail(err, "maxIterations must be positive");
  if (!(cfg.labelFontSize > 0)) return fail(err, "labelFontSize must be positive");
  if (cfg.indicatorCacheEntries == 0)
    return fail(err, "indicatorCacheEntries must be positive");
  return true;
}

bool parseEngineConfig(const std::string& json, EngineConfig& out, Error& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    err = makeError("BAD_CONFIG", "config must be a JSON object");
    std::fprintf(stderr, "[EngineConfig] %s\n", err.message.c_str());
    return false;
  }

  EngineConfig cfg = out;
  ConfigReader r(err);

  if (const auto* v = r.object(doc, "viewport")) readViewport(r, *v, cfg.viewport);
  if (doc.HasMember("lod")) readLod(r, doc["lod"], cfg.viewport.lod);
  if (const auto* t = r.object(doc, "timeAxis")) readTimeAxis(r, *t, cfg.timeAxis);
  if (const auto* p = r.object(doc, "priceAxis")) readPriceAxis(r, *p, cfg.priceAxis);
  if (const auto* c = r.object(doc, "collision")) readCollision(r, *c, cfg.collision);
  if (const auto* d = r.object(doc, "debug")) readDebug(r, *d, cfg.viewport.debug);
  r.number(doc, "labelFontSize", cfg.labelFontSize);
  r.count(doc, "indicatorCacheEntries", cfg.indicatorCacheEntries);

  if (!r.ok() || !validateEngineConfig(cfg, err)) {
    std::fprintf(stderr, "[EngineConfig] rejected: %s\n", err.message.c_str());
    return false;
  }
  out = cfg;
  return true;
}

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();
  const ViewportConfig& v = cfg.viewport;

  rapidjson::Value vp(rapidjson::kObjectType);
  vp.AddMember("minTimeSpanMs", static_cast<std::int64_t>(v.minTimeSpan), alloc);
  vp.AddMember("maxTimeSpanMs", static_cast<std::int64_t>(v.maxTimeSpan), alloc);
  vp.AddMember("loadMarginMs", static_cast<std::int64_t>(v.loadMargin), alloc);
  vp.AddMember("negligibleSpanMs", v.negligibleSpanMs, alloc);
  vp.AddMember("bufferRatio", v.bufferRatio, alloc);
  vp.AddMember("loadBatchSize", static_cast<std::uint64_t>(v.loadBatchSize), alloc);
  vp.AddMember("maxBlocks", static_cast<std::uint64_t>(v.blocks.maxBlocks), alloc);
  vp.AddMember("defaultTimeframe",
               rapidjson::Value(v.defaultTimeframe.c_str(), alloc), alloc);
  vp.AddMember("priceMargin", v.autoScale.priceMargin, alloc);
  vp.AddMember("volumeHeadroom", v.autoScale.volumeHeadroom, alloc);
  vp.AddMember("includeZero", v.autoScale.includeZero, alloc);

  rapidjson::Value momentum(rapidjson::kObjectType);
  momentum.AddMember("threshold", v.momentumThreshold, alloc);
  momentum.AddMember("floor", v.momentumFloor, alloc);
  momentum.AddMember("decay", v.momentumDecay, alloc);
  momentum.AddMember("frameMs", v.frameMs, alloc);
  vp.AddMember("momentum", momentum, alloc);

  rapidjson::Value wheel(rapidjson::kObjectType);
  wheel.AddMember("sensitivity", v.wheelSensitivity, alloc);
  wheel.AddMember("easing", v.smoothZoomFactor, alloc);
  wheel.AddMember("epsilon", v.smoothZoomEpsilon, alloc);
  vp.AddMember("wheel", wheel, alloc);
  doc.AddMember("viewport", vp, alloc);

  rapidjson::Value lod(rapidjson::kArrayType);
  for (const auto& level : v.lod.levels) {
    rapidjson::Value e(rapidjson::kObjectType);
    e.AddMember("level", level.level, alloc);
    e.AddMember("barsPerPixelThreshold", level.barsPerPixelThreshold, alloc);
    e.AddMember("aggregationFactor", level.aggregationFactor, alloc);
    e.AddMember("description", rapidjson::Value(level.description.c_str(), alloc), alloc);
    lod.PushBack(e, alloc);
  }
  doc.AddMember("lod", lod, alloc);

  const TimeAxisConfig& t = cfg.timeAxis;
  rapidjson::Value ta(rapidjson::kObjectType);
  ta.AddMember("minTicks", t.minTicks, alloc);
  ta.AddMember("maxTicks", t.maxTicks, alloc);
  ta.AddMember("pixelsPerTick", t.pixelsPerTick, alloc);
  ta.AddMember("maxSeparators", static_cast<std::uint64_t>(t.maxSeparators), alloc);
  rapidjson::Value session(rapidjson::kObjectType);
  session.AddMember("open", rapidjson::Value(clockText(t.session.openMinute).c_str(), alloc),
                    alloc);
  session.AddMember("breakStart",
                    rapidjson::Value(clockText(t.session.breakStartMinute).c_str(), alloc),
                    alloc);
  session.AddMember("breakEnd",
                    rapidjson::Value(clockText(t.session.breakEndMinute).c_str(), alloc),
                    alloc);
  session.AddMember("close", rapidjson::Value(clockText(t.session.closeMinute).c_str(), alloc),
                    alloc);
  ta.AddMember("session", session, alloc);
  doc.AddMember("timeAxis", ta, alloc);

  rapidjson::Value pa(rapidjson::kObjectType);
  pa.AddMember("minTickSpacingPx", cfg.priceAxis.minTickSpacingPx, alloc);
  pa.AddMember("scale", rapidjson::StringRef(cfg.priceAxis.mode == ScaleMode::Log ? "log"
                                                                                   : "linear"),
               alloc);
  doc.AddMember("priceAxis", pa, alloc);

  const CollisionConfig& c = cfg.collision;
  rapidjson::Value co(rapidjson::kObjectType);
  co.AddMember("minSpacingPx", c.minSpacingPx, alloc);
  co.AddMember("targetDensity", c.targetDensity, alloc);
  co.AddMember("initialSpacingPx", c.initialSpacingPx, alloc);
  co.AddMember("growStepPx", c.growStepPx, alloc);
  co.AddMember("shrinkStepPx", c.shrinkStepPx, alloc);
  co.AddMember("maxIterations", c.maxIterations, alloc);
  doc.AddMember("collision", co, alloc);

  rapidjson::Value dbg(rapidjson::kObjectType);
  dbg.AddMember("logRange", v.debug.logRange, alloc);
  dbg.AddMember("logLoads", v.debug.logLoads, alloc);
  dbg.AddMember("logLod", v.debug.logLod, alloc);
  dbg.AddMember("logIndicators", v.debug.logIndicators, alloc);
  doc.AddMember("debug", dbg, alloc);

  doc.AddMember("labelFontSize", cfg.labelFontSize, alloc);
  doc.AddMember("indicatorCacheEntries",
                static_cast<std::uint64_t>(cfg.indicatorCacheEntries), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace vc
