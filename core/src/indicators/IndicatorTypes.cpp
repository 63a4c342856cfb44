#include "vc/indicators/IndicatorTypes.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace vc {

// NaN/Inf are written as literals instead of failing the write.
using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>,
                                     rapidjson::UTF8<>, rapidjson::CrtAllocator,
                                     rapidjson::kWriteNanAndInfFlag>;

IndicatorParams& IndicatorParams::set(const std::string& key, double value) {
  texts_.erase(key);
  numbers_[key] = value;
  return *this;
}

IndicatorParams& IndicatorParams::set(const std::string& key, const std::string& value) {
  numbers_.erase(key);
  texts_[key] = value;
  return *this;
}

bool IndicatorParams::has(const std::string& key) const {
  return numbers_.count(key) != 0 || texts_.count(key) != 0;
}

double IndicatorParams::number(const std::string& key, double fallback) const {
  auto it = numbers_.find(key);
  return it != numbers_.end() ? it->second : fallback;
}

int IndicatorParams::integer(const std::string& key, int fallback) const {
  auto it = numbers_.find(key);
  if (it == numbers_.end() || !std::isfinite(it->second)) return fallback;
  return static_cast<int>(std::lround(it->second));
}

std::string IndicatorParams::text(const std::string& key, const std::string& fallback) const {
  auto it = texts_.find(key);
  return it != texts_.end() ? it->second : fallback;
}

IndicatorParams IndicatorParams::withDefaults(const IndicatorParams& defaults) const {
  IndicatorParams merged = defaults;
  for (const auto& kv : numbers_) merged.set(kv.first, kv.second);
  for (const auto& kv : texts_) merged.set(kv.first, kv.second);
  return merged;
}

std::string IndicatorParams::toJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  // Merge both maps in key order.
  w.StartObject();
  auto n = numbers_.begin();
  auto t = texts_.begin();
  while (n != numbers_.end() || t != texts_.end()) {
    bool takeNumber = t == texts_.end() || (n != numbers_.end() && n->first < t->first);
    if (takeNumber) {
      w.Key(n->first.c_str());
      w.Double(n->second);
      ++n;
    } else {
      w.Key(t->first.c_str());
      w.String(t->second.c_str());
      ++t;
    }
  }
  w.EndObject();
  return sb.GetString();
}

bool IndicatorParams::fromJson(const std::string& json, IndicatorParams& out, Error& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    err = makeError("BAD_PARAMS", "params must be a JSON object");
    return false;
  }

  IndicatorParams parsed;
  for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
    std::string key = it->name.GetString();
    if (it->value.IsNumber()) {
      parsed.set(key, it->value.GetDouble());
    } else if (it->value.IsString()) {
      parsed.set(key, std::string(it->value.GetString()));
    } else {
      err = makeError("BAD_PARAMS", "param '" + key + "' must be a number or string");
      return false;
    }
  }
  out = parsed;
  return true;
}

const std::vector<double>* IndicatorResult::column(const std::string& plot) const {
  for (std::size_t i = 0; i < plots.size() && i < values.size(); ++i) {
    if (plots[i] == plot) return &values[i];
  }
  return nullptr;
}

bool IndicatorResult::isNull(std::size_t bar) const {
  for (std::size_t p = 0; p < values.size(); ++p) {
    if (hasValue(p, bar)) return false;
  }
  return true;
}

static void writeArray(JsonWriter& w, const char* key,
                       const std::vector<double>& v) {
  w.Key(key);
  w.StartArray();
  for (double x : v) w.Double(x);
  w.EndArray();
}

std::string ScalarInputs::toJson() const {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeArray(w, "returns", returns);
  writeArray(w, "prices", prices);
  writeArray(w, "benchmark", benchmarkReturns);
  w.Key("riskFree");
  w.Double(riskFreeRate);
  w.Key("confidence");
  w.Double(confidence);
  w.Key("fundamentals");
  w.StartObject();
  for (const auto& kv : fundamentals) {
    w.Key(kv.first.c_str());
    w.Double(kv.second);
  }
  w.EndObject();
  w.EndObject();
  return sb.GetString();
}

} // namespace vc
