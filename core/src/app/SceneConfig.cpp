#include "ps/app/SceneConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace ps {

namespace {

class Reader {
public:
  Reader(const rapidjson::Value& root, std::vector<std::string>& warnings)
    : root_(root), warnings_(warnings) {}

  void readInt(const char* key, int& out, int minValue) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsInt() || v->GetInt() < minValue) { warn(key, "an integer"); return; }
    out = v->GetInt();
  }

  void readDouble(const char* key, double& out) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsNumber()) { warn(key, "a number"); return; }
    out = v->GetDouble();
  }

  // Durations must be strictly positive.
  void readSeconds(const char* key, double& out) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsNumber() || !(v->GetDouble() > 0.0)) { warn(key, "a positive number"); return; }
    out = v->GetDouble();
  }

  void readBool(const char* key, bool& out) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsBool()) { warn(key, "a boolean"); return; }
    out = v->GetBool();
  }

  void readString(const char* key, std::string& out) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsString()) { warn(key, "a string"); return; }
    out = v->GetString();
  }

  void readFloats(const char* key, float* out, rapidjson::SizeType count) {
    const rapidjson::Value* v = find(key);
    if (!v) return;
    if (!v->IsArray() || v->Size() != count) { warn(key, "a number array"); return; }
    for (rapidjson::SizeType i = 0; i < count; i++) {
      if (!(*v)[i].IsNumber()) { warn(key, "a number array"); return; }
    }
    for (rapidjson::SizeType i = 0; i < count; i++)
      out[i] = static_cast<float>((*v)[i].GetDouble());
  }

private:
  const rapidjson::Value& root_;
  std::vector<std::string>& warnings_;

  const rapidjson::Value* find(const char* key) const {
    auto it = root_.FindMember(key);
    return it == root_.MemberEnd() ? nullptr : &it->value;
  }

  void warn(const char* key, const char* expected) {
    std::string msg = std::string("'") + key + "' should be " + expected + ", keeping default";
    std::fprintf(stderr, "SceneConfig: %s\n", msg.c_str());
    warnings_.push_back(msg);
  }
};

} // namespace

SceneConfigResult parseSceneConfig(const std::string& json) {
  SceneConfigResult r;
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    r.error = std::string("JSON parse error at offset ") +
              std::to_string(doc.GetErrorOffset()) + ": " +
              rapidjson::GetParseError_En(doc.GetParseError());
    return r;
  }
  if (!doc.IsObject()) {
    r.error = "config root must be an object";
    return r;
  }

  SceneConfig& c = r.config;
  Reader rd(doc, r.warnings);

  // Window
  rd.readInt("windowWidth", c.windowWidth, 1);
  rd.readInt("windowHeight", c.windowHeight, 1);
  rd.readString("title", c.title);
  rd.readFloats("clearColor", c.clearColor, 4);

  // Lighting
  rd.readFloats("lightDir", c.lightDir, 3);
  rd.readFloats("lightColor", c.lightColor, 3);
  rd.readInt("shadowMapSize", c.shadowMapSize, 1);

  // Text
  rd.readSeconds("cursorBlinkSeconds", c.cursorBlinkSeconds);
  rd.readInt("glyphPixelSize", c.glyphPixelSize, 1);
  rd.readFloats("textOrigin", c.textOrigin, 2);
  rd.readSeconds("waitSeconds", c.waitSeconds);
  rd.readSeconds("deleteSeconds", c.deleteSeconds);
  rd.readSeconds("appendSeconds", c.appendSeconds);

  rd.readDouble("cameraSpin", c.cameraSpin);
  rd.readBool("postprocess", c.postprocess);
  rd.readString("assetDir", c.assetDir);
  rd.readString("fontPath", c.fontPath);

  r.ok = true;
  return r;
}

SceneConfigResult loadSceneConfigFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    SceneConfigResult r;
    r.error = "cannot open " + path;
    return r;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return parseSceneConfig(ss.str());
}

} // namespace ps
