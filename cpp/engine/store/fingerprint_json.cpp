/*
================================================================================
Fragment 5.1 - Store: Fingerprint JSON Serializer (Implementation)
FILE: cpp/engine/store/fingerprint_json.cpp
================================================================================
*/

#include "engine/store/fingerprint_json.hpp"

#include <cstdint>
#include <sstream>

namespace folio {

static std::string json_escape(const std::string& s) {
  static const char* kHex = "0123456789abcdef";
  std::string o;
  o.reserve(s.size() + 2);
  o.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      default: {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20) {
          o += "\\u00";
          o.push_back(kHex[uc >> 4]);
          o.push_back(kHex[uc & 0x0F]);
        } else {
          o.push_back(c);
        }
      }
    }
  }
  o.push_back('"');
  return o;
}

struct J {
  std::ostringstream out;
  bool pretty = true;
  int indent = 2;
  int level = 0;

  void nl() {
    if (pretty) out << "\n" << std::string(level * indent, ' ');
  }

  void obj_begin() { out << "{"; level++; }
  void obj_end()   { level--; nl(); out << "}"; }

  void arr_begin() { out << "["; level++; }
  void arr_end()   { level--; nl(); out << "]"; }

  void key(const std::string& k) {
    out << json_escape(k) << (pretty ? ": " : ":");
  }

  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void num_u(uint64_t v) { out << v; }
};

static void emit_fingerprint(J& j, const Fingerprint& fp) {
  j.obj_begin(); j.nl();

  j.key("id"); j.str(fp.id); j.comma(); j.nl();
  if (!fp.parent_id.empty()) {
    j.key("parentId"); j.str(fp.parent_id); j.comma(); j.nl();
  }
  j.key("sha"); j.str(fp.content_hash); j.comma(); j.nl();
  j.key("offset"); j.num_u(fp.offset); j.comma(); j.nl();
  j.key("len"); j.num_u(fp.length); j.comma(); j.nl();
  j.key("pre"); j.str(fp.pre_context); j.comma(); j.nl();
  j.key("post"); j.str(fp.post_context);

  if (!fp.rare_shingles.empty()) {
    j.comma(); j.nl();
    j.key("rareShingles"); j.arr_begin();
    for (size_t i = 0; i < fp.rare_shingles.size(); ++i) {
      j.nl(); j.obj_begin(); j.nl();
      j.key("phrase"); j.str(fp.rare_shingles[i].phrase); j.comma(); j.nl();
      j.key("token"); j.num_u(fp.rare_shingles[i].token_index);
      j.obj_end();
      if (i + 1 < fp.rare_shingles.size()) j.comma();
    }
    j.arr_end();
  }

  if (fp.text) {
    j.comma(); j.nl();
    j.key("text"); j.str(*fp.text);
  }

  j.obj_end();
}

std::string fingerprints_to_json(const FingerprintCollection& c, bool pretty) {
  J j;
  j.pretty = pretty;

  j.obj_begin(); j.nl();
  j.key("documentChecksum"); j.str(c.document_checksum); j.comma(); j.nl();
  j.key("generatedAt"); j.str(c.generated_at); j.comma(); j.nl();

  j.key("spans"); j.obj_begin();
  size_t i = 0;
  for (const auto& [id, fp] : c.spans) {
    j.nl();
    j.key(id); emit_fingerprint(j, fp);
    if (++i < c.spans.size()) j.comma();
  }
  if (c.spans.empty()) {
    j.level--;
    j.out << "}";
  } else {
    j.obj_end();
  }

  j.obj_end();
  if (pretty) j.out << "\n";
  return j.out.str();
}

} // namespace folio
