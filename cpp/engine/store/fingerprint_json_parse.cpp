#include "engine/store/fingerprint_json_parse.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <istream>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace folio {
namespace {

struct Cursor {
  const char* p = nullptr;
  const char* b = nullptr;
  const char* e = nullptr;

  size_t offset() const { return static_cast<size_t>(p - b); }
};

struct Loc {
  int line = 1;
  int col = 1;
};

inline void bump_loc(Loc& loc, char c) {
  if (c == '\n') { loc.line++; loc.col = 1; }
  else { loc.col++; }
}

void set_err(JsonParseError* err, const Cursor& c, const Loc& loc, std::string msg) {
  if (!err) return;
  err->message = std::move(msg);
  err->offset = c.offset();
  err->line = loc.line;
  err->col = loc.col;
}

inline bool eof(const Cursor& c) { return c.p >= c.e; }

inline bool is_digit(char ch) { return ch >= '0' && ch <= '9'; }

void advance(Cursor& c, Loc& loc) {
  bump_loc(loc, *c.p);
  ++c.p;
}

void skip_ws(Cursor& c, Loc& loc) {
  while (!eof(c) && (*c.p == ' ' || *c.p == '\t' || *c.p == '\r' || *c.p == '\n')) {
    advance(c, loc);
  }
}

bool expect(Cursor& c, Loc& loc, char ch, JsonParseError* err) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != ch) {
    set_err(err, c, loc, std::string("Expected '") + ch + "'");
    return false;
  }
  advance(c, loc);
  return true;
}

bool match_literal(Cursor& c, Loc& loc, const char* lit) {
  const char* q = c.p;
  Loc tmp = loc;
  for (const char* s = lit; *s; ++s) {
    if (q >= c.e || *q != *s) return false;
    bump_loc(tmp, *q);
    ++q;
  }
  c.p = q;
  loc = tmp;
  return true;
}

bool parse_hex4(Cursor& c, Loc& loc, JsonParseError* err, unsigned& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in \\uXXXX escape");
      return false;
    }
    const char ch = *c.p;
    unsigned v = 0;
    if (is_digit(ch)) v = static_cast<unsigned>(ch - '0');
    else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
    else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
    else {
      set_err(err, c, loc, "Invalid hex digit in \\uXXXX escape");
      return false;
    }
    out = (out << 4) | v;
    advance(c, loc);
  }
  return true;
}

void append_utf8(std::string& s, unsigned cp) {
  if (cp <= 0x7F) {
    s.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_unicode_escape(Cursor& c, Loc& loc, JsonParseError* err, std::string& out) {
  unsigned u = 0;
  if (!parse_hex4(c, loc, err, u)) return false;

  if (u >= 0xDC00 && u <= 0xDFFF) {
    set_err(err, c, loc, "Unexpected low surrogate");
    return false;
  }
  if (u < 0xD800 || u > 0xDBFF) {
    append_utf8(out, u);
    return true;
  }

  if (eof(c) || *c.p != '\\') {
    set_err(err, c, loc, "High surrogate not followed by low surrogate");
    return false;
  }
  advance(c, loc);
  if (eof(c) || *c.p != 'u') {
    set_err(err, c, loc, "High surrogate not followed by \\u");
    return false;
  }
  advance(c, loc);

  unsigned u2 = 0;
  if (!parse_hex4(c, loc, err, u2)) return false;
  if (u2 < 0xDC00 || u2 > 0xDFFF) {
    set_err(err, c, loc, "Invalid low surrogate");
    return false;
  }
  append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
  return true;
}

bool parse_string(Cursor& c, Loc& loc, JsonParseError* err, std::string& out) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != '"') {
    set_err(err, c, loc, "Expected string");
    return false;
  }
  advance(c, loc);
  out.clear();

  while (!eof(c)) {
    const char ch = *c.p;
    if (ch == '"') {
      advance(c, loc);
      return true;
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      set_err(err, c, loc, "Unescaped control character in string");
      return false;
    }
    if (ch != '\\') {
      out.push_back(ch);
      advance(c, loc);
      continue;
    }

    advance(c, loc);
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in string escape");
      return false;
    }
    const char esc = *c.p;
    advance(c, loc);
    switch (esc) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u':
        if (!parse_unicode_escape(c, loc, err, out)) return false;
        break;
      default:
        set_err(err, c, loc, "Invalid escape sequence");
        return false;
    }
  }

  set_err(err, c, loc, "Unterminated string");
  return false;
}

// Numbers are kept as their literal text; fields convert on demand.
bool scan_number(Cursor& c, Loc& loc, JsonParseError* err, std::string& out) {
  const char* start = c.p;

  if (*c.p == '-') advance(c, loc);
  if (eof(c)) {
    set_err(err, c, loc, "Expected digits after '-'");
    return false;
  }
  if (*c.p == '0') {
    advance(c, loc);
  } else if (*c.p >= '1' && *c.p <= '9') {
    while (!eof(c) && is_digit(*c.p)) advance(c, loc);
  } else {
    set_err(err, c, loc, "Invalid number");
    return false;
  }

  if (!eof(c) && *c.p == '.') {
    advance(c, loc);
    if (eof(c) || !is_digit(*c.p)) {
      set_err(err, c, loc, "Expected digits after '.'");
      return false;
    }
    while (!eof(c) && is_digit(*c.p)) advance(c, loc);
  }

  if (!eof(c) && (*c.p == 'e' || *c.p == 'E')) {
    advance(c, loc);
    if (!eof(c) && (*c.p == '+' || *c.p == '-')) advance(c, loc);
    if (eof(c) || !is_digit(*c.p)) {
      set_err(err, c, loc, "Expected digits in exponent");
      return false;
    }
    while (!eof(c) && is_digit(*c.p)) advance(c, loc);
  }

  out.assign(start, c.p);
  return true;
}

enum class JType { kNull, kBool, kNum, kStr, kObj, kArr };

struct JVal {
  JType t = JType::kNull;
  bool b = false;
  std::string str;  // string value, or number literal for kNum
  std::unordered_map<std::string, JVal> obj;
  std::vector<std::string> keys;  // object keys in input order
  std::vector<JVal> arr;
};

bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JVal& out, int depth);

constexpr int kMaxDepth = 64;

bool parse_array(Cursor& c, Loc& loc, JsonParseError* err, JVal& out, int depth) {
  if (!expect(c, loc, '[', err)) return false;
  out.t = JType::kArr;

  skip_ws(c, loc);
  if (!eof(c) && *c.p == ']') {
    advance(c, loc);
    return true;
  }

  while (true) {
    JVal v;
    if (!parse_value(c, loc, err, v, depth + 1)) return false;
    out.arr.emplace_back(std::move(v));

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in array");
      return false;
    }
    if (*c.p == ',') { advance(c, loc); continue; }
    if (*c.p == ']') { advance(c, loc); return true; }
    set_err(err, c, loc, "Expected ',' or ']'");
    return false;
  }
}

bool parse_object(Cursor& c, Loc& loc, JsonParseError* err, JVal& out, int depth) {
  if (!expect(c, loc, '{', err)) return false;
  out.t = JType::kObj;

  skip_ws(c, loc);
  if (!eof(c) && *c.p == '}') {
    advance(c, loc);
    return true;
  }

  while (true) {
    std::string key;
    if (!parse_string(c, loc, err, key)) return false;
    if (!expect(c, loc, ':', err)) return false;

    JVal val;
    if (!parse_value(c, loc, err, val, depth + 1)) return false;

    if (out.obj.find(key) == out.obj.end()) out.keys.push_back(key);
    out.obj[std::move(key)] = std::move(val);

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in object");
      return false;
    }
    if (*c.p == ',') { advance(c, loc); continue; }
    if (*c.p == '}') { advance(c, loc); return true; }
    set_err(err, c, loc, "Expected ',' or '}'");
    return false;
  }
}

bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JVal& out, int depth) {
  skip_ws(c, loc);
  if (eof(c)) {
    set_err(err, c, loc, "Unexpected EOF");
    return false;
  }
  if (depth > kMaxDepth) {
    set_err(err, c, loc, "Nesting too deep");
    return false;
  }

  const char ch = *c.p;
  if (ch == '{') return parse_object(c, loc, err, out, depth);
  if (ch == '[') return parse_array(c, loc, err, out, depth);
  if (ch == '"') {
    out.t = JType::kStr;
    return parse_string(c, loc, err, out.str);
  }
  if (ch == 't' || ch == 'f') {
    const bool v = (ch == 't');
    if (!match_literal(c, loc, v ? "true" : "false")) {
      set_err(err, c, loc, "Invalid literal");
      return false;
    }
    out.t = JType::kBool;
    out.b = v;
    return true;
  }
  if (ch == 'n') {
    if (!match_literal(c, loc, "null")) {
      set_err(err, c, loc, "Invalid literal");
      return false;
    }
    out.t = JType::kNull;
    return true;
  }
  if (ch == '-' || is_digit(ch)) {
    out.t = JType::kNum;
    return scan_number(c, loc, err, out.str);
  }

  set_err(err, c, loc, "Unexpected token");
  return false;
}

// ----------------------------- Schema mapping --------------------------------

// Schema errors carry no position: the tree has already been built.
struct SchemaCtx {
  JsonParseError* err = nullptr;
  Cursor c;
  Loc loc;

  bool fail(std::string msg) {
    set_err(err, c, loc, std::move(msg));
    return false;
  }
};

// First present key among the given names (current name first, then aliases).
const JVal* find_any(const JVal& o, std::initializer_list<const char*> names) {
  for (const char* k : names) {
    auto it = o.obj.find(k);
    if (it != o.obj.end()) return &it->second;
  }
  return nullptr;
}

bool to_size(const JVal& v, size_t& out) {
  if (v.t != JType::kNum || v.str.empty()) return false;
  for (char ch : v.str) {
    if (!is_digit(ch)) return false;  // rejects '-', '.', exponent
  }
  errno = 0;
  char* endptr = nullptr;
  const unsigned long long x = std::strtoull(v.str.c_str(), &endptr, 10);
  if (errno == ERANGE || *endptr != '\0') return false;
  if (x > std::numeric_limits<size_t>::max()) return false;
  out = static_cast<size_t>(x);
  return true;
}

bool read_string(SchemaCtx& ctx, const JVal& o, std::initializer_list<const char*> names,
                 const std::string& where, std::string& out, bool required) {
  const JVal* v = find_any(o, names);
  if (!v) {
    if (required) return ctx.fail(where + ": missing string field " + *names.begin());
    return true;
  }
  if (v->t != JType::kStr) return ctx.fail(where + ": field " + *names.begin() + " must be a string");
  out = v->str;
  return true;
}

bool read_size(SchemaCtx& ctx, const JVal& o, std::initializer_list<const char*> names,
               const std::string& where, size_t& out) {
  const JVal* v = find_any(o, names);
  if (!v) return ctx.fail(where + ": missing integer field " + *names.begin());
  if (!to_size(*v, out)) {
    return ctx.fail(where + ": field " + *names.begin() + " must be a non-negative integer");
  }
  return true;
}

bool read_shingles(SchemaCtx& ctx, const JVal& arr, const std::string& where,
                   std::vector<RareShingle>& out) {
  if (arr.t != JType::kArr) return ctx.fail(where + ": rareShingles must be an array");
  out.reserve(arr.arr.size());
  for (const auto& it : arr.arr) {
    RareShingle sh;
    if (it.t == JType::kStr) {
      sh.phrase = it.str;
    } else if (it.t == JType::kObj) {
      if (!read_string(ctx, it, {"phrase"}, where + ".rareShingles[]", sh.phrase, true)) return false;
      const JVal* tok = find_any(it, {"token"});
      if (tok) {
        size_t ti = 0;
        if (!to_size(*tok, ti) || ti > std::numeric_limits<uint32_t>::max()) {
          return ctx.fail(where + ".rareShingles[]: token must be a non-negative integer");
        }
        sh.token_index = static_cast<uint32_t>(ti);
      }
    } else {
      return ctx.fail(where + ": rareShingles elements must be strings or objects");
    }
    out.push_back(std::move(sh));
  }
  return true;
}

bool read_fingerprint(SchemaCtx& ctx, const std::string& key, const JVal& o, Fingerprint& fp) {
  const std::string where = "spans." + key;
  if (o.t != JType::kObj) return ctx.fail(where + " must be an object");

  fp.id = key;
  if (!read_string(ctx, o, {"id"}, where, fp.id, false)) return false;
  if (fp.id != key) return ctx.fail(where + ": id '" + fp.id + "' does not match its key");

  if (!read_string(ctx, o, {"parentId"}, where, fp.parent_id, false)) return false;
  if (!read_string(ctx, o, {"sha"}, where, fp.content_hash, true)) return false;
  if (!read_size(ctx, o, {"offset"}, where, fp.offset)) return false;
  if (!read_size(ctx, o, {"len", "length"}, where, fp.length)) return false;
  if (!read_string(ctx, o, {"pre", "preContext"}, where, fp.pre_context, false)) return false;
  if (!read_string(ctx, o, {"post", "postContext"}, where, fp.post_context, false)) return false;

  if (const JVal* sh = find_any(o, {"rareShingles"})) {
    if (sh->t != JType::kNull && !read_shingles(ctx, *sh, where, fp.rare_shingles)) return false;
  }

  if (const JVal* t = find_any(o, {"text"})) {
    if (t->t == JType::kStr) {
      fp.text = t->str;
    } else if (t->t != JType::kNull) {
      return ctx.fail(where + ": text must be a string");
    }
  }
  return true;
}

bool fill_collection(SchemaCtx& ctx, const JVal& root, FingerprintCollection& col) {
  if (root.t != JType::kObj) return ctx.fail("Root must be an object");

  if (!read_string(ctx, root, {"documentChecksum", "manuscript_sha"}, "root",
                   col.document_checksum, false)) {
    return false;
  }
  if (!read_string(ctx, root, {"generatedAt", "generated_at"}, "root", col.generated_at, false)) {
    return false;
  }

  const JVal* spans = find_any(root, {"spans", "scenes"});
  if (!spans) return ctx.fail("root: missing spans object");
  if (spans->t != JType::kObj) return ctx.fail("root: spans must be an object");

  for (const auto& key : spans->keys) {
    Fingerprint fp;
    if (!read_fingerprint(ctx, key, spans->obj.at(key), fp)) return false;
    col.spans.emplace(key, std::move(fp));
  }
  return true;
}

}  // namespace

bool parse_fingerprints_json(std::string_view json,
                             FingerprintCollection* out,
                             JsonParseError* err) {
  if (!out) return false;

  Cursor c;
  c.b = json.data();
  c.p = json.data();
  c.e = json.data() + json.size();
  Loc loc;

  JVal root;
  if (!parse_value(c, loc, err, root, 0)) return false;

  skip_ws(c, loc);
  if (!eof(c)) {
    set_err(err, c, loc, "Trailing characters after JSON");
    return false;
  }

  SchemaCtx ctx;
  ctx.err = err;
  ctx.c = c;
  ctx.c.p = c.b;

  FingerprintCollection col;
  if (!fill_collection(ctx, root, col)) return false;

  *out = std::move(col);
  return true;
}

bool parse_fingerprints_json(std::istream& is,
                             FingerprintCollection* out,
                             JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  const std::string buf = ss.str();
  return parse_fingerprints_json(std::string_view(buf), out, err);
}

}  // namespace folio
