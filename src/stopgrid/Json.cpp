#include "stopgrid/Json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <system_error>

namespace stopgrid {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

void JsonValue::add(std::string key, JsonValue v)
{
  if (type != Type::Object) return;
  objectValue.emplace_back(std::move(key), std::move(v));
}

void JsonValue::push(JsonValue v)
{
  if (type != Type::Array) return;
  arrayValue.push_back(std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  int depth = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  static constexpr int kMaxDepth = 256;

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    err = "JSON parse error @" + std::to_string(i) + ": " + msg;
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[' || c == '{') {
      if (++depth > kMaxDepth) return fail("nesting too deep");
      const bool ok = (c == '[') ? parseArray(out) : parseObject(out);
      --depth;
      return ok;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(v);
    return true;
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    consume('-');
    if (!consume('0')) {
      if (!digits()) return fail("expected digit");
    }
    if (consume('.')) {
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!digits()) return fail("expected exponent digits");
    }

    double v = 0.0;
    const char* first = s.data() + start;
    const char* last = s.data() + i;
    const auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc() || res.ptr != last) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    skipWs();
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        // Surrogate pair.
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (s.compare(i, 2, "\\u") != 0) return fail("unpaired surrogate");
          i += 2;
          std::uint32_t lo = 0;
          if (!parseHex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    for (;;) {
      JsonValue v;
      if (!parseValue(v)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    for (;;) {
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val)) return false;
      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

// Shortest round-trip representation; integral values print without a fraction.
std::string NumberToJson(double v)
{
  if (v == 0.0) return "0";
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), v);
  if (res.ec != std::errc()) return "0";
  return std::string(buf, res.ptr);
}

struct Writer {
  std::ostream& os;
  const JsonWriteOptions& opt;
  bool nullForNonFinite = false;
  std::string err;

  void newline(int depth)
  {
    if (!opt.pretty) return;
    os << '\n';
    for (int k = 0; k < depth * std::max(0, opt.indent); ++k) os << ' ';
  }

  bool write(const JsonValue& v, int depth)
  {
    switch (v.type) {
    case JsonValue::Type::Null: os << "null"; return true;
    case JsonValue::Type::Bool: os << (v.boolValue ? "true" : "false"); return true;
    case JsonValue::Type::Number:
      if (!std::isfinite(v.numberValue)) {
        if (!nullForNonFinite) {
          err = "cannot serialize non-finite number";
          return false;
        }
        os << "null";
        return true;
      }
      os << NumberToJson(v.numberValue);
      return true;
    case JsonValue::Type::String: os << '"' << JsonEscape(v.stringValue) << '"'; return true;
    case JsonValue::Type::Array: return writeArray(v, depth);
    case JsonValue::Type::Object: return writeObject(v, depth);
    }
    return true;
  }

  bool writeArray(const JsonValue& v, int depth)
  {
    if (v.arrayValue.empty()) {
      os << "[]";
      return true;
    }
    os << '[';
    for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
      if (k > 0) os << ',';
      newline(depth + 1);
      if (!write(v.arrayValue[k], depth + 1)) return false;
    }
    newline(depth);
    os << ']';
    return true;
  }

  bool writeObject(const JsonValue& v, int depth)
  {
    if (v.objectValue.empty()) {
      os << "{}";
      return true;
    }

    std::vector<const std::pair<std::string, JsonValue>*> members;
    members.reserve(v.objectValue.size());
    for (const auto& kv : v.objectValue) members.push_back(&kv);
    if (opt.sortKeys) {
      std::stable_sort(members.begin(), members.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
    }

    os << '{';
    for (std::size_t k = 0; k < members.size(); ++k) {
      if (k > 0) os << ',';
      newline(depth + 1);
      os << '"' << JsonEscape(members[k]->first) << "\":";
      if (opt.pretty) os << ' ';
      if (!write(members[k]->second, depth + 1)) return false;
    }
    newline(depth);
    os << '}';
    return true;
  }
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = "JSON parse error @" + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "'";
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();

  std::string text = oss.str();
  // Tolerate a UTF-8 BOM.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }

  std::string err;
  if (!ParseJson(text, outValue, err)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  Writer w{os, opt};
  if (!w.write(value, 0)) {
    outError = w.err;
    return false;
  }
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  Writer w{oss, opt};
  w.nullForNonFinite = true;
  if (!w.write(value, 0)) return std::string();
  return oss.str();
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt)
{
  // Serialize first so a bad value never leaves a truncated file behind.
  std::ostringstream oss;
  if (!WriteJson(oss, value, outError, opt)) return false;

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open '" + path + "' for writing";
    return false;
  }
  f << oss.str();
  if (!f) {
    outError = "failed while writing '" + path + "'";
    return false;
  }
  outError.clear();
  return true;
}

} // namespace stopgrid
