#include "hexregion/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace hexregion {

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

void JsonValue::set(const std::string& key, JsonValue v)
{
  if (!isObject()) return;
  for (auto& kv : objectValue) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return;
    }
  }
  objectValue.emplace_back(key, std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
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
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(ch));
        out += buf;
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

namespace {

static void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
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

class JsonReader {
public:
  explicit JsonReader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 256;

  void skipWs()
  {
    while (m_i < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_i])) != 0) ++m_i;
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) m_err = "JSON parse error @" + std::to_string(m_i) + ": " + msg;
    return false;
  }

  bool literal(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (m_s.compare(m_i, w.size(), w) != 0) return fail("expected '" + w + "'");
    m_i += w.size();
    out = std::move(v);
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();
    const char c = peek();
    switch (c) {
    case '\0': return fail("unexpected end of input");
    case 'n': return literal("null", JsonValue::MakeNull(), out);
    case 't': return literal("true", JsonValue::MakeBool(true), out);
    case 'f': return literal("false", JsonValue::MakeBool(false), out);
    case '"': {
      std::string s;
      if (!string(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return number(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_i;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_i;
    if (peek() == '-') ++m_i;
    if (peek() == '0') {
      ++m_i;
    } else if (!digits()) {
      return fail("expected digit");
    }
    if (peek() == '.') {
      ++m_i;
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string text = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || !end || *end != '\0') return fail("invalid number '" + text + "'");
    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool hex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool string(std::string& out)
  {
    if (peek() != '"') return fail("expected string");
    ++m_i;

    std::string result;
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }
      if (m_i >= m_s.size()) break;
      const char e = m_s[m_i++];
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
        if (!hex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t lo = 0;
          if (m_s.compare(m_i, 2, "\\u") != 0) return fail("unpaired surrogate");
          m_i += 2;
          if (!hex4(lo)) return false;
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

  bool array(JsonValue& out, int depth)
  {
    ++m_i; // '['
    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (peek() == ']') {
      ++m_i;
      out = std::move(arr);
      return true;
    }
    while (true) {
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      arr.arrayValue.push_back(std::move(v));
      skipWs();
      if (peek() == ']') {
        ++m_i;
        break;
      }
      if (peek() != ',') return fail("expected ',' or ']'");
      ++m_i;
    }
    out = std::move(arr);
    return true;
  }

  bool object(JsonValue& out, int depth)
  {
    ++m_i; // '{'
    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (peek() == '}') {
      ++m_i;
      out = std::move(obj);
      return true;
    }
    while (true) {
      skipWs();
      std::string key;
      if (!string(key)) return false;
      skipWs();
      if (peek() != ':') return fail("expected ':'");
      ++m_i;
      JsonValue v;
      if (!value(v, depth + 1)) return false;
      obj.objectValue.emplace_back(std::move(key), std::move(v));
      skipWs();
      if (peek() == '}') {
        ++m_i;
        break;
      }
      if (peek() != ',') return fail("expected ',' or '}'");
      ++m_i;
    }
    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

static void WriteNumber(std::ostringstream& oss, double v)
{
  if (!std::isfinite(v)) {
    oss << "null";
    return;
  }
  if (v == std::floor(v) && std::fabs(v) < 1e15) {
    oss << static_cast<long long>(v);
    return;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  oss << buf;
}

static void NewLine(std::ostringstream& oss, int indent, int depth)
{
  if (indent < 0) return;
  oss << '\n';
  for (int i = 0; i < indent * depth; ++i) oss << ' ';
}

static void WriteValue(std::ostringstream& oss, const JsonValue& v, int indent, int depth)
{
  switch (v.type) {
  case JsonValue::Type::Null: oss << "null"; break;
  case JsonValue::Type::Bool: oss << (v.boolValue ? "true" : "false"); break;
  case JsonValue::Type::Number: WriteNumber(oss, v.numberValue); break;
  case JsonValue::Type::String: oss << '"' << JsonEscape(v.stringValue) << '"'; break;
  case JsonValue::Type::Array:
    oss << '[';
    for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
      if (i > 0) oss << ',';
      NewLine(oss, indent, depth + 1);
      WriteValue(oss, v.arrayValue[i], indent, depth + 1);
    }
    if (!v.arrayValue.empty()) NewLine(oss, indent, depth);
    oss << ']';
    break;
  case JsonValue::Type::Object:
    oss << '{';
    for (std::size_t i = 0; i < v.objectValue.size(); ++i) {
      if (i > 0) oss << ',';
      NewLine(oss, indent, depth + 1);
      oss << '"' << JsonEscape(v.objectValue[i].first) << "\":" << (indent >= 0 ? " " : "");
      WriteValue(oss, v.objectValue[i].second, indent, depth + 1);
    }
    if (!v.objectValue.empty()) NewLine(oss, indent, depth);
    oss << '}';
    break;
  }
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  JsonReader reader(text);
  JsonValue v;
  if (!reader.document(v)) {
    outError = reader.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, int indent)
{
  std::ostringstream oss;
  WriteValue(oss, value, indent, 0);
  return oss.str();
}

} // namespace hexregion
