#include "landcompat/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace landcompat {

JsonValue JsonValue::MakeNull() { return JsonValue{}; }

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

JsonValue& JsonValue::set(const std::string& key, JsonValue v)
{
  if (!isObject()) return *this;
  for (auto& kv : objectValue) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return *this;
    }
  }
  objectValue.emplace_back(key, std::move(v));
  return *this;
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
  out.reserve(s.size() + 8);
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

void AppendUtf8(std::string& out, unsigned int cp)
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

// Nesting limit; deeper documents are rejected instead of overflowing the stack.
constexpr int kMaxDepth = 256;

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  int depth = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
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
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < i && k < s.size(); ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at line " << line << ", column " << col << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0' && i >= s.size()) return fail("unexpected end of input");

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

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno == ERANGE || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(unsigned int& out)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<unsigned int>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned int>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned int>(h - 'A' + 10);
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
        unsigned int cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: must be followed by \uDC00..\uDFFF.
          if (!(consume('\\') && consume('u'))) return fail("unpaired surrogate in \\u escape");
          unsigned int lo = 0;
          if (!parseHex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate in \\u escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
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

void Indent(std::ostream& os, const JsonWriteOptions& opt, int depth)
{
  if (!opt.pretty) return;
  os << '\n';
  for (int k = 0; k < depth * opt.indent; ++k) os << ' ';
}

bool WriteValue(std::ostream& os, const JsonValue& v, const JsonWriteOptions& opt, int depth, std::string& outError)
{
  switch (v.type) {
  case JsonValue::Type::Null: os << "null"; break;
  case JsonValue::Type::Bool: os << (v.boolValue ? "true" : "false"); break;
  case JsonValue::Type::Number: {
    if (!std::isfinite(v.numberValue)) {
      outError = "cannot write non-finite number as JSON";
      return false;
    }
    const double r = std::round(v.numberValue);
    if (r == v.numberValue && std::fabs(r) < 9.0e15) {
      os << static_cast<long long>(r);
    } else {
      os << std::setprecision(std::numeric_limits<double>::max_digits10) << v.numberValue;
    }
    break;
  }
  case JsonValue::Type::String: os << '"' << JsonEscape(v.stringValue) << '"'; break;
  case JsonValue::Type::Array: {
    os << '[';
    for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
      if (k > 0) os << ',';
      Indent(os, opt, depth + 1);
      if (!WriteValue(os, v.arrayValue[k], opt, depth + 1, outError)) return false;
    }
    if (!v.arrayValue.empty()) Indent(os, opt, depth);
    os << ']';
    break;
  }
  case JsonValue::Type::Object: {
    os << '{';
    for (std::size_t k = 0; k < v.objectValue.size(); ++k) {
      if (k > 0) os << ',';
      Indent(os, opt, depth + 1);
      os << '"' << JsonEscape(v.objectValue[k].first) << '"' << (opt.pretty ? ": " : ":");
      if (!WriteValue(os, v.objectValue[k].second, opt, depth + 1, outError)) return false;
    }
    if (!v.objectValue.empty()) Indent(os, opt, depth);
    os << '}';
    break;
  }
  }
  return true;
}

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
    p.fail("trailing characters");
    outError = p.err;
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  if (!WriteValue(os, value, opt, 0, outError)) return false;
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "failed to write JSON output";
    return false;
  }
  outError.clear();
  return true;
}

} // namespace landcompat
