#include "bridge_uri.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace sensorweave::stream {

namespace {

constexpr std::string_view kScheme = "bridge://";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

ResourceType ParseResource(std::string_view name) {
  if (name == "stream") return ResourceType::kStream;
  if (name == "snapshot") return ResourceType::kSnapshot;
  if (name == "mixed") return ResourceType::kMixed;
  if (name == "analysis") return ResourceType::kAnalysis;
  throw util::InvalidArgument("bridge uri: unknown resource type '" + std::string(name) + "'");
}

} // namespace

const char* ToString(ResourceType type) {
  switch (type) {
    case ResourceType::kStream:
      return "stream";
    case ResourceType::kSnapshot:
      return "snapshot";
    case ResourceType::kMixed:
      return "mixed";
    case ResourceType::kAnalysis:
      return "analysis";
  }
  return "stream";
}

std::string PercentDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') {
      out.push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) {
      throw util::InvalidArgument("bridge uri: truncated percent escape");
    }
    const int hi = HexValue(in[i + 1]);
    const int lo = HexValue(in[i + 2]);
    if (hi < 0 || lo < 0) throw util::InvalidArgument("bridge uri: invalid percent escape");
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

std::string PercentEncode(std::string_view in) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

BridgeUri ParseBridgeUri(std::string_view uri) {
  if (uri.substr(0, kScheme.size()) != kScheme) throw util::InvalidArgument("bridge uri: expected bridge:// scheme");
  uri.remove_prefix(kScheme.size());

  std::string_view query;
  if (auto q = uri.find('?'); q != std::string_view::npos) {
    query = uri.substr(q + 1);
    uri   = uri.substr(0, q);
  }

  const auto first_slash = uri.find('/');
  if (first_slash == std::string_view::npos) throw util::InvalidArgument("bridge uri: missing resource type");

  BridgeUri parsed;
  parsed.bridge_id = PercentDecode(uri.substr(0, first_slash));
  if (parsed.bridge_id.empty()) throw util::InvalidArgument("bridge uri: empty bridge id");

  auto rest        = uri.substr(first_slash + 1);
  auto type_end    = rest.find('/');
  parsed.resource  = ParseResource(rest.substr(0, type_end));
  if (type_end != std::string_view::npos) parsed.spec = PercentDecode(rest.substr(type_end + 1));

  while (!query.empty()) {
    auto amp  = query.find('&');
    auto pair = query.substr(0, amp);
    query     = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) continue;

    auto        eq    = pair.find('=');
    std::string key   = PercentDecode(pair.substr(0, eq));
    std::string value = eq == std::string_view::npos ? std::string() : PercentDecode(pair.substr(eq + 1));
    if (key.empty()) throw util::InvalidArgument("bridge uri: empty parameter name");
    if (!parsed.params.emplace(std::move(key), std::move(value)).second) {
      throw util::InvalidArgument("bridge uri: duplicate parameter '" + std::string(pair.substr(0, eq)) + "'");
    }
  }

  return parsed;
}

std::string BridgeUri::ToString() const {
  std::string out = std::string(kScheme) + PercentEncode(bridge_id) + "/" + stream::ToString(resource);
  if (!spec.empty()) out += "/" + PercentEncode(spec);

  char sep = '?';
  for (const auto& [key, value] : params) {
    out.push_back(sep);
    out += PercentEncode(key) + "=" + PercentEncode(value);
    sep = '&';
  }
  return out;
}

} // namespace sensorweave::stream
