#pragma once

#include <map>
#include <string>
#include <string_view>

namespace sensorweave::stream {

enum class ResourceType {
  kStream,
  kSnapshot,
  kMixed,
  kAnalysis,
};

const char* ToString(ResourceType type);

/*
  bridge://<bridge-id>/<stream|snapshot|mixed|analysis>/<stream-spec>?k=v&...

  All components are percent-decoded. A repeated query key is rejected
  rather than resolved.
*/
struct BridgeUri {
  std::string                        bridge_id;
  ResourceType                       resource = ResourceType::kStream;
  std::string                        spec;
  std::map<std::string, std::string> params;

  std::string ToString() const;
};

// throws util::InvalidArgument
BridgeUri ParseBridgeUri(std::string_view uri);

std::string PercentDecode(std::string_view in);
std::string PercentEncode(std::string_view in);

} // namespace sensorweave::stream
