#include "avlink/wire_codec.h"

#include <json/json.h>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <memory>

namespace avlink {
namespace {

constexpr std::chrono::milliseconds kAtlasTimeout{2000};
constexpr std::chrono::milliseconds kGlobalCacheTimeout{1000};
constexpr std::chrono::milliseconds kCecBridgeTimeout{5000};

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool StartsWith(const std::string& text, const char* prefix) {
  return text.rfind(prefix, 0) == 0;
}

// Pull val/pct/str out of an Atlas params or result object.
ParamValue ValueFromJson(const Json::Value& node) {
  if (node.isBool()) {
    return node.asBool() ? 1.0 : 0.0;
  }
  if (node.isNumeric()) {
    return node.asDouble();
  }
  if (node.isString()) {
    return node.asString();
  }
  if (node.isObject()) {
    for (const char* field : {"val", "pct", "str"}) {
      if (node.isMember(field)) {
        return ValueFromJson(node[field]);
      }
    }
  }
  return std::monostate{};
}

ValueFormat FormatFromParams(const Json::Value& params) {
  if (params.isMember("pct")) {
    return ValueFormat::kPct;
  }
  if (params.isMember("str")) {
    return ValueFormat::kStr;
  }
  return ValueFormat::kVal;
}

std::string StringMember(const Json::Value& node, const char* name) {
  const Json::Value& member = node[name];
  return member.isString() ? member.asString() : std::string();
}

// AtlasIED Atmosphere: JSON-RPC 2.0 over TCP, one object per '\n' line.
class AtlasCodec : public WireCodec {
 public:
  AtlasCodec() {
    writer_["indentation"] = "";
    reader_.reset(Json::CharReaderBuilder().newCharReader());
  }

  ProtocolKind kind() const override { return ProtocolKind::kAtlas; }

  bool Encode(const Command& command, std::string* out, std::string* error) override {
    if (command.parameter.empty()) {
      if (error) {
        *error = "parameter must not be empty";
      }
      return false;
    }
    Json::Value message(Json::objectValue);
    message["jsonrpc"] = "2.0";
    message["method"] = CommandKindName(command.kind);
    Json::Value params(Json::objectValue);
    params["param"] = command.parameter;
    if (command.kind == CommandKind::kSet) {
      if (!HasValue(command.value)) {
        if (error) {
          *error = "set requires a value";
        }
        return false;
      }
      const char* field = ValueFormatName(command.format);
      if (const auto* number = std::get_if<double>(&command.value)) {
        params[field] = *number;
      } else {
        params[field] = std::get<std::string>(command.value);
      }
    } else {
      params["fmt"] = ValueFormatName(command.format);
    }
    message["params"] = params;
    if (ExpectsResponse(command)) {
      message["id"] = static_cast<Json::UInt64>(next_id_++);
    }
    *out = Json::writeString(writer_, message);
    out->push_back('\n');
    return true;
  }

  bool ExpectsResponse(const Command& command) const override {
    return command.kind == CommandKind::kGet || command.kind == CommandKind::kSet;
  }

  DecodeResult Decode(const std::string& frame, Response* response,
                      ParameterUpdate* update, std::string* error) const override {
    Json::Value message;
    std::string parse_error;
    if (!reader_->parse(frame.data(), frame.data() + frame.size(), &message, &parse_error) ||
        !message.isObject()) {
      if (error) {
        *error = "invalid JSON frame: " + frame;
      }
      return DecodeResult::kMalformed;
    }
    try {
      return DecodeMessage(message, frame, response, update, error);
    } catch (const Json::Exception& ex) {
      if (error) {
        *error = std::string("unexpected JSON shape: ") + ex.what();
      }
      return DecodeResult::kMalformed;
    }
  }

  Command PingCommand() const override {
    return Command::Get("KeepAlive", ValueFormat::kStr);
  }

  std::chrono::milliseconds DefaultTimeout() const override { return kAtlasTimeout; }

  bool SupportsSubscriptions() const override { return true; }

 protected:
  char terminator() const override { return '\n'; }

 private:
  DecodeResult DecodeMessage(const Json::Value& message, const std::string& frame,
                             Response* response, ParameterUpdate* update,
                             std::string* error) const {
    const std::string method = StringMember(message, "method");
    if (method == "update") {
      const Json::Value& params = message["params"];
      if (!params.isObject()) {
        if (error) {
          *error = "update without params";
        }
        return DecodeResult::kMalformed;
      }
      update->parameter = StringMember(params, "param");
      update->value = ValueFromJson(params);
      update->format = FormatFromParams(params);
      return DecodeResult::kUpdate;
    }
    if (message.isMember("error")) {
      const Json::Value& err = message["error"];
      if (error) {
        if (err.isObject() && err["message"].isString()) {
          *error = err["message"].asString();
        } else {
          *error = Json::writeString(writer_, err);
        }
      }
      return DecodeResult::kDeviceError;
    }
    if (method == "getResp") {
      const Json::Value& params = message["params"];
      if (!params.isObject()) {
        if (error) {
          *error = "getResp without params";
        }
        return DecodeResult::kMalformed;
      }
      response->parameter = StringMember(params, "param");
      response->value = ValueFromJson(params);
      response->raw = frame;
      return DecodeResult::kResponse;
    }
    if (message.isMember("result")) {
      const Json::Value& result = message["result"];
      if (result.isArray()) {
        // Some firmware wraps a single getResp-style object in an array.
        if (result.empty()) {
          response->value = ParamValue{};
        } else {
          const Json::Value& first = result[0u];
          response->value = ValueFromJson(first);
          if (first.isObject()) {
            response->parameter = StringMember(first, "param");
          }
        }
      } else {
        response->value = ValueFromJson(result);
        if (result.isObject()) {
          response->parameter = StringMember(result, "param");
        }
      }
      response->raw = frame;
      return DecodeResult::kResponse;
    }
    return DecodeResult::kIgnored;
  }

  Json::StreamWriterBuilder writer_;
  std::unique_ptr<Json::CharReader> reader_;
  uint64_t next_id_ = 1;
};

// Global Cache iTach: CR-terminated ASCII, no pushes.
class GlobalCacheCodec : public WireCodec {
 public:
  ProtocolKind kind() const override { return ProtocolKind::kGlobalCache; }

  bool Encode(const Command& command, std::string* out, std::string* error) override {
    if (command.parameter.empty()) {
      if (error) {
        *error = "parameter must not be empty";
      }
      return false;
    }
    switch (command.kind) {
      case CommandKind::kGet:
        if (command.parameter == "version") {
          *out = "getversion";
        } else {
          *out = "get_" + command.parameter;
        }
        break;
      case CommandKind::kSet:
        *out = command.parameter;
        if (HasValue(command.value)) {
          *out += ",";
          *out += ParamValueToString(command.value);
        }
        break;
      case CommandKind::kSubscribe:
      case CommandKind::kUnsubscribe:
        if (error) {
          *error = "globalcache does not support subscriptions";
        }
        return false;
    }
    out->push_back('\r');
    return true;
  }

  bool ExpectsResponse(const Command&) const override { return true; }

  DecodeResult Decode(const std::string& frame, Response* response,
                      ParameterUpdate*, std::string* error) const override {
    if (StartsWith(frame, "ERR") || StartsWith(frame, "busyIR")) {
      if (error) {
        *error = frame;
      }
      return DecodeResult::kDeviceError;
    }
    response->value = frame;
    response->raw = frame;
    const size_t comma = frame.find(',');
    if (comma != std::string::npos) {
      response->parameter = frame.substr(0, comma);
    }
    return DecodeResult::kResponse;
  }

  Command PingCommand() const override { return Command::Get("version"); }

  std::chrono::milliseconds DefaultTimeout() const override { return kGlobalCacheTimeout; }

  bool SupportsSubscriptions() const override { return false; }

 protected:
  char terminator() const override { return '\r'; }
};

// Line interface of a network-attached cec-client.
class CecBridgeCodec : public WireCodec {
 public:
  explicit CecBridgeCodec(uint8_t logical_address) : logical_address_(logical_address) {}

  ProtocolKind kind() const override { return ProtocolKind::kCecBridge; }

  bool Encode(const Command& command, std::string* out, std::string* error) override {
    auto fail = [&](const std::string& message) {
      if (error) {
        *error = message;
      }
      return false;
    };
    switch (command.kind) {
      case CommandKind::kGet:
        if (command.parameter == "power") {
          *out = "pow " + AddressArgument(command.value);
        } else if (command.parameter == "ping") {
          *out = "ping";
        } else {
          return fail("cec bridge cannot read parameter '" + command.parameter + "'");
        }
        break;
      case CommandKind::kSet:
        if (command.parameter == "tx") {
          const std::string frame = ParamValueToString(command.value);
          if (frame.empty()) {
            return fail("tx requires a frame");
          }
          *out = "tx " + frame;
        } else if (command.parameter == "on" || command.parameter == "standby") {
          *out = command.parameter + " " + AddressArgument(command.value);
        } else if (!command.parameter.empty()) {
          *out = command.parameter;
          if (HasValue(command.value)) {
            *out += " " + ParamValueToString(command.value);
          }
        } else {
          return fail("parameter must not be empty");
        }
        break;
      case CommandKind::kSubscribe:
      case CommandKind::kUnsubscribe:
        return fail("cec bridge does not support subscriptions");
    }
    out->push_back('\n');
    return true;
  }

  bool ExpectsResponse(const Command&) const override { return true; }

  DecodeResult Decode(const std::string& frame, Response* response,
                      ParameterUpdate*, std::string* error) const override {
    if (StartsWith(frame, "ERR") || frame.find("TRANSMIT_FAILED") != std::string::npos) {
      if (error) {
        *error = frame;
      }
      return DecodeResult::kDeviceError;
    }
    static const std::string kPowerPrefix = "power status:";
    const size_t power = frame.find(kPowerPrefix);
    if (power != std::string::npos) {
      response->parameter = "power";
      response->value = Trim(frame.substr(power + kPowerPrefix.size()));
    } else {
      response->value = frame;
    }
    response->raw = frame;
    return DecodeResult::kResponse;
  }

  Command PingCommand() const override { return Command::Get("ping"); }

  std::chrono::milliseconds DefaultTimeout() const override { return kCecBridgeTimeout; }

  bool SupportsSubscriptions() const override { return false; }

 protected:
  char terminator() const override { return '\n'; }

 private:
  // Explicit target address from the command value, else the endpoint's.
  std::string AddressArgument(const ParamValue& value) const {
    if (HasValue(value)) {
      return ParamValueToString(value);
    }
    char buffer[4];
    std::snprintf(buffer, sizeof(buffer), "%x", logical_address_ & 0x0f);
    return buffer;
  }

  uint8_t logical_address_;
};

}  // namespace

std::optional<std::string> WireCodec::ExtractFrame(std::string* buffer) const {
  while (true) {
    const size_t end = buffer->find(terminator());
    if (end == std::string::npos) {
      return std::nullopt;
    }
    std::string frame = Trim(buffer->substr(0, end));
    buffer->erase(0, end + 1);
    if (!frame.empty()) {
      return frame;
    }
  }
}

std::unique_ptr<WireCodec> MakeCodec(const DeviceEndpoint& endpoint) {
  switch (endpoint.kind) {
    case ProtocolKind::kAtlas:
      return std::make_unique<AtlasCodec>();
    case ProtocolKind::kGlobalCache:
      return std::make_unique<GlobalCacheCodec>();
    case ProtocolKind::kCecBridge:
      return std::make_unique<CecBridgeCodec>(endpoint.cec_logical_address);
  }
  return nullptr;
}

}  // namespace avlink
