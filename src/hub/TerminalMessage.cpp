#include "TerminalMessage.hpp"

namespace sb {
string stringField(const json &j, const string &key) {
  if (!j.is_object()) {
    return "";
  }
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

optional<TerminalInfo> TerminalInfo::fromJson(const json &j) {
  if (!j.is_object()) {
    return nullopt;
  }
  TerminalInfo info;
  info.terminalId = stringField(j, "terminal_id");
  if (info.terminalId.empty()) {
    return nullopt;
  }
  info.name = stringField(j, "name");
  info.fields = j;
  return info;
}

optional<string> extractTargetTerminalId(const string &frame) {
  auto parsed = tryParseJson(frame);
  if (!parsed || !parsed->is_object()) {
    return nullopt;
  }
  auto it = parsed->find("target_terminal_id");
  if (it == parsed->end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<string>();
}

json makeRequest(const string &traceId, const string &method,
                 const string &source, const string &target, const json &req) {
  json request = {
      {"trace_id", traceId},
      {"method", method},
      {"source_terminal_id", source},
      {"target_terminal_id", target},
      {"req", req},
  };
  return request;
}

json makeResponse(const json &request, int code, const string &message,
                  const json &data) {
  json res = {{"code", code}, {"message", message}};
  if (!data.is_null()) {
    res["data"] = data;
  }
  json response = {
      {"trace_id", stringField(request, "trace_id")},
      {"method", stringField(request, "method")},
      {"source_terminal_id", HOST_TERMINAL_ID},
      {"target_terminal_id", stringField(request, "source_terminal_id")},
      {"res", res},
  };
  return response;
}

json makeChannelFrame(const string &traceId, const string &target,
                      const json &value) {
  json frame = {
      {"trace_id", traceId},
      {"source_terminal_id", HOST_TERMINAL_ID},
      {"target_terminal_id", target},
      {"frame", value},
  };
  return frame;
}
}  // namespace sb
