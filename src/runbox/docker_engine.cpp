#include <runbox/docker_engine.h>

#include <sys/socket.h>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_utils.h"

namespace {

using nlohmann::json;

constexpr char kJsonType[] = "application/json";
constexpr int kPullRetries = 3;
constexpr auto kConnectTimeout = std::chrono::seconds(5);
constexpr auto kPullTimeout = std::chrono::minutes(10);

std::unique_ptr<httplib::Client> NewClient(const std::string& socket_path, std::chrono::seconds read_timeout) {
  auto cli = std::make_unique<httplib::Client>(socket_path);
  cli->set_address_family(AF_UNIX);
  // the engine rejects a socket path as Host
  cli->set_default_headers({{"Host", "localhost"}});
  cli->set_connection_timeout(kConnectTimeout);
  cli->set_read_timeout(read_timeout);
  return cli;
}

// {"message": "..."} on engine errors
std::string ErrorMessage(const std::string& body) {
  json j = json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    if (auto it = j.find("message"); it != j.end() && it->is_string()) return it->get<std::string>();
  }
  return body;
}

EngineReply ToReply(const httplib::Result& res) {
  if (!res) return {false, 0, "engine unreachable: " + httplib::to_string(res.error())};
  if (http_utils::IsSuccess(res->status)) return {true, res->status};
  return {false, res->status, ErrorMessage(res->body)};
}

// "python:3.11-slim" -> ("python", "3.11-slim"); a ':' before the last '/' is a registry port
std::pair<std::string, std::string> SplitImage(const std::string& image) {
  size_t slash = image.rfind('/');
  size_t colon = image.rfind(':');
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

} // namespace

DockerEngine::DockerEngine(std::string socket_path, std::string api_version) :
    socket_path_(std::move(socket_path)),
    api_prefix_(api_version.empty() ? "" : "/" + api_version),
    request_timeout_(30),
    stream_timeout_(3600) {}

EngineReply DockerEngine::Ping() {
  auto cli = NewClient(socket_path_, request_timeout_);
  return ToReply(HTTPRequest<HTTPGet>(*cli, "/_ping"));
}

EngineReply DockerEngine::CreateContainer(const ContainerSpec& spec, std::string& id) {
  json host_config = {
    {"Binds", json::array({spec.bind_source + ":" + spec.bind_target + ":rw"})},
    {"NetworkMode", spec.network_disabled ? "none" : "default"},
  };
  if (spec.memory_limit > 0) {
    host_config["Memory"] = spec.memory_limit;
    host_config["MemorySwap"] = spec.memory_limit; // no swap on top of the ceiling
  }
  json body = {
    {"Image", spec.image},
    {"Cmd", spec.command},
    {"WorkingDir", spec.workdir},
    {"Labels", spec.labels},
    {"NetworkDisabled", spec.network_disabled},
    {"AttachStdin", false},
    {"AttachStdout", false},
    {"AttachStderr", false},
    {"Tty", false},
    {"HostConfig", host_config},
  };
  auto cli = NewClient(socket_path_, request_timeout_);
  auto res = HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/create"), body.dump(), kJsonType);
  EngineReply reply = ToReply(res);
  if (!reply) return reply;
  try {
    id = json::parse(res->body).at("Id").get<std::string>();
  } catch (const json::exception& err) {
    return {false, res->status, std::string("malformed create response: ") + err.what()};
  }
  return reply;
}

EngineReply DockerEngine::StartContainer(const std::string& id) {
  auto cli = NewClient(socket_path_, request_timeout_);
  return ToReply(HTTPRequest<HTTPPost>(*cli, Endpoint("/containers/" + id + "/start"), std::string(), kJsonType));
}

EngineReply DockerEngine::RemoveContainer(const std::string& id, bool force) {
  auto cli = NewClient(socket_path_, request_timeout_);
  std::string endpoint = Endpoint("/containers/" + id + "?v=true");
  if (force) endpoint += "&force=true";
  return ToReply(HTTPRequest<HTTPDelete>(*cli, endpoint));
}

EngineReply DockerEngine::CreateExec(
    const std::string& container_id, const std::vector<std::string>& command,
    const std::string& workdir, std::string& exec_id) {
  json body = {
    {"AttachStdin", false},
    {"AttachStdout", true},
    {"AttachStderr", true},
    {"Tty", false},
    {"Cmd", command},
    {"WorkingDir", workdir},
  };
  auto cli = NewClient(socket_path_, request_timeout_);
  auto res = HTTPRequest<HTTPPost>(
      *cli, Endpoint("/containers/" + container_id + "/exec"), body.dump(), kJsonType);
  EngineReply reply = ToReply(res);
  if (!reply) return reply;
  try {
    exec_id = json::parse(res->body).at("Id").get<std::string>();
  } catch (const json::exception& err) {
    return {false, res->status, std::string("malformed exec response: ") + err.what()};
  }
  return reply;
}

EngineReply DockerEngine::StartExec(const std::string& exec_id, const StreamReceiver& receiver) {
  auto cli = NewClient(socket_path_, stream_timeout_);
  {
    std::lock_guard lck(streams_mtx_);
    streams_[exec_id] = cli.get();
  }
  httplib::Request req;
  req.method = "POST";
  req.path = Endpoint("/exec/" + exec_id + "/start");
  req.set_header("Host", "localhost");
  req.set_header("Content-Type", kJsonType);
  req.body = json{{"Detach", false}, {"Tty", false}}.dump();
  int status = 0;
  std::string error_body;
  req.response_handler = [&](const httplib::Response& res) {
    status = res.status;
    return true;
  };
  // the success body is the raw multiplexed stream, without a length
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (!http_utils::IsSuccess(status)) {
      error_body.append(data, len);
      return true;
    }
    return receiver(data, len);
  };
  spdlog::debug("POST {} (stream)", req.path);
  auto res = cli->send(req);
  {
    std::lock_guard lck(streams_mtx_);
    streams_.erase(exec_id);
  }
  if (!res) {
    // also the case if the receiver stopped the stream or AbortExec was called
    return {false, status, "exec stream ended: " + httplib::to_string(res.error())};
  }
  if (!http_utils::IsSuccess(res->status)) {
    return {false, res->status, ErrorMessage(error_body.empty() ? res->body : error_body)};
  }
  return {true, res->status};
}

void DockerEngine::AbortExec(const std::string& exec_id) {
  std::lock_guard lck(streams_mtx_);
  if (auto it = streams_.find(exec_id); it != streams_.end()) {
    spdlog::debug("Abort exec stream {}", exec_id);
    it->second->stop();
  }
}

EngineReply DockerEngine::InspectExec(const std::string& exec_id, ExecState& state) {
  auto cli = NewClient(socket_path_, request_timeout_);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/exec/" + exec_id + "/json"));
  EngineReply reply = ToReply(res);
  if (!reply) return reply;
  try {
    json j = json::parse(res->body);
    state.running = j.at("Running").get<bool>();
    // null while running
    auto& code = j.at("ExitCode");
    state.exit_code = code.is_number() ? code.get<int>() : -1;
  } catch (const json::exception& err) {
    return {false, res->status, std::string("malformed exec inspect response: ") + err.what()};
  }
  return reply;
}

EngineReply DockerEngine::ListContainers(const std::string& label, std::vector<ContainerInfo>& containers) {
  httplib::Params params{{"all", "true"}};
  if (!label.empty()) params.emplace("filters", json{{"label", json::array({label})}}.dump());
  auto cli = NewClient(socket_path_, request_timeout_);
  auto res = HTTPRequest<HTTPGet>(*cli, Endpoint("/containers/json"), params, httplib::Headers{});
  EngineReply reply = ToReply(res);
  if (!reply) return reply;
  try {
    for (auto& item : json::parse(res->body)) {
      ContainerInfo info;
      info.id = item.at("Id").get<std::string>();
      info.image = item.value("Image", "");
      info.state = item.value("State", "");
      info.created = item.value("Created", (int64_t)0);
      if (auto it = item.find("Labels"); it != item.end() && it->is_object()) {
        info.labels = it->get<std::map<std::string, std::string>>();
      }
      containers.push_back(std::move(info));
    }
  } catch (const json::exception& err) {
    return {false, res->status, std::string("malformed container list: ") + err.what()};
  }
  return reply;
}

EngineReply DockerEngine::PullImage(const std::string& image) {
  auto [name, tag] = SplitImage(image);
  spdlog::info("Pulling image {}:{}", name, tag);
  auto cli = NewClient(socket_path_, std::chrono::duration_cast<std::chrono::seconds>(kPullTimeout));
  auto res = RequestRetry<HTTPPost>(
      kPullRetries, *cli, Endpoint("/images/create?fromImage=" + name + "&tag=" + tag), std::string(), kJsonType);
  EngineReply reply = ToReply(res);
  if (!reply) return reply;
  // the body is a sequence of JSON progress messages; failures show up as {"error": ...}
  std::istringstream sin(res->body);
  for (std::string line; std::getline(sin, line);) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) continue;
    if (auto it = j.find("error"); it != j.end() && it->is_string()) {
      return {false, res->status, it->get<std::string>()};
    }
  }
  return reply;
}
