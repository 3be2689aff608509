#ifndef INCLUDE_RUNBOX_DOCKER_ENGINE_H_
#define INCLUDE_RUNBOX_DOCKER_ENGINE_H_

#include <mutex>
#include <chrono>
#include <string>
#include <unordered_map>

#include "engine.h"

namespace httplib {
class Client;
} // namespace httplib

// Docker Engine API over the local control socket.
// Each call opens its own connection, so concurrent requests never share a socket.
class DockerEngine : public ContainerEngine {
  std::string socket_path_;
  std::string api_prefix_; // "/v1.41"
  std::chrono::seconds request_timeout_;
  std::chrono::seconds stream_timeout_;

  std::mutex streams_mtx_;
  std::unordered_map<std::string, httplib::Client*> streams_; // exec id -> in-flight client

  std::string Endpoint(const std::string& path) const { return api_prefix_ + path; }
 public:
  explicit DockerEngine(std::string socket_path, std::string api_version = "v1.41");

  // backstop for exec streams that produce nothing; executions are normally
  //   ended earlier by AbortExec
  void SetStreamTimeout(std::chrono::seconds timeout) { stream_timeout_ = timeout; }
  const std::string& SocketPath() const { return socket_path_; }

  EngineReply Ping() override;
  EngineReply CreateContainer(const ContainerSpec&, std::string& id) override;
  EngineReply StartContainer(const std::string& id) override;
  EngineReply RemoveContainer(const std::string& id, bool force) override;
  EngineReply CreateExec(
      const std::string& container_id, const std::vector<std::string>& command,
      const std::string& workdir, std::string& exec_id) override;
  EngineReply StartExec(const std::string& exec_id, const StreamReceiver&) override;
  void AbortExec(const std::string& exec_id) override;
  EngineReply InspectExec(const std::string& exec_id, ExecState&) override;
  EngineReply ListContainers(const std::string& label, std::vector<ContainerInfo>&) override;
  EngineReply PullImage(const std::string& image) override;
};

#endif  // INCLUDE_RUNBOX_DOCKER_ENGINE_H_
