#ifndef INCLUDE_RUNBOX_ENGINE_H_
#define INCLUDE_RUNBOX_ENGINE_H_

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <functional>

class ContainerSpec {
 public:
  std::string image;
  std::vector<std::string> command;
  std::string workdir; // inside container
  // host directory bound read-write at bind_target
  std::string bind_source, bind_target;
  std::map<std::string, std::string> labels;
  int64_t memory_limit; // bytes; also used as the swap ceiling
  bool network_disabled;

  ContainerSpec() : memory_limit(0), network_disabled(true) {}
};

class ContainerInfo {
 public:
  std::string id;
  std::string image;
  std::string state; // "created", "running", "exited", ...
  std::map<std::string, std::string> labels;
  int64_t created; // UNIX timestamp, seconds

  ContainerInfo() : created(0) {}
};

class ExecState {
 public:
  bool running;
  int exit_code;

  ExecState() : running(false), exit_code(-1) {}
};

class EngineReply {
 public:
  bool ok;
  int status; // HTTP status; 0 if the engine could not be reached
  std::string message;

  EngineReply() : ok(false), status(0) {}
  EngineReply(bool ok_, int status_, std::string message_ = "") :
      ok(ok_), status(status_), message(std::move(message_)) {}
  explicit operator bool() const { return ok; }
};

// Raw bytes of an exec stream; return false to stop reading
using StreamReceiver = std::function<bool(const char* data, size_t len)>;

// Connection to a container engine. Implementations must allow concurrent calls
// from different threads; every call below is blocking.
class ContainerEngine {
 public:
  virtual ~ContainerEngine() = default;

  virtual EngineReply Ping() = 0;
  virtual EngineReply CreateContainer(const ContainerSpec&, std::string& id) = 0;
  virtual EngineReply StartContainer(const std::string& id) = 0;
  // status is 404 if the container does not exist
  virtual EngineReply RemoveContainer(const std::string& id, bool force) = 0;

  virtual EngineReply CreateExec(
      const std::string& container_id, const std::vector<std::string>& command,
      const std::string& workdir, std::string& exec_id) = 0;
  // Returns once the process exits, the receiver returns false, the container is
  //   removed or AbortExec is called
  virtual EngineReply StartExec(const std::string& exec_id, const StreamReceiver&) = 0;
  // Unblocks a StartExec in progress on another thread; no-op if there is none
  virtual void AbortExec(const std::string& exec_id) = 0;
  virtual EngineReply InspectExec(const std::string& exec_id, ExecState&) = 0;

  // empty label = all containers
  virtual EngineReply ListContainers(const std::string& label, std::vector<ContainerInfo>&) = 0;
  virtual EngineReply PullImage(const std::string& image) = 0;
};

#endif  // INCLUDE_RUNBOX_ENGINE_H_
