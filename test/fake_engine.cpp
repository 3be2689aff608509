#include "fake_engine.h"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <filesystem>

#include "executor.h"

namespace {

FakeEngine::Behavior CatLastArgument(const ContainerSpec& spec, const std::vector<std::string>& command) {
  FakeEngine::Behavior ret;
  std::ifstream fin(std::filesystem::path(spec.bind_source) / command.back());
  if (!fin) {
    ret.err = command.back() + ": not found\n";
    ret.exit_code = 127;
    return ret;
  }
  std::stringstream buf;
  buf << fin.rdbuf();
  ret.out = buf.str();
  return ret;
}

} // namespace

std::vector<char> FakeEngine::Frame(uint8_t stream, const std::string& payload) {
  std::vector<char> ret = {(char)stream, 0, 0, 0,
    (char)(payload.size() >> 24 & 0xff), (char)(payload.size() >> 16 & 0xff),
    (char)(payload.size() >> 8 & 0xff), (char)(payload.size() & 0xff)};
  ret.insert(ret.end(), payload.begin(), payload.end());
  return ret;
}

EngineReply FakeEngine::Ping() {
  if (!available) return {false, 0, "connection refused"};
  return {true, 200};
}

EngineReply FakeEngine::CreateContainer(const ContainerSpec& spec, std::string& id) {
  if (!available) return {false, 0, "connection refused"};
  if (fail_create) return {false, 500, "create failed"};
  std::lock_guard lck(mtx_);
  if (!present_images.empty() && !present_images.count(spec.image)) {
    return {false, 404, "No such image: " + spec.image};
  }
  id = "container" + std::to_string(++seq_);
  containers_[id] = {spec, false};
  specs_.push_back(spec);
  created++;
  return {true, 201};
}

EngineReply FakeEngine::StartContainer(const std::string& id) {
  if (fail_start) return {false, 500, "start failed"};
  std::lock_guard lck(mtx_);
  auto it = containers_.find(id);
  if (it == containers_.end()) return {false, 404, "No such container: " + id};
  it->second.running = true;
  started++;
  return {true, 204};
}

EngineReply FakeEngine::RemoveContainer(const std::string& id, bool force) {
  if (fail_remove) return {false, 500, "remove failed"};
  {
    std::lock_guard lck(mtx_);
    auto it = containers_.find(id);
    if (it == containers_.end()) return {false, 404, "No such container: " + id};
    if (it->second.running && !force) return {false, 409, "container is running"};
    containers_.erase(it);
    removed++;
  }
  // killing the container ends its exec streams
  cv_.notify_all();
  return {true, 204};
}

EngineReply FakeEngine::CreateExec(
    const std::string& container_id, const std::vector<std::string>& command,
    const std::string& workdir, std::string& exec_id) {
  if (fail_exec_create) return {false, 500, "exec create failed"};
  std::lock_guard lck(mtx_);
  auto it = containers_.find(container_id);
  if (it == containers_.end()) return {false, 404, "No such container: " + container_id};
  if (!it->second.running) return {false, 409, "Container " + container_id + " is not running"};
  exec_id = "exec" + std::to_string(++seq_);
  execs_[exec_id] = {container_id, command};
  if (command != ScrubCommand()) commands_.push_back(command);
  return {true, 201};
}

EngineReply FakeEngine::StartExec(const std::string& exec_id, const StreamReceiver& receiver) {
  if (fail_exec_start) return {false, 500, "exec start failed"};
  ContainerSpec spec;
  std::vector<std::string> command;
  {
    std::lock_guard lck(mtx_);
    auto it = execs_.find(exec_id);
    if (it == execs_.end()) return {false, 404, "No such exec instance: " + exec_id};
    auto cont = containers_.find(it->second.container_id);
    if (cont == containers_.end()) return {false, 409, "container is gone"};
    spec = cont->second.spec;
    command = it->second.command;
    if (command == ScrubCommand()) {
      // kill -9 -1: every other process of the container dies
      for (auto& [id, exec] : execs_) {
        if (id != exec_id && exec.container_id == it->second.container_id) exec.aborted = true;
      }
      it->second.exit_code = 0;
      scrubbed++;
    } else {
      it->second.running = true;
    }
  }
  if (command == ScrubCommand()) {
    cv_.notify_all();
    return {true, 200};
  }
  Behavior behavior = script ? script(spec, command) : CatLastArgument(spec, command);
  std::vector<char> stream;
  if (!behavior.out.empty()) {
    auto frame = Frame(1, behavior.out);
    stream.insert(stream.end(), frame.begin(), frame.end());
  }
  if (!behavior.err.empty()) {
    auto frame = Frame(2, behavior.err);
    stream.insert(stream.end(), frame.begin(), frame.end());
  }
  size_t chunk = std::max<size_t>(behavior.chunk, 1);
  for (size_t i = 0; i < stream.size(); i += chunk) {
    if (!receiver(stream.data() + i, std::min(chunk, stream.size() - i))) {
      return {false, 0, "stream cancelled"};
    }
  }
  std::unique_lock lck(mtx_);
  Exec& exec = execs_[exec_id];
  if (behavior.hang) {
    cv_.wait(lck, [&]() { return exec.aborted || !containers_.count(exec.container_id); });
    exec.running = false;
    return {false, 0, "stream closed"};
  }
  exec.running = false;
  exec.exit_code = behavior.exit_code;
  return {true, 200};
}

void FakeEngine::AbortExec(const std::string& exec_id) {
  {
    std::lock_guard lck(mtx_);
    auto it = execs_.find(exec_id);
    if (it == execs_.end()) return;
    it->second.aborted = true;
  }
  cv_.notify_all();
}

EngineReply FakeEngine::InspectExec(const std::string& exec_id, ExecState& state) {
  std::lock_guard lck(mtx_);
  auto it = execs_.find(exec_id);
  if (it == execs_.end()) return {false, 404, "No such exec instance: " + exec_id};
  state.running = it->second.running;
  state.exit_code = it->second.exit_code;
  return {true, 200};
}

EngineReply FakeEngine::ListContainers(const std::string& label, std::vector<ContainerInfo>& ret) {
  if (!available) return {false, 0, "connection refused"};
  std::lock_guard lck(mtx_);
  for (auto& [id, container] : containers_) {
    if (!label.empty() && !container.spec.labels.count(label)) continue;
    ContainerInfo info;
    info.id = id;
    info.image = container.spec.image;
    info.state = container.running ? "running" : "created";
    info.labels = container.spec.labels;
    ret.push_back(std::move(info));
  }
  return {true, 200};
}

EngineReply FakeEngine::PullImage(const std::string& image) {
  if (!available) return {false, 0, "connection refused"};
  std::lock_guard lck(mtx_);
  if (!present_images.empty()) present_images.insert(image);
  pulled++;
  return {true, 200};
}

size_t FakeEngine::LiveContainers() const {
  std::lock_guard lck(mtx_);
  return containers_.size();
}

bool FakeEngine::IsLive(const std::string& id) const {
  std::lock_guard lck(mtx_);
  return containers_.count(id);
}

std::vector<ContainerSpec> FakeEngine::Specs() const {
  std::lock_guard lck(mtx_);
  return specs_;
}

std::vector<std::vector<std::string>> FakeEngine::Commands() const {
  std::lock_guard lck(mtx_);
  return commands_;
}

std::string FakeEngine::AddOrphan(const std::string& label) {
  std::lock_guard lck(mtx_);
  std::string id = "orphan" + std::to_string(++seq_);
  ContainerSpec spec;
  spec.image = "python:3.11-slim";
  spec.labels[label] = "1";
  containers_[id] = {spec, true};
  return id;
}
