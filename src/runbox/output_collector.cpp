#include "output_collector.h"

#include <algorithm>

#include <spdlog/spdlog.h>

void OutputCollector::Append_(uint8_t stream, const char* data, size_t len) {
  std::string* buf;
  switch (stream) {
    case kStdout: buf = &stdout_; break;
    case kStderr: [[fallthrough]];
    case kSystemErr: buf = &stderr_; break;
    default:
      spdlog::debug("Dropping {} bytes of stream type {}", len, (int)stream);
      return;
  }
  size_t room = buf->size() < cap_ ? cap_ - buf->size() : 0;
  if (len > room) {
    if (!truncated_) spdlog::info("Output exceeds {} bytes, truncating", cap_);
    truncated_ = true;
    len = room;
  }
  buf->append(data, len);
}

void OutputCollector::Feed(const char* data, size_t len) {
  std::lock_guard lck(mtx_);
  received_ += len;
  while (len > 0) {
    if (remaining_ == 0) {
      size_t take = std::min(kHeaderSize - header_len_, len);
      std::copy(data, data + take, header_ + header_len_);
      header_len_ += take;
      data += take, len -= take;
      if (header_len_ < kHeaderSize) break;
      header_len_ = 0;
      stream_ = header_[0];
      remaining_ = (size_t)header_[4] << 24 | (size_t)header_[5] << 16 |
                   (size_t)header_[6] << 8 | (size_t)header_[7];
      continue;
    }
    size_t take = std::min(remaining_, len);
    Append_(stream_, data, take);
    data += take, len -= take;
    remaining_ -= take;
  }
}

std::string OutputCollector::Stdout() const {
  std::lock_guard lck(mtx_);
  return stdout_;
}

std::string OutputCollector::Stderr() const {
  std::lock_guard lck(mtx_);
  return stderr_;
}

bool OutputCollector::Truncated() const {
  std::lock_guard lck(mtx_);
  return truncated_;
}

uint64_t OutputCollector::Received() const {
  std::lock_guard lck(mtx_);
  return received_;
}
