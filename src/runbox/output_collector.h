#ifndef RUNBOX_OUTPUT_COLLECTOR_H_
#define RUNBOX_OUTPUT_COLLECTOR_H_

#include <mutex>
#include <string>
#include <cstdint>

// Demultiplex an attached exec stream into bounded stdout/stderr buffers.
// Stream format: frames of an 8-byte header
//   [stream type, 0, 0, 0, size (uint32, big endian)]
// followed by size bytes of payload. Frames may be split across Feed() calls.
// Feed() and the getters may be called from different threads.
class OutputCollector {
 public:
  static constexpr size_t kHeaderSize = 8;
  enum StreamType : uint8_t {
    kStdin = 0,
    kStdout = 1,
    kStderr = 2,
    kSystemErr = 3, // error message from the engine itself
  };
 private:
  mutable std::mutex mtx_;
  size_t cap_; // bytes, per stream
  std::string stdout_, stderr_;
  bool truncated_;
  uint64_t received_;
  // parser state
  uint8_t header_[kHeaderSize];
  size_t header_len_;
  uint8_t stream_;
  size_t remaining_; // payload bytes left in the current frame

  void Append_(uint8_t stream, const char* data, size_t len);
 public:
  explicit OutputCollector(size_t cap) :
      cap_(cap), truncated_(false), received_(0),
      header_{}, header_len_(0), stream_(0), remaining_(0) {}

  void Feed(const char* data, size_t len);

  std::string Stdout() const;
  std::string Stderr() const;
  bool Truncated() const;
  // total bytes fed, including headers and discarded payload
  uint64_t Received() const;
};

#endif  // RUNBOX_OUTPUT_COLLECTOR_H_
