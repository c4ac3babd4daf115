#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>

#include "nbdmap/base/status.hpp"

namespace nbdmap::replay {

// write side of replay: the attached device
class block_target {
public:
  virtual ~block_target() = default;

  virtual status write(uint64_t offset, std::span<const uint8_t> data) = 0;
  virtual status write_zeroes(uint64_t offset, uint64_t length) = 0;
  virtual status flush() = 0;
};

// read side of replay: payload bytes inside backup files
class source_reader {
public:
  virtual ~source_reader() = default;

  virtual status read(const std::string& path, uint64_t offset, std::span<uint8_t> out) = 0;
};

// block device node or regular file opened for writing
class device_target final : public block_target {
public:
  ~device_target() override;

  device_target(const device_target&) = delete;
  device_target& operator=(const device_target&) = delete;

  static result<std::unique_ptr<device_target>> open(const std::string& path);

  status write(uint64_t offset, std::span<const uint8_t> data) override;
  status write_zeroes(uint64_t offset, uint64_t length) override;
  status flush() override;

  const std::string& path() const { return path_; }

private:
  device_target(std::string path, int fd, bool block_device)
      : path_(std::move(path)), fd_(fd), block_device_(block_device) {}

  status write_zero_buffer(uint64_t offset, uint64_t length);

  std::string path_;
  int fd_ = -1;
  bool block_device_ = false;
  bool zero_offload_ = true;
};

// keeps one read-only descriptor per backup file
class file_source_reader final : public source_reader {
public:
  file_source_reader() = default;
  ~file_source_reader() override;

  file_source_reader(const file_source_reader&) = delete;
  file_source_reader& operator=(const file_source_reader&) = delete;

  status read(const std::string& path, uint64_t offset, std::span<uint8_t> out) override;

private:
  std::unordered_map<std::string, int> descriptors_;
};

} // namespace nbdmap::replay
