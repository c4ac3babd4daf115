#include "block_target.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <redlog.hpp>

#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::replay {

namespace {

auto log_target = redlog::get_logger("nbdmap.replay");

constexpr size_t k_zero_buffer_size = 1024 * 1024;

std::string errno_text(int value) { return std::strerror(value); }

} // namespace

device_target::~device_target() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

result<std::unique_ptr<device_target>> device_target::open(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    return error_result<std::unique_ptr<device_target>>(
        error_code::io_error, "cannot open " + path + " for writing: " + errno_text(errno)
    );
  }

  struct stat info {};
  if (::fstat(fd, &info) != 0) {
    int stat_errno = errno;
    ::close(fd);
    return error_result<std::unique_ptr<device_target>>(
        error_code::io_error, "cannot stat " + path + ": " + errno_text(stat_errno)
    );
  }

  bool block_device = S_ISBLK(info.st_mode);
  log_target.dbg("opened replay target", redlog::field("path", path), redlog::field("block_device", block_device));
  return ok_result(std::unique_ptr<device_target>(new device_target(path, fd, block_device)));
}

status device_target::write(uint64_t offset, std::span<const uint8_t> data) {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t wrote = ::pwrite(fd_, data.data() + done, data.size() - done, static_cast<off_t>(offset + done));
    if (wrote < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_status(
          error_code::io_error, "write to " + path_ + " at " + util::format_hex(offset + done) + " failed: " +
                                    errno_text(errno)
      );
    }
    if (wrote == 0) {
      return make_status(error_code::io_error, "short write to " + path_ + " at " + util::format_hex(offset + done));
    }
    done += static_cast<size_t>(wrote);
  }
  return ok_status();
}

status device_target::write_zeroes(uint64_t offset, uint64_t length) {
  if (length == 0) {
    return ok_status();
  }

  if (zero_offload_) {
    int rc = -1;
    if (block_device_) {
      uint64_t range[2] = {offset, length};
      rc = ::ioctl(fd_, BLKZEROOUT, range);
    } else {
      rc = ::fallocate(fd_, FALLOC_FL_ZERO_RANGE, static_cast<off_t>(offset), static_cast<off_t>(length));
    }
    if (rc == 0) {
      return ok_status();
    }
    if (errno != EOPNOTSUPP && errno != ENOTTY && errno != EINVAL) {
      return make_status(
          error_code::io_error, "zeroing " + path_ + " at " + util::format_hex(offset) + " failed: " + errno_text(errno)
      );
    }
    log_target.dbg("zero offload unsupported, writing zero buffers", redlog::field("path", path_));
    zero_offload_ = false;
  }

  return write_zero_buffer(offset, length);
}

status device_target::write_zero_buffer(uint64_t offset, uint64_t length) {
  std::vector<uint8_t> zeros(static_cast<size_t>(std::min<uint64_t>(length, k_zero_buffer_size)), 0);
  uint64_t done = 0;
  while (done < length) {
    size_t chunk = static_cast<size_t>(std::min<uint64_t>(length - done, zeros.size()));
    status wrote = write(offset + done, std::span<const uint8_t>(zeros.data(), chunk));
    if (!wrote.ok()) {
      return wrote;
    }
    done += chunk;
  }
  return ok_status();
}

status device_target::flush() {
  if (::fsync(fd_) != 0) {
    return make_status(error_code::io_error, "fsync of " + path_ + " failed: " + errno_text(errno));
  }
  return ok_status();
}

file_source_reader::~file_source_reader() {
  for (auto& [_, fd] : descriptors_) {
    ::close(fd);
  }
}

status file_source_reader::read(const std::string& path, uint64_t offset, std::span<uint8_t> out) {
  auto it = descriptors_.find(path);
  if (it == descriptors_.end()) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      return make_status(error_code::io_error, "cannot open " + path + ": " + errno_text(errno));
    }
    it = descriptors_.emplace(path, fd).first;
  }

  size_t done = 0;
  while (done < out.size()) {
    ssize_t got = ::pread(it->second, out.data() + done, out.size() - done, static_cast<off_t>(offset + done));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_status(
          error_code::io_error, "read from " + path + " at " + util::format_hex(offset + done) + " failed: " +
                                    errno_text(errno)
      );
    }
    if (got == 0) {
      return make_status(error_code::io_error, "unexpected end of " + path + " at " + util::format_hex(offset + done));
    }
    done += static_cast<size_t>(got);
  }
  return ok_status();
}

} // namespace nbdmap::replay
