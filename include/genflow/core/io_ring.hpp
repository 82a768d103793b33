#pragma once

#include <chrono>
#include <cstdint>

#include <liburing.h>

namespace genflow {

using shard_id = unsigned;
inline constexpr shard_id kInvalidShard = ~0u;
inline constexpr std::uint32_t kRingSize = 256;
inline constexpr std::uintptr_t kWakeEventToken = 0x1;

// Completion slot for one submitted operation. Owned by the awaiter that
// submitted it; the ring only stores a pointer in the sqe user data.
struct io_data {
  void* coroutine = nullptr;
  std::int32_t result = 0;
  std::uint32_t flags = 0;
  __kernel_timespec ts{};
};

enum class IoOpType : std::uint8_t {
  Read,
  Write,
  PollTimeout,
  Nop
};

struct IoRequest {
  IoOpType op{IoOpType::Nop};
  io_data* data{nullptr};
  int fd{-1};
  void* buf{nullptr};
  std::uint32_t len{0};
  std::uint32_t poll_mask{0};
  __kernel_timespec* ts_ptr{nullptr};
};

class IoRing {
public:
  IoRing();
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return initialized_;
  }

  auto prepare(const IoRequest& req) -> bool;
  auto submit(bool force = false) -> int;

  template <typename Callback>
  auto process_completions(Callback&& cb) -> unsigned {
    if (!initialized_)
      return 0;

    io_uring_cqe* cqe = nullptr;
    unsigned head, count = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
      cb(io_uring_cqe_get_data(cqe), cqe->res, cqe->flags);
      ++count;
    }
    io_uring_cq_advance(&ring_, count);
    return count;
  }

  auto wait(std::chrono::milliseconds timeout) -> void;
  auto setup_wake_poll(int fd) -> void;

private:
  io_uring ring_{};
  bool initialized_ = false;
  std::uint32_t pending_count_ = 0;
  static constexpr std::uint32_t kBatchSize = 8;
};

}  // namespace genflow
