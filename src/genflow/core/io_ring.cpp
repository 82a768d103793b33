#include "genflow/core/io_ring.hpp"

#include "genflow/util/log.hpp"

#include <cstring>

#include <poll.h>

namespace genflow {

IoRing::IoRing() {
  if (auto rc = io_uring_queue_init(kRingSize, &ring_, 0); rc == 0) {
    initialized_ = true;
  } else {
    log::warn("io_uring unavailable ({}), socket I/O disabled on this shard",
              std::strerror(-rc));
  }
}

IoRing::~IoRing() {
  if (initialized_) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::prepare(const IoRequest& req) -> bool {
  if (!initialized_)
    return false;

  auto* sqe = io_uring_get_sqe(&ring_);
  if (!sqe) {
    submit(true);
    sqe = io_uring_get_sqe(&ring_);
    if (!sqe)
      return false;
  }

  switch (req.op) {
    case IoOpType::Read:
      io_uring_prep_read(sqe, req.fd, req.buf, req.len, 0);
      break;
    case IoOpType::Write:
      io_uring_prep_write(sqe, req.fd, req.buf, req.len, 0);
      break;
    case IoOpType::PollTimeout: {
      // The poll and its linked timeout need two sqes; reserve the second
      // before committing the first.
      if (io_uring_sq_space_left(&ring_) < 1) {
        io_uring_prep_nop(sqe);
        io_uring_sqe_set_data(sqe, nullptr);
        ++pending_count_;
        return false;
      }
      io_uring_prep_poll_add(sqe, req.fd, req.poll_mask);
      sqe->flags |= IOSQE_IO_LINK;
      io_uring_sqe_set_data(sqe, req.data);
      ++pending_count_;

      auto* timeout_sqe = io_uring_get_sqe(&ring_);
      io_uring_prep_link_timeout(timeout_sqe, req.ts_ptr, 0);
      io_uring_sqe_set_data(timeout_sqe, nullptr);
      ++pending_count_;
      return true;
    }
    case IoOpType::Nop:
      io_uring_prep_nop(sqe);
      break;
  }

  io_uring_sqe_set_data(sqe, req.data);
  ++pending_count_;
  return true;
}

auto IoRing::submit(bool force) -> int {
  if (pending_count_ == 0)
    return 0;
  if (!force && pending_count_ < kBatchSize)
    return 0;

  pending_count_ = 0;
  return io_uring_submit(&ring_);
}

auto IoRing::wait(std::chrono::milliseconds timeout) -> void {
  if (!initialized_)
    return;

  __kernel_timespec ts{.tv_sec = timeout.count() / 1000,
                       .tv_nsec = (timeout.count() % 1000) * 1000000};
  io_uring_cqe* cqe = nullptr;
  // -ETIME just means nothing completed before the deadline.
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

auto IoRing::setup_wake_poll(int fd) -> void {
  if (!initialized_ || fd < 0)
    return;

  auto* sqe = io_uring_get_sqe(&ring_);
  if (!sqe)
    return;

  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, reinterpret_cast<void*>(kWakeEventToken));
  ++pending_count_;
  submit(true);
}

}  // namespace genflow
