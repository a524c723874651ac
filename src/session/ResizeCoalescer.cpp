#include "ResizeCoalescer.hpp"

namespace tt {
ResizeCoalescer::ResizeCoalescer(int _quietPeriodMs, FlushCallback _flush)
    : quietPeriod(_quietPeriodMs), flush(_flush), shuttingDown(false) {
  flushThread.reset(new thread(&ResizeCoalescer::run, this));
}

ResizeCoalescer::~ResizeCoalescer() { shutdown(); }

void ResizeCoalescer::request(int cols, int rows) {
  {
    lock_guard<mutex> guard(coalescerMutex);
    if (shuttingDown) {
      return;
    }
    pending = TerminalSize{cols, rows};
    deadline = std::chrono::steady_clock::now() + quietPeriod;
  }
  wakeup.notify_all();
}

optional<TerminalSize> ResizeCoalescer::getPending() {
  lock_guard<mutex> guard(coalescerMutex);
  return pending;
}

void ResizeCoalescer::shutdown() {
  {
    lock_guard<mutex> guard(coalescerMutex);
    shuttingDown = true;
    pending.reset();
  }
  wakeup.notify_all();
  if (flushThread) {
    flushThread->join();
    flushThread.reset();
  }
}

void ResizeCoalescer::run() {
  while (true) {
    TerminalSize size;
    {
      unique_lock<mutex> lock(coalescerMutex);
      wakeup.wait(lock, [this] { return shuttingDown || bool(pending); });
      if (shuttingDown) {
        return;
      }
      // A newer request pushes the deadline back, keep waiting for it
      while (!shuttingDown && pending &&
             std::chrono::steady_clock::now() < deadline) {
        wakeup.wait_until(lock, deadline);
      }
      if (shuttingDown) {
        return;
      }
      if (!pending) {
        continue;
      }
      size = *pending;
      pending.reset();
    }
    VLOG(2) << "Flushing resize to " << size.cols << "x" << size.rows;
    flush(size);
  }
}

}  // namespace tt
