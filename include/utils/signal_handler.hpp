#pragma once
/**
 * @file signal_handler.hpp
 * @brief RAII POSIX signal handler for clean shutdown.
 *
 * SIGINT/SIGTERM flip the shared StopFlag; SIGPIPE is ignored so a scraper hanging up
 * mid-response cannot kill the process. Previous handlers are restored on destruction.
 */
#include "exporter/stop_flag.hpp"

#include <atomic>
#include <csignal>

namespace utils {

class SignalHandler {
public:
  explicit SignalHandler(exporter::StopFlag& stop) : stop_(stop) {
    instance_ = this;
    old_int_  = std::signal(SIGINT,  &SignalHandler::on_signal);
    old_term_ = std::signal(SIGTERM, &SignalHandler::on_signal);
    old_pipe_ = std::signal(SIGPIPE, SIG_IGN);
  }

  ~SignalHandler() noexcept {
    std::signal(SIGINT,  old_int_);
    std::signal(SIGTERM, old_term_);
    std::signal(SIGPIPE, old_pipe_);
    instance_ = nullptr;
  }

  SignalHandler(const SignalHandler&) = delete;
  SignalHandler& operator=(const SignalHandler&) = delete;

  // Last signal received, 0 if none.
  static int last_signal() noexcept { return last_signal_.load(); }

private:
  static void on_signal(int sig) {
    last_signal_.store(sig);
    if (instance_) instance_->stop_.request_stop();
  }

  exporter::StopFlag& stop_;
  using Handler = void(*)(int);
  Handler old_int_{SIG_DFL};
  Handler old_term_{SIG_DFL};
  Handler old_pipe_{SIG_DFL};
  static inline SignalHandler* instance_{nullptr};
  static inline std::atomic<int> last_signal_{0};
};

} // namespace utils
