#pragma once
#include "bench-io/Command.hpp"
#include "bench-io/Errors.hpp"
#include "bench-io/device/Device.hpp"
#include "bench-io/pipeline/MeasurementSink.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace benchio {

struct RetryPolicy {
  /// Accepted ranges for configured values
  static constexpr long long MAX_TIMEOUT_MS = 3600000;
  static constexpr int MAX_RETRIES = 1000;

  std::chrono::milliseconds read_timeout{1000};
  int max_io_retries{3};
  int max_timeouts{3};
  std::chrono::milliseconds backoff_initial{50};
  std::chrono::milliseconds backoff_max{800};

  /// Delay before timeout retry `attempt` (1-based), doubling up to the max
  std::chrono::milliseconds backoff_for(int attempt) const;
};

struct RunSummary {
  size_t commands_attempted{0};
  size_t commands_succeeded{0};
  size_t measurements{0};
  size_t decode_errors{0};
  size_t command_failures{0};
  std::optional<ErrorKind> fatal_error;
  std::string fatal_message;
  bool interrupted{false};

  bool ok() const {
    return !fatal_error && !interrupted && decode_errors == 0 &&
           command_failures == 0;
  }
};

/// Drives a command sequence through one Device:
/// check, encode, write, read until a complete unit, decode, record, emit.
///
/// Decode errors and capability mismatches become Diagnostic events and the
/// run continues. Transport failures that outlast the retry policy end the
/// run with a Fatal event; the session closes the transport.
class MeasurementPipeline {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit MeasurementPipeline(RetryPolicy policy = {},
                               const std::atomic<bool> *cancel = nullptr);

  /// Replace the backoff sleep (tests)
  void set_sleeper(Sleeper sleeper) { sleep_ = std::move(sleeper); }

  const RetryPolicy &policy() const { return policy_; }

  RunSummary run(Device &device, const std::vector<Command> &commands,
                 MeasurementSink &sink);

private:
  enum class Outcome { Succeeded, Failed, Interrupted };

  Outcome execute(Device &device, const Command &cmd, MeasurementSink &sink,
                  RunSummary &summary);
  void write_with_retry(Device &device, const Frame &frame);
  bool cancelled() const { return cancel_ && cancel_->load(); }

  PipelineEvent make_event(EventKind kind, const Device &device,
                           const Command &cmd) const;

  RetryPolicy policy_;
  const std::atomic<bool> *cancel_;
  Sleeper sleep_;
};

} // namespace benchio
