#include "bench-io/pipeline/MeasurementPipeline.hpp"
#include "bench-io/Logger.hpp"
#include <algorithm>
#include <thread>

namespace benchio {

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
  auto delay = backoff_initial;
  for (int i = 1; i < attempt && delay < backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, backoff_max);
}

MeasurementPipeline::MeasurementPipeline(RetryPolicy policy,
                                         const std::atomic<bool> *cancel)
    : policy_(policy), cancel_(cancel),
      sleep_([](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
      }) {}

PipelineEvent MeasurementPipeline::make_event(EventKind kind,
                                              const Device &device,
                                              const Command &cmd) const {
  PipelineEvent event;
  event.kind = kind;
  event.device_id = device.id();
  event.command = to_string(cmd);
  event.timestamp = std::chrono::system_clock::now();
  return event;
}

void MeasurementPipeline::write_with_retry(Device &device, const Frame &frame) {
  int io_errors = 0;
  int timeouts = 0;
  while (true) {
    try {
      device.transport().write(frame);
      return;
    } catch (const TransportError &e) {
      if (!e.retryable())
        throw;
      if (e.kind() == ErrorKind::TransportIoError &&
          io_errors < policy_.max_io_retries) {
        ++io_errors;
        LOG_WARN("PIPELINE", device.id(), "Write failed ({}), retry {}/{}",
                 e.what(), io_errors, policy_.max_io_retries);
        continue;
      }
      if (e.kind() == ErrorKind::IoTimeout && timeouts < policy_.max_timeouts) {
        ++timeouts;
        auto delay = policy_.backoff_for(timeouts);
        LOG_WARN("PIPELINE", device.id(),
                 "Write timed out, retry {}/{} in {} ms", timeouts,
                 policy_.max_timeouts, delay.count());
        sleep_(delay);
        continue;
      }
      throw;
    }
  }
}

MeasurementPipeline::Outcome
MeasurementPipeline::execute(Device &device, const Command &cmd,
                             MeasurementSink &sink, RunSummary &summary) {
  EncodedRequest req;
  try {
    req = device.prepare(cmd);
  } catch (const CapabilityError &e) {
    LOG_WARN("PIPELINE", device.id(), "{} rejected: {}", to_string(cmd),
             e.what());
    PipelineEvent event = make_event(EventKind::Diagnostic, device, cmd);
    event.error = e.kind();
    event.message = e.what();
    sink.on_event(event);
    return Outcome::Failed;
  }

  write_with_retry(device, req.frame);
  device.on_executed(cmd);

  if (!req.expects_reply) {
    PipelineEvent event = make_event(EventKind::Acknowledgement, device, cmd);
    event.message = fmt::format("wrote {} bytes", req.frame.size());
    sink.on_event(event);
    return Outcome::Succeeded;
  }

  ProtocolCodec &codec = device.codec();
  int io_errors = 0;
  int timeouts = 0;
  bool decode_failed = false;

  while (true) {
    Frame inbound;
    try {
      inbound = device.transport().read(policy_.read_timeout);
    } catch (const TransportError &e) {
      if (cancelled())
        return Outcome::Interrupted;
      if (!e.retryable())
        throw;

      if (e.kind() == ErrorKind::IoTimeout && decode_failed) {
        // The reply arrived but was unusable; nothing more is coming
        LOG_WARN("PIPELINE", device.id(), "{}: no valid reply after decode "
                 "error", to_string(cmd));
        return Outcome::Failed;
      }
      if (e.kind() == ErrorKind::IoTimeout &&
          timeouts < policy_.max_timeouts) {
        ++timeouts;
        auto delay = policy_.backoff_for(timeouts);
        LOG_WARN("PIPELINE", device.id(), "Read timed out, retry {}/{} in {} ms",
                 timeouts, policy_.max_timeouts, delay.count());
        sleep_(delay);
        continue;
      }
      if (e.kind() == ErrorKind::TransportIoError &&
          io_errors < policy_.max_io_retries) {
        ++io_errors;
        LOG_WARN("PIPELINE", device.id(), "Read failed ({}), retry {}/{}",
                 e.what(), io_errors, policy_.max_io_retries);
        continue;
      }
      throw;
    }

    if (cancelled())
      return Outcome::Interrupted;

    // Feed the frame, then keep draining what the codec has buffered
    Frame next = std::move(inbound);
    while (true) {
      DecodedUnit unit;
      try {
        unit = codec.decode(next);
      } catch (const ProtocolError &e) {
        ++summary.decode_errors;
        decode_failed = true;
        LOG_WARN("PIPELINE", device.id(), "Decode error: {}", e.what());
        PipelineEvent event = make_event(EventKind::Diagnostic, device, cmd);
        event.error = e.kind();
        event.message = e.what();
        sink.on_event(event);
        next = Frame::inbound({});
        continue;
      }
      next = Frame::inbound({});

      if (is_partial(unit))
        break;

      if (auto *m = std::get_if<Measurement>(&unit)) {
        device.record(*m);
        ++summary.measurements;
        PipelineEvent event = make_event(EventKind::Measurement, device, cmd);
        event.measurement = *m;
        const DeviceState &state = device.state();
        if (state.mode == DeviceMode::MinMaxTracking && state.running_min) {
          event.running_min = state.running_min;
          event.running_max = state.running_max;
        }
        sink.on_event(event);
      } else {
        PipelineEvent event =
            make_event(EventKind::Acknowledgement, device, cmd);
        event.message = std::get<Acknowledgement>(unit).detail;
        sink.on_event(event);
      }

      if (!codec.has_queued())
        return Outcome::Succeeded;
    }
  }
}

RunSummary MeasurementPipeline::run(Device &device,
                                    const std::vector<Command> &commands,
                                    MeasurementSink &sink) {
  RunSummary summary;

  auto fatal = [&](const BenchError &e) {
    summary.fatal_error = e.kind();
    summary.fatal_message = e.what();
    LOG_ERROR("PIPELINE", device.id(), "{} on {}: {}", error_kind_name(e.kind()),
              device.transport().describe(), e.what());
    PipelineEvent event;
    event.kind = EventKind::Fatal;
    event.device_id = device.id();
    event.timestamp = std::chrono::system_clock::now();
    event.error = e.kind();
    event.message = fmt::format("{}: {}", device.transport().describe(),
                                e.what());
    sink.on_event(event);
  };

  try {
    Device::Session session(device);

    for (const auto &cmd : commands) {
      if (cancelled()) {
        summary.interrupted = true;
        break;
      }

      ++summary.commands_attempted;
      Outcome outcome = execute(device, cmd, sink, summary);
      if (outcome == Outcome::Succeeded) {
        ++summary.commands_succeeded;
      } else if (outcome == Outcome::Failed) {
        ++summary.command_failures;
      } else {
        summary.interrupted = true;
        break;
      }
    }
  } catch (const TransportError &e) {
    fatal(e);
  }

  if (summary.interrupted) {
    LOG_WARN("PIPELINE", device.id(), "Interrupted after {} of {} commands",
             summary.commands_attempted, commands.size());
  }
  LOG_INFO("PIPELINE", device.id(),
           "Done: {} commands, {} succeeded, {} measurements, {} decode errors",
           summary.commands_attempted, summary.commands_succeeded,
           summary.measurements, summary.decode_errors);

  sink.flush();
  return summary;
}

} // namespace benchio
