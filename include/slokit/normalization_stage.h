#pragma once

// This component provides a class, `NormalizationStage`, that assigns event
// keys to a stream of `HttpRequest` events.
//
// A stage is created from a `FinalizedNormalizerConfig` and then started with
// `run`, which spawns a worker thread. The worker pops events from the input
// channel one at a time, in order. For each event:
//
// - If the event already has a key, the event is left unchanged.
// - Otherwise its key is computed by an `EventKeyBuilder` and assigned.
//
// Either way the event is then pushed onto the output channel, and the time
// it spent in the stage is reported to the stage's `DurationObserver`.
//
// When the input channel is closed and drained, the worker closes the output
// channel and exits. There is no other way to stop a stage: the producer
// stops it by closing the input. The destructor waits for the worker, so the
// input channel must be closed before the stage is destroyed.

#include <slokit/channel.h>
#include <slokit/clock.h>
#include <slokit/event_key_builder.h>
#include <slokit/expected.h>

#include <memory>
#include <string>
#include <thread>

namespace slokit {
namespace normalizer {

class DurationObserver;
class FinalizedNormalizerConfig;
class Logger;
struct HttpRequest;

class NormalizationStage {
 public:
  using Event = std::unique_ptr<HttpRequest>;
  using EventChannel = Channel<Event>;

 private:
  EventKeyBuilder builder_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<DurationObserver> observer_;
  Clock clock_;
  std::string config_json_;
  std::thread worker_;

  void process(EventChannel& input, EventChannel& output);

 public:
  // If `observer` is null, durations are discarded.
  explicit NormalizationStage(
      const FinalizedNormalizerConfig& config,
      std::shared_ptr<DurationObserver> observer = nullptr,
      const Clock& clock = default_clock);
  ~NormalizationStage();

  NormalizationStage(const NormalizationStage&) = delete;
  NormalizationStage& operator=(const NormalizationStage&) = delete;

  // Start the worker thread, which moves events from `input` to `output`
  // until `input` is closed, and then closes `output`. Return an error if the
  // stage is already running.
  Expected<void> run(std::shared_ptr<EventChannel> input,
                     std::shared_ptr<EventChannel> output);

  // Block until the worker started by `run` has closed its output channel
  // and exited. Return immediately if the stage is not running.
  void wait();

  // Assign a key to `event` unless it already has one. Return whether a key
  // was assigned.
  bool normalize(HttpRequest& event) const;

  // Return a JSON object describing the stage's configuration.
  std::string config_json() const;
};

}  // namespace normalizer
}  // namespace slokit
