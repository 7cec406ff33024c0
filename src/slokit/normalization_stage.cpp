#include <slokit/duration_observer.h>
#include <slokit/environment.h>
#include <slokit/http_request.h>
#include <slokit/logger.h>
#include <slokit/normalization_stage.h>
#include <slokit/normalizer_config.h>
#include <slokit/version.h>

#include <nlohmann/json.hpp>
#include <ostream>

#include "json_util.h"

namespace slokit {
namespace normalizer {

NormalizationStage::NormalizationStage(
    const FinalizedNormalizerConfig& config,
    std::shared_ptr<DurationObserver> observer, const Clock& clock)
    : builder_(config),
      logger_(config.logger),
      observer_(observer ? std::move(observer)
                         : std::make_shared<NullDurationObserver>()),
      clock_(clock) {
  // clang-format off
  config_json_ = dump_json(nlohmann::json::object({
    {"version", normalizer_version_string},
    {"normalizer", nlohmann::json::parse(to_json(config))},
    {"environment_variables", nlohmann::json::parse(environment::to_json())},
  }));
  // clang-format on

  if (config.log_on_startup) {
    logger_->log_startup([this](std::ostream& log) {
      log << "SLOKIT NORMALIZER CONFIGURATION - " << config_json_;
    });
  }
}

NormalizationStage::~NormalizationStage() { wait(); }

Expected<void> NormalizationStage::run(std::shared_ptr<EventChannel> input,
                                       std::shared_ptr<EventChannel> output) {
  if (worker_.joinable()) {
    return Error{Error::STAGE_ALREADY_RUNNING,
                 "NormalizationStage::run called on a stage that is already "
                 "running."};
  }

  worker_ = std::thread([this, input = std::move(input),
                         output = std::move(output)]() {
    process(*input, *output);
  });
  return {};
}

void NormalizationStage::wait() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool NormalizationStage::normalize(HttpRequest& event) const {
  if (!event.event_key.empty()) {
    logger_->log_debug([&](std::ostream& log) {
      log << "skipping event normalization, already has key: "
          << event.event_key;
    });
    return false;
  }

  event.event_key = builder_.build_key(event);
  logger_->log_debug([&](std::ostream& log) {
    log << "processed event with key: " << event.event_key;
  });
  return true;
}

void NormalizationStage::process(EventChannel& input, EventChannel& output) {
  while (auto event = input.pop()) {
    const TimePoint start = clock_();
    if (*event) {
      normalize(**event);
    }
    if (!output.push(std::move(*event))) {
      logger_->log_error(
          "Output channel was closed before the normalization stage finished; "
          "an event was dropped.");
    }
    observer_->observe(to_seconds(clock_() - start));
  }

  logger_->log_debug([](std::ostream& log) {
    log << "input channel closed, finishing";
  });
  output.close();
}

std::string NormalizationStage::config_json() const { return config_json_; }

}  // namespace normalizer
}  // namespace slokit
