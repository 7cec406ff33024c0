// This program reads HTTP request events from standard input, one JSON object
// per line, assigns each an event key using a `NormalizationStage`, and writes
// the events to standard output, one JSON object per line.
//
// Usage:
//
//     slokit-normalize [CONFIG_FILE]
//     slokit-normalize --version
//
// CONFIG_FILE is a JSON normalizer configuration (see `normalizer_config.h`).
// Environment variables such as `SLOKIT_SANITIZE_NUMBERS` override it. Set
// `SLOKIT_NORMALIZER_DEBUG=true` to log each event's key to standard error.
//
// Each input line looks like:
//
//     {"method": "GET", "url": "/users/42?op=list", "status_code": 200,
//      "duration_ms": 12.5, "headers": {"host": "example.com"}}
//
// "event_key" may also be present, in which case it is kept as-is. Lines that
// are not valid events are reported to standard error and skipped.
//
// When input is exhausted, a summary of per-event processing time is written
// to standard error.

#include <slokit/cerr_logger.h>
#include <slokit/duration_observer.h>
#include <slokit/environment.h>
#include <slokit/http_request.h>
#include <slokit/normalization_stage.h>
#include <slokit/normalizer_config.h>
#include <slokit/parse_util.h>
#include <slokit/version.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>

namespace sn = slokit::normalizer;

namespace {

sn::Expected<std::unique_ptr<sn::HttpRequest>> parse_event(
    const std::string& line) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& error) {
    return sn::Error{sn::Error::OTHER,
                     std::string("Invalid JSON: ") + error.what()};
  }
  if (!json.is_object()) {
    return sn::Error{sn::Error::OTHER, "Event must be a JSON object."};
  }

  auto event = std::make_unique<sn::HttpRequest>();
  try {
    event->method = json.value("method", "");
    auto url = sn::URL::parse(json.value("url", ""));
    if (auto* error = url.if_error()) {
      return std::move(*error);
    }
    event->url = std::move(*url);
    event->status_code = json.value("status_code", 0);
    event->duration = std::chrono::duration_cast<sn::Duration>(
        std::chrono::duration<double, std::milli>(
            json.value("duration_ms", 0.0)));
    if (auto headers = json.find("headers"); headers != json.end()) {
      event->headers =
          headers->get<std::unordered_map<std::string, std::string>>();
    }
    event->event_key = json.value("event_key", "");
  } catch (const nlohmann::json::exception& error) {
    return sn::Error{sn::Error::OTHER,
                     std::string("Invalid event: ") + error.what()};
  }

  return std::move(event);
}

nlohmann::json to_json(const sn::HttpRequest& event) {
  std::ostringstream url;
  url << event.url;
  return nlohmann::json::object({
      {"method", event.method},
      {"url", url.str()},
      {"status_code", event.status_code},
      {"duration_ms",
       std::chrono::duration<double, std::milli>(event.duration).count()},
      {"headers", event.headers},
      {"event_key", event.event_key},
  });
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [CONFIG_FILE]\n";
    return 2;
  }
  if (argc == 2 && std::string(argv[1]) == "--version") {
    std::cout << "slokit-normalize " << sn::normalizer_version << '\n';
    return 0;
  }

  bool debug = false;
  if (auto debug_env = sn::environment::lookup(
          sn::environment::NORMALIZER_DEBUG)) {
    auto parsed = sn::parse_bool(*debug_env);
    if (auto* error = parsed.if_error()) {
      std::cerr << *error << '\n';
      return 1;
    }
    debug = *parsed;
  }
  auto logger = std::make_shared<sn::CerrLogger>(debug);

  sn::NormalizerConfig config;
  if (argc == 2) {
    auto loaded = sn::load_config_file(argv[1]);
    if (auto* error = loaded.if_error()) {
      logger->log_error(*error);
      return 1;
    }
    config = std::move(*loaded);
  }
  config.logger = logger;

  auto finalized = sn::finalize_config(config);
  if (auto* error = finalized.if_error()) {
    logger->log_error(*error);
    return 1;
  }

  auto histogram = std::make_shared<sn::DurationHistogram>(
      "normalizer.event_duration_seconds", std::vector<std::string>{});
  sn::NormalizationStage stage{*finalized, histogram};

  const std::size_t capacity = 1024;
  using EventChannel = sn::NormalizationStage::EventChannel;
  auto input = std::make_shared<EventChannel>(capacity);
  auto output = std::make_shared<EventChannel>(capacity);

  auto started = stage.run(input, output);
  if (auto* error = started.if_error()) {
    logger->log_error(*error);
    return 1;
  }

  std::thread producer([&]() {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(std::cin, line)) {
      ++line_number;
      if (line.empty()) {
        continue;
      }
      auto event = parse_event(line);
      if (auto* error = event.if_error()) {
        logger->log_error(error->with_prefix(
            "Skipping input line " + std::to_string(line_number) + ": "));
        continue;
      }
      input->push(std::move(*event));
    }
    input->close();
  });

  while (auto event = output->pop()) {
    // Paths and keys may hold decoded bytes that are not UTF-8.
    std::cout << to_json(**event).dump(
                     -1, ' ', false, nlohmann::json::error_handler_t::replace)
              << '\n';
  }
  std::cout.flush();

  producer.join();
  stage.wait();

  const std::uint64_t count = histogram->count();
  const double total = histogram->sum();
  std::cerr << "normalized " << count << " events";
  if (count) {
    std::cerr << ", mean " << (total / count) * 1e6 << " us per event";
  }
  std::cerr << '\n';
}
