#include <benchmark/benchmark.h>

#include <slokit/event_key_builder.h>
#include <slokit/http_request.h>
#include <slokit/normalization_stage.h>
#include <slokit/normalizer_config.h>
#include <slokit/null_logger.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace sn = slokit::normalizer;

const char* const targets[] = {
    "/users/42/orders?op=list",
    "/blobs/d41d8cd98f00b204e9800998ecf8427e",
    "/sessions/123e4567-e89b-12d3-a456-426614174000/end?op=close&op=audit",
    "/hosts/10.1.2.3/status",
    "/static/img/logo.png",
    "/v2/orders/77/items//3/../4/",
};

sn::FinalizedNormalizerConfig make_config() {
  sn::NormalizerConfig config;
  config.query_param = "op";
  config.rewrite_rules = {{"^/v2/orders/", "/orders/legacy"}};
  config.sanitize_hashes = true;
  config.sanitize_numbers = true;
  config.sanitize_uuids = true;
  config.sanitize_ips = true;
  config.sanitize_images = true;
  config.sanitize_fonts = true;
  config.logger = std::make_shared<sn::NullLogger>();
  config.log_on_startup = false;
  return *sn::finalize_config(config);
}

std::vector<sn::HttpRequest> make_requests() {
  std::vector<sn::HttpRequest> requests;
  for (const char* target : targets) {
    sn::HttpRequest request;
    request.method = "GET";
    request.url = *sn::URL::parse(target);
    requests.push_back(std::move(request));
  }
  return requests;
}

void BM_Sanitize(benchmark::State& state) {
  const auto config = make_config();
  const sn::PathSanitizer sanitizer{config.rewrite_rules, config.sanitizer};
  const auto requests = make_requests();
  for (auto _ : state) {
    for (const auto& request : requests) {
      benchmark::DoNotOptimize(sanitizer.sanitize(request.url.path));
    }
  }
  state.SetItemsProcessed(state.iterations() * requests.size());
}
BENCHMARK(BM_Sanitize);

void BM_BuildKey(benchmark::State& state) {
  const sn::EventKeyBuilder builder{make_config()};
  const auto requests = make_requests();
  for (auto _ : state) {
    for (const auto& request : requests) {
      benchmark::DoNotOptimize(builder.build_key(request));
    }
  }
  state.SetItemsProcessed(state.iterations() * requests.size());
}
BENCHMARK(BM_BuildKey);

// Push events through a running stage, end to end.
void BM_Stage(benchmark::State& state) {
  const auto config = make_config();
  const auto requests = make_requests();
  const std::size_t batch = 1000;
  for (auto _ : state) {
    sn::NormalizationStage stage{config};
    using EventChannel = sn::NormalizationStage::EventChannel;
    auto input = std::make_shared<EventChannel>(state.range(0));
    auto output = std::make_shared<EventChannel>(state.range(0));
    auto started = stage.run(input, output);
    if (auto* error = started.if_error()) {
      state.SkipWithError(error->message.c_str());
      break;
    }

    std::thread producer([&]() {
      for (std::size_t i = 0; i < batch; ++i) {
        input->push(std::make_unique<sn::HttpRequest>(
            requests[i % requests.size()]));
      }
      input->close();
    });
    while (output->pop()) {
    }
    producer.join();
    stage.wait();
  }
  state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_Stage)->Arg(0)->Arg(16)->Arg(1024);

}  // namespace

BENCHMARK_MAIN();
