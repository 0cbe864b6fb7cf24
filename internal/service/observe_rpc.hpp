#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace checkpoint::service {

/*
  Wraps one RPC body with a span, request count and latency.
  Exceptions are logged and rethrown for the gRPC adapter to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view worker_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!worker_id.empty()) {
    span.SetAttribute("worker.id", worker_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CHECKPOINT_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::StringField("worker_id", worker_id)});
    finish(false);
    throw;
  }
}

} // namespace checkpoint::service
