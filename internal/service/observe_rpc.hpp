#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace sensorweave::service {

/*
  Wraps one RPC body in a span, request metrics and an error log.
  Exceptions are rethrown for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, std::string_view subject, Fn&& fn) {
  sensorweave::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    sensorweave::observability::Metrics::Instance().RecordRpc(
        route, ok, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
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
    SENSORWEAVE_LOG_ERROR("RPC failed", {sensorweave::observability::StringField("route", route),
                                         sensorweave::observability::StringField("error", ex.what()),
                                         sensorweave::observability::StringField(subject_key, subject)});
    finish(false);
    throw;
  }
}

} // namespace sensorweave::service
