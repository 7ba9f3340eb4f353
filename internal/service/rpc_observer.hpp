#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace phrase::service {

/*
  Wraps one RPC body: span, request/latency metrics and an error log.
  Exceptions are rethrown for the gRPC layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_key, const std::string& subject, Fn&& fn) {
  phrase::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute(subject_key, subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    phrase::observability::Metrics::Instance().RecordRequest(route, ok);
    phrase::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    if (subject.empty()) {
      PHRASE_LOG_ERROR("RPC failed", {phrase::observability::StringField("route", route), phrase::observability::StringField("error", ex.what())});
    } else {
      PHRASE_LOG_ERROR("RPC failed", {phrase::observability::StringField("route", route), phrase::observability::StringField("error", ex.what()),
                                      phrase::observability::StringField(subject_key, subject)});
    }
    finish(false);
    throw;
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  static const std::string kNoSubject;
  return ObserveRpc(route, {}, kNoSubject, std::forward<Fn>(fn));
}

} // namespace phrase::service
