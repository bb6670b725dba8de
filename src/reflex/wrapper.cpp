#include <warden/reflex/wrapper.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace warden::reflex {

namespace {

reflex_result_t allow() {
  return reflex_result_t{verdict_t::allow, deny_reason_t::none, {}};
}

reflex_result_t deny(const deny_reason_t reason, std::string detail) {
  return reflex_result_t{verdict_t::deny, reason, std::move(detail)};
}

}  // namespace

reflex_result_t wrap(const check_t& check) {
  if (!check) {
    return deny(deny_reason_t::check_failed, "no check");
  }
  try {
    return check() ? allow() : deny(deny_reason_t::check_failed, {});
  } catch (const std::exception& e) {
    spdlog::error("Safety check threw, denying: {}", e.what());
    return deny(deny_reason_t::exception, e.what());
  } catch (...) {
    spdlog::error("Safety check threw a non-standard exception, denying");
    return deny(deny_reason_t::exception, "non-standard exception");
  }
}

reflex_result_t wrap(check_t check, const std::chrono::milliseconds timeout) {
  if (!check) {
    return deny(deny_reason_t::check_failed, "no check");
  }
  auto promise = std::make_shared<std::promise<reflex_result_t>>();
  auto future = promise->get_future();
  std::thread([promise, check = std::move(check)] {
    promise->set_value(wrap(check));
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    spdlog::error("Safety check did not answer within {} ms, denying",
                  timeout.count());
    return deny(deny_reason_t::timeout, {});
  }
  return future.get();
}

}  // namespace warden::reflex
