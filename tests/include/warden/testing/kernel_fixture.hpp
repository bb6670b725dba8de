#pragma once

#include <warden/reflex/registry.hpp>
#include <warden/security/capability_store.hpp>
#include <warden/security/event_journal.hpp>
#include <warden/security/kernel.hpp>
#include <warden/security/rate_limiter.hpp>
#include <warden/testing/common.hpp>
#include <warden/trust/engine.hpp>
#include <warden/trust/policy.hpp>

#include <string>

namespace warden::testing {

/// A kernel wired to in-memory collaborators that share one manual clock
/// and one audit journal.
class kernel_fixture final {
 public:
  explicit kernel_fixture(
      warden::security::kernel_options options = {},
      warden::security::capability_store_options store_options = {})
      : clock_{},
        journal_{},
        store_{store_options, clock_.source()},
        trust_{warden::trust::engine_options{}, clock_.source()},
        policy_{},
        reflexes_{},
        limiter_{clock_.source()},
        kernel_{store_,  trust_,   policy_,         reflexes_,
                limiter_, options, clock_.source()} {
    store_.set_event_sink(journal_.sink());
    trust_.set_event_sink(journal_.sink());
    kernel_.set_event_sink(journal_.sink());
  }

  kernel_fixture(const kernel_fixture&) = delete;
  kernel_fixture& operator=(const kernel_fixture&) = delete;
  kernel_fixture(kernel_fixture&&) = delete;
  kernel_fixture& operator=(kernel_fixture&&) = delete;

  manual_clock& clock() { return clock_; }
  warden::security::event_journal& journal() { return journal_; }
  warden::security::capability_store& store() { return store_; }
  warden::trust::engine& trust() { return trust_; }
  warden::trust::tier_policy& policy() { return policy_; }
  warden::reflex::reflex_registry& reflexes() { return reflexes_; }
  warden::security::rate_limiter& limiter() { return limiter_; }
  warden::security::kernel& kernel() { return kernel_; }

  /// One successful action from a fresh profile scores 80: veteran.
  void make_veteran(const std::string& agent_id) {
    trust_.record_event(agent_id,
                        warden::schema::trust_event_type_t::action_success);
  }

  /// One failed action from a fresh profile scores 50: trusted.
  void make_trusted(const std::string& agent_id) {
    trust_.record_event(agent_id,
                        warden::schema::trust_event_type_t::action_failure);
  }

 private:
  manual_clock clock_;
  warden::security::event_journal journal_;
  warden::security::capability_store store_;
  warden::trust::engine trust_;
  warden::trust::tier_policy policy_;
  warden::reflex::reflex_registry reflexes_;
  warden::security::rate_limiter limiter_;
  warden::security::kernel kernel_;
};

}  // namespace warden::testing
