#pragma once

#include <memory>

#include "internal/config/runtime_settings.hpp"

namespace creditgate::db { class Repository; }
namespace creditgate::unlock { class UnlockStore; }
namespace creditgate::ledger { class CreditLedger; }
namespace creditgate::provider { class ProviderCircuit; }
namespace creditgate::jobs { class JobLeaseStore; }
namespace creditgate::sweep { class ReliabilitySweep; }

namespace creditgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<creditgate::db::Repository>          repository;
  std::shared_ptr<creditgate::unlock::UnlockStore>     unlocks;
  std::shared_ptr<creditgate::ledger::CreditLedger>    ledger;
  std::shared_ptr<creditgate::provider::ProviderCircuit> circuit;
  std::shared_ptr<creditgate::jobs::JobLeaseStore>     jobs;
  std::shared_ptr<creditgate::sweep::ReliabilitySweep> sweep;
  creditgate::config::RuntimeSettings                  settings;
};

}
