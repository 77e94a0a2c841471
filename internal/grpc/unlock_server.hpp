#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "creditgate/v1/unlock_service.grpc.pb.h"
#include "internal/service/unlock_service.hpp"

namespace creditgate::grpc {

class UnlockServer final : public creditgate::v1::UnlockService::Service {
 public:
  explicit UnlockServer(std::shared_ptr<creditgate::service::UnlockService> svc);

  ::grpc::Status RequestUnlock(::grpc::ServerContext*, const creditgate::v1::RequestUnlockRequest*,
                               creditgate::v1::RequestUnlockResponse*) override;

  ::grpc::Status GetUnlock(::grpc::ServerContext*, const creditgate::v1::GetUnlockRequest*, creditgate::v1::GetUnlockResponse*) override;

  ::grpc::Status GetWallet(::grpc::ServerContext*, const creditgate::v1::GetWalletRequest*, creditgate::v1::GetWalletResponse*) override;

  ::grpc::Status ExportLedger(::grpc::ServerContext*, const creditgate::v1::ExportLedgerRequest*,
                              creditgate::v1::ExportLedgerResponse*) override;

  ::grpc::Status RunSweep(::grpc::ServerContext*, const creditgate::v1::RunSweepRequest*, creditgate::v1::RunSweepResponse*) override;

  ::grpc::Status GetProviderCircuit(::grpc::ServerContext*, const creditgate::v1::GetProviderCircuitRequest*,
                                    creditgate::v1::GetProviderCircuitResponse*) override;

 private:
  std::shared_ptr<creditgate::service::UnlockService> service_;
};

} // namespace creditgate::grpc
