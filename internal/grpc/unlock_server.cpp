#include "unlock_server.hpp"

#include "grpc_error.hpp"

namespace creditgate::grpc {

using namespace creditgate::v1;

UnlockServer::UnlockServer(std::shared_ptr<creditgate::service::UnlockService> svc) : service_(std::move(svc)) {
}

::grpc::Status UnlockServer::RequestUnlock(::grpc::ServerContext*, const RequestUnlockRequest* req, RequestUnlockResponse* resp) {
  try {
    *resp = service_->RequestUnlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UnlockServer::GetUnlock(::grpc::ServerContext*, const GetUnlockRequest* req, GetUnlockResponse* resp) {
  try {
    *resp = service_->GetUnlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UnlockServer::GetWallet(::grpc::ServerContext*, const GetWalletRequest* req, GetWalletResponse* resp) {
  try {
    *resp = service_->GetWallet(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UnlockServer::ExportLedger(::grpc::ServerContext*, const ExportLedgerRequest* req, ExportLedgerResponse* resp) {
  try {
    *resp = service_->ExportLedger(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UnlockServer::RunSweep(::grpc::ServerContext*, const RunSweepRequest* req, RunSweepResponse* resp) {
  try {
    *resp = service_->RunSweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UnlockServer::GetProviderCircuit(::grpc::ServerContext*, const GetProviderCircuitRequest* req,
                                                GetProviderCircuitResponse* resp) {
  try {
    *resp = service_->GetProviderCircuit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace creditgate::grpc
