#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/grpc/market_server.hpp"
#include "internal/observability/logging.hpp"

namespace usedgear::runtime {

namespace {
constexpr std::chrono::seconds kShutdownGrace{5};
}

Server::Server(std::string bind_address, std::shared_ptr<usedgear::service::MarketService> service)
    : bind_address_(std::move(bind_address)), market_(std::make_unique<usedgear::grpc::MarketServer>(std::move(service))) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());
  builder.RegisterService(market_.get());

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("Failed to start market API on " + bind_address_);
  }

  USEDGEAR_LOG_INFO("Market API listening",
                    {observability::StringField("bind_address", bind_address_),
                     observability::StringField("service", usedgear::market::v1::MarketService::service_full_name())});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  grpc_server_.reset();
  USEDGEAR_LOG_INFO("Market API stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace usedgear::runtime
