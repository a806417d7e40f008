#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

namespace usedgear::service { class MarketService; }
namespace usedgear::grpc { class MarketServer; }

namespace usedgear::runtime {

/*
  Serves the market API over gRPC on one listening address.

  Stop() gives in-flight calls a short grace period, so a snapshot taken
  right after it sees every offer or purchase that was acknowledged.
*/
class Server {
public:
  Server(std::string bind_address, std::shared_ptr<usedgear::service::MarketService> service);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

private:
  std::string bind_address_;
  std::unique_ptr<usedgear::grpc::MarketServer> market_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace usedgear::runtime
