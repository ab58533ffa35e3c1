#include <grpcpp/grpcpp.h>
#include <grpcpp/resource_quota.h>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "edge_service.hh"

using grpc::ResourceQuota;
using grpc::Server;
using grpc::ServerBuilder;

using EdgeStream::CannyEdgeDetectorImpl;

constexpr int DEFAULT_MAX_THREADS = 10;

auto main(int argc, char *argv[]) -> int {
  if (argc > 3) {
    std::cerr << "Usage: " << argv[0] << " [address] [max_threads]" << std::endl;
    return 1;
  }

  try {
    const std::string server_address = argc > 1 ? argv[1] : "0.0.0.0:50051";
    const int max_threads = argc > 2 ? std::stoi(argv[2]) : DEFAULT_MAX_THREADS;
    if (max_threads <= 0) {
      throw std::runtime_error("max_threads must be positive");
    }

    CannyEdgeDetectorImpl service;

    ResourceQuota quota("edge_server");
    quota.SetMaxThreads(max_threads);

    ServerBuilder builder;
    builder.SetResourceQuota(quota);
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
      throw std::runtime_error("Failed to listen on " + server_address);
    }
    std::cout << "Server listening on " << server_address << " (" << max_threads
              << " threads)" << std::endl;
    server->Wait();
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
