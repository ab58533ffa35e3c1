#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "edge_client.hh"

using EdgeStream::Bytes;
using EdgeStream::EdgeDetectorClient;
using EdgeStream::RpcError;
using EdgeStream::Thresholds;

auto read_file(const std::string &path) -> Bytes {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open image: " + path);
  }
  return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string &path, const Bytes &data) {
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  if (!out) {
    throw std::runtime_error("Failed to write result: " + path);
  }
}

auto main(int argc, char *argv[]) -> int {
  if (argc != 3 && argc != 5 && argc != 6 && argc != 7) {
    std::cerr << "Usage: " << argv[0]
              << " <input image> <output.jpg> [min_threshold max_threshold] [address [timeout_ms]]"
              << std::endl;
    return 1;
  }

  try {
    Thresholds thresholds{100, 200};
    if (argc >= 5) {
      thresholds.min_threshold = std::stoi(argv[3]);
      thresholds.max_threshold = std::stoi(argv[4]);
    }
    const std::string address = argc >= 6 ? argv[5] : "localhost:50051";
    std::optional<std::chrono::milliseconds> timeout;
    if (argc == 7) {
      const int ms = std::stoi(argv[6]);
      if (ms <= 0) {
        throw std::runtime_error("timeout_ms must be positive");
      }
      timeout = std::chrono::milliseconds(ms);
    }

    Bytes image = read_file(argv[1]);

    EdgeDetectorClient client(
        grpc::CreateChannel(address, grpc::InsecureChannelCredentials()), timeout);

    std::cout << "Sending " << image.size() << " bytes (thresholds "
              << thresholds.min_threshold << "/" << thresholds.max_threshold << ")"
              << std::endl;
    Bytes edges = client.detect_edges(thresholds, image);
    std::cout << "Received " << edges.size() << " bytes" << std::endl;

    write_file(argv[2], edges);
  } catch (const RpcError &e) {
    std::cerr << "RPC failed (" << e.code() << "): " << e.detail() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
