#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "server/server_core.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0
            << " [--config file.yaml] [--host addr] [--port n] [--store-uri dir]"
               " [--log-file path] [--log-level level]\n";
}

std::optional<devinv::server::Args> ParseArgs(int argc, char** argv) {
  devinv::server::Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      ++i;
      return std::string(argv[i]);
    };

    std::string* target = nullptr;
    if (a == "--config") target = &out.config_yaml;
    else if (a == "--host") target = &out.host;
    else if (a == "--port") target = &out.port;
    else if (a == "--store-uri") target = &out.store_uri;
    else if (a == "--log-file") target = &out.log_file;
    else if (a == "--log-level") target = &out.log_level;

    if (target == nullptr) {
      std::cerr << "unknown option " << a << "\n";
      return std::nullopt;
    }
    const auto v = take_value();
    if (!v.has_value()) {
      std::cerr << "missing value for " << a << "\n";
      return std::nullopt;
    }
    *target = *v;
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (a == "--help" || a == "-h") {
      PrintUsage(argv[0]);
      return 0;
    }
  }

  const auto args = ParseArgs(argc, argv);
  if (!args.has_value()) {
    PrintUsage(argv[0]);
    return 2;
  }
  return devinv::server::ServerCore::Run(*args);
}
