#pragma once

#include <string>

namespace devinv {
namespace server {

// Command-line overrides; empty means "not given".
struct Args {
  std::string config_yaml;
  std::string log_file;
  std::string log_level;
  std::string host;
  std::string port;
  std::string store_uri;
};

class ServerCore {
public:
  // Blocks until SIGINT/SIGTERM. Returns the process exit code.
  static int Run(const Args& args);
};

}  // namespace server
}  // namespace devinv
