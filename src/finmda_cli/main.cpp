#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "finmda_cli/cli_handler.hpp"
#include "finmda_cli/config.hpp"

namespace {

finmda_cli::Config load_config() {
  const char *config_path = std::getenv("FINMDA_CONFIG");
  if (config_path) {
    return finmda_cli::Config::from_file(config_path);
  }
  if (std::filesystem::exists("finmdarc.json")) {
    return finmda_cli::Config::from_file("finmdarc.json");
  }
  return finmda_cli::Config::defaults();
}

}  // namespace

int main(int argc, char *argv[])
{
  try
  {
    // Parse first so that help and usage errors never touch the config or database
    finmda_cli::CliOptions options = finmda_cli::CliHandler::parse_arguments(argc, argv);

    finmda_cli::CliHandler handler(load_config());
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
