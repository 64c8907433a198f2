#include <cstdlib>
#include <iostream>

#include "localmind_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    localmind_cli::CliOptions options = localmind_cli::CliHandler::parse_arguments(argc, argv);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code;
    {
      localmind_cli::CliHandler handler(base_url);
      exit_code = handler.execute_command(options);
    }
    curl_global_cleanup();
    return exit_code;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
