#include "ragdesk_cli/cli_handler.hpp"
#include "ragdesk_core/errors.hpp"
#include <iostream>
#include <cstdlib>

namespace
{
  constexpr const char *kDefaultApiBaseUrl = "http://127.0.0.1:8000";

  // The server binds host:port; the CLI needs a scheme in front of it
  std::string resolve_api_base_url()
  {
    const char *from_env = std::getenv("API_BASE_URL");
    std::string url = (from_env && *from_env) ? from_env : kDefaultApiBaseUrl;
    if (url.find("://") == std::string::npos)
    {
      url = "http://" + url;
    }
    return url;
  }
}

int main(int argc, char *argv[])
{
  ragdesk_cli::CliOptions options;
  try
  {
    options = ragdesk_cli::CliHandler::parse_arguments(argc, argv);
  }
  catch (const ragdesk_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'ragdesk_cli help' for usage." << std::endl;
    return 1;
  }

  try
  {
    ragdesk_cli::CliHandler handler(resolve_api_base_url());
    handler.execute_command(options);
  }
  catch (const ragdesk_core::RagError &e)
  {
    std::cerr << "Error (" << ragdesk_core::to_string(e.kind()) << "): " << e.what() << std::endl;
    return 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
