#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ragdesk_cli
{

  enum class Command
  {
    Ingest,
    Search,
    Answer,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    int top_k = 4;
    std::string provider;  // empty means the server's default provider
    bool with_text = false;
    std::string config_path = "ragdeskrc.json";
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; failures are thrown to the caller
    void execute_command(const CliOptions &options);


  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_answer_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);

    // Utility methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_search_response(const nlohmann::json &response, bool with_text);
    void print_answer_response(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}  // namespace ragdesk_cli
