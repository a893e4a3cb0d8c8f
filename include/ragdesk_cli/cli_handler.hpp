#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ragdesk_cli
{

  enum class Command
  {
    Load,
    Search,
    Tools,
    Tool,
    Check,
    Route,
    Costs,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::vector<std::string> file_paths;  // empty loads the server's documents directory
    std::string query;
    int top_k = 3;
    std::string tool_name;
    std::string answer;
    std::vector<std::string> tools_used;
    std::string question;
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

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments. Throws CliError on missing or malformed flags.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_load_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_tools_command(const CliOptions &options);
    void handle_tool_command(const CliOptions &options);
    void handle_check_command(const CliOptions &options);
    void handle_route_command(const CliOptions &options);
    void handle_costs_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_load_response(const nlohmann::json &response);
    void print_search_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
