#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace localmind_cli
{

  enum class Command
  {
    Ingest,
    Remove,
    Documents,
    Search,
    Chat,
    Style,
    Conversations,
    NewConversation,
    Turns,
    Export,
    Stats,
    Categories,
    AddCategory,
    Tools,
    Invoke,
    ListTasks,
    TaskStatus,
    TaskProgress,
    ClearTasks,
    Snapshot,
    RebuildIndex,
    VerifyIndex,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string document_id;
    std::string query;
    int top_k = 0;
    std::vector<std::string> categories;
    bool category_scoped = false;
    bool retrieve = true;
    std::string conversation_id;
    std::vector<std::string> tools;
    std::string exemplar_file;
    std::string title;
    std::string format = "md";
    std::string name;
    std::string description;
    std::string color;
    std::string tool_arguments;
    std::string status_filter;
    std::string task_id;
    int older_than_days = 7;
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

  // HTTP status and parsed body of one API call.
  struct ApiResponse
  {
    long status = 0;
    nlohmann::json body;

    bool ok() const { return status >= 200 && status < 300; }
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Throws CliError for unknown commands, flags or missing values.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Builds the JSON request body for commands that send one.
    static nlohmann::json build_request_body(const CliOptions &options);

    // Returns the process exit code.
    int execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    ApiResponse make_request(const std::string &method, const std::string &endpoint,
                             const nlohmann::json *data = nullptr);

    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_search_response(const nlohmann::json &response);
    void print_turn_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint);
  };

}  // namespace localmind_cli
