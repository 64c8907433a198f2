#include "localmind_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace localmind_cli {

namespace {

const std::map<std::string, Command>& command_names() {
  static const std::map<std::string, Command> names = {
      {"ingest", Command::Ingest},          {"i", Command::Ingest},
      {"remove", Command::Remove},          {"rm", Command::Remove},
      {"documents", Command::Documents},    {"docs", Command::Documents},
      {"search", Command::Search},          {"s", Command::Search},
      {"chat", Command::Chat},              {"c", Command::Chat},
      {"style", Command::Style},
      {"conversations", Command::Conversations},
      {"new-conversation", Command::NewConversation},
      {"turns", Command::Turns},
      {"export", Command::Export},
      {"stats", Command::Stats},
      {"categories", Command::Categories},
      {"add-category", Command::AddCategory},
      {"tools", Command::Tools},
      {"invoke", Command::Invoke},
      {"tasks", Command::ListTasks},        {"lt", Command::ListTasks},
      {"task-status", Command::TaskStatus}, {"ts", Command::TaskStatus},
      {"task-progress", Command::TaskProgress}, {"tp", Command::TaskProgress},
      {"clear-tasks", Command::ClearTasks}, {"ct", Command::ClearTasks},
      {"snapshot", Command::Snapshot},
      {"rebuild-index", Command::RebuildIndex},
      {"verify-index", Command::VerifyIndex},
      {"help", Command::Help},              {"h", Command::Help},
      {"--help", Command::Help},            {"-h", Command::Help},
  };
  return names;
}

int parse_int(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects a number, got '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw CliError(flag + " expects a number, got '" + value + "'");
  }
}

void require(bool present, const std::string& message) {
  if (!present) {
    throw CliError(message);
  }
}

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Could not open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url) : api_base_url_(api_base_url), curl_handle_(nullptr) {
  setup_curl_handle();
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    api_base_url_ = std::move(other.api_base_url_);
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void CliHandler::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw CliError("Failed to initialize CURL");
  }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  const std::string command = argv[1];
  auto it = command_names().find(command);
  if (it == command_names().end()) {
    throw CliError("Unknown command: " + command);
  }
  options.command = it->second;

  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];

    // Switches without a value
    if (flag == "--scoped") {
      options.category_scoped = true;
      continue;
    }
    if (flag == "--no-retrieve") {
      options.retrieve = false;
      continue;
    }

    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    const std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--id" || flag == "-i") {
      options.document_id = value;
      options.conversation_id = value;
      options.task_id = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int(flag, value);
    } else if (flag == "--category") {
      options.categories.push_back(value);
    } else if (flag == "--conversation" || flag == "-c") {
      options.conversation_id = value;
    } else if (flag == "--tool" || flag == "-t") {
      options.tools.push_back(value);
      options.name = value;
    } else if (flag == "--exemplar") {
      options.exemplar_file = value;
    } else if (flag == "--title") {
      options.title = value;
    } else if (flag == "--format") {
      options.format = value;
    } else if (flag == "--name" || flag == "-n") {
      options.name = value;
    } else if (flag == "--description") {
      options.description = value;
    } else if (flag == "--color") {
      options.color = value;
    } else if (flag == "--args") {
      options.tool_arguments = value;
    } else if (flag == "--status" || flag == "-s") {
      options.status_filter = value;
    } else if (flag == "--days" || flag == "-d") {
      options.older_than_days = parse_int(flag, value);
    } else {
      throw CliError("Unknown option " + flag + " for command " + command);
    }
  }

  switch (options.command) {
    case Command::Ingest:
      require(!options.file_path.empty(), "ingest requires a file. Usage: ingest --file <path>");
      break;
    case Command::Remove:
      require(!options.document_id.empty(), "remove requires a document id. Usage: remove --id <document_id>");
      break;
    case Command::Search:
    case Command::Chat:
    case Command::Style:
      require(!options.query.empty(), command + " requires a query. Usage: " + command + " --query <text>");
      break;
    case Command::Turns:
    case Command::Export:
      require(!options.conversation_id.empty(), command + " requires a conversation id. Usage: " + command +
                                                    " --id <conversation_id>");
      break;
    case Command::AddCategory:
      require(!options.name.empty(), "add-category requires a name. Usage: add-category --name <name>");
      break;
    case Command::Invoke:
      require(!options.name.empty(), "invoke requires a tool. Usage: invoke --tool <name> [--args <json>]");
      break;
    case Command::TaskStatus:
    case Command::TaskProgress:
      require(!options.task_id.empty(), command + " requires a task ID. Usage: " + command + " --id <task_id>");
      break;
    default:
      break;
  }
  return options;
}

nlohmann::json CliHandler::build_request_body(const CliOptions& options) {
  nlohmann::json body = nlohmann::json::object();
  switch (options.command) {
    case Command::Ingest:
      body["file_path"] = options.file_path;
      break;
    case Command::Remove:
      body["document_id"] = options.document_id;
      break;
    case Command::Search:
      body["query"] = options.query;
      if (options.top_k > 0) body["top_k"] = options.top_k;
      if (!options.categories.empty()) body["categories"] = options.categories;
      body["category_scoped"] = options.category_scoped;
      break;
    case Command::Chat:
    case Command::Style: {
      body["query"] = options.query;
      if (!options.conversation_id.empty()) body["conversation_id"] = options.conversation_id;
      if (options.top_k > 0) body["top_k"] = options.top_k;
      if (!options.categories.empty()) body["categories"] = options.categories;
      body["category_scoped"] = options.category_scoped;
      body["retrieve"] = options.retrieve;
      nlohmann::json tools = nlohmann::json::array();
      for (const auto& tool : options.tools) {
        tools.push_back({{"name", tool}, {"arguments", nlohmann::json::object()}});
      }
      if (!tools.empty()) body["tools"] = tools;
      if (options.command == Command::Style && !options.exemplar_file.empty()) {
        body["exemplar"] = read_file(options.exemplar_file);
      }
      break;
    }
    case Command::NewConversation:
      if (!options.title.empty()) body["title"] = options.title;
      break;
    case Command::Export:
      body["format"] = options.format;
      break;
    case Command::AddCategory:
      body["name"] = options.name;
      if (!options.description.empty()) body["description"] = options.description;
      if (!options.color.empty()) body["color"] = options.color;
      break;
    case Command::Invoke: {
      nlohmann::json arguments = nlohmann::json::object();
      if (!options.tool_arguments.empty()) {
        arguments = nlohmann::json::parse(options.tool_arguments, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object()) {
          throw CliError("--args must be a JSON object");
        }
      }
      body["arguments"] = arguments;
      if (!options.conversation_id.empty()) body["conversation_id"] = options.conversation_id;
      break;
    }
    case Command::ClearTasks:
      body["older_than_days"] = options.older_than_days;
      break;
    default:
      break;
  }
  return body;
}

int CliHandler::execute_command(const CliOptions& options) {
  if (options.command == Command::Help) {
    print_help();
    return 0;
  }

  const nlohmann::json body = build_request_body(options);
  std::string method = "GET";
  std::string endpoint;

  switch (options.command) {
    case Command::Ingest: method = "POST"; endpoint = "/documents"; break;
    case Command::Remove: method = "DELETE"; endpoint = "/documents"; break;
    case Command::Documents: endpoint = "/documents"; break;
    case Command::Search: method = "POST"; endpoint = "/search"; break;
    case Command::Chat: method = "POST"; endpoint = "/chat"; break;
    case Command::Style: method = "POST"; endpoint = "/style"; break;
    case Command::Conversations: endpoint = "/conversations"; break;
    case Command::NewConversation: method = "POST"; endpoint = "/conversations"; break;
    case Command::Turns: endpoint = "/conversations/" + options.conversation_id + "/turns"; break;
    case Command::Export:
      method = "POST";
      endpoint = "/conversations/" + options.conversation_id + "/export";
      break;
    case Command::Stats: endpoint = "/statistics"; break;
    case Command::Categories: endpoint = "/categories"; break;
    case Command::AddCategory: method = "POST"; endpoint = "/categories"; break;
    case Command::Tools: endpoint = "/tools"; break;
    case Command::Invoke: method = "POST"; endpoint = "/tools/" + options.name + "/invoke"; break;
    case Command::ListTasks:
      endpoint = "/tasks";
      if (!options.status_filter.empty()) {
        endpoint += "?status=" + options.status_filter;
      }
      break;
    case Command::TaskStatus: endpoint = "/tasks/" + options.task_id + "/status"; break;
    case Command::TaskProgress: endpoint = "/tasks/" + options.task_id + "/progress"; break;
    case Command::ClearTasks: method = "POST"; endpoint = "/tasks/clear"; break;
    case Command::Snapshot: method = "POST"; endpoint = "/index/snapshot"; break;
    case Command::RebuildIndex: method = "POST"; endpoint = "/index/rebuild"; break;
    case Command::VerifyIndex: endpoint = "/index/verify"; break;
    case Command::Help: break;
  }

  try {
    ApiResponse response = make_request(method, endpoint, method == "GET" ? nullptr : &body);
    if (options.command == Command::Search && response.ok()) {
      print_search_response(response.body);
    } else if ((options.command == Command::Chat || options.command == Command::Style) &&
               response.body.contains("state")) {
      print_turn_response(response.body);
    } else if (!response.ok()) {
      print_error(response.body.value("error", std::string("HTTP ") + std::to_string(response.status)));
    } else {
      print_json_response(response.body);
    }
    return response.ok() ? 0 : 1;
  } catch (const CliError& e) {
    print_error(e.what());
    return 1;
  }
}

ApiResponse CliHandler::make_request(const std::string& method,
                                     const std::string& endpoint,
                                     const nlohmann::json* data) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }

  std::string url = build_url(endpoint);
  std::string request_json = data ? data->dump() : std::string();
  std::string response_buffer;
  struct curl_slist* headers = nullptr;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (method != "GET") {
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  if (data) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  ApiResponse response;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = nlohmann::json::parse(response_buffer, nullptr, false);
  if (response.body.is_discarded()) {
    throw CliError("Server returned a non-JSON response (HTTP " + std::to_string(response.status) + ")");
  }
  return response;
}

void CliHandler::set_api_base_url(const std::string& url) {
  api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
  std::cout << "\n=== Search Results ===" << std::endl;
  const auto& data = response.contains("data") ? response.at("data") : response;
  if (!data.contains("chunks") || data.at("chunks").empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }

  for (const auto& chunk : data.at("chunks")) {
    std::string content = chunk.value("content", std::string());
    std::cout << "  * " << chunk.value("document_id", std::string()) << ":" << chunk.value("chunk_index", 0)
              << " | Score: " << std::fixed << std::setprecision(3) << chunk.value("score", 0.0f) << std::endl;
    std::cout << "    " << content.substr(0, 100);
    if (content.size() > 100) {
      std::cout << "...";
    }
    std::cout << std::endl << std::endl;
  }
}

void CliHandler::print_turn_response(const nlohmann::json& response) {
  if (response.value("state", std::string()) != "COMPLETED") {
    const auto& error = response.contains("error") ? response.at("error") : nlohmann::json::object();
    print_error(error.value("kind", std::string("Failed")) + ": " + error.value("message", std::string()));
    return;
  }

  std::cout << response.value("answer", std::string()) << std::endl;
  if (response.contains("provenance") && !response.at("provenance").empty()) {
    std::cout << "\nSources:" << std::endl;
    for (const auto& source : response.at("provenance")) {
      std::cout << "  - " << source.value("document_id", std::string()) << " [" << source.value("start_offset", 0)
                << ", " << source.value("end_offset", 0) << ")" << std::endl;
    }
  }
  if (response.contains("tool_calls") && !response.at("tool_calls").empty()) {
    std::cout << "\nTools:" << std::endl;
    for (const auto& call : response.at("tool_calls")) {
      std::cout << "  - " << call.value("name", std::string()) << (call.value("success", false) ? " ok" : " failed")
                << std::endl;
    }
  }
}

void CliHandler::print_error(const std::string& error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << R"(
LocalMind CLI - local document assistant

Usage: localmind <command> [options]

Documents:
  ingest, i         Queue a .txt or .md file for indexing
    --file, -f <path>
  remove, rm        Queue removal of an indexed document
    --id, -i <document_id>
  documents, docs   List indexed documents

Questions:
  search, s         Semantic search over indexed chunks
    --query, -q <text>   --top-k, -k <n>   --category <name> (repeatable)   --scoped
  chat, c           Ask a grounded question
    --query, -q <text>   --conversation, -c <id>   --tool, -t <name> (repeatable)
    --category <name>    --scoped   --no-retrieve
  style             Answer in the style of an exemplar
    --query, -q <text>   --exemplar <file>

Conversations:
  conversations     List conversations
  new-conversation  Create a conversation     --title <text>
  turns             Show a conversation       --id <conversation_id>
  export            Export a conversation     --id <conversation_id> --format json|txt|md

Tools and categories:
  stats             Document and conversation statistics
  categories        List categories
  add-category      --name <name> [--description <text>] [--color <#hex>]
  tools             List registered tools
  invoke            --tool <name> [--args '<json object>'] [--conversation <id>]

Tasks:
  tasks, lt         List tasks             [--status PENDING|PROCESSING|COMPLETED|FAILED]
  task-status, ts   --id <task_id>
  task-progress, tp --id <task_id>
  clear-tasks, ct   [--days <n>]  (default 7)

Index:
  snapshot          Write an index snapshot now
  rebuild-index     Rebuild the vector index from stored vectors
  verify-index      Check index and store agree

Environment Variables:
  API_BASE_URL  Base URL for the LocalMind API (default: http://127.0.0.1:3030)
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
  return api_base_url_ + endpoint;
}

}  // namespace localmind_cli
