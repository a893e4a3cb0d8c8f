#include "ragdesk_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision

namespace ragdesk_cli {

namespace {

// Walks "--flag value" pairs after the command name
template <typename Handler>
void for_each_flag(int argc, char* argv[], Handler handler) {
    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        if (!handler(flag, std::string(argv[i + 1]))) {
            throw CliError("Unknown option: " + flag);
        }
    }
}

int parse_top_k(const std::string& value) {
    try {
        int top_k = std::stoi(value);
        if (top_k <= 0) {
            throw CliError("--top-k must be greater than 0");
        }
        return top_k;
    } catch (const std::invalid_argument&) {
        throw CliError("--top-k expects a number, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw CliError("--top-k is out of range: " + value);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
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
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "load" || command == "l") {
        options.command = Command::Load;
        for_each_flag(argc, argv, [&](const std::string& flag, const std::string& value) {
            if (flag == "--file" || flag == "-f") {
                options.file_paths.push_back(value);
                return true;
            }
            return false;
        });
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        for_each_flag(argc, argv, [&](const std::string& flag, const std::string& value) {
            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(value);
            } else {
                return false;
            }
            return true;
        });
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
    } else if (command == "tools") {
        options.command = Command::Tools;
    } else if (command == "tool" || command == "t") {
        options.command = Command::Tool;
        for_each_flag(argc, argv, [&](const std::string& flag, const std::string& value) {
            if (flag == "--name" || flag == "-n") {
                options.tool_name = value;
            } else if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else {
                return false;
            }
            return true;
        });
        if (options.tool_name.empty() || options.query.empty()) {
            throw CliError("Tool command requires a name and a query. Usage: tool --name <tool> --query <query>");
        }
    } else if (command == "check" || command == "c") {
        options.command = Command::Check;
        for_each_flag(argc, argv, [&](const std::string& flag, const std::string& value) {
            if (flag == "--answer" || flag == "-a") {
                options.answer = value;
            } else if (flag == "--tool" || flag == "-t") {
                options.tools_used.push_back(value);
            } else {
                return false;
            }
            return true;
        });
        if (options.answer.empty()) {
            throw CliError("Check command requires an answer. Usage: check --answer <text> [--tool <name>]...");
        }
    } else if (command == "route" || command == "r") {
        options.command = Command::Route;
        for_each_flag(argc, argv, [&](const std::string& flag, const std::string& value) {
            if (flag == "--question" || flag == "-q") {
                options.question = value;
                return true;
            }
            return false;
        });
        if (options.question.empty()) {
            throw CliError("Route command requires a question. Usage: route --question <text>");
        }
    } else if (command == "costs") {
        options.command = Command::Costs;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Load:
            handle_load_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Tools:
            handle_tools_command(options);
            break;
        case Command::Tool:
            handle_tool_command(options);
            break;
        case Command::Check:
            handle_check_command(options);
            break;
        case Command::Route:
            handle_route_command(options);
            break;
        case Command::Costs:
            handle_costs_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_load_command(const CliOptions& options) {
    nlohmann::json request_data = nlohmann::json::object();
    if (options.file_paths.empty()) {
        std::cout << "Loading documents directory on the server..." << std::endl;
    } else {
        std::cout << "Loading " << options.file_paths.size() << " file(s)..." << std::endl;
        request_data["file_paths"] = options.file_paths;
    }

    try {
        nlohmann::json response = make_post_request("/documents/load", request_data);
        print_load_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to load documents: " + std::string(e.what()));
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Document search for: " << options.query << " (top_k: " << options.top_k << ")" << std::endl;

    nlohmann::json request_data = {
        {"query", options.query},
        {"top_k", options.top_k}
    };

    try {
        nlohmann::json response = make_post_request("/search", request_data);
        print_search_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to search: " + std::string(e.what()));
    }
}

void CliHandler::handle_tools_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/tools");
        std::cout << "\n=== Available Tools ===" << std::endl;
        for (const auto& tool : response.value("data", nlohmann::json::array())) {
            std::cout << "\n  " << tool.value("name", "") << std::endl;
            std::cout << "    " << tool.value("description", "") << std::endl;
        }
    } catch (const std::exception& e) {
        print_error("Failed to list tools: " + std::string(e.what()));
    }
}

void CliHandler::handle_tool_command(const CliOptions& options) {
    std::cout << "Invoking " << options.tool_name << " for: " << options.query << std::endl;

    try {
        nlohmann::json response =
            make_post_request("/tools/" + options.tool_name, {{"query", options.query}});
        std::cout << "\n" << response.value("result", "") << std::endl;
    } catch (const std::exception& e) {
        print_error("Failed to invoke tool: " + std::string(e.what()));
    }
}

void CliHandler::handle_check_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"answer", options.answer},
        {"tools_used", options.tools_used}
    };

    try {
        nlohmann::json response = make_post_request("/guardrails/check", request_data);
        const auto data = response.value("data", nlohmann::json::object());
        std::cout << "Has sources:     " << (data.value("has_sources", false) ? "yes" : "no") << std::endl;
        std::cout << "Confidence:      " << std::fixed << std::setprecision(1)
                  << data.value("confidence", 0.0) << std::endl;
        std::cout << "Uncertain:       " << (data.value("is_uncertain", false) ? "yes" : "no") << std::endl;
        std::cout << "\n" << data.value("enhanced_answer", "") << std::endl;
    } catch (const std::exception& e) {
        print_error("Failed to check answer: " + std::string(e.what()));
    }
}

void CliHandler::handle_route_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_post_request("/route", {{"question", options.question}});
        print_json_response(response["data"]);
    } catch (const std::exception& e) {
        print_error("Failed to route question: " + std::string(e.what()));
    }
}

void CliHandler::handle_costs_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/costs");
        const auto data = response.value("data", nlohmann::json::object());
        std::cout << "\n=== Session Costs ===" << std::endl;
        std::cout << "Calls:        " << data.value("calls", 0) << std::endl;
        std::cout << "Tokens:       " << data.value("total_tokens", 0LL) << std::endl;
        std::cout << "Session cost: $" << std::fixed << std::setprecision(6)
                  << data.value("total_cost", 0.0) << std::endl;
        std::cout << "All-time:     $" << std::fixed << std::setprecision(6)
                  << data.value("project_total_cost", 0.0) << std::endl;
        for (const auto& [model, breakdown] : data.value("by_model", nlohmann::json::object()).items()) {
            std::cout << "  " << model << ": " << breakdown.value("calls", 0) << " calls, $"
                      << std::fixed << std::setprecision(6) << breakdown.value("cost", 0.0) << std::endl;
        }
    } catch (const std::exception& e) {
        print_error("Failed to fetch costs: " + std::string(e.what()));
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    curl_easy_reset(curl_handle_);
    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform_request(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string detail = body.is_object() ? body.value("error", "") : "";
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                       (detail.empty() ? "" : " (" + detail + ")"));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned a response that is not JSON");
    }
    return body;
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

void CliHandler::print_load_response(const nlohmann::json& response) {
    const auto data = response.value("data", nlohmann::json::object());
    for (const auto& doc : data.value("loaded", nlohmann::json::array())) {
        std::cout << "  Loaded " << doc.value("source_name", "") << ": "
                  << doc.value("chunks", 0) << " chunks" << std::endl;
    }
    for (const auto& failure : data.value("failed", nlohmann::json::array())) {
        std::cerr << "  Failed " << failure.value("path", "") << ": "
                  << failure.value("reason", "") << std::endl;
    }
    std::cout << "Total chunks: " << data.value("total_chunks", 0) << std::endl;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    const auto data = response.value("data", nlohmann::json::object());
    const auto results = data.value("results", nlohmann::json::array());
    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "\n=== Document Search Results ===" << std::endl;
    for (const auto& result : results) {
        std::cout << "\n[" << result.value("rank", 0) << "] " << result.value("source_name", "")
                  << " (chunk " << result.value("chunk_index", 0) << ")"
                  << " | Distance: " << std::fixed << std::setprecision(4)
                  << result.value("distance", 0.0) << std::endl;
        std::cout << "    " << result.value("excerpt", "") << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
RAGDesk CLI - Search your personal documents

Usage: ragdesk_cli <command> [options]

Document Commands:
  load, l       Load documents into the server, replacing the current corpus
    --file, -f <path>    File to load (.txt or .pdf); repeat for several files.
                         Without --file the server's documents directory is loaded.

  search, s     Semantic search over the loaded documents
    --query, -q <query>  Search query
    --top-k, -k <num>    Number of results to return (default: 3)

Tool Commands:
  tools         List the tools the server exposes
  tool, t       Invoke a tool by name
    --name, -n <tool>    search_documents or search_web
    --query, -q <query>  Tool input

Answer Commands:
  check, c      Run the answer guardrails
    --answer, -a <text>  Answer text to check
    --tool, -t <name>    Tool used to produce the answer; repeatable

  route, r      Show which tools a question should use
    --question, -q <text>

  costs         Show API usage and cost for the server session

General:
  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the RAGDesk API (default: http://127.0.0.1:3030)

Examples:
  ragdesk_cli load --file notes.txt --file paper.pdf
  ragdesk_cli search --query "chunk size" --top-k 5
  ragdesk_cli tool --name search_web --query "latest RAG news"
  ragdesk_cli check --answer "I'm not sure." --tool search_documents
  ragdesk_cli route --question "What did I write in my notes about RAG?"
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace ragdesk_cli
