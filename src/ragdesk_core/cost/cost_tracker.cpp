#include "ragdesk_core/cost/cost_tracker.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace ragdesk_core {

namespace {

// Restores the caller's number formatting when a summary is done printing
class StreamFormatGuard {
 public:
  explicit StreamFormatGuard(std::ostream &out)
      : out_(out), flags_(out.flags()), precision_(out.precision()) {}
  ~StreamFormatGuard() {
    out_.flags(flags_);
    out_.precision(precision_);
  }

  StreamFormatGuard(const StreamFormatGuard &) = delete;
  StreamFormatGuard &operator=(const StreamFormatGuard &) = delete;

 private:
  std::ostream &out_;
  std::ios_base::fmtflags flags_;
  std::streamsize precision_;
};

CostSummary summarize(const std::vector<TrackedCall> &calls) {
  CostSummary summary;
  for (const auto &call : calls) {
    const long long tokens = call.usage.input_tokens + call.usage.output_tokens;
    summary.calls++;
    summary.total_tokens += tokens;
    summary.total_cost += call.total_cost;

    auto &model = summary.by_model[call.usage.model];
    model.calls++;
    model.tokens += tokens;
    model.cost += call.total_cost;
  }
  return summary;
}

const std::unordered_map<std::string, ModelPricing> &pricing_table() {
  static const std::unordered_map<std::string, ModelPricing> table = {
      {"claude-haiku", {0.80, 4.00}},
      {"claude-sonnet", {3.00, 15.00}},
      {"gpt-4o-mini", {0.15, 0.60}},
      {"gpt-4o", {2.50, 10.00}},
      {"text-embedding-3-small", {0.02, 0.00}},
      {"text-embedding-3-large", {0.13, 0.00}},
      {"text-embedding-ada-002", {0.10, 0.00}},
  };
  return table;
}

nlohmann::json to_json(const TrackedCall &call) {
  return {{"timestamp", call.timestamp},
          {"model", call.usage.model},
          {"input_tokens", call.usage.input_tokens},
          {"output_tokens", call.usage.output_tokens},
          {"total_tokens", call.usage.input_tokens + call.usage.output_tokens},
          {"item_count", call.usage.item_count},
          {"input_cost", call.input_cost},
          {"output_cost", call.output_cost},
          {"total_cost", call.total_cost},
          {"description", call.usage.description}};
}

TrackedCall from_json(const nlohmann::json &entry) {
  TrackedCall call;
  call.timestamp = entry.value("timestamp", std::string());
  call.usage.model = entry.value("model", std::string());
  call.usage.input_tokens = entry.value("input_tokens", 0LL);
  call.usage.output_tokens = entry.value("output_tokens", 0LL);
  call.usage.item_count = entry.value("item_count", static_cast<size_t>(0));
  call.usage.description = entry.value("description", std::string());
  call.input_cost = entry.value("input_cost", 0.0);
  call.output_cost = entry.value("output_cost", 0.0);
  call.total_cost = entry.value("total_cost", 0.0);
  return call;
}

}  // namespace

CostTracker::CostTracker(std::filesystem::path log_file) : log_file_(std::move(log_file)) {
  load_history();
}

std::optional<ModelPricing> CostTracker::pricing_for(const std::string &model) {
  const auto &table = pricing_table();
  auto it = table.find(model);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

double CostTracker::track_call(const UsageRecord &usage) {
  TrackedCall call;
  call.timestamp = current_timestamp();
  call.usage = usage;

  auto pricing = pricing_for(usage.model);
  if (pricing) {
    call.input_cost = (static_cast<double>(usage.input_tokens) / 1'000'000.0) * pricing->input;
    call.output_cost = (static_cast<double>(usage.output_tokens) / 1'000'000.0) * pricing->output;
  } else {
    std::cerr << "[CostTracker] Warning: no pricing for model '" << usage.model
              << "', recording usage at zero cost" << std::endl;
  }
  call.total_cost = call.input_cost + call.output_cost;

  session_calls_.push_back(call);
  history_.push_back(call);
  save_history();
  return call.total_cost;
}

CostSummary CostTracker::session_summary() const {
  return summarize(session_calls_);
}

CostSummary CostTracker::project_summary() const {
  return summarize(history_);
}

double CostTracker::project_total_cost() const {
  double total = 0.0;
  for (const auto &call : history_) {
    total += call.total_cost;
  }
  return total;
}

double CostTracker::estimate_remaining_budget(double total_budget) const {
  return total_budget - project_total_cost();
}

void CostTracker::print_session_summary(std::ostream &out) const {
  const CostSummary summary = session_summary();
  if (summary.calls == 0) {
    out << "No API calls tracked in this session" << std::endl;
    return;
  }

  StreamFormatGuard format_guard(out);
  out << std::string(60, '=') << "\n"
      << "SESSION SUMMARY\n"
      << std::string(60, '=') << "\n"
      << "Total API calls: " << summary.calls << "\n"
      << "Total tokens: " << summary.total_tokens << "\n"
      << "Total cost: $" << std::fixed << std::setprecision(4) << summary.total_cost << "\n"
      << "Average cost per call: $" << std::setprecision(6) << summary.total_cost / summary.calls
      << "\n"
      << std::string(60, '=') << "\n"
      << "\nBreakdown by model:\n";
  for (const auto &[model, stats] : summary.by_model) {
    out << "  " << model << ":\n"
        << "    Calls: " << stats.calls << "\n"
        << "    Tokens: " << stats.tokens << "\n"
        << "    Cost: $" << std::setprecision(4) << stats.cost << "\n";
  }
  out << std::string(60, '=') << std::endl;
}

void CostTracker::print_project_summary(std::ostream &out,
                                        const std::string &project_name) const {
  const CostSummary summary = project_summary();
  if (summary.calls == 0) {
    out << "No API calls tracked yet" << std::endl;
    return;
  }

  std::string heading = project_name;
  std::transform(heading.begin(), heading.end(), heading.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  StreamFormatGuard format_guard(out);
  out << "\n"
      << std::string(60, '=') << "\n"
      << heading << " - TOTAL COSTS\n"
      << std::string(60, '=') << "\n"
      << "Total API calls: " << summary.calls << "\n"
      << "Total tokens: " << summary.total_tokens << "\n"
      << "Total cost: $" << std::fixed << std::setprecision(2) << summary.total_cost << "\n"
      << std::string(60, '=') << std::endl;
}

void CostTracker::load_history() {
  if (log_file_.empty() || !std::filesystem::exists(log_file_)) {
    return;
  }

  std::ifstream file_stream(log_file_);
  if (!file_stream.is_open()) {
    throw CostTrackerError("Failed to open cost log: " + log_file_.string());
  }

  nlohmann::json entries;
  try {
    file_stream >> entries;
  } catch (const nlohmann::json::exception &e) {
    throw CostTrackerError("Failed to parse cost log '" + log_file_.string() + "': " + e.what());
  }
  if (!entries.is_array()) {
    throw CostTrackerError("Cost log is not a JSON array: " + log_file_.string());
  }

  for (const auto &entry : entries) {
    history_.push_back(from_json(entry));
  }
}

void CostTracker::save_history() const {
  if (log_file_.empty()) {
    return;
  }

  std::error_code ec;
  if (log_file_.has_parent_path()) {
    std::filesystem::create_directories(log_file_.parent_path(), ec);
  }

  nlohmann::json entries = nlohmann::json::array();
  for (const auto &call : history_) {
    entries.push_back(to_json(call));
  }

  std::ofstream file_stream(log_file_, std::ios::trunc);
  if (!file_stream.is_open()) {
    // The call stays in memory, only the on-disk copy is stale
    std::cerr << "[CostTracker] Warning: could not write cost log " << log_file_ << std::endl;
    return;
  }
  file_stream << entries.dump(2);
}

std::string CostTracker::current_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace ragdesk_core
