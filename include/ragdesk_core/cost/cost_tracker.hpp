#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ragdesk_core {

class CostTrackerError : public std::exception {
 public:
  explicit CostTrackerError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// What a single remote call consumed
struct UsageRecord {
  std::string model;
  long long input_tokens = 0;
  long long output_tokens = 0;
  size_t item_count = 0;
  std::string description;
};

struct TrackedCall {
  std::string timestamp;
  UsageRecord usage;
  double input_cost = 0.0;
  double output_cost = 0.0;
  double total_cost = 0.0;
};

// USD per one million tokens
struct ModelPricing {
  double input;
  double output;
};

struct ModelCostBreakdown {
  int calls = 0;
  long long tokens = 0;
  double cost = 0.0;
};

struct CostSummary {
  int calls = 0;
  long long total_tokens = 0;
  double total_cost = 0.0;
  std::map<std::string, ModelCostBreakdown> by_model;
};

/**
 * @class CostTracker
 * @brief Append-only ledger of API usage and what it cost.
 *
 * Every tracked call is kept for the session and appended to the history. When
 * a log file is configured, the history is loaded from it at construction and
 * written back after every call. Calls to models without a known price are
 * still recorded, at zero cost.
 */
class CostTracker {
 public:
  // An empty log_file keeps the history in memory only
  explicit CostTracker(std::filesystem::path log_file = {});
  virtual ~CostTracker() = default;

  CostTracker(const CostTracker &) = delete;
  CostTracker &operator=(const CostTracker &) = delete;

  // Records the call and returns its cost in USD
  virtual double track_call(const UsageRecord &usage);

  CostSummary session_summary() const;
  // Every call in the history, earlier sessions included
  CostSummary project_summary() const;
  double project_total_cost() const;
  double estimate_remaining_budget(double total_budget) const;

  // Both leave the stream's number formatting as they found it
  void print_session_summary(std::ostream &out) const;
  void print_project_summary(std::ostream &out, const std::string &project_name = "Project") const;

  const std::vector<TrackedCall> &session_calls() const {
    return session_calls_;
  }
  const std::vector<TrackedCall> &history() const {
    return history_;
  }

  static std::optional<ModelPricing> pricing_for(const std::string &model);

 private:
  std::filesystem::path log_file_;
  std::vector<TrackedCall> session_calls_;
  std::vector<TrackedCall> history_;

  void load_history();
  void save_history() const;
  static std::string current_timestamp();
};

}  // namespace ragdesk_core
