#include <reporter.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace std;

Reporter::Reporter(std::ostream& out, Level level) :
  out_(&out),
  level_(level),
  recording_(false),
  num_warnings_(0),
  num_errors_(0)
{
}

Reporter& Reporter::global()
{
  static Reporter reporter(std::cout, Warning);
  return reporter;
}

Reporter::Level Reporter::parseLevel(const std::string& name)
{
  string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug")
    return Debug;
  if (lower == "info")
    return Info;
  if (lower == "warning")
    return Warning;
  if (lower == "error")
    return Error;
  if (lower == "silent")
    return Silent;
  throw std::invalid_argument("Unknown log level: " + name);
}

void Reporter::log(Level level, const std::string& msg)
{
  if (level == Warning)
    num_warnings_ += 1;
  if (level == Error)
    num_errors_ += 1;
  if (recording_)
    history_.push_back(Entry(level, msg));
  if (level < level_)
    return;

  static const char* tags[] = { "[debug] ", "", "[warning] ", "[error] ", "" };
  *out_ << tags[level] << msg << endl;
}

void Reporter::logAtpProduction(const std::string& source, double amount)
{
  atp_production_[source] += amount;
  logEvent(fmt::format("ATP produced by {}: {:.2f}", source, amount));
}

double Reporter::atpProduced(const std::string& source) const
{
  auto it = atp_production_.find(source);
  if (it == atp_production_.end())
    return 0.0;
  return it->second;
}

void Reporter::reportSimulationResults(const std::map<std::string, double>& results)
{
  logEvent("Simulation results:");
  size_t width = 0;
  for (const auto& kv : results)
    width = std::max(width, kv.first.size());
  for (const auto& kv : results)
    logEvent(fmt::format("  {:<{}} {:.4f}", kv.first, width, kv.second));
  logEvent("ATP production by source:");
  for (const auto& kv : atp_production_)
    logEvent(fmt::format("  {:<{}} {:.4f}", kv.first, width, kv.second));
}

void Reporter::clear()
{
  history_.clear();
  atp_production_.clear();
  num_warnings_ = 0;
  num_errors_ = 0;
}

bool Reporter::contains(const std::string& substring) const
{
  for (const Entry& entry : history_)
    if (entry.second.find(substring) != string::npos)
      return true;
  return false;
}
