#pragma once

#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Console sink for everything the simulator wants to say.
// Reactions log to Reporter::global(); pathways and the controller take a Reporter& so tests
// can hand them a recording one.
class Reporter
{
public:
  enum Level {
    Debug=0,
    Info=1,
    Warning=2,
    Error=3,
    Silent=4
  };

  typedef std::pair<Level, std::string> Entry;

  Reporter(std::ostream& out = std::cout, Level level = Info);

  static Reporter& global();
  static Level parseLevel(const std::string& name);

  void logDebug(const std::string& msg) { log(Debug, msg); }
  void logEvent(const std::string& msg) { log(Info, msg); }
  void logWarning(const std::string& msg) { log(Warning, msg); }
  void logError(const std::string& msg) { log(Error, msg); }
  void log(Level level, const std::string& msg);

  void logAtpProduction(const std::string& source, double amount);
  void reportSimulationResults(const std::map<std::string, double>& results);

  void setLevel(Level level) { level_ = level; }
  Level level() const { return level_; }
  void setOutput(std::ostream& out) { out_ = &out; }

  // When recording, every entry (including ones below the print threshold) is kept in history_.
  void setRecording(bool recording) { recording_ = recording; }
  void clear();
  int numWarnings() const { return num_warnings_; }
  int numErrors() const { return num_errors_; }
  double atpProduced(const std::string& source) const;
  bool contains(const std::string& substring) const;
  const std::vector<Entry>& history() const { return history_; }

private:
  std::ostream* out_;
  Level level_;
  bool recording_;
  int num_warnings_;
  int num_errors_;
  std::vector<Entry> history_;
  std::map<std::string, double> atp_production_;
};
