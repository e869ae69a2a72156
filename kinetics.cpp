#include <kinetics.h>
#include <reporter.h>
#include <fmt/core.h>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <sstream>

using namespace std;

namespace
{
  Amounts lowercaseKeys(const Amounts& amounts)
  {
    Amounts result;
    for (const auto& kv : amounts)
      result[lowercase(kv.first)] = kv.second;
    return result;
  }

  Amounts parseAmounts(const YAML::Node& yaml)
  {
    Amounts result;
    if (!yaml)
      return result;
    for (YAML::const_iterator it = yaml.begin(); it != yaml.end(); ++it)
      result[lowercase(it->first.as<string>())] = it->second.as<double>();
    return result;
  }

  double level(const Amounts& levels, const std::string& species)
  {
    auto it = levels.find(species);
    if (it == levels.end())
      return 0.0;
    return it->second;
  }

  Enzyme::Regulation parseRegulation(const YAML::Node& yaml)
  {
    if (!yaml["regulation"])
      return Enzyme::Competitive;
    string reg = lowercase(yaml["regulation"].as<string>());
    if (reg == "competitive")
      return Enzyme::Competitive;
    if (reg == "allosteric")
      return Enzyme::Allosteric;
    throw std::invalid_argument("Unknown enzyme regulation: " + reg);
  }

  string enzymeName(const YAML::Node& yaml)
  {
    if (yaml["enzyme"])
      return yaml["enzyme"].as<string>();
    return yaml["name"].as<string>();
  }

  vector<string> tokenizeSimple(const std::string& s)
  {
    vector<string> tokens;
    std::stringstream ss(s);
    string word;
    while (ss >> word)
      tokens.push_back(word);
    return tokens;
  }

  bool isNumber(const std::string& s, double* value)
  {
    if (s.empty())
      return false;
    char* end = nullptr;
    double v = strtod(s.c_str(), &end);
    if (*end != '\0')
      return false;
    *value = v;
    return true;
  }

  void parseHalfFormula(const std::vector<std::string>& tokens, size_t startidx, size_t endidx, Amounts* amounts)
  {
    double coeff = 1.0;
    for (size_t i = startidx; i < endidx; ++i) {
      double value;
      if (isNumber(tokens[i], &value))
        coeff = value;
      else if (tokens[i] == "+")
        continue;
      else {
        (*amounts)[tokens[i]] += coeff;
        coeff = 1.0;
      }
    }
  }

  void formatHalfFormula(const Amounts& amounts, std::ostream& os)
  {
    bool first = true;
    for (const auto& kv : amounts) {
      os << (first ? "" : " + ");
      if (kv.second != 1.0)
        os << kv.second << " ";
      os << kv.first;
      first = false;
    }
  }
}

void parseFormula(const std::string& formula, Amounts* consume, Amounts* produce)
{
  vector<string> tokens = tokenizeSimple(formula);
  int sep = -1;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i] == "->") {
      if (sep >= 0)
        throw std::invalid_argument("More than one -> in formula \"" + formula + "\"");
      sep = i;
    }
  }
  if (sep < 0)
    throw std::invalid_argument("No -> in formula \"" + formula + "\"");

  parseHalfFormula(tokens, 0, sep, consume);
  parseHalfFormula(tokens, sep+1, tokens.size(), produce);
}

std::string formatFormula(const Amounts& consume, const Amounts& produce)
{
  std::ostringstream oss;
  formatHalfFormula(consume, oss);
  oss << " -> ";
  formatHalfFormula(produce, oss);
  return oss.str();
}

double coefficient(const Amounts& amounts, const std::string& species)
{
  string lower = lowercase(species);
  double total = 0;
  for (const auto& kv : amounts)
    if (lowercase(kv.first) == lower)
      total += kv.second;
  return total;
}

double rateMM(double substrate_concentration, double km, double vmax)
{
  assert(substrate_concentration >= 0);
  assert(km > 0);
  assert(vmax >= 0);
  return vmax * substrate_concentration / (km + substrate_concentration);
}

double rateHill(double substrate_concentration, double k, double vmax, double hill_coefficient)
{
  assert(substrate_concentration >= 0);
  assert(k > 0);
  assert(hill_coefficient > 0);
  double sn = pow(substrate_concentration, hill_coefficient);
  return vmax * sn / (pow(k, hill_coefficient) + sn);
}

Enzyme::Enzyme(const std::string& name, double vmax, double km,
               const Amounts& inhibitors, const Amounts& activators,
               double hill_coefficient, Regulation regulation) :
  name_(name),
  vmax_(vmax),
  km_(km),
  inhibitors_(lowercaseKeys(inhibitors)),
  activators_(lowercaseKeys(activators)),
  hill_coefficient_(hill_coefficient),
  regulation_(regulation),
  activity_(1.0)
{
  validate();
}

Enzyme::Enzyme(const std::string& name, double vmax, const Amounts& kms,
               const Amounts& inhibitors, const Amounts& activators,
               double hill_coefficient, Regulation regulation) :
  name_(name),
  vmax_(vmax),
  km_(kms.empty() ? 1.0 : kms.begin()->second),
  kms_(lowercaseKeys(kms)),
  inhibitors_(lowercaseKeys(inhibitors)),
  activators_(lowercaseKeys(activators)),
  hill_coefficient_(hill_coefficient),
  regulation_(regulation),
  activity_(1.0)
{
  validate();
}

Enzyme::Enzyme(const YAML::Node& yaml) :
  name_(enzymeName(yaml)),
  vmax_(yaml["vmax"] ? yaml["vmax"].as<double>() : yaml["kcat"].as<double>()),
  km_(yaml["km"] ? yaml["km"].as<double>() : 1.0),
  kms_(parseAmounts(yaml["KMs"])),
  inhibitors_(parseAmounts(yaml["inhibitors"])),
  activators_(parseAmounts(yaml["activators"])),
  hill_coefficient_(yaml["hill"] ? yaml["hill"].as<double>() : 0.0),
  regulation_(parseRegulation(yaml)),
  activity_(1.0)
{
  validate();
}

void Enzyme::validate() const
{
  if (vmax_ < 0)
    throw std::invalid_argument(fmt::format("Enzyme {}: vmax must be non-negative, got {}", name_, vmax_));
  if (km_ <= 0)
    throw std::invalid_argument(fmt::format("Enzyme {}: km must be positive, got {}", name_, km_));
  if (hill_coefficient_ < 0)
    throw std::invalid_argument(fmt::format("Enzyme {}: hill coefficient must be non-negative, got {}", name_, hill_coefficient_));
  for (const auto& kv : kms_)
    if (kv.second <= 0)
      throw std::invalid_argument(fmt::format("Enzyme {}: Km for {} must be positive, got {}", name_, kv.first, kv.second));
  for (const auto& kv : inhibitors_)
    if (kv.second <= 0)
      throw std::invalid_argument(fmt::format("Enzyme {}: Ki for {} must be positive, got {}", name_, kv.first, kv.second));
  for (const auto& kv : activators_)
    if (kv.second <= 0)
      throw std::invalid_argument(fmt::format("Enzyme {}: Ka for {} must be positive, got {}", name_, kv.first, kv.second));
}

double Enzyme::effectiveKm(double km, const Amounts& levels) const
{
  if (regulation_ == Allosteric)
    return km;
  double km_effective = km;
  for (const auto& kv : inhibitors_)
    km_effective *= 1.0 + level(levels, kv.first) / kv.second;
  return km_effective;
}

double Enzyme::effectiveVmax(const Amounts& levels) const
{
  if (regulation_ == Allosteric)
    return vmax_ * allostericRegulation(levels);

  double vmax_effective = vmax_ * activity_;
  for (const auto& kv : activators_)
    vmax_effective *= 1.0 + level(levels, kv.first) / kv.second;
  return vmax_effective;
}

double Enzyme::allostericRegulation(const Amounts& levels) const
{
  double activity = activity_;
  for (const auto& kv : inhibitors_)
    activity *= 1.0 / (1.0 + level(levels, kv.first) / kv.second);
  for (const auto& kv : activators_)
    activity *= 1.0 + level(levels, kv.first) / kv.second;
  return activity;
}

double Enzyme::calculateRate(double substrate_concentration, double km, const Amounts& levels) const
{
  double km_effective = effectiveKm(km, levels);
  double vmax_effective = effectiveVmax(levels);
  if (hill_coefficient_ > 0)
    return rateHill(substrate_concentration, km_effective, vmax_effective, hill_coefficient_);
  return rateMM(substrate_concentration, km_effective, vmax_effective);
}

double Enzyme::rate(const Amounts& levels, const std::vector<std::string>& default_substrates) const
{
  // Simplify: everything follows single-substrate kinetics, and we take the min across substrates.
  double minrate = std::numeric_limits<double>::max();
  bool any = false;
  if (!kms_.empty()) {
    for (const auto& kv : kms_) {
      minrate = std::min(minrate, calculateRate(level(levels, kv.first), kv.second, levels));
      any = true;
    }
  }
  else {
    for (const string& substrate : default_substrates) {
      minrate = std::min(minrate, calculateRate(level(levels, lowercase(substrate)), km_, levels));
      any = true;
    }
  }

  // Nothing to saturate on, so it just runs flat out.
  if (!any)
    return effectiveVmax(levels);
  return minrate;
}

std::vector<std::string> Enzyme::regulators() const
{
  vector<string> result;
  for (const auto& kv : inhibitors_)
    result.push_back(kv.first);
  for (const auto& kv : activators_)
    result.push_back(kv.first);
  return result;
}

void Enzyme::setActivity(double activity)
{
  if (activity < 0)
    throw std::invalid_argument(fmt::format("Enzyme {}: activity must be non-negative, got {}", name_, activity));
  activity_ = activity;
}

std::string Enzyme::_str() const
{
  std::ostringstream oss;
  oss << "Enzyme \"" << name_ << "\"" << endl;
  oss << "  vmax_: " << vmax_ << " activity_: " << activity_ << endl;
  if (kms_.empty())
    oss << "  km_: " << km_ << endl;
  for (const auto& kv : kms_)
    oss << "  km " << kv.first << ": " << kv.second << endl;
  for (const auto& kv : inhibitors_)
    oss << "  inhibitor " << kv.first << " (Ki " << kv.second << ")" << endl;
  for (const auto& kv : activators_)
    oss << "  activator " << kv.first << " (Ka " << kv.second << ")" << endl;
  if (hill_coefficient_ > 0)
    oss << "  hill_coefficient_: " << hill_coefficient_ << endl;
  if (regulation_ == Allosteric)
    oss << "  allosteric" << endl;
  return oss.str();
}

Reaction::Reaction(const std::string& name, Enzyme::Ptr enzyme, const Amounts& consume, const Amounts& produce) :
  name_(name),
  enzyme_(enzyme),
  consume_(consume),
  produce_(produce)
{
  if (!enzyme_)
    throw std::invalid_argument(fmt::format("Reaction {} has no enzyme", name_));
  for (const auto& kv : consume_)
    if (kv.second < 0)
      throw std::invalid_argument(fmt::format("Reaction {}: negative coefficient for {}", name_, kv.first));
  for (const auto& kv : produce_)
    if (kv.second < 0)
      throw std::invalid_argument(fmt::format("Reaction {}: negative coefficient for {}", name_, kv.first));
}

Reaction::Reaction(const std::string& name, Enzyme::Ptr enzyme, const std::string& formula) :
  name_(name),
  enzyme_(enzyme)
{
  if (!enzyme_)
    throw std::invalid_argument(fmt::format("Reaction {} has no enzyme", name_));
  parseFormula(formula, &consume_, &produce_);
}

Reaction::Reaction(const YAML::Node& yaml) :
  name_(yaml["name"].as<string>()),
  enzyme_(new Enzyme(yaml))
{
  parseFormula(yaml["formula"].as<string>(), &consume_, &produce_);
}

Amounts Reaction::levels(const MetaboliteStore& store) const
{
  Amounts result;
  for (const auto& kv : enzyme_->kms_)
    result[kv.first] = store.quantity(kv.first);
  for (const auto& kv : consume_)
    result[lowercase(kv.first)] = store.quantity(kv.first);
  for (const string& regulator : enzyme_->regulators())
    if (store.has(regulator))
      result[regulator] = store.quantity(regulator);
  return result;
}

double Reaction::execute(MetaboliteStore& store, double time_step, double max_extent) const
{
  return executeDetailed(store, time_step, max_extent).rate_;
}

ReactionOutcome Reaction::executeDetailed(MetaboliteStore& store, double time_step, double max_extent) const
{
  if (time_step < 0)
    throw std::invalid_argument(fmt::format("Reaction {}: time step cannot be negative ({})", name_, time_step));
  if (max_extent < 0)
    throw std::invalid_argument(fmt::format("Reaction {}: max extent cannot be negative ({})", name_, max_extent));

  Reporter& reporter = Reporter::global();
  ReactionOutcome outcome;
  try {
    vector<string> substrates;
    for (const auto& kv : consume_)
      substrates.push_back(kv.first);
    outcome.reaction_rate_ = enzyme_->rate(levels(store), substrates);
    reporter.logDebug(fmt::format("Reaction '{}': initial reaction rate: {:.6f}", name_, outcome.reaction_rate_));

    outcome.factors_.push_back(LimitingFactor{"reaction_rate", outcome.reaction_rate_ * time_step});
    for (const auto& kv : consume_) {
      if (kv.second > 0) {
        const Metabolite& met = store.metabolite(kv.first);
        outcome.factors_.push_back(LimitingFactor{met.name_ + "_availability", (met.quantity() - met.min_quantity_) / kv.second});
      }
    }
    if (std::isfinite(max_extent))
      outcome.factors_.push_back(LimitingFactor{"requested_extent", max_extent});

    outcome.rate_ = std::numeric_limits<double>::max();
    for (const LimitingFactor& factor : outcome.factors_)
      outcome.rate_ = std::min(outcome.rate_, factor.value_);
    outcome.rate_ = std::max(outcome.rate_, 0.0);
    for (const LimitingFactor& factor : outcome.factors_)
      if (factor.value_ <= outcome.rate_)
        outcome.binding_.push_back(factor.name_);

    reporter.logDebug(fmt::format("Reaction '{}': potential limiting factors:", name_));
    for (const LimitingFactor& factor : outcome.factors_)
      reporter.logDebug(fmt::format("  - {}: {:.6f}", factor.name_, factor.value_));

    string binding;
    for (size_t i = 0; i < outcome.binding_.size(); ++i)
      binding += (i > 0 ? ", " : "") + outcome.binding_[i];
    reporter.logDebug(fmt::format("Reaction '{}': rate limited by {}. Actual rate: {:.6f}", name_, binding, outcome.rate_));

    if (outcome.rate_ > 0) {
      Amounts consumed;
      for (const auto& kv : consume_) {
        const Metabolite& met = store.metabolite(kv.first);
        // Don't let coeff * (quantity / coeff) rounding ask for more than is there.
        consumed[kv.first] = std::min(kv.second * outcome.rate_, met.quantity() - met.min_quantity_);
      }
      Amounts produced;
      for (const auto& kv : produce_)
        produced[kv.first] = kv.second * outcome.rate_;
      store.exchange(consumed, produced);
    }
  }
  catch (const MetaboliteError& e) {
    reporter.logError(fmt::format("Reaction '{}' failed: {}", name_, e.what()));
    std::throw_with_nested(ReactionError(fmt::format("Reaction '{}' failed: {}", name_, e.what())));
  }

  reporter.logEvent(fmt::format("Executed reaction '{}' with rate {:.4f}.", name_, outcome.rate_));
  return outcome;
}

std::string Reaction::formula() const
{
  return formatFormula(consume_, produce_);
}

std::string Reaction::_str() const
{
  std::ostringstream oss;
  oss << "Reaction \"" << name_ << "\"" << endl;
  oss << "  " << formula() << endl;
  oss << enzyme_->str("  ") << endl;
  return oss.str();
}
