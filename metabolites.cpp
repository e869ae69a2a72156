#include <metabolites.h>
#include <reporter.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cmath>

using namespace std;
using Eigen::ArrayXd;

namespace
{
  // Differences smaller than this are floating point noise from coeff * (quantity / coeff) round trips,
  // not real bound violations.
  const double ROUNDING = 1e-12;

  bool belowMin(double quantity, double min_quantity)
  {
    return quantity < min_quantity - ROUNDING * std::max(1.0, fabs(min_quantity));
  }

  bool aboveMax(double quantity, double max_quantity)
  {
    return quantity > max_quantity + ROUNDING * std::max(1.0, fabs(max_quantity));
  }
}

std::string lowercase(const std::string& str)
{
  string lower = str;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  return lower;
}

double freeEnergyConstant(const std::string& name)
{
  static const std::map<std::string, double> gibbs_free_energies = {
    {"atp", 50},
    {"adp", 30},
    {"amp", 10},
    {"gtp", 50},
    {"nadh", 158},
    {"fadh2", 105},
    {"acetyl_coa", 31},
    {"proton_gradient", 5},
    {"glucose", 686},
    {"glucose_6_phosphate", 916},
    {"fructose_6_phosphate", 916},
    {"fructose_1_6_bisphosphate", 1146},
    {"glyceraldehyde_3_phosphate", 573},
    {"bisphosphoglycerate_1_3", 803},
    {"phosphoglycerate_3", 573},
    {"phosphoglycerate_2", 573},
    {"phosphoenolpyruvate", 803},
    {"pyruvate", 343}
  };

  auto it = gibbs_free_energies.find(lowercase(name));
  if (it == gibbs_free_energies.end())
    return 1.0;
  return it->second;
}

Metabolite::Metabolite(const std::string& name, double quantity, double max_quantity,
                       double min_quantity,
                       const std::string& unit,
                       const YAML::Node& metadata,
                       const std::string& type) :
  name_(lowercase(name)),
  label_(name),
  type_(type),
  min_quantity_(min_quantity),
  max_quantity_(max_quantity),
  unit_(unit),
  metadata_(YAML::Clone(metadata)),
  quantity_(quantity)
{
  if (min_quantity_ > max_quantity_)
    throw std::invalid_argument(fmt::format("Metabolite {}: min quantity {} exceeds max quantity {}.", name, min_quantity_, max_quantity_));
  if (quantity_ < min_quantity_ || quantity_ > max_quantity_)
    throw std::invalid_argument(fmt::format("Metabolite {}: quantity {} is outside [{}, {}].", name, quantity_, min_quantity_, max_quantity_));
}

double Metabolite::quantity() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return quantity_;
}

void Metabolite::adjustQuantity(double amount)
{
  applyAdjustment(amount);
  notify();
}

void Metabolite::setQuantity(double quantity)
{
  applyQuantity(quantity);
  notify();
}

void Metabolite::reset()
{
  applyReset();
  notify();
}

void Metabolite::applyAdjustment(double amount)
{
  std::lock_guard<std::mutex> lock(mutex_);
  double new_quantity = quantity_ + amount;
  if (belowMin(new_quantity, min_quantity_))
    throw QuantityError(fmt::format("Cannot reduce {} below {}. Attempted to set {} to {}.", label_, min_quantity_, label_, new_quantity));
  if (aboveMax(new_quantity, max_quantity_))
    throw QuantityError(fmt::format("Cannot exceed max quantity for {}. Attempted to set {} to {}, but max is {}.",
                                    label_, label_, new_quantity, max_quantity_));
  quantity_ = std::min(std::max(new_quantity, min_quantity_), max_quantity_);
}

void Metabolite::applyQuantity(double quantity)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (quantity < min_quantity_ || quantity > max_quantity_)
    throw QuantityError(fmt::format("Invalid quantity for {}. Attempted to set to {}, valid range is [{}, {}].",
                                    label_, quantity, min_quantity_, max_quantity_));
  quantity_ = quantity;
}

void Metabolite::applyReset()
{
  std::lock_guard<std::mutex> lock(mutex_);
  quantity_ = min_quantity_;
}

void Metabolite::notify()
{
  // Called with no lock held, so the callback is free to read or mutate.
  if (on_change_)
    on_change_(*this);
}

bool Metabolite::hasAttribute(const std::string& attribute) const
{
  return attribute == "quantity" || attribute == "energy" || attribute == "min_quantity" ||
    attribute == "max_quantity" || attribute == "percentage_filled";
}

double Metabolite::attribute(const std::string& attribute) const
{
  if (attribute == "quantity")
    return quantity();
  if (attribute == "energy")
    return energy();
  if (attribute == "min_quantity")
    return min_quantity_;
  if (attribute == "max_quantity")
    return max_quantity_;
  if (attribute == "percentage_filled")
    return percentageFilled();
  throw std::invalid_argument("Metabolite has no attribute " + attribute);
}

std::string Metabolite::_str() const
{
  std::ostringstream oss;
  oss << "Metabolite \"" << label_ << "\"" << endl;
  oss << "  quantity: " << quantity() << " " << unit_ << endl;
  oss << "  range: [" << min_quantity_ << ", " << max_quantity_ << "]" << endl;
  oss << "  type_: " << type_ << endl;
  oss << "  energy: " << energy() << endl;
  return oss.str();
}

const std::vector<std::string> MetaboliteStore::DEFAULT_STATE_ATTRIBUTES = {"quantity", "energy"};

MetaboliteStore::MetaboliteStore(const std::string& name) :
  name_(name)
{
}

Metabolite::Ptr MetaboliteStore::find(const std::string& name) const
{
  auto it = metabolites_.find(lowercase(name));
  if (it == metabolites_.end())
    throw UnknownMetabolite(fmt::format("Unknown metabolite in {}: {}", name_, name));
  return it->second;
}

void MetaboliteStore::registerMetabolite(const std::string& name, double quantity, double max_quantity,
                                         const YAML::Node& metadata)
{
  if (quantity < 0)
    throw std::invalid_argument(fmt::format("Quantity must be non-negative. Got: {} for {}", quantity, name));
  if (quantity > max_quantity)
    throw std::invalid_argument(fmt::format("Initial quantity {} exceeds max quantity {} for {}.", quantity, max_quantity, name));

  Metabolite::Ptr topped_up;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metabolites_.find(lowercase(name));
    if (it == metabolites_.end()) {
      Metabolite::Ptr met(new Metabolite(name, quantity, max_quantity, 0, "mM", metadata));
      metabolites_[met->name_] = met;
      return;
    }
    topped_up = it->second;
    topped_up->applyQuantity(std::min(topped_up->quantity() + quantity, topped_up->max_quantity_));
  }
  topped_up->notify();
}

void MetaboliteStore::registerMetabolites(const YAML::Node& yaml)
{
  for (YAML::const_iterator it = yaml.begin(); it != yaml.end(); ++it) {
    string name = it->first.as<string>();
    // By value: it-> hands back a temporary.
    const YAML::Node info = it->second;
    double quantity = 0;
    if (info["quantity"])
      quantity = info["quantity"].as<double>();

    double max_quantity = quantity;
    YAML::Node meta;
    if (info["meta"]) {
      meta = info["meta"];
      if (meta["concentration"] && meta["concentration"]["range"] && meta["concentration"]["range"]["max"])
        max_quantity = meta["concentration"]["range"]["max"].as<double>();
    }

    try {
      registerMetabolite(name, quantity, max_quantity, meta);
    }
    catch (const std::invalid_argument& e) {
      throw std::invalid_argument(fmt::format("Error processing metabolite '{}': {}", name, e.what()));
    }
  }
}

Metabolite& MetaboliteStore::getOrRegisterDefault(const std::string& name)
{
  if (!has(name)) {
    Reporter::global().logWarning(fmt::format("Metabolite '{}' was not found in {}. Created with default values.", name, name_));
    registerMetabolite(name, 0, 100);
  }
  return *find(name);
}

bool MetaboliteStore::has(const std::string& name) const
{
  return metabolites_.find(lowercase(name)) != metabolites_.end();
}

bool MetaboliteStore::isAvailable(const std::string& name, double amount) const
{
  return find(name)->quantity() >= amount;
}

double MetaboliteStore::quantity(const std::string& name) const
{
  return find(name)->quantity();
}

Metabolite& MetaboliteStore::metabolite(const std::string& name)
{
  return *find(name);
}

const Metabolite& MetaboliteStore::metabolite(const std::string& name) const
{
  return *find(name);
}

void MetaboliteStore::consume(const Amounts& amounts)
{
  exchange(amounts, Amounts());
}

void MetaboliteStore::produce(const Amounts& amounts)
{
  exchange(Amounts(), amounts);
}

void MetaboliteStore::exchange(const Amounts& consumed, const Amounts& produced)
{
  std::vector<Metabolite::Ptr> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    applyExchange(consumed, produced, &changed);
  }
  notifyAll(changed);
}

void MetaboliteStore::applyExchange(const Amounts& consumed, const Amounts& produced, std::vector<Metabolite::Ptr>* changed)
{
  // Net change per metabolite, resolved up front so an unknown name fails before anything moves.
  std::map<std::string, std::pair<Metabolite::Ptr, double>> deltas;
  for (const auto& kv : consumed) {
    if (kv.second < 0)
      throw std::invalid_argument(fmt::format("Cannot consume a negative amount of {}: {}", kv.first, kv.second));
    Metabolite::Ptr met = find(kv.first);
    deltas[met->name_].first = met;
    deltas[met->name_].second -= kv.second;
  }
  for (const auto& kv : produced) {
    if (kv.second < 0)
      throw std::invalid_argument(fmt::format("Cannot produce a negative amount of {}: {}", kv.first, kv.second));
    Metabolite::Ptr met = find(kv.first);
    deltas[met->name_].first = met;
    deltas[met->name_].second += kv.second;
  }

  for (const auto& kv : deltas) {
    const Metabolite& met = *kv.second.first;
    double new_quantity = met.quantity() + kv.second.second;
    if (belowMin(new_quantity, met.min_quantity_))
      throw InsufficientMetabolite(fmt::format("Insufficient {} in {}: need {}, have {}.",
                                               met.label_, name_, -kv.second.second, met.quantity() - met.min_quantity_));
    if (aboveMax(new_quantity, met.max_quantity_))
      throw QuantityError(fmt::format("Cannot exceed max quantity for {} in {}. Attempted to set to {}, but max is {}.",
                                      met.label_, name_, new_quantity, met.max_quantity_));
  }

  for (auto& kv : deltas) {
    if (kv.second.second != 0.0) {
      kv.second.first->applyAdjustment(kv.second.second);
      changed->push_back(kv.second.first);
    }
  }
}

void MetaboliteStore::changeQuantity(const std::string& name, double delta)
{
  Metabolite::Ptr met;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    met = find(name);
    met->applyAdjustment(delta);
  }
  met->notify();
}

void MetaboliteStore::reset()
{
  std::vector<Metabolite::Ptr> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : metabolites_) {
      kv.second->applyReset();
      changed.push_back(kv.second);
    }
  }
  notifyAll(changed);
}

void MetaboliteStore::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  metabolites_.clear();
}

void MetaboliteStore::notifyAll(const std::vector<Metabolite::Ptr>& changed)
{
  for (const Metabolite::Ptr& met : changed)
    met->notify();
}

MetaboliteStore::Snapshot MetaboliteStore::snapshot() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  snap.quantities_ = ArrayXd::Zero(metabolites_.size());
  int idx = 0;
  for (const auto& kv : metabolites_) {
    snap.names_.push_back(kv.first);
    snap.quantities_[idx++] = kv.second->quantity();
  }
  return snap;
}

void MetaboliteStore::restore(const Snapshot& snapshot)
{
  std::vector<Metabolite::Ptr> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Check everything first so a bad snapshot doesn't leave us half restored.
    for (size_t i = 0; i < snapshot.names_.size(); ++i) {
      const Metabolite& met = *find(snapshot.names_[i]);
      double q = snapshot.quantities_[i];
      if (q < met.min_quantity_ || q > met.max_quantity_)
        throw QuantityError(fmt::format("Snapshot quantity {} for {} is outside [{}, {}].", q, met.label_, met.min_quantity_, met.max_quantity_));
    }
    for (size_t i = 0; i < snapshot.names_.size(); ++i) {
      Metabolite::Ptr met = find(snapshot.names_[i]);
      met->applyQuantity(snapshot.quantities_[i]);
      changed.push_back(met);
    }
  }
  notifyAll(changed);
}

std::map<std::string, double> MetaboliteStore::quantities() const
{
  std::map<std::string, double> result;
  for (const auto& kv : metabolites_)
    result[kv.first] = kv.second->quantity();
  return result;
}

std::map<std::string, std::map<std::string, double>> MetaboliteStore::state(const std::vector<std::string>& attributes) const
{
  std::map<std::string, std::map<std::string, double>> result;
  for (const auto& kv : metabolites_) {
    std::map<std::string, double>& entry = result[kv.first];
    for (const string& attr : attributes)
      if (kv.second->hasAttribute(attr))
        entry[attr] = kv.second->attribute(attr);
  }
  return result;
}

std::map<std::string, double> MetaboliteStore::energies() const
{
  std::map<std::string, double> result;
  for (const auto& kv : metabolites_)
    result[kv.first] = kv.second->energy();
  return result;
}

double MetaboliteStore::totalEnergy() const
{
  double total = 0;
  for (const auto& kv : metabolites_)
    total += kv.second->energy();
  return total;
}

std::vector<std::string> MetaboliteStore::names() const
{
  vector<string> result;
  for (const auto& kv : metabolites_)
    result.push_back(kv.first);
  return result;
}

std::string MetaboliteStore::_str() const
{
  std::ostringstream oss;
  oss << "MetaboliteStore \"" << name_ << "\"" << endl;
  size_t width = 0;
  for (const auto& kv : metabolites_)
    width = std::max(width, kv.second->label_.size());
  for (const auto& kv : metabolites_) {
    const Metabolite& met = *kv.second;
    oss << "  " << fmt::format("{:<{}} {:10.4f} / {} {}", met.label_, width, met.quantity(), met.max_quantity_, met.unit_) << endl;
  }
  return oss.str();
}
