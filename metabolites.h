#pragma once

#include <printable.h>
#include <Eigen/Dense>
#include <yaml-cpp/yaml.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class MetaboliteError : public std::runtime_error
{
public:
  explicit MetaboliteError(const std::string& msg) : std::runtime_error(msg) {}
};

// Reference to a species that was never registered in the store.
class UnknownMetabolite : public MetaboliteError
{
public:
  explicit UnknownMetabolite(const std::string& msg) : MetaboliteError(msg) {}
};

// A batch consume failed its availability pre-check.  Nothing was decremented.
class InsufficientMetabolite : public MetaboliteError
{
public:
  explicit InsufficientMetabolite(const std::string& msg) : MetaboliteError(msg) {}
};

// A direct mutation would have left a metabolite outside [min_quantity_, max_quantity_].
class QuantityError : public MetaboliteError
{
public:
  explicit QuantityError(const std::string& msg) : MetaboliteError(msg) {}
};

// species name -> amount (or stoichiometric coefficient).
typedef std::map<std::string, double> Amounts;

std::string lowercase(const std::string& str);

// Free energy per unit quantity, looked up by species name.  Unknown species get 1.
double freeEnergyConstant(const std::string& name);

class Metabolite : public Printable
{
public:
  typedef std::shared_ptr<Metabolite> Ptr;
  typedef std::shared_ptr<const Metabolite> ConstPtr;
  typedef std::function<void(const Metabolite&)> ChangeCallback;

  std::string name_;  // lower-cased, used as identity
  std::string label_;  // as originally registered, e.g. "ATP"
  std::string type_;
  double min_quantity_;
  double max_quantity_;
  std::string unit_;
  YAML::Node metadata_;
  ChangeCallback on_change_;

  Metabolite(const std::string& name, double quantity, double max_quantity,
             double min_quantity = 0,
             const std::string& unit = "mM",
             const YAML::Node& metadata = YAML::Node(),
             const std::string& type = "default");

  double quantity() const;
  // Throws QuantityError and leaves the quantity alone if the result would be out of bounds.
  void adjustQuantity(double amount);
  void setQuantity(double quantity);
  void reset();

  double energy() const { return freeEnergyConstant(label_) * quantity(); }
  double percentageFilled() const { return quantity() / max_quantity_ * 100.0; }
  // Numeric attribute by name: quantity, energy, min_quantity, max_quantity, percentage_filled.
  bool hasAttribute(const std::string& attribute) const;
  double attribute(const std::string& attribute) const;
  std::string _str() const;

private:
  friend class MetaboliteStore;

  // Guards quantity_.  The orchestration layer is single threaded; this just makes a single
  // Metabolite safe to share.
  mutable std::mutex mutex_;
  double quantity_;

  // The mutations without the callback.  The store uses these while it holds its own lock
  // and notifies once the lock is released.
  void applyAdjustment(double amount);
  void applyQuantity(double quantity);
  void applyReset();
  void notify();
};

// Registry of the metabolites of one compartment.
// Every name must be registered before use; lookups never create entries (except the explicit
// getOrRegisterDefault()).  All mutation goes through consume / produce / exchange / changeQuantity.
class MetaboliteStore : public Printable
{
public:
  typedef std::shared_ptr<MetaboliteStore> Ptr;
  typedef std::shared_ptr<const MetaboliteStore> ConstPtr;

  // Quantities aligned with names_, for reset-to-initial-state and for broadcasting.
  struct Snapshot
  {
    std::vector<std::string> names_;
    Eigen::ArrayXd quantities_;
  };

  static const std::vector<std::string> DEFAULT_STATE_ATTRIBUTES;

  std::string name_;

  MetaboliteStore(const std::string& name = "store");

  // Registering an existing name tops it up (clamped to its max) rather than overwriting it.
  void registerMetabolite(const std::string& name, double quantity, double max_quantity,
                          const YAML::Node& metadata = YAML::Node());
  // name: {quantity: n, meta: {concentration: {range: {max: m}}}}
  void registerMetabolites(const YAML::Node& yaml);
  Metabolite& getOrRegisterDefault(const std::string& name);

  bool has(const std::string& name) const;
  bool isAvailable(const std::string& name, double amount) const;
  double quantity(const std::string& name) const;
  Metabolite& metabolite(const std::string& name);
  const Metabolite& metabolite(const std::string& name) const;

  // All-or-nothing: the whole batch is checked before anything is decremented.
  void consume(const Amounts& amounts);
  void produce(const Amounts& amounts);
  // consume + produce in one critical section, both checked before any mutation.
  void exchange(const Amounts& consumed, const Amounts& produced);
  void changeQuantity(const std::string& name, double delta);

  // Every metabolite to its min_quantity_.
  void reset();
  // Drops every registration.
  void clear();
  Snapshot snapshot() const;
  void restore(const Snapshot& snapshot);

  std::map<std::string, double> quantities() const;
  std::map<std::string, std::map<std::string, double>> state(const std::vector<std::string>& attributes = DEFAULT_STATE_ATTRIBUTES) const;
  std::map<std::string, double> energies() const;
  double totalEnergy() const;
  std::vector<std::string> names() const;
  size_t size() const { return metabolites_.size(); }

  std::string _str() const;

private:
  std::map<std::string, Metabolite::Ptr> metabolites_;
  // Held for the duration of a batch so the pre-check and the mutation are not interleaved.
  mutable std::mutex mutex_;

  Metabolite::Ptr find(const std::string& name) const;
  // The checked batch update.  Caller holds mutex_.  Appends what moved to *changed.
  void applyExchange(const Amounts& consumed, const Amounts& produced, std::vector<Metabolite::Ptr>* changed);
  // Change callbacks run after the store lock is released, so they may use the store themselves.
  static void notifyAll(const std::vector<Metabolite::Ptr>& changed);
};
