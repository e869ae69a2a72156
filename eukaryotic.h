#pragma once

#include <pathways.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Everything read from the "Simulation:" node.
class SimulationParams
{
public:
  double time_step_;  // minimum simulated time per controller iteration
  double max_simulation_time_;
  double glucose_;
  std::vector<double> glucose_amounts_;  // run.cpp runs one simulation per entry, resetting in between
  bool broadcast_;
  std::string log_level_;
  bool correct_adenine_drift_;
  OxidativePhosphorylation::SynthaseRemainder synthase_remainder_;
  double glycolysis_time_step_;
  double krebs_time_step_;
  int max_substeps_;
  double nadh_shuttle_rate_;  // cytoplasmic NADH offered to the shuttle per iteration
  double atp_demand_;  // cytoplasmic ATP hydrolysed by cellular work per iteration
  int max_oxphos_updates_;  // per respiration call

  SimulationParams();
  SimulationParams(const YAML::Node& yaml);
};

// A compartment: one metabolite store plus whatever pathways run in it.
class Organelle : public Printable
{
public:
  std::string name_;
  MetaboliteStore metabolites_;
  Reporter& reporter_;

  Organelle(const std::string& name, Reporter& reporter);
  virtual ~Organelle() {}

  // Starts from an empty store, registers the metabolite map, then the default species the map
  // didn't mention.  Calling it again replaces the earlier configuration.
  void applyConfig(const YAML::Node& yaml);
  // Remember the current quantities; reset() goes back to them.
  void captureInitialState();
  void reset();
  std::string _str() const;

protected:
  MetaboliteStore::Snapshot initial_state_;

  virtual void registerDefaults() = 0;
  void ensureRegistered(const std::string& name, double quantity, double max_quantity);
};

class Cytoplasm : public Organelle
{
public:
  std::shared_ptr<Glycolysis> glycolysis_;

  Cytoplasm(Reporter& reporter = Reporter::global());

  void buildPathways(const ReactionCatalog& catalog, const SimulationParams& params);
  // ATP -> ADP + Pi for cellular work, as much of amount as there is.  Returns ATP hydrolysed.
  double hydrolyzeAtp(double amount);

protected:
  void registerDefaults();
};

struct RespirationResult
{
  double acetyl_coa_;
  double co2_;
  double krebs_atp_;
  double oxphos_atp_;
  double atp_;  // net change in matrix ATP
  double oxygen_consumed_;
  double elapsed_;

  RespirationResult();
};

class Mitochondrion : public Organelle
{
public:
  std::shared_ptr<PyruvateOxidation> pyruvate_oxidation_;
  std::shared_ptr<KrebsCycle> krebs_cycle_;
  OxidativePhosphorylation oxidative_phosphorylation_;
  // Glycerol phosphate shuttle: each cytoplasmic NADH arrives as this much matrix NADH.
  double shuttle_efficiency_;
  double calcium_threshold_;
  double calcium_boost_;
  bool calcium_boost_active_;
  int max_oxphos_updates_;

  Mitochondrion(Reporter& reporter = Reporter::global());

  void buildPathways(const ReactionCatalog& catalog, const SimulationParams& params);
  // Moves up to amount pyruvate in from the cytoplasm.  Returns what moved.
  double importPyruvate(MetaboliteStore& cytoplasm, double amount);
  // Same for Pi.
  double importPhosphate(MetaboliteStore& cytoplasm, double amount);
  // Oxidises up to amount cytoplasmic NADH; returns the NADH that appeared in the matrix.
  double transferCytoplasmicNadh(MetaboliteStore& cytoplasm, double amount);
  // Takes up calcium.  Above calcium_threshold_ the matrix dehydrogenases run calcium_boost_ times
  // faster; the boost is lifted again once calcium drops back.  Returns whether it's active.
  bool bufferCalcium(double amount);
  // Pyruvate dehydrogenase on whole pyruvate units, a Krebs turn per whole acetyl-CoA, then
  // oxidative phosphorylation until the carriers are drained or max_oxphos_updates_ is hit.
  RespirationResult cellularRespiration(double pyruvate_units);

protected:
  void registerDefaults();

private:
  std::vector<Enzyme::Ptr> calciumSensitiveEnzymes() const;
};

class Cell : public Printable
{
public:
  typedef std::shared_ptr<Cell> Ptr;
  typedef std::shared_ptr<const Cell> ConstPtr;

  Reporter& reporter_;
  ReactionCatalog catalog_;
  SimulationParams params_;
  Cytoplasm cytoplasm_;
  Mitochondrion mitochondrion_;

  Cell(Reporter& reporter = Reporter::global());
  Cell(const YAML::Node& yaml, Reporter& reporter = Reporter::global());

  // Top-level keys: Simulation, Reactions, Cytoplasm, Mitochondrion, OxidativePhosphorylation.
  // Rebuilds the pathways, so reaction overrides take effect, and captures the state reset() returns to.
  void applyConfig(const std::string& path);
  void applyConfig(const YAML::Node& yaml);

  // Adenine nucleotide translocase: matrix ATP out, cytoplasmic ADP in, 1:1.  Returns ATP moved.
  double exchangeAtp(double amount);
  double totalAdenineNucleotides() const;
  double totalEnergy() const;
  // Back to the quantities captured by the last applyConfig, with enzyme activities at 1.
  void reset();
  std::string _str() const;
};

struct SimulationResults
{
  double total_atp_produced_;
  double glycolysis_atp_;
  double respiration_atp_;
  double glucose_processed_;
  double pyruvate_produced_;
  double lactate_produced_;
  double co2_produced_;
  double oxygen_consumed_;
  double simulation_time_;
  double initial_adenine_;
  double final_adenine_;
  double initial_energy_;
  double final_energy_;
  double cytoplasm_atp_;
  double mitochondrion_atp_;
  double proton_gradient_;
  int iterations_;
  int skipped_iterations_;
  bool stopped_early_;

  SimulationResults();
  std::map<std::string, double> asMap() const;
};

// Runs the cell one glucose unit at a time.
class SimulationController
{
public:
  typedef std::function<void(const SimulationController&)> StepCallback;

  Cell& cell_;
  Reporter& reporter_;
  SimulationParams params_;
  double simulation_time_;
  double glucose_processed_;
  // Called after every iteration, including skipped ones.
  StepCallback on_step_;

  SimulationController(Cell& cell, Reporter& reporter = Reporter::global());
  SimulationController(Cell& cell, const SimulationParams& params, Reporter& reporter = Reporter::global());

  // Adds glucose to the cytoplasm and processes it.  Stops when it's all been processed, glucose runs
  // out, max_simulation_time_ passes or glycolysis fails.  Store errors only skip the iteration.
  SimulationResults runSimulation(double glucose);

  // ADP feedback on hexokinase and phosphofructokinase: activity = 1 + ADP/500.
  void applyAdpFeedback();
  // Observers.  Log and return false on a violation.
  bool checkBounds() const;
  bool checkAdenineBalance(double expected, double tolerance = 1e-6) const;
  // Total free energy of both compartments against expected.  Drift is only a warning: pathways
  // don't conserve it, so this tracks where it goes.
  bool checkEnergyBalance(double expected, double tolerance = 1e-6) const;
  // Time, glucose processed so far and the main pools, for reporting mid-run.
  std::map<std::string, double> currentState() const;
};
