#pragma once

#include <catalog.h>
#include <reporter.h>
#include <string>
#include <vector>

class PathwayError : public std::runtime_error
{
public:
  explicit PathwayError(const std::string& msg) : std::runtime_error(msg) {}
};

class GlycolysisError : public PathwayError
{
public:
  explicit GlycolysisError(const std::string& msg) : PathwayError(msg) {}
};

class KrebsCycleError : public PathwayError
{
public:
  explicit KrebsCycleError(const std::string& msg) : PathwayError(msg) {}
};

class OxidativePhosphorylationError : public PathwayError
{
public:
  explicit OxidativePhosphorylationError(const std::string& msg) : PathwayError(msg) {}
};

// ATP + ADP + AMP.  Throws UnknownMetabolite if any of the three isn't registered.
double totalAdenineNucleotides(const MetaboliteStore& store);

// Pathways are stateless apart from their tunables; all state lives in the store they're handed.
class Pathway
{
public:
  std::string name_;
  double time_step_;
  int max_substeps_;
  // A step counts as complete when less than this much of its extent remains.
  double tolerance_;
  Reporter& reporter_;

  Pathway(const std::string& name, double time_step, Reporter& reporter);
  virtual ~Pathway() {}

  // Calls reaction.execute until it has performed extent units, one time_step_ per call.
  // Throws ReactionError if the reaction stalls (rate hits zero) or runs out of substeps first.
  // Adds the simulated time spent to *elapsed if given.  Returns the extent performed.
  double runStep(const Reaction& reaction, MetaboliteStore& store, double extent, double* elapsed = nullptr) const;
};

struct GlycolysisResult
{
  double net_atp_;
  double pyruvate_;  // net change
  double nadh_;  // net change
  double lactate_;  // produced by NAD+ regeneration
  double elapsed_;
  bool adenine_corrected_;

  GlycolysisResult();
};

struct AdenineCorrection
{
  bool applied_;
  double excess_;
  double atp_adjustment_;
  double adp_adjustment_;
};

// Puts ATP + ADP + AMP back to initial_total by taking the excess out of ATP first (at most what
// ATP gained), then ADP.  Logs a warning when it does anything.
AdenineCorrection correctAdenineDrift(MetaboliteStore& store, double initial_total, double initial_atp,
                                      Reporter& reporter, double tolerance = 1e-6);

class Glycolysis : public Pathway
{
public:
  std::vector<Reaction::ConstPtr> investment_;
  std::vector<Reaction::ConstPtr> yield_;
  Reaction::ConstPtr nad_regeneration_;
  bool correct_adenine_drift_;
  double adenine_tolerance_;
  // GAPDH won't be attempted with less NAD+ than this; lactate dehydrogenase tops it up first.
  double nad_threshold_;

  Glycolysis(const ReactionCatalog& catalog, Reporter& reporter = Reporter::global(), double time_step = 0.1);

  // glucose_units is floored.  Throws GlycolysisError if that leaves nothing to do, or if any step fails.
  // Steps that already ran are not rolled back.
  GlycolysisResult perform(MetaboliteStore& store, double glucose_units) const;

  void investmentPhase(MetaboliteStore& store, int glucose_units, double* elapsed = nullptr) const;
  // Returns lactate produced along the way.
  double yieldPhase(MetaboliteStore& store, int g3p_units, double* elapsed = nullptr) const;
  // Lactate fermentation until NAD+ reaches needed or NADH / pyruvate run out.  Returns lactate made.
  double regenerateNad(MetaboliteStore& store, double needed, double* elapsed = nullptr) const;
};

struct KrebsCycleResult
{
  double energy_;  // change in store total energy
  double adenine_;  // change in ATP + ADP + AMP
  double co2_;
  double atp_;
  double elapsed_;
};

class KrebsCycle : public Pathway
{
public:
  std::vector<Reaction::ConstPtr> steps_;
  double drift_tolerance_;  // energy and adenine changes above this get a warning

  KrebsCycle(const ReactionCatalog& catalog, Reporter& reporter = Reporter::global(), double time_step = 1.0);

  // One turn per whole unit of acetyl-CoA.  Throws KrebsCycleError.
  KrebsCycleResult run(MetaboliteStore& store, double acetyl_coa_units) const;
  // A single turn.  Returns CO2 produced.
  double cycle(MetaboliteStore& store, double* elapsed = nullptr) const;
};

// Pyruvate -> acetyl-CoA, feeding the Krebs cycle.
class PyruvateOxidation : public Pathway
{
public:
  Reaction::ConstPtr pyruvate_dehydrogenase_;

  PyruvateOxidation(const ReactionCatalog& catalog, Reporter& reporter = Reporter::global(), double time_step = 1.0);

  // Whole units only.  Returns acetyl-CoA produced.  Throws PathwayError.
  double perform(MetaboliteStore& store, double pyruvate_units, double* elapsed = nullptr) const;
};

// One member of the electron transport chain.  Not enzyme-kinetic: each update it moves as many
// units as its reactant pools, its capacity and (if it pumps) the gradient headroom allow.
struct ElectronTransportComplex
{
  std::string name_;
  Amounts consume_;
  Amounts produce_;
  double protons_per_unit_;
  double capacity_;  // max units per update

  ElectronTransportComplex(const std::string& name, const std::string& formula,
                           double protons_per_unit, double capacity);
};

struct OxidativePhosphorylationResult
{
  double atp_produced_;
  double protons_pumped_;
  double protons_leaked_;
  double oxygen_consumed_;
  double nadh_oxidized_;
  double fadh2_oxidized_;

  OxidativePhosphorylationResult();
};

class OxidativePhosphorylation
{
public:
  // What ATP synthase does with protons that didn't make a whole ATP (or had no ADP to go to).
  enum SynthaseRemainder {
    Retain,
    Discard
  };

  static const std::string PROTON_GRADIENT;

  std::vector<ElectronTransportComplex> complexes_;
  double leak_rate_;
  double leak_steepness_;
  double leak_midpoint_;
  double protons_per_atp_;
  SynthaseRemainder remainder_;
  Reporter& reporter_;

  OxidativePhosphorylation(Reporter& reporter = Reporter::global());

  static SynthaseRemainder parseRemainder(const std::string& name);
  // Reads leak_rate, leak_steepness, leak_midpoint, protons_per_atp, synthase_remainder, complex_capacity.
  void applyConfig(const YAML::Node& yaml);

  // Complexes I-IV in order, then leak, then ATP synthase.  Throws OxidativePhosphorylationError.
  OxidativePhosphorylationResult perform(MetaboliteStore& store) const;
  // Sigmoid in the gradient, centered on leak_midpoint_.
  double calculateProtonLeak(double gradient) const;
  // Returns protons pumped.
  double runComplex(const ElectronTransportComplex& complex, MetaboliteStore& store, double* extent = nullptr) const;
  // Returns ATP made.
  double synthesizeAtp(MetaboliteStore& store) const;
};
