#include <pathways.h>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <exception>

using namespace std;

namespace
{
  string join(const vector<string>& strings)
  {
    string result;
    for (size_t i = 0; i < strings.size(); ++i)
      result += (i > 0 ? ", " : "") + strings[i];
    return result;
  }

  double available(const Metabolite& met)
  {
    return std::max(met.quantity() - met.min_quantity_, 0.0);
  }

  double headroom(const Metabolite& met)
  {
    return std::max(met.max_quantity_ - met.quantity(), 0.0);
  }

  vector<Reaction::ConstPtr> lookup(const ReactionCatalog& catalog, const vector<string>& names)
  {
    vector<Reaction::ConstPtr> reactions;
    for (const string& name : names)
      reactions.push_back(catalog.reaction(name));
    return reactions;
  }
}

double totalAdenineNucleotides(const MetaboliteStore& store)
{
  return store.quantity("ATP") + store.quantity("ADP") + store.quantity("AMP");
}

Pathway::Pathway(const std::string& name, double time_step, Reporter& reporter) :
  name_(name),
  time_step_(time_step),
  max_substeps_(1000),
  tolerance_(1e-9),
  reporter_(reporter)
{
  if (time_step_ <= 0)
    throw std::invalid_argument(fmt::format("{}: time step must be positive, got {}", name_, time_step_));
}

double Pathway::runStep(const Reaction& reaction, MetaboliteStore& store, double extent, double* elapsed) const
{
  if (extent < 0)
    throw std::invalid_argument(fmt::format("{}: cannot run {} for a negative extent ({})", name_, reaction.name_, extent));

  double done = 0;
  double remaining = extent;
  int substeps = 0;
  while (remaining > tolerance_) {
    if (substeps >= max_substeps_)
      throw ReactionError(fmt::format("Reaction '{}' did not complete within {} substeps ({:.6g} of {:.6g} units remaining).",
                                      reaction.name_, max_substeps_, remaining, extent));
    ReactionOutcome outcome = reaction.executeDetailed(store, time_step_, remaining);
    ++substeps;
    if (elapsed)
      *elapsed += time_step_;
    if (outcome.rate_ <= 0)
      throw ReactionError(fmt::format("Reaction '{}' stalled with {:.6g} of {:.6g} units remaining, limited by {}.",
                                      reaction.name_, remaining, extent, join(outcome.binding_)));
    done += outcome.rate_;
    remaining -= outcome.rate_;
  }
  return done;
}

GlycolysisResult::GlycolysisResult() :
  net_atp_(0),
  pyruvate_(0),
  nadh_(0),
  lactate_(0),
  elapsed_(0),
  adenine_corrected_(false)
{
}

AdenineCorrection correctAdenineDrift(MetaboliteStore& store, double initial_total, double initial_atp,
                                      Reporter& reporter, double tolerance)
{
  AdenineCorrection correction;
  correction.applied_ = false;
  correction.excess_ = totalAdenineNucleotides(store) - initial_total;
  correction.atp_adjustment_ = 0;
  correction.adp_adjustment_ = 0;
  if (fabs(correction.excess_) <= tolerance)
    return correction;

  double atp_gain = store.quantity("ATP") - initial_atp;
  correction.atp_adjustment_ = std::min(correction.excess_, atp_gain);
  correction.adp_adjustment_ = correction.excess_ - correction.atp_adjustment_;
  reporter.logWarning(fmt::format("Adenine nucleotide imbalance of {:.6f}. Adjusting ATP by {:.6f} and ADP by {:.6f}.",
                                  correction.excess_, -correction.atp_adjustment_, -correction.adp_adjustment_));

  // Positive adjustments come out of the pool, negative ones go back in.
  Amounts consumed;
  Amounts produced;
  if (correction.atp_adjustment_ > 0)
    consumed["ATP"] = correction.atp_adjustment_;
  else if (correction.atp_adjustment_ < 0)
    produced["ATP"] = -correction.atp_adjustment_;
  if (correction.adp_adjustment_ > 0)
    consumed["ADP"] = correction.adp_adjustment_;
  else if (correction.adp_adjustment_ < 0)
    produced["ADP"] = -correction.adp_adjustment_;
  store.exchange(consumed, produced);

  correction.applied_ = true;
  return correction;
}

Glycolysis::Glycolysis(const ReactionCatalog& catalog, Reporter& reporter, double time_step) :
  Pathway("Glycolysis", time_step, reporter),
  investment_(lookup(catalog, ReactionCatalog::GLYCOLYSIS_INVESTMENT)),
  yield_(lookup(catalog, ReactionCatalog::GLYCOLYSIS_YIELD)),
  nad_regeneration_(catalog.reaction("lactate_dehydrogenase")),
  correct_adenine_drift_(true),
  adenine_tolerance_(1e-6),
  nad_threshold_(1.0)
{
}

GlycolysisResult Glycolysis::perform(MetaboliteStore& store, double glucose_units) const
{
  int units = (int)floor(glucose_units);
  if (units <= 0)
    throw GlycolysisError(fmt::format("Glycolysis needs at least one whole glucose unit, got {}.", glucose_units));

  GlycolysisResult result;
  try {
    double initial_adenine = totalAdenineNucleotides(store);
    double initial_atp = store.quantity("ATP");
    double initial_pyruvate = store.quantity("pyruvate");
    double initial_nadh = store.quantity("NADH");
    reporter_.logEvent(fmt::format("Starting glycolysis with {} glucose units.", units));

    investmentPhase(store, units, &result.elapsed_);
    result.lactate_ = yieldPhase(store, 2 * units, &result.elapsed_);

    if (correct_adenine_drift_) {
      AdenineCorrection correction = correctAdenineDrift(store, initial_adenine, initial_atp, reporter_, adenine_tolerance_);
      result.adenine_corrected_ = correction.applied_;
    }
    else {
      double drift = totalAdenineNucleotides(store) - initial_adenine;
      if (fabs(drift) > adenine_tolerance_)
        reporter_.logWarning(fmt::format("Adenine nucleotide imbalance of {:.6f} after glycolysis (not corrected).", drift));
    }

    result.net_atp_ = store.quantity("ATP") - initial_atp;
    result.pyruvate_ = store.quantity("pyruvate") - initial_pyruvate;
    result.nadh_ = store.quantity("NADH") - initial_nadh;
  }
  catch (const MetaboliteError& e) {
    reporter_.logError(fmt::format("Glycolysis failed: {}", e.what()));
    std::throw_with_nested(GlycolysisError(fmt::format("Glycolysis failed: {}", e.what())));
  }

  reporter_.logEvent(fmt::format("Glycolysis complete. Net ATP: {:.4f}, pyruvate: {:.4f}, NADH: {:.4f}.",
                                 result.net_atp_, result.pyruvate_, result.nadh_));
  return result;
}

void Glycolysis::investmentPhase(MetaboliteStore& store, int glucose_units, double* elapsed) const
{
  for (int i = 0; i < glucose_units; ++i) {
    for (const Reaction::ConstPtr& step : investment_) {
      try {
        runStep(*step, store, 1.0, elapsed);
      }
      catch (const ReactionError& e) {
        reporter_.logError(e.what());
        std::throw_with_nested(GlycolysisError(fmt::format("Investment phase failed at glucose unit {} ({}): {}",
                                                           i + 1, step->name_, e.what())));
      }
    }
  }
}

double Glycolysis::yieldPhase(MetaboliteStore& store, int g3p_units, double* elapsed) const
{
  double lactate = 0;
  for (int i = 0; i < g3p_units; ++i) {
    for (const Reaction::ConstPtr& step : yield_) {
      if (coefficient(step->consume_, "NAD") > 0 && store.quantity("NAD") < nad_threshold_)
        lactate += regenerateNad(store, nad_threshold_, elapsed);

      try {
        runStep(*step, store, 1.0, elapsed);
      }
      catch (const ReactionError& e) {
        reporter_.logError(e.what());
        std::throw_with_nested(GlycolysisError(fmt::format("Yield phase failed at G3P unit {} ({}): {}",
                                                           i + 1, step->name_, e.what())));
      }
    }
  }
  return lactate;
}

double Glycolysis::regenerateNad(MetaboliteStore& store, double needed, double* elapsed) const
{
  const Reaction& ldh = *nad_regeneration_;
  double extent = needed - store.quantity("NAD");
  for (const auto& kv : ldh.consume_)
    if (kv.second > 0)
      extent = std::min(extent, available(store.metabolite(kv.first)) / kv.second);
  if (extent <= tolerance_)
    return 0;

  reporter_.logEvent(fmt::format("NAD+ is low ({:.4f}); regenerating {:.4f} via {}.", store.quantity("NAD"), extent, ldh.name_));
  double done = 0;
  try {
    done = runStep(ldh, store, extent, elapsed);
  }
  catch (const ReactionError& e) {
    reporter_.logError(e.what());
    std::throw_with_nested(GlycolysisError(fmt::format("NAD+ regeneration failed: {}", e.what())));
  }
  return done * coefficient(ldh.produce_, "lactate");
}

KrebsCycle::KrebsCycle(const ReactionCatalog& catalog, Reporter& reporter, double time_step) :
  Pathway("Krebs cycle", time_step, reporter),
  steps_(lookup(catalog, ReactionCatalog::KREBS_CYCLE)),
  drift_tolerance_(1e-6)
{
}

KrebsCycleResult KrebsCycle::run(MetaboliteStore& store, double acetyl_coa_units) const
{
  int units = (int)floor(acetyl_coa_units);
  if (units <= 0)
    throw KrebsCycleError(fmt::format("Krebs cycle needs at least one whole acetyl-CoA unit, got {}.", acetyl_coa_units));

  KrebsCycleResult result = {0, 0, 0, 0, 0};
  try {
    double initial_energy = store.totalEnergy();
    double initial_adenine = totalAdenineNucleotides(store);
    double initial_atp = store.quantity("ATP");

    for (int i = 0; i < units; ++i)
      result.co2_ += cycle(store, &result.elapsed_);

    result.energy_ = store.totalEnergy() - initial_energy;
    result.adenine_ = totalAdenineNucleotides(store) - initial_adenine;
    result.atp_ = store.quantity("ATP") - initial_atp;
  }
  catch (const MetaboliteError& e) {
    reporter_.logError(fmt::format("Krebs cycle failed: {}", e.what()));
    std::throw_with_nested(KrebsCycleError(fmt::format("Krebs cycle failed: {}", e.what())));
  }

  if (fabs(result.energy_) > drift_tolerance_)
    reporter_.logWarning(fmt::format("Energy not conserved in Krebs cycle. Change: {:.4f}", result.energy_));
  if (fabs(result.adenine_) > drift_tolerance_)
    reporter_.logWarning(fmt::format("Adenine nucleotides not conserved in Krebs cycle. Change: {:.6f}", result.adenine_));
  reporter_.logEvent(fmt::format("Krebs cycle complete: {} turns, {:.4f} CO2, {:.4f} ATP.", units, result.co2_, result.atp_));
  return result;
}

double KrebsCycle::cycle(MetaboliteStore& store, double* elapsed) const
{
  double initial_co2 = store.quantity("CO2");
  for (const Reaction::ConstPtr& step : steps_) {
    try {
      runStep(*step, store, 1.0, elapsed);
    }
    catch (const ReactionError& e) {
      reporter_.logError(e.what());
      std::throw_with_nested(KrebsCycleError(fmt::format("Krebs cycle step {} failed: {}", step->name_, e.what())));
    }
  }
  return store.quantity("CO2") - initial_co2;
}

PyruvateOxidation::PyruvateOxidation(const ReactionCatalog& catalog, Reporter& reporter, double time_step) :
  Pathway("Pyruvate oxidation", time_step, reporter),
  pyruvate_dehydrogenase_(catalog.reaction("pyruvate_dehydrogenase"))
{
}

double PyruvateOxidation::perform(MetaboliteStore& store, double pyruvate_units, double* elapsed) const
{
  int units = (int)floor(pyruvate_units);
  if (units <= 0)
    return 0;

  double done = 0;
  try {
    done = runStep(*pyruvate_dehydrogenase_, store, units, elapsed);
  }
  catch (const ReactionError& e) {
    reporter_.logError(e.what());
    std::throw_with_nested(PathwayError(fmt::format("Pyruvate oxidation failed: {}", e.what())));
  }
  return done * coefficient(pyruvate_dehydrogenase_->produce_, "acetyl_coa");
}

ElectronTransportComplex::ElectronTransportComplex(const std::string& name, const std::string& formula,
                                                   double protons_per_unit, double capacity) :
  name_(name),
  protons_per_unit_(protons_per_unit),
  capacity_(capacity)
{
  parseFormula(formula, &consume_, &produce_);
}

OxidativePhosphorylationResult::OxidativePhosphorylationResult() :
  atp_produced_(0),
  protons_pumped_(0),
  protons_leaked_(0),
  oxygen_consumed_(0),
  nadh_oxidized_(0),
  fadh2_oxidized_(0)
{
}

const std::string OxidativePhosphorylation::PROTON_GRADIENT = "proton_gradient";

OxidativePhosphorylation::OxidativePhosphorylation(Reporter& reporter) :
  leak_rate_(0.1),
  leak_steepness_(0.1),
  leak_midpoint_(150),
  protons_per_atp_(4),
  remainder_(Retain),
  reporter_(reporter)
{
  // Cytochrome c is counted in electron pairs, so every carrier moves one unit at a time.
  complexes_.push_back(ElectronTransportComplex("Complex I", "NADH + ubiquinone -> NAD + ubiquinol", 4, 10));
  complexes_.push_back(ElectronTransportComplex("Complex II", "FADH2 + ubiquinone -> FAD + ubiquinol", 0, 10));
  complexes_.push_back(ElectronTransportComplex("Complex III", "ubiquinol + cytochrome_c_ox -> ubiquinone + cytochrome_c_red", 2, 10));
  complexes_.push_back(ElectronTransportComplex("Complex IV", "cytochrome_c_red + 0.5 oxygen -> cytochrome_c_ox + 0.5 water", 2, 10));
}

OxidativePhosphorylation::SynthaseRemainder OxidativePhosphorylation::parseRemainder(const std::string& name)
{
  string lower = lowercase(name);
  if (lower == "retain")
    return Retain;
  if (lower == "discard")
    return Discard;
  throw std::invalid_argument("Unknown ATP synthase remainder mode: " + name);
}

void OxidativePhosphorylation::applyConfig(const YAML::Node& yaml)
{
  if (!yaml)
    return;
  if (yaml["leak_rate"])
    leak_rate_ = yaml["leak_rate"].as<double>();
  if (yaml["leak_steepness"])
    leak_steepness_ = yaml["leak_steepness"].as<double>();
  if (yaml["leak_midpoint"])
    leak_midpoint_ = yaml["leak_midpoint"].as<double>();
  if (yaml["protons_per_atp"])
    protons_per_atp_ = yaml["protons_per_atp"].as<double>();
  if (yaml["synthase_remainder"])
    remainder_ = parseRemainder(yaml["synthase_remainder"].as<string>());
  if (yaml["complex_capacity"])
    for (ElectronTransportComplex& complex : complexes_)
      complex.capacity_ = yaml["complex_capacity"].as<double>();

  if (leak_rate_ < 0 || leak_steepness_ < 0)
    throw std::invalid_argument("Proton leak rate and steepness must be non-negative.");
  if (protons_per_atp_ <= 0)
    throw std::invalid_argument(fmt::format("protons_per_atp must be positive, got {}", protons_per_atp_));
}

double OxidativePhosphorylation::calculateProtonLeak(double gradient) const
{
  return leak_rate_ / (1.0 + exp(-leak_steepness_ * (gradient - leak_midpoint_)));
}

double OxidativePhosphorylation::runComplex(const ElectronTransportComplex& complex, MetaboliteStore& store, double* extent) const
{
  double units = complex.capacity_;
  for (const auto& kv : complex.consume_)
    if (kv.second > 0)
      units = std::min(units, available(store.metabolite(kv.first)) / kv.second);
  if (complex.protons_per_unit_ > 0)
    units = std::min(units, headroom(store.metabolite(PROTON_GRADIENT)) / complex.protons_per_unit_);
  units = std::max(units, 0.0);
  if (extent)
    *extent = units;
  if (units == 0)
    return 0;

  Amounts consumed;
  for (const auto& kv : complex.consume_)
    consumed[kv.first] = std::min(kv.second * units, available(store.metabolite(kv.first)));
  Amounts produced;
  for (const auto& kv : complex.produce_)
    produced[kv.first] = kv.second * units;
  double protons = complex.protons_per_unit_ * units;
  if (protons > 0)
    produced[PROTON_GRADIENT] = std::min(protons, headroom(store.metabolite(PROTON_GRADIENT)));
  store.exchange(consumed, produced);

  reporter_.logDebug(fmt::format("{}: {:.4f} units, {:.4f} protons pumped.", complex.name_, units, protons));
  return protons;
}

double OxidativePhosphorylation::synthesizeAtp(MetaboliteStore& store) const
{
  double gradient = available(store.metabolite(PROTON_GRADIENT));
  double atp = floor(gradient / protons_per_atp_);
  atp = std::min(atp, available(store.metabolite("ADP")));
  atp = std::min(atp, available(store.metabolite("Pi")));
  atp = std::min(atp, headroom(store.metabolite("ATP")));
  atp = std::max(atp, 0.0);

  double protons_used = atp * protons_per_atp_;
  if (remainder_ == Discard)
    protons_used = gradient - fmod(gradient, protons_per_atp_);
  if (protons_used <= 0)
    return 0;

  Amounts consumed = {{PROTON_GRADIENT, std::min(protons_used, gradient)}};
  if (atp > 0) {
    consumed["ADP"] = atp;
    consumed["Pi"] = atp;
  }
  Amounts produced;
  if (atp > 0)
    produced["ATP"] = atp;
  store.exchange(consumed, produced);
  return atp;
}

OxidativePhosphorylationResult OxidativePhosphorylation::perform(MetaboliteStore& store) const
{
  OxidativePhosphorylationResult result;
  try {
    for (const ElectronTransportComplex& complex : complexes_) {
      double units = 0;
      result.protons_pumped_ += runComplex(complex, store, &units);
      result.oxygen_consumed_ += coefficient(complex.consume_, "oxygen") * units;
      result.nadh_oxidized_ += coefficient(complex.consume_, "NADH") * units;
      result.fadh2_oxidized_ += coefficient(complex.consume_, "FADH2") * units;
    }

    double gradient = available(store.metabolite(PROTON_GRADIENT));
    result.protons_leaked_ = std::min(calculateProtonLeak(gradient), gradient);
    if (result.protons_leaked_ > 0)
      store.consume({{PROTON_GRADIENT, result.protons_leaked_}});

    result.atp_produced_ = synthesizeAtp(store);
  }
  catch (const MetaboliteError& e) {
    reporter_.logError(fmt::format("Oxidative phosphorylation failed: {}", e.what()));
    std::throw_with_nested(OxidativePhosphorylationError(fmt::format("Oxidative phosphorylation failed: {}", e.what())));
  }

  reporter_.logEvent(fmt::format("Oxidative phosphorylation: {:.4f} ATP, {:.4f} protons pumped, {:.4f} leaked, gradient {:.4f}.",
                                 result.atp_produced_, result.protons_pumped_, result.protons_leaked_,
                                 store.quantity(PROTON_GRADIENT)));
  return result;
}
