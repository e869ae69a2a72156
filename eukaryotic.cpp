#include <eukaryotic.h>
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <exception>

using namespace std;

namespace
{
  // Pathways leave behind up to their completion tolerance, so 1.9999999999 pyruvate counts as 2 units.
  const double WHOLE_UNIT_SLACK = 1e-6;

  double wholeUnits(double quantity)
  {
    return floor(quantity + WHOLE_UNIT_SLACK);
  }

  double available(const MetaboliteStore& store, const std::string& name)
  {
    const Metabolite& met = store.metabolite(name);
    return std::max(met.quantity() - met.min_quantity_, 0.0);
  }

  double headroom(const MetaboliteStore& store, const std::string& name)
  {
    const Metabolite& met = store.metabolite(name);
    return std::max(met.max_quantity_ - met.quantity(), 0.0);
  }

  template<typename T>
  T readOr(const YAML::Node& yaml, const std::string& key, T default_value)
  {
    if (yaml[key])
      return yaml[key].as<T>();
    return default_value;
  }
}

SimulationParams::SimulationParams() :
  time_step_(0.1),
  max_simulation_time_(100),
  glucose_(4),
  broadcast_(false),
  log_level_("info"),
  correct_adenine_drift_(true),
  synthase_remainder_(OxidativePhosphorylation::Retain),
  glycolysis_time_step_(0.1),
  krebs_time_step_(1.0),
  max_substeps_(1000),
  nadh_shuttle_rate_(5),
  atp_demand_(20),
  max_oxphos_updates_(20)
{
}

SimulationParams::SimulationParams(const YAML::Node& yaml) :
  SimulationParams()
{
  if (!yaml)
    return;

  time_step_ = readOr(yaml, "time_step", time_step_);
  max_simulation_time_ = readOr(yaml, "max_simulation_time", max_simulation_time_);
  glucose_ = readOr(yaml, "glucose", glucose_);
  if (yaml["glucose_amounts"])
    glucose_amounts_ = yaml["glucose_amounts"].as<vector<double>>();
  broadcast_ = readOr(yaml, "broadcast", broadcast_);
  log_level_ = readOr(yaml, "log_level", log_level_);
  correct_adenine_drift_ = readOr(yaml, "correct_adenine_drift", correct_adenine_drift_);
  if (yaml["synthase_remainder"])
    synthase_remainder_ = OxidativePhosphorylation::parseRemainder(yaml["synthase_remainder"].as<string>());
  glycolysis_time_step_ = readOr(yaml, "glycolysis_time_step", glycolysis_time_step_);
  krebs_time_step_ = readOr(yaml, "krebs_time_step", krebs_time_step_);
  max_substeps_ = readOr(yaml, "max_substeps", max_substeps_);
  nadh_shuttle_rate_ = readOr(yaml, "nadh_shuttle_rate", nadh_shuttle_rate_);
  atp_demand_ = readOr(yaml, "atp_demand", atp_demand_);
  max_oxphos_updates_ = readOr(yaml, "max_oxphos_updates", max_oxphos_updates_);

  if (time_step_ <= 0)
    throw std::invalid_argument(fmt::format("Simulation time_step must be positive, got {}", time_step_));
  if (max_substeps_ <= 0)
    throw std::invalid_argument(fmt::format("Simulation max_substeps must be positive, got {}", max_substeps_));
  Reporter::parseLevel(log_level_);
}

Organelle::Organelle(const std::string& name, Reporter& reporter) :
  name_(name),
  metabolites_(name),
  reporter_(reporter)
{
}

void Organelle::applyConfig(const YAML::Node& yaml)
{
  metabolites_.clear();
  if (yaml)
    metabolites_.registerMetabolites(yaml);
  registerDefaults();
  captureInitialState();
}

void Organelle::ensureRegistered(const std::string& name, double quantity, double max_quantity)
{
  if (!metabolites_.has(name))
    metabolites_.registerMetabolite(name, quantity, max_quantity);
}

void Organelle::captureInitialState()
{
  initial_state_ = metabolites_.snapshot();
}

void Organelle::reset()
{
  metabolites_.restore(initial_state_);
}

std::string Organelle::_str() const
{
  return metabolites_._str();
}

Cytoplasm::Cytoplasm(Reporter& reporter) :
  Organelle("cytoplasm", reporter)
{
}

void Cytoplasm::registerDefaults()
{
  ensureRegistered("glucose", 0, 1000);
  ensureRegistered("glucose_6_phosphate", 0, 1000);
  ensureRegistered("fructose_6_phosphate", 0, 1000);
  ensureRegistered("fructose_1_6_bisphosphate", 0, 1000);
  ensureRegistered("dihydroxyacetone_phosphate", 0, 1000);
  ensureRegistered("glyceraldehyde_3_phosphate", 0, 1000);
  ensureRegistered("bisphosphoglycerate_1_3", 0, 1000);
  ensureRegistered("phosphoglycerate_3", 0, 1000);
  ensureRegistered("phosphoglycerate_2", 0, 1000);
  ensureRegistered("phosphoenolpyruvate", 0, 1000);
  ensureRegistered("pyruvate", 0, 1000);
  ensureRegistered("lactate", 0, 1000);
  ensureRegistered("ATP", 100, 1000);
  ensureRegistered("ADP", 100, 1000);
  ensureRegistered("AMP", 0, 1000);
  ensureRegistered("Pi", 500, 1000);
  ensureRegistered("NAD", 10, 1000);
  ensureRegistered("NADH", 0, 1000);
}

void Cytoplasm::buildPathways(const ReactionCatalog& catalog, const SimulationParams& params)
{
  glycolysis_.reset(new Glycolysis(catalog, reporter_, params.glycolysis_time_step_));
  glycolysis_->max_substeps_ = params.max_substeps_;
  glycolysis_->correct_adenine_drift_ = params.correct_adenine_drift_;
}

double Cytoplasm::hydrolyzeAtp(double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot hydrolyse a negative amount of ATP: {}", amount));
  double hydrolyzed = std::min({amount, available(metabolites_, "ATP"),
                                headroom(metabolites_, "ADP"), headroom(metabolites_, "Pi")});
  if (hydrolyzed > 0)
    metabolites_.exchange({{"ATP", hydrolyzed}}, {{"ADP", hydrolyzed}, {"Pi", hydrolyzed}});
  return hydrolyzed;
}

RespirationResult::RespirationResult() :
  acetyl_coa_(0),
  co2_(0),
  krebs_atp_(0),
  oxphos_atp_(0),
  atp_(0),
  oxygen_consumed_(0),
  elapsed_(0)
{
}

Mitochondrion::Mitochondrion(Reporter& reporter) :
  Organelle("mitochondrion", reporter),
  oxidative_phosphorylation_(reporter),
  shuttle_efficiency_(0.67),
  calcium_threshold_(800),
  calcium_boost_(1.2),
  calcium_boost_active_(false),
  max_oxphos_updates_(20)
{
}

void Mitochondrion::registerDefaults()
{
  ensureRegistered("pyruvate", 0, 1000);
  ensureRegistered("acetyl_coa", 0, 1000);
  ensureRegistered("CoA", 10, 1000);
  ensureRegistered("citrate", 0, 1000);
  ensureRegistered("isocitrate", 0, 1000);
  ensureRegistered("alpha_ketoglutarate", 0, 1000);
  ensureRegistered("succinyl_coa", 0, 1000);
  ensureRegistered("succinate", 0, 1000);
  ensureRegistered("fumarate", 0, 1000);
  ensureRegistered("malate", 0, 1000);
  ensureRegistered("oxaloacetate", 10, 1000);
  ensureRegistered("NAD", 50, 1000);
  ensureRegistered("NADH", 0, 1000);
  ensureRegistered("FAD", 10, 1000);
  ensureRegistered("FADH2", 0, 1000);
  ensureRegistered("ATP", 100, 1000);
  ensureRegistered("ADP", 100, 1000);
  ensureRegistered("AMP", 0, 1000);
  ensureRegistered("Pi", 500, 1000);
  ensureRegistered("CO2", 0, 1e6);
  ensureRegistered("ubiquinone", 100, 1000);
  ensureRegistered("ubiquinol", 0, 1000);
  ensureRegistered("cytochrome_c_ox", 100, 1000);
  ensureRegistered("cytochrome_c_red", 0, 1000);
  ensureRegistered("oxygen", 1000, 1000);
  ensureRegistered("water", 0, 1e6);
  ensureRegistered(OxidativePhosphorylation::PROTON_GRADIENT, 0, 200);
  ensureRegistered("calcium", 0, 2000);
}

void Mitochondrion::buildPathways(const ReactionCatalog& catalog, const SimulationParams& params)
{
  pyruvate_oxidation_.reset(new PyruvateOxidation(catalog, reporter_, params.krebs_time_step_));
  pyruvate_oxidation_->max_substeps_ = params.max_substeps_;
  krebs_cycle_.reset(new KrebsCycle(catalog, reporter_, params.krebs_time_step_));
  krebs_cycle_->max_substeps_ = params.max_substeps_;
  oxidative_phosphorylation_.remainder_ = params.synthase_remainder_;
  max_oxphos_updates_ = params.max_oxphos_updates_;
  calcium_boost_active_ = false;
}

std::vector<Enzyme::Ptr> Mitochondrion::calciumSensitiveEnzymes() const
{
  vector<Enzyme::Ptr> enzymes;
  enzymes.push_back(pyruvate_oxidation_->pyruvate_dehydrogenase_->enzyme_);
  for (const Reaction::ConstPtr& step : krebs_cycle_->steps_)
    if (step->name_ == "isocitrate_dehydrogenase" || step->name_ == "alpha_ketoglutarate_dehydrogenase")
      enzymes.push_back(step->enzyme_);
  return enzymes;
}

double Mitochondrion::importPyruvate(MetaboliteStore& cytoplasm, double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot import a negative amount of pyruvate: {}", amount));
  double imported = std::min({amount, available(cytoplasm, "pyruvate"), headroom(metabolites_, "pyruvate")});
  if (imported <= 0)
    return 0;
  cytoplasm.consume({{"pyruvate", imported}});
  metabolites_.produce({{"pyruvate", imported}});
  reporter_.logDebug(fmt::format("Imported {:.4f} pyruvate into the mitochondrion.", imported));
  return imported;
}

double Mitochondrion::importPhosphate(MetaboliteStore& cytoplasm, double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot import a negative amount of Pi: {}", amount));
  double imported = std::min({amount, available(cytoplasm, "Pi"), headroom(metabolites_, "Pi")});
  if (imported <= 0)
    return 0;
  cytoplasm.consume({{"Pi", imported}});
  metabolites_.produce({{"Pi", imported}});
  return imported;
}

double Mitochondrion::transferCytoplasmicNadh(MetaboliteStore& cytoplasm, double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot shuttle a negative amount of NADH: {}", amount));
  double oxidized = std::min({amount, available(cytoplasm, "NADH"), headroom(cytoplasm, "NAD"),
                              available(metabolites_, "NAD") / shuttle_efficiency_,
                              headroom(metabolites_, "NADH") / shuttle_efficiency_});
  if (oxidized <= 0)
    return 0;

  double delivered = oxidized * shuttle_efficiency_;
  cytoplasm.exchange({{"NADH", oxidized}}, {{"NAD", oxidized}});
  metabolites_.exchange({{"NAD", delivered}}, {{"NADH", delivered}});
  reporter_.logDebug(fmt::format("Shuttled {:.4f} cytoplasmic NADH as {:.4f} matrix NADH.", oxidized, delivered));
  return delivered;
}

bool Mitochondrion::bufferCalcium(double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot buffer a negative amount of calcium: {}", amount));
  double taken = std::min(amount, headroom(metabolites_, "calcium"));
  if (taken > 0)
    metabolites_.produce({{"calcium", taken}});

  bool above = metabolites_.quantity("calcium") > calcium_threshold_;
  if (above && !calcium_boost_active_) {
    for (const Enzyme::Ptr& enzyme : calciumSensitiveEnzymes())
      enzyme->setActivity(enzyme->activity_ * calcium_boost_);
    calcium_boost_active_ = true;
    reporter_.logEvent(fmt::format("Calcium at {:.1f}; dehydrogenase activity x{}.", metabolites_.quantity("calcium"), calcium_boost_));
  }
  else if (!above && calcium_boost_active_) {
    for (const Enzyme::Ptr& enzyme : calciumSensitiveEnzymes())
      enzyme->setActivity(enzyme->activity_ / calcium_boost_);
    calcium_boost_active_ = false;
  }
  return calcium_boost_active_;
}

RespirationResult Mitochondrion::cellularRespiration(double pyruvate_units)
{
  RespirationResult result;
  double initial_atp = metabolites_.quantity("ATP");
  double initial_co2 = metabolites_.quantity("CO2");

  double units = std::min(wholeUnits(pyruvate_units), wholeUnits(metabolites_.quantity("pyruvate")));
  if (units > 0)
    result.acetyl_coa_ = pyruvate_oxidation_->perform(metabolites_, units, &result.elapsed_);

  double turns = wholeUnits(metabolites_.quantity("acetyl_coa"));
  if (turns > 0) {
    KrebsCycleResult krebs = krebs_cycle_->run(metabolites_, turns);
    result.krebs_atp_ = krebs.atp_;
    result.elapsed_ += krebs.elapsed_;
  }

  for (int i = 0; i < max_oxphos_updates_; ++i) {
    OxidativePhosphorylationResult oxphos = oxidative_phosphorylation_.perform(metabolites_);
    result.oxphos_atp_ += oxphos.atp_produced_;
    result.oxygen_consumed_ += oxphos.oxygen_consumed_;
    if (oxphos.protons_pumped_ == 0 && oxphos.atp_produced_ == 0)
      break;
  }

  result.co2_ = metabolites_.quantity("CO2") - initial_co2;
  result.atp_ = metabolites_.quantity("ATP") - initial_atp;
  reporter_.logEvent(fmt::format("Cellular respiration: {:.4f} acetyl-CoA, {:.4f} CO2, {:.4f} ATP.",
                                 result.acetyl_coa_, result.co2_, result.atp_));
  return result;
}

Cell::Cell(Reporter& reporter) :
  reporter_(reporter),
  cytoplasm_(reporter),
  mitochondrion_(reporter)
{
  applyConfig(YAML::Node());
}

Cell::Cell(const YAML::Node& yaml, Reporter& reporter) :
  reporter_(reporter),
  cytoplasm_(reporter),
  mitochondrion_(reporter)
{
  applyConfig(yaml);
}

void Cell::applyConfig(const std::string& path)
{
  applyConfig(YAML::LoadFile(path));
}

void Cell::applyConfig(const YAML::Node& yaml)
{
  catalog_.applyConfig(yaml);
  params_ = SimulationParams(yaml["Simulation"]);
  cytoplasm_.applyConfig(yaml["Cytoplasm"]);
  mitochondrion_.applyConfig(yaml["Mitochondrion"]);

  cytoplasm_.buildPathways(catalog_, params_);
  mitochondrion_.buildPathways(catalog_, params_);
  mitochondrion_.oxidative_phosphorylation_.applyConfig(yaml["OxidativePhosphorylation"]);
}

double Cell::exchangeAtp(double amount)
{
  if (amount < 0)
    throw std::invalid_argument(fmt::format("Cannot exchange a negative amount of ATP: {}", amount));
  MetaboliteStore& matrix = mitochondrion_.metabolites_;
  MetaboliteStore& cytosol = cytoplasm_.metabolites_;
  double moved = std::min({amount, available(matrix, "ATP"), available(cytosol, "ADP"),
                           headroom(cytosol, "ATP"), headroom(matrix, "ADP")});
  if (moved <= 0)
    return 0;
  matrix.exchange({{"ATP", moved}}, {{"ADP", moved}});
  cytosol.exchange({{"ADP", moved}}, {{"ATP", moved}});
  return moved;
}

double Cell::totalAdenineNucleotides() const
{
  return ::totalAdenineNucleotides(cytoplasm_.metabolites_) + ::totalAdenineNucleotides(mitochondrion_.metabolites_);
}

double Cell::totalEnergy() const
{
  return cytoplasm_.metabolites_.totalEnergy() + mitochondrion_.metabolites_.totalEnergy();
}

void Cell::reset()
{
  cytoplasm_.reset();
  mitochondrion_.reset();
  for (const string& name : catalog_.names())
    catalog_.enzyme(name)->setActivity(1.0);
  mitochondrion_.calcium_boost_active_ = false;
}

std::string Cell::_str() const
{
  std::ostringstream oss;
  oss << "Cell" << endl;
  oss << cytoplasm_.str("  ") << endl;
  oss << mitochondrion_.str("  ") << endl;
  oss << "  total adenine nucleotides: " << totalAdenineNucleotides() << endl;
  oss << "  total energy: " << totalEnergy() << endl;
  return oss.str();
}

SimulationResults::SimulationResults() :
  total_atp_produced_(0),
  glycolysis_atp_(0),
  respiration_atp_(0),
  glucose_processed_(0),
  pyruvate_produced_(0),
  lactate_produced_(0),
  co2_produced_(0),
  oxygen_consumed_(0),
  simulation_time_(0),
  initial_adenine_(0),
  final_adenine_(0),
  initial_energy_(0),
  final_energy_(0),
  cytoplasm_atp_(0),
  mitochondrion_atp_(0),
  proton_gradient_(0),
  iterations_(0),
  skipped_iterations_(0),
  stopped_early_(false)
{
}

std::map<std::string, double> SimulationResults::asMap() const
{
  std::map<std::string, double> result;
  result["total_atp_produced"] = total_atp_produced_;
  result["glycolysis_atp"] = glycolysis_atp_;
  result["respiration_atp"] = respiration_atp_;
  result["glucose_processed"] = glucose_processed_;
  result["pyruvate_produced"] = pyruvate_produced_;
  result["lactate_produced"] = lactate_produced_;
  result["co2_produced"] = co2_produced_;
  result["oxygen_consumed"] = oxygen_consumed_;
  result["simulation_time"] = simulation_time_;
  result["initial_adenine"] = initial_adenine_;
  result["final_adenine"] = final_adenine_;
  result["initial_energy"] = initial_energy_;
  result["final_energy"] = final_energy_;
  result["cytoplasm_atp"] = cytoplasm_atp_;
  result["mitochondrion_atp"] = mitochondrion_atp_;
  result["proton_gradient"] = proton_gradient_;
  result["iterations"] = iterations_;
  result["skipped_iterations"] = skipped_iterations_;
  return result;
}

SimulationController::SimulationController(Cell& cell, Reporter& reporter) :
  SimulationController(cell, cell.params_, reporter)
{
}

SimulationController::SimulationController(Cell& cell, const SimulationParams& params, Reporter& reporter) :
  cell_(cell),
  reporter_(reporter),
  params_(params),
  simulation_time_(0),
  glucose_processed_(0)
{
}

void SimulationController::applyAdpFeedback()
{
  double adp = cell_.cytoplasm_.metabolites_.quantity("ADP");
  double activity = 1.0 + adp / 500.0;
  for (const Reaction::ConstPtr& step : cell_.cytoplasm_.glycolysis_->investment_)
    if (step->name_ == "hexokinase" || step->name_ == "phosphofructokinase")
      step->enzyme_->setActivity(activity);
}

bool SimulationController::checkBounds() const
{
  bool ok = true;
  const MetaboliteStore* stores[] = { &cell_.cytoplasm_.metabolites_, &cell_.mitochondrion_.metabolites_ };
  for (const MetaboliteStore* store : stores) {
    for (const string& name : store->names()) {
      const Metabolite& met = store->metabolite(name);
      double q = met.quantity();
      if (q < met.min_quantity_ || q > met.max_quantity_) {
        reporter_.logError(fmt::format("{} in {} is out of bounds: {} not in [{}, {}].",
                                       met.label_, store->name_, q, met.min_quantity_, met.max_quantity_));
        ok = false;
      }
    }
  }
  return ok;
}

bool SimulationController::checkAdenineBalance(double expected, double tolerance) const
{
  double total = cell_.totalAdenineNucleotides();
  if (fabs(total - expected) <= tolerance)
    return true;
  reporter_.logWarning(fmt::format("Cell-wide adenine nucleotides drifted: expected {:.6f}, have {:.6f}.", expected, total));
  return false;
}

bool SimulationController::checkEnergyBalance(double expected, double tolerance) const
{
  double total = cell_.totalEnergy();
  if (fabs(total - expected) <= tolerance)
    return true;
  reporter_.logWarning(fmt::format("Energy conservation violation. Current: {:.6f}, initial: {:.6f}, difference: {:.6f}.",
                                   total, expected, total - expected));
  return false;
}

std::map<std::string, double> SimulationController::currentState() const
{
  const MetaboliteStore& cytosol = cell_.cytoplasm_.metabolites_;
  const MetaboliteStore& matrix = cell_.mitochondrion_.metabolites_;
  std::map<std::string, double> state;
  state["simulation_time"] = simulation_time_;
  state["glucose_processed"] = glucose_processed_;
  state["cytoplasm_atp"] = cytosol.quantity("ATP");
  state["mitochondrion_atp"] = matrix.quantity("ATP");
  state["proton_gradient"] = matrix.quantity(OxidativePhosphorylation::PROTON_GRADIENT);
  state["oxygen_remaining"] = matrix.quantity("oxygen");
  state["cytoplasm_nad"] = cytosol.quantity("NAD");
  state["cytoplasm_nadh"] = cytosol.quantity("NADH");
  state["mitochondrion_nad"] = matrix.quantity("NAD");
  state["mitochondrion_nadh"] = matrix.quantity("NADH");
  state["total_energy"] = cell_.totalEnergy();
  return state;
}

SimulationResults SimulationController::runSimulation(double glucose)
{
  if (glucose < 0)
    throw std::invalid_argument(fmt::format("Cannot simulate a negative amount of glucose: {}", glucose));

  Cytoplasm& cytoplasm = cell_.cytoplasm_;
  Mitochondrion& mitochondrion = cell_.mitochondrion_;
  SimulationResults results;
  simulation_time_ = 0;
  glucose_processed_ = 0;

  double supplied = std::min(glucose, headroom(cytoplasm.metabolites_, "glucose"));
  if (supplied < glucose)
    reporter_.logWarning(fmt::format("Only room for {:.4f} of {:.4f} glucose in the cytoplasm.", supplied, glucose));
  if (supplied > 0)
    cytoplasm.metabolites_.produce({{"glucose", supplied}});

  results.initial_adenine_ = cell_.totalAdenineNucleotides();
  results.initial_energy_ = cell_.totalEnergy();
  double initial_co2 = mitochondrion.metabolites_.quantity("CO2");
  double target = floor(glucose);
  reporter_.logEvent(fmt::format("Starting simulation with {} glucose units.", target));

  while (results.glucose_processed_ < target) {
    if (simulation_time_ >= params_.max_simulation_time_) {
      reporter_.logWarning(fmt::format("Reached max simulation time ({}) with {} glucose processed.",
                                       params_.max_simulation_time_, results.glucose_processed_));
      results.stopped_early_ = true;
      break;
    }
    if (wholeUnits(cytoplasm.metabolites_.quantity("glucose")) < 1) {
      reporter_.logWarning("Glucose depleted. Stopping simulation.");
      results.stopped_early_ = true;
      break;
    }

    double elapsed = 0;
    try {
      GlycolysisResult glycolysis = cytoplasm.glycolysis_->perform(cytoplasm.metabolites_, 1);
      elapsed += glycolysis.elapsed_;
      results.glucose_processed_ += 1;
      glucose_processed_ = results.glucose_processed_;
      results.glycolysis_atp_ += glycolysis.net_atp_;
      results.pyruvate_produced_ += glycolysis.pyruvate_ + glycolysis.lactate_;
      results.lactate_produced_ += glycolysis.lactate_;
      reporter_.logAtpProduction("Glycolysis", glycolysis.net_atp_);

      applyAdpFeedback();
      mitochondrion.transferCytoplasmicNadh(cytoplasm.metabolites_, params_.nadh_shuttle_rate_);
      double pyruvate = mitochondrion.importPyruvate(cytoplasm.metabolites_, cytoplasm.metabolites_.quantity("pyruvate"));

      try {
        RespirationResult respiration = mitochondrion.cellularRespiration(pyruvate);
        elapsed += respiration.elapsed_;
        results.respiration_atp_ += respiration.atp_;
        results.oxygen_consumed_ += respiration.oxygen_consumed_;
        reporter_.logAtpProduction("Cellular respiration", respiration.atp_);
        double exported = cell_.exchangeAtp(std::max(respiration.atp_, 0.0));
        mitochondrion.importPhosphate(cytoplasm.metabolites_, exported);
      }
      catch (const PathwayError& e) {
        reporter_.logError(fmt::format("Respiration failed at t = {:.3f}: {}", simulation_time_, e.what()));
      }

      cytoplasm.hydrolyzeAtp(params_.atp_demand_);
      checkBounds();
      checkAdenineBalance(results.initial_adenine_);
      checkEnergyBalance(results.initial_energy_);
    }
    catch (const GlycolysisError& e) {
      reporter_.logError(fmt::format("Glycolysis failed at t = {:.3f}: {}", simulation_time_, e.what()));
      reporter_.logWarning("Stopping simulation.");
      results.stopped_early_ = true;
      break;
    }
    catch (const MetaboliteError& e) {
      reporter_.logError(fmt::format("Metabolite error at t = {:.3f}: {}", simulation_time_, e.what()));
      reporter_.logWarning("Skipping this iteration.");
      results.skipped_iterations_ += 1;
    }

    simulation_time_ += std::max(elapsed, params_.time_step_);
    results.iterations_ += 1;
    if (on_step_)
      on_step_(*this);
  }

  results.total_atp_produced_ = results.glycolysis_atp_ + results.respiration_atp_;
  results.co2_produced_ = mitochondrion.metabolites_.quantity("CO2") - initial_co2;
  results.simulation_time_ = simulation_time_;
  results.final_adenine_ = cell_.totalAdenineNucleotides();
  results.final_energy_ = cell_.totalEnergy();
  results.cytoplasm_atp_ = cytoplasm.metabolites_.quantity("ATP");
  results.mitochondrion_atp_ = mitochondrion.metabolites_.quantity("ATP");
  results.proton_gradient_ = mitochondrion.metabolites_.quantity(OxidativePhosphorylation::PROTON_GRADIENT);
  reporter_.reportSimulationResults(results.asMap());
  return results;
}
