#include <doctest.h>
#include <eukaryotic.h>
#include <cmath>
#include <exception>
#include <sstream>

using namespace std;

void printHeader();

namespace
{
  // A recording reporter that doesn't clutter the test output.
  struct QuietReporter
  {
    std::ostringstream oss_;
    Reporter reporter_;

    QuietReporter() : reporter_(oss_, Reporter::Silent) { reporter_.setRecording(true); }
  };

  void checkInBounds(const MetaboliteStore& store)
  {
    for (const string& name : store.names()) {
      const Metabolite& met = store.metabolite(name);
      CHECK(met.quantity() >= met.min_quantity_);
      CHECK(met.quantity() <= met.max_quantity_);
    }
  }
}

TEST_CASE("Glycolysis yields 2 ATP and 2 pyruvate per glucose")
{
  printHeader();
  QuietReporter quiet;
  ReactionCatalog catalog;
  Cytoplasm cytoplasm(quiet.reporter_);
  cytoplasm.applyConfig(YAML::Node());
  MetaboliteStore& store = cytoplasm.metabolites_;
  store.produce({{"glucose", 10}});
  Glycolysis glycolysis(catalog, quiet.reporter_);

  double initial_adenine = totalAdenineNucleotides(store);
  double initial_adp = store.quantity("ADP");

  SUBCASE("One glucose") {
    GlycolysisResult result = glycolysis.perform(store, 1);
    cout << store.str() << endl;
    CHECK(result.net_atp_ == doctest::Approx(2));
    CHECK(result.pyruvate_ == doctest::Approx(2));
    CHECK(result.nadh_ == doctest::Approx(2));
    CHECK(result.lactate_ == 0);
    CHECK(result.elapsed_ > 0);
    CHECK(!result.adenine_corrected_);
    CHECK(store.quantity("glucose") == doctest::Approx(9));
    CHECK(store.quantity("ADP") == doctest::Approx(initial_adp - 2));
    CHECK(fabs(totalAdenineNucleotides(store) - initial_adenine) < 1e-6);
    CHECK(store.quantity("glyceraldehyde_3_phosphate") == doctest::Approx(0));
    checkInBounds(store);
  }

  SUBCASE("Two glucose doubles the yield") {
    GlycolysisResult result = glycolysis.perform(store, 2);
    CHECK(result.net_atp_ == doctest::Approx(4));
    CHECK(result.pyruvate_ == doctest::Approx(4));
    CHECK(fabs(totalAdenineNucleotides(store) - initial_adenine) < 1e-6);
  }

  SUBCASE("Fractional units are floored") {
    GlycolysisResult result = glycolysis.perform(store, 1.9);
    CHECK(result.pyruvate_ == doctest::Approx(2));
    CHECK_THROWS_AS(glycolysis.perform(store, 0.5), GlycolysisError);
    CHECK_THROWS_AS(glycolysis.perform(store, -3), GlycolysisError);
  }
}

TEST_CASE("Glycolysis failures")
{
  printHeader();
  QuietReporter quiet;
  ReactionCatalog catalog;
  Cytoplasm cytoplasm(quiet.reporter_);
  cytoplasm.applyConfig(YAML::Node());
  MetaboliteStore& store = cytoplasm.metabolites_;
  Glycolysis glycolysis(catalog, quiet.reporter_);

  SUBCASE("No glucose") {
    try {
      glycolysis.perform(store, 1);
      FAIL("Expected GlycolysisError");
    }
    catch (const GlycolysisError& e) {
      CHECK(string(e.what()).find("hexokinase") != string::npos);
      CHECK_THROWS_AS(std::rethrow_if_nested(e), ReactionError);
    }
    CHECK(quiet.reporter_.numErrors() > 0);
  }

  SUBCASE("No NAD+ and nothing to regenerate it from") {
    store.produce({{"glucose", 1}});
    store.metabolite("NAD").setQuantity(0);
    CHECK_THROWS_AS(glycolysis.perform(store, 1), GlycolysisError);
    // The investment phase already ran and is not rolled back.
    CHECK(store.quantity("glucose") == doctest::Approx(0));
    checkInBounds(store);
  }

  SUBCASE("Missing species") {
    MetaboliteStore empty;
    empty.registerMetabolite("ATP", 10, 100);
    empty.registerMetabolite("ADP", 10, 100);
    empty.registerMetabolite("AMP", 0, 100);
    CHECK_THROWS_AS(glycolysis.perform(empty, 1), GlycolysisError);
  }
}

TEST_CASE("NAD+ regeneration by lactate dehydrogenase")
{
  printHeader();
  QuietReporter quiet;
  ReactionCatalog catalog;
  Cytoplasm cytoplasm(quiet.reporter_);
  cytoplasm.applyConfig(YAML::Node());
  MetaboliteStore& store = cytoplasm.metabolites_;
  Glycolysis glycolysis(catalog, quiet.reporter_);

  store.produce({{"glucose", 1}, {"NADH", 5}, {"pyruvate", 5}});
  store.metabolite("NAD").setQuantity(0.5);

  GlycolysisResult result = glycolysis.perform(store, 1);
  CHECK(result.net_atp_ == doctest::Approx(2));
  // 0.5 before the first G3P, then 1 before the second.
  CHECK(result.lactate_ == doctest::Approx(1.5));
  CHECK(result.pyruvate_ == doctest::Approx(0.5));
  CHECK(result.nadh_ == doctest::Approx(0.5));
  CHECK(store.quantity("lactate") == doctest::Approx(1.5));
  checkInBounds(store);

  SUBCASE("Nothing to do when NAD+ is plentiful") {
    store.metabolite("NAD").setQuantity(10);
    CHECK(glycolysis.regenerateNad(store, glycolysis.nad_threshold_) == 0);
  }
}

TEST_CASE("Adenine drift correction")
{
  printHeader();
  QuietReporter quiet;
  ReactionCatalog catalog;
  // Makes an AMP out of nothing every time it runs.
  catalog.addReaction(Reaction::Ptr(new Reaction("phosphofructokinase",
                                                 Enzyme::Ptr(new Enzyme("Leaky PFK", 100, Amounts{{"fructose_6_phosphate", 1}})),
                                                 "fructose_6_phosphate + ATP -> fructose_1_6_bisphosphate + ADP + AMP")));
  Cytoplasm cytoplasm(quiet.reporter_);
  cytoplasm.applyConfig(YAML::Node());
  MetaboliteStore& store = cytoplasm.metabolites_;
  store.produce({{"glucose", 1}});
  double initial_adenine = totalAdenineNucleotides(store);
  Glycolysis glycolysis(catalog, quiet.reporter_);

  SUBCASE("Corrected") {
    GlycolysisResult result = glycolysis.perform(store, 1);
    CHECK(result.adenine_corrected_);
    CHECK(fabs(totalAdenineNucleotides(store) - initial_adenine) < 1e-6);
    // The extra unit comes out of ATP.
    CHECK(result.net_atp_ == doctest::Approx(1));
    CHECK(quiet.reporter_.numWarnings() == 1);
    CHECK(quiet.reporter_.contains("Adenine nucleotide imbalance"));
  }

  SUBCASE("Disabled") {
    glycolysis.correct_adenine_drift_ = false;
    GlycolysisResult result = glycolysis.perform(store, 1);
    CHECK(!result.adenine_corrected_);
    CHECK(totalAdenineNucleotides(store) == doctest::Approx(initial_adenine + 1));
    CHECK(quiet.reporter_.contains("not corrected"));
  }

  SUBCASE("Direct call") {
    store.produce({{"ADP", 3}});
    AdenineCorrection correction = correctAdenineDrift(store, initial_adenine, store.quantity("ATP"), quiet.reporter_);
    CHECK(correction.applied_);
    CHECK(correction.excess_ == doctest::Approx(3));
    CHECK(correction.atp_adjustment_ == 0);
    CHECK(correction.adp_adjustment_ == doctest::Approx(3));
    CHECK(totalAdenineNucleotides(store) == doctest::Approx(initial_adenine));
  }
}

TEST_CASE("Krebs cycle")
{
  printHeader();
  QuietReporter quiet;
  ReactionCatalog catalog;
  Mitochondrion mitochondrion(quiet.reporter_);
  mitochondrion.applyConfig(YAML::Node());
  MetaboliteStore& store = mitochondrion.metabolites_;
  store.produce({{"acetyl_coa", 5}});
  KrebsCycle krebs(catalog, quiet.reporter_);

  double initial_oxaloacetate = store.quantity("oxaloacetate");
  double initial_adenine = totalAdenineNucleotides(store);

  SUBCASE("One turn releases exactly 2 CO2") {
    double co2 = krebs.cycle(store);
    CHECK(co2 == doctest::Approx(2));
    CHECK(store.quantity("CO2") == doctest::Approx(2));
    CHECK(store.quantity("oxaloacetate") == doctest::Approx(initial_oxaloacetate));
    CHECK(store.quantity("acetyl_coa") == doctest::Approx(4));
  }

  SUBCASE("Three turns") {
    KrebsCycleResult result = krebs.run(store, 3);
    cout << store.str() << endl;
    CHECK(result.co2_ == doctest::Approx(6));
    CHECK(result.atp_ == doctest::Approx(3));
    CHECK(fabs(result.adenine_) < 1e-6);
    CHECK(result.elapsed_ > 0);
    CHECK(store.quantity("NADH") == doctest::Approx(9));
    CHECK(store.quantity("FADH2") == doctest::Approx(3));
    CHECK(totalAdenineNucleotides(store) == doctest::Approx(initial_adenine));
    // Free energy is not conserved by this bookkeeping, and it says so.
    CHECK(result.energy_ != 0);
    CHECK(quiet.reporter_.contains("Energy not conserved"));
    checkInBounds(store);
  }

  SUBCASE("Failures") {
    CHECK_THROWS_AS(krebs.run(store, 0), KrebsCycleError);
    store.metabolite("oxaloacetate").setQuantity(0);
    CHECK_THROWS_AS(krebs.run(store, 1), KrebsCycleError);
    CHECK(store.quantity("acetyl_coa") == doctest::Approx(5));
  }
}

TEST_CASE("Proton leak")
{
  printHeader();
  OxidativePhosphorylation oxphos;
  CHECK(oxphos.calculateProtonLeak(oxphos.leak_midpoint_) == doctest::Approx(oxphos.leak_rate_ / 2));
  double prev = oxphos.calculateProtonLeak(0);
  for (double gradient = 5; gradient <= 400; gradient += 5) {
    double leak = oxphos.calculateProtonLeak(gradient);
    CHECK(leak >= prev);
    CHECK(leak <= oxphos.leak_rate_);
    prev = leak;
  }
}

TEST_CASE("Oxidative phosphorylation")
{
  printHeader();
  QuietReporter quiet;
  Mitochondrion mitochondrion(quiet.reporter_);
  mitochondrion.applyConfig(YAML::Node());
  MetaboliteStore& store = mitochondrion.metabolites_;
  store.produce({{"NADH", 10}});
  OxidativePhosphorylation oxphos(quiet.reporter_);
  const string& gradient = OxidativePhosphorylation::PROTON_GRADIENT;

  SUBCASE("Electron transport and ATP synthase") {
    OxidativePhosphorylationResult result = oxphos.perform(store);
    cout << store.str() << endl;
    // 4 + 2 + 2 per NADH.
    CHECK(result.protons_pumped_ == doctest::Approx(80));
    CHECK(result.nadh_oxidized_ == doctest::Approx(10));
    CHECK(result.fadh2_oxidized_ == 0);
    CHECK(result.oxygen_consumed_ == doctest::Approx(5));
    CHECK(result.protons_leaked_ > 0);
    CHECK(result.protons_leaked_ < 1e-3);
    CHECK(result.atp_produced_ == 19);
    CHECK(store.quantity(gradient) == doctest::Approx(80 - result.protons_leaked_ - 76));
    CHECK(store.quantity("NAD") == doctest::Approx(60));
    CHECK(store.quantity("ubiquinol") == doctest::Approx(0));
    CHECK(store.quantity("cytochrome_c_red") == doctest::Approx(0));
    CHECK(store.quantity("water") == doctest::Approx(5));
    checkInBounds(store);
  }

  SUBCASE("ADP-limited synthase retains the leftover gradient") {
    store.metabolite("ADP").setQuantity(5);
    OxidativePhosphorylationResult result = oxphos.perform(store);
    CHECK(result.atp_produced_ == doctest::Approx(5));
    CHECK(store.quantity(gradient) == doctest::Approx(60 - result.protons_leaked_));
  }

  SUBCASE("Discard mode drops everything but the sub-ATP remainder") {
    oxphos.remainder_ = OxidativePhosphorylation::Discard;
    store.metabolite("ADP").setQuantity(5);
    OxidativePhosphorylationResult result = oxphos.perform(store);
    CHECK(result.atp_produced_ == doctest::Approx(5));
    CHECK(store.quantity(gradient) < oxphos.protons_per_atp_);
  }

  SUBCASE("Gradient never exceeds its max") {
    store.metabolite(gradient).setQuantity(199);
    store.metabolite("ADP").setQuantity(0);
    oxphos.perform(store);
    CHECK(store.quantity(gradient) <= store.metabolite(gradient).max_quantity_);
    checkInBounds(store);
  }

  SUBCASE("Config") {
    oxphos.applyConfig(YAML::Load("leak_rate: 2\nsynthase_remainder: discard\ncomplex_capacity: 3\n"));
    CHECK(oxphos.leak_rate_ == 2);
    CHECK(oxphos.remainder_ == OxidativePhosphorylation::Discard);
    CHECK(oxphos.complexes_[0].capacity_ == 3);
    OxidativePhosphorylationResult result = oxphos.perform(store);
    CHECK(result.nadh_oxidized_ == doctest::Approx(3));
    CHECK_THROWS_AS(oxphos.applyConfig(YAML::Load("synthase_remainder: recycle")), std::invalid_argument);
  }

  SUBCASE("Missing species") {
    MetaboliteStore empty;
    empty.registerMetabolite("ATP", 10, 100);
    try {
      oxphos.perform(empty);
      FAIL("Expected OxidativePhosphorylationError");
    }
    catch (const OxidativePhosphorylationError& e) {
      CHECK_THROWS_AS(std::rethrow_if_nested(e), UnknownMetabolite);
    }
  }
}

TEST_CASE("Cell")
{
  printHeader();
  QuietReporter quiet;
  Cell cell(quiet.reporter_);
  cout << cell.str() << endl;
  MetaboliteStore& cytosol = cell.cytoplasm_.metabolites_;
  MetaboliteStore& matrix = cell.mitochondrion_.metabolites_;
  double initial_adenine = cell.totalAdenineNucleotides();
  CHECK(initial_adenine == doctest::Approx(400));

  SUBCASE("ATP/ADP translocase") {
    CHECK(cell.exchangeAtp(10) == doctest::Approx(10));
    CHECK(matrix.quantity("ATP") == doctest::Approx(90));
    CHECK(matrix.quantity("ADP") == doctest::Approx(110));
    CHECK(cytosol.quantity("ATP") == doctest::Approx(110));
    CHECK(cytosol.quantity("ADP") == doctest::Approx(90));
    CHECK(cell.totalAdenineNucleotides() == doctest::Approx(initial_adenine));
    // Can't move more ATP than the matrix has.
    CHECK(cell.exchangeAtp(1000) == doctest::Approx(90));
    CHECK_THROWS_AS(cell.exchangeAtp(-1), std::invalid_argument);
  }

  SUBCASE("Reset goes back to the configured state") {
    cell.exchangeAtp(10);
    cytosol.produce({{"glucose", 3}});
    cell.catalog_.enzyme("hexokinase")->setActivity(3);
    cell.reset();
    CHECK(matrix.quantity("ATP") == doctest::Approx(100));
    CHECK(cytosol.quantity("glucose") == 0);
    CHECK(cell.catalog_.enzyme("hexokinase")->activity_ == 1);
  }

  SUBCASE("NADH shuttle") {
    cytosol.produce({{"NADH", 3}});
    double matrix_nadh = matrix.quantity("NADH");
    double delivered = cell.mitochondrion_.transferCytoplasmicNadh(cytosol, 10);
    CHECK(delivered == doctest::Approx(3 * 0.67));
    CHECK(cytosol.quantity("NADH") == doctest::Approx(0));
    CHECK(cytosol.quantity("NAD") == doctest::Approx(13));
    CHECK(matrix.quantity("NADH") == doctest::Approx(matrix_nadh + delivered));
  }

  SUBCASE("Pyruvate import") {
    cytosol.produce({{"pyruvate", 2}});
    CHECK(cell.mitochondrion_.importPyruvate(cytosol, 5) == doctest::Approx(2));
    CHECK(cytosol.quantity("pyruvate") == 0);
    CHECK(matrix.quantity("pyruvate") == doctest::Approx(2));
  }

  SUBCASE("Calcium boosts the matrix dehydrogenases") {
    Enzyme::Ptr pdh = cell.catalog_.enzyme("pyruvate_dehydrogenase");
    Enzyme::Ptr idh = cell.catalog_.enzyme("isocitrate_dehydrogenase");
    Enzyme::Ptr fumarase = cell.catalog_.enzyme("fumarase");
    CHECK(!cell.mitochondrion_.bufferCalcium(500));
    CHECK(pdh->activity_ == 1);
    CHECK(cell.mitochondrion_.bufferCalcium(400));
    CHECK(pdh->activity_ == doctest::Approx(1.2));
    CHECK(idh->activity_ == doctest::Approx(1.2));
    CHECK(fumarase->activity_ == 1);
    // Only applied once.
    CHECK(cell.mitochondrion_.bufferCalcium(1));
    CHECK(pdh->activity_ == doctest::Approx(1.2));

    matrix.consume({{"calcium", 500}});
    CHECK(!cell.mitochondrion_.bufferCalcium(0));
    CHECK(pdh->activity_ == doctest::Approx(1));
  }

  SUBCASE("Cellular respiration") {
    matrix.produce({{"pyruvate", 2}});
    RespirationResult result = cell.mitochondrion_.cellularRespiration(2);
    cout << matrix.str() << endl;
    CHECK(result.acetyl_coa_ == doctest::Approx(2));
    // 1 from pyruvate dehydrogenase and 2 per Krebs turn.
    CHECK(result.co2_ == doctest::Approx(6));
    CHECK(result.krebs_atp_ == doctest::Approx(2));
    CHECK(result.oxphos_atp_ > 0);
    CHECK(result.atp_ == doctest::Approx(result.krebs_atp_ + result.oxphos_atp_));
    CHECK(matrix.quantity("NADH") == doctest::Approx(0));
    CHECK(matrix.quantity("FADH2") == doctest::Approx(0));
    CHECK(cell.totalAdenineNucleotides() == doctest::Approx(initial_adenine));
    checkInBounds(matrix);
  }
}

TEST_CASE("Configuring a default cell replaces its state")
{
  printHeader();
  QuietReporter quiet;
  Cell cell(quiet.reporter_);
  cell.cytoplasm_.metabolites_.produce({{"glucose", 7}});
  cell.applyConfig(YAML::Load("Cytoplasm:\n"
                              "  ATP: {quantity: 100, meta: {concentration: {range: {max: 150}}}}\n"));
  MetaboliteStore& cytosol = cell.cytoplasm_.metabolites_;
  CHECK(cytosol.quantity("ATP") == 100);
  CHECK(cytosol.metabolite("ATP").max_quantity_ == 150);
  CHECK(cytosol.quantity("glucose") == 0);
  CHECK(cytosol.quantity("ADP") == 100);

  // The configured state is what reset goes back to.
  cytosol.consume({{"ATP", 30}});
  cell.reset();
  CHECK(cytosol.quantity("ATP") == 100);

  // Applying the same config twice doesn't stack.
  cell.applyConfig("config.yaml");
  cell.applyConfig("config.yaml");
  CHECK(cytosol.quantity("AMP") == 10);
  CHECK(cytosol.quantity("ATP") == YAML::LoadFile("config.yaml")["Cytoplasm"]["ATP"]["quantity"].as<double>());
}

TEST_CASE("Cell configuration")
{
  printHeader();
  QuietReporter quiet;
  Cell cell(YAML::Load("Simulation:\n"
                       "  synthase_remainder: discard\n"
                       "  correct_adenine_drift: false\n"
                       "  max_substeps: 50\n"
                       "Cytoplasm:\n"
                       "  glucose: {quantity: 5, meta: {concentration: {range: {max: 50}}}}\n"
                       "Mitochondrion:\n"
                       "  oxygen: {quantity: 20}\n"
                       "Reactions:\n"
                       "  - name: hexokinase\n"
                       "    formula: glucose + ATP -> glucose_6_phosphate + ADP\n"
                       "    vmax: 50\n"
                       "    KMs: {glucose: 0.1, ATP: 0.1}\n"),
            quiet.reporter_);

  CHECK(cell.cytoplasm_.metabolites_.quantity("glucose") == 5);
  CHECK(cell.cytoplasm_.metabolites_.metabolite("glucose").max_quantity_ == 50);
  // Defaults fill in whatever the config leaves out.
  CHECK(cell.cytoplasm_.metabolites_.quantity("ATP") == 100);
  CHECK(cell.mitochondrion_.metabolites_.metabolite("oxygen").max_quantity_ == 20);
  CHECK(cell.mitochondrion_.oxidative_phosphorylation_.remainder_ == OxidativePhosphorylation::Discard);
  CHECK(!cell.cytoplasm_.glycolysis_->correct_adenine_drift_);
  CHECK(cell.cytoplasm_.glycolysis_->max_substeps_ == 50);
  CHECK(cell.cytoplasm_.glycolysis_->investment_[0]->enzyme_->vmax_ == 50);
  CHECK(cell.cytoplasm_.glycolysis_->investment_[0] == cell.catalog_.reaction("hexokinase"));

  CHECK_THROWS_AS(Cell(YAML::Load("Simulation: {time_step: 0}"), quiet.reporter_), std::invalid_argument);
  CHECK_THROWS_AS(Cell(YAML::Load("Simulation: {log_level: chatty}"), quiet.reporter_), std::invalid_argument);
}

TEST_CASE("Shipped config.yaml")
{
  printHeader();
  QuietReporter quiet;
  Cell cell(YAML::LoadFile("config.yaml"), quiet.reporter_);
  CHECK(cell.params_.glucose_amounts_.size() == 3);
  CHECK(cell.cytoplasm_.metabolites_.quantity("AMP") == 10);
  CHECK(cell.catalog_.has("lactate_dehydrogenase"));
}

TEST_CASE("Simulation")
{
  printHeader();
  QuietReporter quiet;
  Cell cell(quiet.reporter_);
  double initial_adenine = cell.totalAdenineNucleotides();
  SimulationController controller(cell, quiet.reporter_);

  SUBCASE("Full run") {
    int num_steps = 0;
    bool in_bounds = true;
    controller.on_step_ = [&](const SimulationController& ctrl) {
      ++num_steps;
      in_bounds = in_bounds && ctrl.checkBounds();
    };
    SimulationResults results = controller.runSimulation(4);
    cout << cell.str() << endl;

    CHECK(results.glucose_processed_ == 4);
    CHECK(!results.stopped_early_);
    CHECK(results.skipped_iterations_ == 0);
    CHECK(num_steps == results.iterations_);
    CHECK(in_bounds);
    CHECK(results.glycolysis_atp_ == doctest::Approx(8));
    CHECK(results.respiration_atp_ > results.glycolysis_atp_);
    CHECK(results.total_atp_produced_ == doctest::Approx(results.glycolysis_atp_ + results.respiration_atp_));
    // 6 CO2 per glucose: 2 from pyruvate dehydrogenase, 4 from the Krebs cycle.
    CHECK(results.co2_produced_ == doctest::Approx(24));
    CHECK(results.oxygen_consumed_ > 0);
    CHECK(results.simulation_time_ > 0);
    CHECK(results.final_adenine_ == doctest::Approx(initial_adenine));
    CHECK(quiet.reporter_.atpProduced("Glycolysis") == doctest::Approx(8));
    CHECK(controller.checkAdenineBalance(initial_adenine));
    checkInBounds(cell.cytoplasm_.metabolites_);
    checkInBounds(cell.mitochondrion_.metabolites_);
  }

  SUBCASE("ADP feedback") {
    controller.applyAdpFeedback();
    double expected = 1 + cell.cytoplasm_.metabolites_.quantity("ADP") / 500;
    CHECK(cell.catalog_.enzyme("hexokinase")->activity_ == doctest::Approx(expected));
    CHECK(cell.catalog_.enzyme("phosphofructokinase")->activity_ == doctest::Approx(expected));
    CHECK(cell.catalog_.enzyme("aldolase")->activity_ == 1);
  }

  SUBCASE("Simulated time ceiling") {
    controller.params_.max_simulation_time_ = 20;
    SimulationResults results = controller.runSimulation(10);
    CHECK(results.stopped_early_);
    CHECK(results.glucose_processed_ < 10);
    CHECK(results.glucose_processed_ > 0);
    CHECK(quiet.reporter_.contains("max simulation time"));
  }

  SUBCASE("Glycolysis failure stops the run") {
    cell.cytoplasm_.metabolites_.metabolite("NAD").setQuantity(0);
    SimulationResults results = controller.runSimulation(2);
    CHECK(results.stopped_early_);
    CHECK(results.glucose_processed_ == 0);
    CHECK(quiet.reporter_.contains("Stopping simulation"));
  }

  SUBCASE("Energy bookkeeping") {
    double initial_energy = cell.totalEnergy();
    CHECK(controller.checkEnergyBalance(initial_energy));
    CHECK(!controller.checkEnergyBalance(initial_energy + 1));
    CHECK(quiet.reporter_.contains("Energy conservation violation"));

    SimulationResults results = controller.runSimulation(2);
    CHECK(results.final_energy_ == doctest::Approx(cell.totalEnergy()));

    map<string, double> state = controller.currentState();
    CHECK(state["glucose_processed"] == 2);
    CHECK(state["simulation_time"] == doctest::Approx(results.simulation_time_));
    CHECK(state["cytoplasm_atp"] == doctest::Approx(results.cytoplasm_atp_));
    CHECK(state["total_energy"] == doctest::Approx(results.final_energy_));
    CHECK(state["oxygen_remaining"] == doctest::Approx(cell.mitochondrion_.metabolites_.quantity("oxygen")));
  }

  SUBCASE("Nothing to do") {
    SimulationResults results = controller.runSimulation(0);
    CHECK(results.iterations_ == 0);
    CHECK_THROWS_AS(controller.runSimulation(-1), std::invalid_argument);
  }
}
