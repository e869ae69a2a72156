#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>
#include <catalog.h>
#include <comms.h>
#include <reporter.h>
#include <algorithm>
#include <exception>
#include <sstream>

using namespace std;

void printHeader()
{
  cout << "====================================================================================================" << endl;
}

void fillStore(MetaboliteStore* store)
{
  store->registerMetabolite("A", 10, 100);
  store->registerMetabolite("B", 10, 100);
  store->registerMetabolite("ATP", 2, 100);
}

TEST_CASE("Metabolite registration")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);
  cout << store.str() << endl;

  CHECK(store.has("atp"));
  CHECK(store.has("ATP"));
  CHECK(store.quantity("ATP") == 2);
  CHECK(store.size() == 3);

  SUBCASE("Registering again tops up, clamped to max") {
    store.registerMetabolite("A", 95, 100);
    CHECK(store.quantity("A") == 100);
  }

  SUBCASE("Bad registrations") {
    CHECK_THROWS_AS(store.registerMetabolite("C", -1, 100), std::invalid_argument);
    CHECK_THROWS_AS(store.registerMetabolite("C", 101, 100), std::invalid_argument);
    CHECK(!store.has("C"));
  }

  SUBCASE("Lookups never create entries") {
    CHECK_THROWS_AS(store.quantity("glucose"), UnknownMetabolite);
    CHECK_THROWS_AS(store.isAvailable("glucose", 1), UnknownMetabolite);
    CHECK(!store.has("glucose"));
  }

  SUBCASE("getOrRegisterDefault") {
    Metabolite& met = store.getOrRegisterDefault("glucose");
    CHECK(met.quantity() == 0);
    CHECK(met.max_quantity_ == 100);
    CHECK(store.has("glucose"));
  }
}

TEST_CASE("Metabolite YAML registration")
{
  printHeader();
  MetaboliteStore store;
  store.registerMetabolites(YAML::Load("glucose: {quantity: 5, meta: {concentration: {range: {max: 50}}}}\n"
                                       "ATP: {quantity: 3}\n"));
  CHECK(store.quantity("glucose") == 5);
  CHECK(store.metabolite("glucose").max_quantity_ == 50);
  CHECK(store.metabolite("glucose").metadata_["concentration"]["range"]["max"].as<double>() == 50);
  // No meta means max is the initial quantity.
  CHECK(store.metabolite("ATP").max_quantity_ == 3);
  CHECK(store.metabolite("ATP").label_ == "ATP");
  CHECK(store.metabolite("ATP").name_ == "atp");

  CHECK_THROWS_AS(store.registerMetabolites(YAML::Load("NAD: {quantity: 10, meta: {concentration: {range: {max: 5}}}}")),
                  std::invalid_argument);

  SUBCASE("Every entry of a larger map") {
    MetaboliteStore big;
    YAML::Node yaml;
    for (int i = 0; i < 20; ++i) {
      string name = "m" + to_string(i);
      yaml[name]["quantity"] = i;
      yaml[name]["meta"]["concentration"]["range"]["max"] = 100 + i;
    }
    big.registerMetabolites(yaml);
    CHECK(big.size() == 20);
    for (int i = 0; i < 20; ++i) {
      const Metabolite& met = big.metabolite("m" + to_string(i));
      CHECK(met.quantity() == i);
      CHECK(met.max_quantity_ == 100 + i);
      CHECK(met.metadata_["concentration"]["range"]["max"].as<double>() == 100 + i);
    }
  }
}

TEST_CASE("Batch consume is all or nothing")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);

  CHECK_THROWS_AS(store.consume({{"A", 5}, {"B", 1000}}), InsufficientMetabolite);
  CHECK(store.quantity("A") == 10);
  CHECK(store.quantity("B") == 10);

  CHECK_THROWS_AS(store.consume({{"A", 5}, {"nope", 1}}), UnknownMetabolite);
  CHECK(store.quantity("A") == 10);

  store.consume({{"A", 5}, {"B", 10}});
  CHECK(store.quantity("A") == 5);
  CHECK(store.quantity("B") == 0);

  SUBCASE("Produce past max") {
    CHECK_THROWS_AS(store.produce({{"A", 1}, {"ATP", 99}}), QuantityError);
    CHECK(store.quantity("A") == 5);
    CHECK(store.quantity("ATP") == 2);
  }

  SUBCASE("Exchange nets out per species") {
    // B is empty, but the exchange gives back as much as it takes.
    store.exchange({{"B", 3}}, {{"B", 3}, {"A", 1}});
    CHECK(store.quantity("B") == 0);
    CHECK(store.quantity("A") == 6);
  }

  SUBCASE("Negative amounts") {
    CHECK_THROWS_AS(store.consume({{"A", -1}}), std::invalid_argument);
    CHECK(store.quantity("A") == 5);
  }
}

TEST_CASE("Direct quantity changes respect bounds")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);
  store.changeQuantity("A", -10);
  CHECK(store.quantity("A") == 0);
  CHECK_THROWS_AS(store.changeQuantity("A", -1), QuantityError);
  CHECK_THROWS_AS(store.changeQuantity("B", 91), QuantityError);
  CHECK(store.quantity("A") == 0);
  CHECK(store.quantity("B") == 10);
  CHECK_THROWS_AS(store.metabolite("B").setQuantity(-1), QuantityError);
  CHECK_THROWS_AS(Metabolite("X", 5, 1), std::invalid_argument);
}

TEST_CASE("Change callbacks")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);
  int num_calls = 0;
  double last = -1;
  store.metabolite("A").on_change_ = [&](const Metabolite& met) { ++num_calls; last = met.quantity(); };
  store.consume({{"A", 4}});
  CHECK(num_calls == 1);
  CHECK(last == 6);
  // Failed batches never get as far as the callback.
  CHECK_THROWS(store.consume({{"A", 1}, {"B", 50}}));
  CHECK(num_calls == 1);

  SUBCASE("A callback can use the store") {
    store.metabolite("A").on_change_ = [&](const Metabolite&) { store.produce({{"B", 1}}); };
    store.consume({{"A", 1}});
    CHECK(store.quantity("A") == 5);
    CHECK(store.quantity("B") == 11);
    store.changeQuantity("A", 1);
    CHECK(store.quantity("B") == 12);
    store.registerMetabolite("A", 1, 100);
    CHECK(store.quantity("B") == 13);

    MetaboliteStore::Snapshot snap = store.snapshot();
    store.restore(snap);
    CHECK(store.quantity("B") == 14);
    store.reset();
    // Callbacks run once everything is back at its min.
    CHECK(store.quantity("A") == 0);
    CHECK(store.quantity("B") == 1);
  }
}

TEST_CASE("Reset, snapshot and restore")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);
  MetaboliteStore::Snapshot snap = store.snapshot();
  CHECK(snap.names_.size() == 3);
  CHECK(snap.quantities_.sum() == doctest::Approx(22));

  store.reset();
  for (const string& name : store.names())
    CHECK(store.quantity(name) == store.metabolite(name).min_quantity_);

  store.restore(snap);
  CHECK(store.quantity("A") == 10);
  CHECK(store.quantity("ATP") == 2);

  snap.quantities_[0] = 1000;
  CHECK_THROWS_AS(store.restore(snap), QuantityError);
  CHECK(store.quantity("A") == 10);
}

TEST_CASE("Energy and state")
{
  printHeader();
  MetaboliteStore store("test");
  fillStore(&store);
  CHECK(store.metabolite("ATP").energy() == doctest::Approx(100));
  CHECK(store.metabolite("A").energy() == doctest::Approx(10));  // unknown species are 1 per unit
  CHECK(store.totalEnergy() == doctest::Approx(120));
  CHECK(store.energies()["atp"] == doctest::Approx(100));

  auto state = store.state({"quantity", "percentage_filled", "bogus"});
  CHECK(state["atp"]["quantity"] == 2);
  CHECK(state["atp"]["percentage_filled"] == doctest::Approx(2));
  CHECK(state["atp"].count("bogus") == 0);
}

TEST_CASE("Rate laws")
{
  printHeader();
  CHECK(rateMM(10, 10, 100) == doctest::Approx(50));
  CHECK(rateMM(0, 10, 100) == 0);
  CHECK(rateHill(2, 2, 100, 2) == doctest::Approx(50));
  CHECK(rateHill(1, 2, 100, 2) == doctest::Approx(20));

  SUBCASE("Competitive inhibition raises Km") {
    Enzyme enzyme("inhibited", 100, 10.0, Amounts{{"I", 5}});
    Amounts levels = {{"i", 5}};
    CHECK(enzyme.effectiveKm(10, levels) == doctest::Approx(20));
    CHECK(enzyme.calculateRate(10, levels) == doctest::Approx(100.0 * 10 / 30));
    CHECK(enzyme.calculateRate(10, Amounts()) == doctest::Approx(50));
  }

  SUBCASE("Activation raises Vmax") {
    Enzyme enzyme("activated", 100, 10.0, Amounts(), Amounts{{"A", 2}});
    CHECK(enzyme.effectiveVmax({{"a", 2}}) == doctest::Approx(200));
    CHECK(enzyme.calculateRate(10, {{"a", 2}}) == doctest::Approx(100));
  }

  SUBCASE("Allosteric Hill enzyme") {
    Enzyme enzyme("idh", 100, Amounts{{"isocitrate", 1}}, Amounts{{"ATP", 50}}, Amounts{{"ADP", 10}}, 2.0, Enzyme::Allosteric);
    cout << enzyme.str() << endl;
    Amounts levels = {{"isocitrate", 1}, {"atp", 50}, {"adp", 10}};
    CHECK(enzyme.allostericRegulation(levels) == doctest::Approx(1));
    CHECK(enzyme.effectiveKm(1, levels) == 1);
    CHECK(enzyme.rate(levels, {}) == doctest::Approx(50));

    levels = {{"isocitrate", 1}, {"atp", 100}, {"adp", 0}};
    CHECK(enzyme.allostericRegulation(levels) == doctest::Approx(1.0 / 3));
    CHECK(enzyme.rate(levels, {}) == doctest::Approx(100.0 / 6));
  }

  SUBCASE("Multi-substrate enzymes go at the pace of the scarcest substrate") {
    Enzyme enzyme("two", 100, Amounts{{"X", 1}, {"Y", 1}});
    CHECK(enzyme.rate({{"x", 1}, {"y", 9}}, {}) == doctest::Approx(50));
    CHECK(enzyme.rate({{"x", 9}, {"y", 0}}, {}) == 0);
  }

  SUBCASE("Activity") {
    Enzyme enzyme("e", 100, 1.0);
    enzyme.setActivity(0.5);
    CHECK(enzyme.effectiveVmax(Amounts()) == doctest::Approx(50));
    CHECK_THROWS_AS(enzyme.setActivity(-1), std::invalid_argument);
  }

  SUBCASE("Bad parameters") {
    CHECK_THROWS_AS(Enzyme("e", -1, 1.0), std::invalid_argument);
    CHECK_THROWS_AS(Enzyme("e", 1, 0.0), std::invalid_argument);
    CHECK_THROWS_AS(Enzyme("e", 1, 1.0, Amounts{{"I", 0}}), std::invalid_argument);
  }
}

TEST_CASE("Formula parsing")
{
  printHeader();
  Enzyme::Ptr enzyme(new Enzyme("e", 100, 1.0));
  Reaction rxn("r", enzyme, "2 A + B -> C + 0.5 D");
  CHECK(rxn.consume_["A"] == 2);
  CHECK(rxn.consume_["B"] == 1);
  CHECK(rxn.produce_["C"] == 1);
  CHECK(rxn.produce_["D"] == 0.5);
  CHECK(coefficient(rxn.consume_, "a") == 2);
  CHECK(coefficient(rxn.consume_, "C") == 0);
  cout << rxn.str() << endl;

  CHECK_THROWS_AS(Reaction("r", enzyme, "A -> B -> C"), std::invalid_argument);
  CHECK_THROWS_AS(Reaction("r", enzyme, "A + B"), std::invalid_argument);
  CHECK_THROWS_AS(Reaction("r", enzyme, Amounts{{"A", -1}}, Amounts()), std::invalid_argument);
}

TEST_CASE("Reaction execution is limited by the scarcest factor")
{
  printHeader();
  MetaboliteStore store;
  store.registerMetabolite("S", 3, 100);
  store.registerMetabolite("P", 0, 100);
  Reaction rxn("conversion", Enzyme::Ptr(new Enzyme("e", 100, 1.0)), "S -> P");

  SUBCASE("Substrate bound") {
    // Enzyme allows 75 per unit time, but there are only 3.
    ReactionOutcome outcome = rxn.executeDetailed(store, 1.0);
    CHECK(outcome.reaction_rate_ == doctest::Approx(75));
    CHECK(outcome.rate_ == doctest::Approx(3));
    CHECK(outcome.binding_ == vector<string>{"s_availability"});
    CHECK(store.quantity("S") == doctest::Approx(0));
    CHECK(store.quantity("P") == doctest::Approx(3));
    CHECK(store.quantity("S") >= 0);
  }

  SUBCASE("Kinetics bound") {
    store.changeQuantity("S", 47);
    double rate = rxn.execute(store, 0.1);
    CHECK(rate == doctest::Approx(100.0 * 50 / 51 * 0.1));
    CHECK(store.quantity("S") == doctest::Approx(50 - rate));
    CHECK(store.quantity("P") == doctest::Approx(rate));
  }

  SUBCASE("Ties report every binding factor") {
    store.changeQuantity("S", -1);
    ReactionOutcome outcome = rxn.executeDetailed(store, 1.0, 2.0);
    CHECK(outcome.rate_ == doctest::Approx(2));
    CHECK(outcome.binding_.size() == 2);
    CHECK(std::find(outcome.binding_.begin(), outcome.binding_.end(), "s_availability") != outcome.binding_.end());
    CHECK(std::find(outcome.binding_.begin(), outcome.binding_.end(), "requested_extent") != outcome.binding_.end());
  }

  SUBCASE("Zero time step does nothing") {
    CHECK(rxn.execute(store, 0.0) == 0);
    CHECK(store.quantity("S") == 3);
    CHECK_THROWS_AS(rxn.execute(store, -1.0), std::invalid_argument);
  }

  SUBCASE("Product overflow") {
    store.changeQuantity("P", 99);
    try {
      rxn.execute(store);
      FAIL("Expected ReactionError");
    }
    catch (const ReactionError& e) {
      CHECK_THROWS_AS(std::rethrow_if_nested(e), QuantityError);
    }
    CHECK(store.quantity("S") == 3);
    CHECK(store.quantity("P") == 99);
  }

  SUBCASE("Unregistered species") {
    Reaction missing("missing", Enzyme::Ptr(new Enzyme("e", 100, 1.0)), "S + Q -> P");
    try {
      missing.execute(store);
      FAIL("Expected ReactionError");
    }
    catch (const ReactionError& e) {
      CHECK_THROWS_AS(std::rethrow_if_nested(e), UnknownMetabolite);
    }
    CHECK(store.quantity("S") == 3);
  }
}

TEST_CASE("Reaction from YAML")
{
  printHeader();
  Reaction rxn(YAML::Load("name: hexokinase\n"
                          "enzyme: Hexokinase\n"
                          "formula: glucose + ATP -> glucose_6_phosphate + ADP\n"
                          "vmax: 12\n"
                          "KMs: {glucose: 0.1, ATP: 0.2}\n"
                          "inhibitors: {glucose_6_phosphate: 10}\n"
                          "hill: 1.5\n"
                          "regulation: allosteric\n"));
  CHECK(rxn.name_ == "hexokinase");
  CHECK(rxn.enzyme_->name_ == "Hexokinase");
  CHECK(rxn.enzyme_->vmax_ == 12);
  CHECK(rxn.enzyme_->kms_.at("atp") == doctest::Approx(0.2));
  CHECK(rxn.enzyme_->inhibitors_.at("glucose_6_phosphate") == 10);
  CHECK(rxn.enzyme_->hill_coefficient_ == 1.5);
  CHECK(rxn.enzyme_->regulation_ == Enzyme::Allosteric);
  CHECK(rxn.consume_.size() == 2);

  CHECK_THROWS_AS(Reaction(YAML::Load("name: r\nformula: A -> B\nvmax: 1\nregulation: magic\n")), std::invalid_argument);
}

TEST_CASE("Reaction catalog")
{
  printHeader();
  ReactionCatalog catalog;
  cout << catalog.str() << endl;
  for (const string& name : ReactionCatalog::GLYCOLYSIS_INVESTMENT)
    CHECK(catalog.has(name));
  for (const string& name : ReactionCatalog::GLYCOLYSIS_YIELD)
    CHECK(catalog.has(name));
  for (const string& name : ReactionCatalog::KREBS_CYCLE)
    CHECK(catalog.has(name));
  CHECK(catalog.has("pyruvate_dehydrogenase"));
  CHECK(catalog.enzyme("isocitrate_dehydrogenase")->hill_coefficient_ == 2);
  CHECK_THROWS_AS(catalog.reaction("photosynthesis"), std::invalid_argument);

  catalog.applyConfig(YAML::Load("Reactions:\n"
                                 "  - name: hexokinase\n"
                                 "    formula: glucose + ATP -> glucose_6_phosphate + ADP\n"
                                 "    vmax: 1\n"
                                 "    KMs: {glucose: 0.1}\n"));
  CHECK(catalog.enzyme("hexokinase")->vmax_ == 1);
}

TEST_CASE("Reporter")
{
  printHeader();
  std::ostringstream oss;
  Reporter reporter(oss, Reporter::Warning);
  reporter.setRecording(true);

  reporter.logDebug("quiet");
  reporter.logEvent("also quiet");
  reporter.logWarning("loud");
  reporter.logError("louder");
  CHECK(oss.str() == "[warning] loud\n[error] louder\n");
  CHECK(reporter.numWarnings() == 1);
  CHECK(reporter.numErrors() == 1);
  CHECK(reporter.history().size() == 4);
  CHECK(reporter.contains("also quiet"));

  reporter.logAtpProduction("Glycolysis", 2);
  reporter.logAtpProduction("Glycolysis", 2);
  CHECK(reporter.atpProduced("Glycolysis") == 4);
  CHECK(reporter.atpProduced("Photosynthesis") == 0);

  reporter.clear();
  CHECK(reporter.numWarnings() == 0);
  CHECK(reporter.history().empty());

  CHECK(Reporter::parseLevel("DEBUG") == Reporter::Debug);
  CHECK_THROWS_AS(Reporter::parseLevel("chatty"), std::invalid_argument);
}

TEST_CASE("Message encoding")
{
  printHeader();
  MessageWrapper msg;
  CHECK(msg.size() == 1);
  msg.addField("t", 1.5);
  // name length + name + dtype + double
  CHECK(msg.size() == 1 + 4 + 1 + 1 + 8);

  MetaboliteStore store("test");
  fillStore(&store);
  MessageWrapper snap;
  snap.addSnapshot("s", store.snapshot());
  // s_names: 4 + 7 + 1 + 4 + 3 * (4 + len); s_quantities: 4 + 12 + 1 + 4 + 3 * 8
  CHECK(snap.size() == 1 + (4 + 7 + 1 + 4 + (4 + 1) + (4 + 1) + (4 + 3)) + (4 + 12 + 1 + 4 + 24));
}
