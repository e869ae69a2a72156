#include <catalog.h>
#include <fmt/core.h>
#include <sstream>

using namespace std;

const std::vector<std::string> ReactionCatalog::GLYCOLYSIS_INVESTMENT = {
  "hexokinase",
  "phosphoglucose_isomerase",
  "phosphofructokinase",
  "aldolase",
  "triose_phosphate_isomerase"
};

const std::vector<std::string> ReactionCatalog::GLYCOLYSIS_YIELD = {
  "glyceraldehyde_3_phosphate_dehydrogenase",
  "phosphoglycerate_kinase",
  "phosphoglycerate_mutase",
  "enolase",
  "pyruvate_kinase"
};

const std::vector<std::string> ReactionCatalog::KREBS_CYCLE = {
  "citrate_synthase",
  "aconitase",
  "isocitrate_dehydrogenase",
  "alpha_ketoglutarate_dehydrogenase",
  "succinyl_coa_synthetase",
  "succinate_dehydrogenase",
  "fumarase",
  "malate_dehydrogenase"
};

ReactionCatalog::ReactionCatalog()
{
  addDefaults();
}

ReactionCatalog::ReactionCatalog(const YAML::Node& yaml)
{
  addDefaults();
  applyConfig(yaml);
}

void ReactionCatalog::add(const std::string& name, const std::string& formula, Enzyme* enzyme)
{
  addReaction(Reaction::Ptr(new Reaction(name, Enzyme::Ptr(enzyme), formula)));
}

// Kinetic constants are order-of-magnitude guesses, tuned so that with healthy pools a pathway step
// finishes in a handful of substeps.  Units are whatever the store uses.
void ReactionCatalog::addDefaults()
{
  // Glycolysis, investment phase.
  add("hexokinase", "glucose + ATP -> glucose_6_phosphate + ADP",
      new Enzyme("Hexokinase", 100, Amounts{{"glucose", 0.1}, {"ATP", 0.1}},
                 Amounts{{"glucose_6_phosphate", 10}}));
  add("phosphoglucose_isomerase", "glucose_6_phosphate -> fructose_6_phosphate",
      new Enzyme("Phosphoglucose isomerase", 100, Amounts{{"glucose_6_phosphate", 1}}));
  // ATP is both substrate and feedback inhibitor here; AMP relieves it.
  add("phosphofructokinase", "fructose_6_phosphate + ATP -> fructose_1_6_bisphosphate + ADP",
      new Enzyme("Phosphofructokinase", 100, Amounts{{"fructose_6_phosphate", 1}, {"ATP", 0.1}},
                 Amounts{{"ATP", 500}}, Amounts{{"AMP", 1}}));
  add("aldolase", "fructose_1_6_bisphosphate -> dihydroxyacetone_phosphate + glyceraldehyde_3_phosphate",
      new Enzyme("Aldolase", 100, Amounts{{"fructose_1_6_bisphosphate", 1}}));
  add("triose_phosphate_isomerase", "dihydroxyacetone_phosphate -> glyceraldehyde_3_phosphate",
      new Enzyme("Triose-phosphate isomerase", 100, Amounts{{"dihydroxyacetone_phosphate", 1}}));

  // Glycolysis, yield phase.  Runs twice per glucose.
  add("glyceraldehyde_3_phosphate_dehydrogenase", "glyceraldehyde_3_phosphate + NAD + Pi -> bisphosphoglycerate_1_3 + NADH",
      new Enzyme("Glyceraldehyde 3-phosphate dehydrogenase", 100, Amounts{{"glyceraldehyde_3_phosphate", 1}, {"NAD", 0.1}}));
  add("phosphoglycerate_kinase", "bisphosphoglycerate_1_3 + ADP -> phosphoglycerate_3 + ATP",
      new Enzyme("Phosphoglycerate kinase", 100, Amounts{{"bisphosphoglycerate_1_3", 1}, {"ADP", 0.1}}));
  add("phosphoglycerate_mutase", "phosphoglycerate_3 -> phosphoglycerate_2",
      new Enzyme("Phosphoglycerate mutase", 100, Amounts{{"phosphoglycerate_3", 1}}));
  add("enolase", "phosphoglycerate_2 -> phosphoenolpyruvate",
      new Enzyme("Enolase", 100, Amounts{{"phosphoglycerate_2", 1}}));
  // Feed-forward activation by F1,6BP.
  add("pyruvate_kinase", "phosphoenolpyruvate + ADP -> pyruvate + ATP",
      new Enzyme("Pyruvate kinase", 100, Amounts{{"phosphoenolpyruvate", 0.5}, {"ADP", 0.1}},
                 Amounts{{"ATP", 500}}, Amounts{{"fructose_1_6_bisphosphate", 1}}));

  add("lactate_dehydrogenase", "pyruvate + NADH -> lactate + NAD",
      new Enzyme("Lactate dehydrogenase", 100, Amounts{{"pyruvate", 0.5}, {"NADH", 0.1}}));

  // Link reaction, in the matrix.
  add("pyruvate_dehydrogenase", "pyruvate + NAD + CoA -> acetyl_coa + NADH + CO2",
      new Enzyme("Pyruvate dehydrogenase", 100, Amounts{{"pyruvate", 0.5}, {"NAD", 0.1}, {"CoA", 0.1}},
                 Amounts{{"acetyl_coa", 50}, {"NADH", 200}}));

  // Krebs cycle.
  add("citrate_synthase", "acetyl_coa + oxaloacetate -> citrate + CoA",
      new Enzyme("Citrate synthase", 100, Amounts{{"acetyl_coa", 0.1}, {"oxaloacetate", 0.1}},
                 Amounts{{"ATP", 500}, {"citrate", 50}}));
  add("aconitase", "citrate -> isocitrate",
      new Enzyme("Aconitase", 100, Amounts{{"citrate", 1}}));
  // Cooperative, and regulated by the energy charge rather than by competition.
  add("isocitrate_dehydrogenase", "isocitrate + NAD -> alpha_ketoglutarate + NADH + CO2",
      new Enzyme("Isocitrate dehydrogenase", 100, Amounts{{"isocitrate", 0.3}},
                 Amounts{{"ATP", 50}}, Amounts{{"ADP", 10}}, 2.0, Enzyme::Allosteric));
  add("alpha_ketoglutarate_dehydrogenase", "alpha_ketoglutarate + NAD + CoA -> succinyl_coa + NADH + CO2",
      new Enzyme("Alpha-ketoglutarate dehydrogenase", 100, Amounts{{"alpha_ketoglutarate", 0.5}},
                 Amounts{{"ATP", 100}, {"NADH", 50}, {"succinyl_coa", 10}}));
  add("succinyl_coa_synthetase", "succinyl_coa + ADP + Pi -> succinate + ATP + CoA",
      new Enzyme("Succinyl-CoA synthetase", 100, Amounts{{"succinyl_coa", 0.5}, {"ADP", 0.1}}));
  add("succinate_dehydrogenase", "succinate + FAD -> fumarate + FADH2",
      new Enzyme("Succinate dehydrogenase", 100, Amounts{{"succinate", 0.5}}));
  add("fumarase", "fumarate -> malate",
      new Enzyme("Fumarase", 100, Amounts{{"fumarate", 1}}));
  add("malate_dehydrogenase", "malate + NAD -> oxaloacetate + NADH",
      new Enzyme("Malate dehydrogenase", 100, Amounts{{"malate", 0.5}}));
}

void ReactionCatalog::applyConfig(const YAML::Node& yaml)
{
  if (!yaml || !yaml["Reactions"])
    return;
  for (const YAML::Node& node : yaml["Reactions"])
    addReaction(Reaction::Ptr(new Reaction(node)));
}

void ReactionCatalog::addReaction(Reaction::Ptr reaction)
{
  if (!reaction)
    throw std::invalid_argument("ReactionCatalog: null reaction");
  reactions_[lowercase(reaction->name_)] = reaction;
}

bool ReactionCatalog::has(const std::string& name) const
{
  return reactions_.find(lowercase(name)) != reactions_.end();
}

Reaction::Ptr ReactionCatalog::reaction(const std::string& name) const
{
  auto it = reactions_.find(lowercase(name));
  if (it == reactions_.end())
    throw std::invalid_argument(fmt::format("No reaction named {} in the catalog.", name));
  return it->second;
}

std::vector<std::string> ReactionCatalog::names() const
{
  vector<string> result;
  for (const auto& kv : reactions_)
    result.push_back(kv.first);
  return result;
}

std::string ReactionCatalog::_str() const
{
  std::ostringstream oss;
  oss << "ReactionCatalog with " << reactions_.size() << " reactions" << endl;
  for (const auto& kv : reactions_)
    oss << "  " << kv.first << ": " << kv.second->formula() << endl;
  return oss.str();
}
