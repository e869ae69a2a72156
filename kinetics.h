#pragma once

#include <metabolites.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// See Fig 1 of http://book.bionumbers.org/how-many-reactions-do-enzymes-carry-out-each-second/
// Also https://en.wikipedia.org/wiki/Michaelis%E2%80%93Menten_kinetics
double rateMM(double substrate_concentration, double km, double vmax);
// Cooperative binding.  https://en.wikipedia.org/wiki/Hill_equation_(biochemistry)
double rateHill(double substrate_concentration, double k, double vmax, double hill_coefficient);

class Enzyme : public Printable
{
public:
  typedef std::shared_ptr<Enzyme> Ptr;
  typedef std::shared_ptr<const Enzyme> ConstPtr;

  // Competitive: inhibitors raise the effective Km, activators raise the effective Vmax.
  // Allosteric: Km is left alone and Vmax is scaled by allostericRegulation().
  enum Regulation {
    Competitive,
    Allosteric
  };

  const std::string name_;
  const double vmax_;
  const double km_;  // used for substrates that have no entry in kms_
  const Amounts kms_;  // per-substrate Km
  const Amounts inhibitors_;  // species -> Ki
  const Amounts activators_;  // species -> Ka
  const double hill_coefficient_;  // 0 means plain Michaelis-Menten
  const Regulation regulation_;
  // The only thing that changes after construction.  Feedback logic in the pathways and the
  // controller scales it.
  double activity_;

  Enzyme(const std::string& name, double vmax, double km,
         const Amounts& inhibitors = Amounts(),
         const Amounts& activators = Amounts(),
         double hill_coefficient = 0,
         Regulation regulation = Competitive);
  Enzyme(const std::string& name, double vmax, const Amounts& kms,
         const Amounts& inhibitors = Amounts(),
         const Amounts& activators = Amounts(),
         double hill_coefficient = 0,
         Regulation regulation = Competitive);
  Enzyme(const YAML::Node& yaml);

  double calculateRate(double substrate_concentration, const Amounts& levels) const { return calculateRate(substrate_concentration, km_, levels); }
  double calculateRate(double substrate_concentration, double km, const Amounts& levels) const;
  // Multi-substrate enzymes run at the pace of their slowest substrate.
  // default_substrates are used with km_ when kms_ is empty.
  double rate(const Amounts& levels, const std::vector<std::string>& default_substrates) const;

  double effectiveKm(double km, const Amounts& levels) const;
  double effectiveVmax(const Amounts& levels) const;
  // activity_ * prod 1/(1+[I]/Ki) * prod (1+[A]/Ka)
  double allostericRegulation(const Amounts& levels) const;

  std::vector<std::string> regulators() const;
  void setActivity(double activity);
  std::string _str() const;

private:
  void validate() const;
};

class ReactionError : public std::runtime_error
{
public:
  explicit ReactionError(const std::string& msg) : std::runtime_error(msg) {}
};

struct LimitingFactor
{
  std::string name_;
  double value_;
};

struct ReactionOutcome
{
  double rate_;  // the extent actually performed
  double reaction_rate_;  // what the enzyme alone would allow per unit time
  std::vector<LimitingFactor> factors_;
  std::vector<std::string> binding_;  // every factor equal to the minimum
};

class Reaction : public Printable
{
public:
  typedef std::shared_ptr<Reaction> Ptr;
  typedef std::shared_ptr<const Reaction> ConstPtr;

  std::string name_;
  Enzyme::Ptr enzyme_;  // shared with other reactions
  Amounts consume_;  // species -> stoichiometric coefficient
  Amounts produce_;

  Reaction(const std::string& name, Enzyme::Ptr enzyme, const Amounts& consume, const Amounts& produce);
  // formula looks like "glucose + ATP -> glucose_6_phosphate + ADP" or "2 X + Y -> Z".
  Reaction(const std::string& name, Enzyme::Ptr enzyme, const std::string& formula);
  // name, formula, and the enzyme parameters (vmax, km or KMs, inhibitors, activators, hill, regulation).
  Reaction(const YAML::Node& yaml);

  // Runs the reaction for one time step at whatever extent the scarcest limiting factor allows
  // (enzyme kinetics, any single consumed substrate, max_extent).  Returns the extent performed.  Store errors come out as ReactionError
  // with the store exception nested.
  double execute(MetaboliteStore& store, double time_step = 1.0,
                 double max_extent = std::numeric_limits<double>::infinity()) const;
  ReactionOutcome executeDetailed(MetaboliteStore& store, double time_step = 1.0,
                                  double max_extent = std::numeric_limits<double>::infinity()) const;

  // Current levels of everything the rate law looks at.  Regulators that aren't registered are left out
  // (and so count as zero).
  Amounts levels(const MetaboliteStore& store) const;
  std::string formula() const;
  std::string _str() const;
};

// "2 X + Y -> Z" into {X: 2, Y: 1} and {Z: 1}.
void parseFormula(const std::string& formula, Amounts* consume, Amounts* produce);
std::string formatFormula(const Amounts& consume, const Amounts& produce);
// Case-insensitive coefficient lookup, 0 if the species isn't there.
double coefficient(const Amounts& amounts, const std::string& species);
