#pragma once

#include <kinetics.h>
#include <map>
#include <string>
#include <vector>

// Named reactions the pathways are assembled from.
// Pathways look their reactions up once, at construction, so overrides have to be applied before
// the pathways that use them are built.
class ReactionCatalog : public Printable
{
public:
  typedef std::shared_ptr<ReactionCatalog> Ptr;
  typedef std::shared_ptr<const ReactionCatalog> ConstPtr;

  // Starts out with the default set: glycolysis, lactate fermentation, pyruvate dehydrogenase, Krebs.
  ReactionCatalog();
  // Same as default construction then applyConfig(yaml).
  ReactionCatalog(const YAML::Node& yaml);

  // "Reactions:" list of {name, formula, vmax, KMs, inhibitors, activators, hill, regulation}.
  // Each entry replaces (or adds) the reaction of that name.
  void applyConfig(const YAML::Node& yaml);
  void addReaction(Reaction::Ptr reaction);

  bool has(const std::string& name) const;
  Reaction::Ptr reaction(const std::string& name) const;
  Enzyme::Ptr enzyme(const std::string& name) const { return reaction(name)->enzyme_; }
  std::vector<std::string> names() const;
  std::string _str() const;

  static const std::vector<std::string> GLYCOLYSIS_INVESTMENT;
  static const std::vector<std::string> GLYCOLYSIS_YIELD;
  static const std::vector<std::string> KREBS_CYCLE;

private:
  std::map<std::string, Reaction::Ptr> reactions_;

  void addDefaults();
  void add(const std::string& name, const std::string& formula, Enzyme* enzyme);
};
