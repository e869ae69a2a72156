#include <eukaryotic.h>
#include <comms.h>
#include <fmt/core.h>
#include <iostream>
#include <memory>

using std::cout, std::endl;

int main(int argc, char** argv)
{
  std::string path = "config.yaml";
  if (argc > 1)
    path = argv[1];

  const YAML::Node& yaml = YAML::LoadFile(path);
  Reporter& reporter = Reporter::global();
  Cell cell(yaml, reporter);
  reporter.setLevel(Reporter::parseLevel(cell.params_.log_level_));
  cout << cell.str() << endl;

  SimulationController controller(cell, reporter);

  // Only bind the socket if someone asked for it; nothing else needs zmq.
  std::unique_ptr<Comms> comms;
  if (cell.params_.broadcast_) {
    comms.reset(new Comms());
    controller.on_step_ = [&comms, &cell](const SimulationController& ctrl) {
      MessageWrapper msg;
      msg.addField("simulation_time", ctrl.simulation_time_);
      msg.addSnapshot("cytoplasm", cell.cytoplasm_.metabolites_.snapshot());
      msg.addSnapshot("mitochondrion", cell.mitochondrion_.metabolites_.snapshot());
      comms->broadcast(msg);
    };
  }

  std::vector<double> amounts = cell.params_.glucose_amounts_;
  if (amounts.empty())
    amounts.push_back(cell.params_.glucose_);

  for (size_t i = 0; i < amounts.size(); ++i) {
    if (i > 0)
      cell.reset();
    cout << fmt::format("Running simulation with {} glucose.", amounts[i]) << endl;
    SimulationResults results = controller.runSimulation(amounts[i]);
    cout << fmt::format("  ATP produced: {:.2f} (glycolysis {:.2f}, respiration {:.2f})",
                        results.total_atp_produced_, results.glycolysis_atp_, results.respiration_atp_) << endl;
    cout << fmt::format("  glucose processed: {}, CO2: {:.2f}, O2 consumed: {:.2f}, simulated time: {:.2f}",
                        results.glucose_processed_, results.co2_produced_, results.oxygen_consumed_,
                        results.simulation_time_) << endl;
    cout << fmt::format("  adenine nucleotides: {:.4f} -> {:.4f}", results.initial_adenine_, results.final_adenine_) << endl;
  }

  cout << cell.str() << endl;
  return 0;
}
