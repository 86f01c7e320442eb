#include <filesystem>
#include <mpi.h>

#include "../inc/planner.h"
#include "../inc/synthesizer.h"
#include "../inc/compiler.h"
#include "../inc/decomposer.h"
#include "../inc/gurobi_solver.h"
#include "../inc/arcs.h"

constexpr auto RESULT_FIELDS = 5;		// trial, status, objective, consumed, produced

void Planner::readInputs()
{
	if (is_master_proc()) PRINT_SECTION("Reading Parameters");
	rw.readParameters(settings);
	if (alg == Algorithm::ARCS) return;

	if (is_master_proc()) PRINT_SECTION("Reading Scenario Data");
	tables = rw.readTables();
}

int Planner::optimize()
{
	Result result = Result::OPTIMAL;
	switch (alg)
	{
	case Algorithm::DIRECT:
		result = direct();
		break;
	case Algorithm::MONTECARLO:
		result = monteCarlo();
		break;
	case Algorithm::ARCS:
		result = buildArcs();
		break;
	default:
		break;
	}
	return result;
}

Result Planner::runScenario(const TableSet &_tables, const Settings &_settings, const std::string &directory, TrialResult &result) const
{
	if (_settings.solver.name != "gurobi") throw std::invalid_argument("unsupported solver '" + _settings.solver.name + "'");

	const InputData data = to_input_data(_tables);
	PRINT_SUBSECTION("building the hydrogen network");
	const Network g = synthesize(data, _settings);
	PRINT_SUBSECTION("compiling the optimization model");
	const OptimizationModel m = compile(g, _settings);

	GurobiSolver solver(directory + "/model.lp");
	Solution sol;
	result.status = solver.solve(m, _settings.solver, sol);
	if (result.status != Result::OPTIMAL) return result.status;

	std::filesystem::create_directories(directory);

	const OutputTable output = decompose(sol, m, g, _settings);
	result.objective = sol.get_objective();
	result.h2_consumed = output.h2_consumed;
	result.h2_produced = output.h2_produced;
	rw.printSolution(output, g.hubs(), directory);
	return result.status;
}

Result Planner::direct()
{
	if (!is_master_proc()) return Result::OPTIMAL;
	PRINT_SECTION("Planning the hydrogen infrastructure");
	TrialResult result;
	result.trial = 0;
	return runScenario(tables, settings, output_directory, result);
}

Result Planner::monteCarlo()
{
	const MonteCarloPlan plan = rw.readMonteCarlo();
	const int numParams = static_cast<int>(plan.params.size());
	if (is_master_proc()) PRINT_SECTION("Monte Carlo with " << plan.trials << " trials of " << numParams << " parameters");

	/* ******************* samples drawn on master and broadcast ****************** */
	std::vector<double> samples(plan.trials * numParams);
	if (is_master_proc()) samples = draw_samples(plan, tables, settings);
	if (!samples.empty()) MPI_Bcast(samples.data(), static_cast<int>(samples.size()), MPI_DOUBLE, master, MPI_COMM_WORLD);

	/* ******************* trials of this rank ****************** */
	std::vector<TrialResult> mine;
	for (int t : trials_of_rank(plan.trials, rank, num_ranks)) {
		std::cout << "rank " << rank << ": trial " << t << std::endl;
		TableSet trialTables = tables;
		Settings trialSettings = settings;
		apply_trial(plan, samples, t, trialTables, trialSettings);

		TrialResult result;
		result.trial = t;
		result.samples.assign(samples.begin() + t * numParams, samples.begin() + (t + 1) * numParams);
		runScenario(trialTables, trialSettings, output_directory + "/trial_" + std::to_string(t), result);
		mine.push_back(result);
	}

	/* ******************* results collected on master ****************** */
	if (!is_master_proc()) {
		for (const auto &r : mine) {
			double buf[RESULT_FIELDS] = { double(r.trial), double(r.status), r.objective, r.h2_consumed, r.h2_produced };
			MPI_Send(buf, RESULT_FIELDS, MPI_DOUBLE, master, r.trial, MPI_COMM_WORLD);
		}
		return Result::OPTIMAL;
	}

	std::vector<TrialResult> results(plan.trials);
	for (const auto &r : mine) results[r.trial] = r;
	for (int t = 0; t < plan.trials; t++) {
		if (t % num_ranks == rank) continue;
		double buf[RESULT_FIELDS];
		MPI_Recv(buf, RESULT_FIELDS, MPI_DOUBLE, t % num_ranks, t, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
		TrialResult &r = results[t];
		r.trial = static_cast<int>(buf[0]);
		r.status = static_cast<Result>(static_cast<int>(buf[1]));
		r.objective = buf[2];
		r.h2_consumed = buf[3];
		r.h2_produced = buf[4];
		r.samples.assign(samples.begin() + t * numParams, samples.begin() + (t + 1) * numParams);
	}
	std::filesystem::create_directories(output_directory);
	rw.printMonteCarlo(plan, results);

	int numOptimal = 0;
	for (const auto &r : results) {
		if (r.status == Result::OPTIMAL) numOptimal++;
	}
	PRINT_SUBSECTION(numOptimal << " of " << plan.trials << " trials solved to optimality");
	return Result::OPTIMAL;
}

Result Planner::buildArcs()
{
	if (!is_master_proc()) return Result::OPTIMAL;
	PRINT_SECTION("Building the hub arcs");
	const std::vector<Hub> hubs = rw.readHubs();
	GreatCircleClient client(settings.arcs.road_detour_factor);
	ArcBuilder builder(hubs, settings.arcs, client);
	const std::vector<HubArc> arcs = builder.build(rw.readArcList("arcs_whitelist"), rw.readArcList("arcs_blacklist"));
	rw.writeArcs(arcs);
	return Result::OPTIMAL;
}
