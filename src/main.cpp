// h2plan : entry point of the hydrogen infrastructure planner

#include <mpi.h>
#include "../inc/planner.h"

int main(int argc, char **argv)
{
	MPI_Init(&argc, &argv);

	ReadWrite rw;
	Planner planner(rw);

	/* ******************* Parallel Setup ******************** */
	int _rank = 0, count = 1;
	MPI_Comm_rank(MPI_COMM_WORLD, &_rank);							// get rank: processor id
	planner.set_rank(_rank);
	planner.set_master(0);
	MPI_Comm_size(MPI_COMM_WORLD, &count);
	planner.set_num_ranks(count);

	if (planner.is_master_proc()) PRINT_SECTION("Hydrogen Infrastructure Planning");

	/* ******************* Process arguments ***************** */
	if (argc < 3) {
		if (planner.is_master_proc()) std::cerr << "usage: " << argv[0] << " <scenario_dir> <-d|-m|-a>" << std::endl;
		MPI_Finalize();
		return EXIT_FAILURE;
	}
	const std::string directory = argv[1];
	rw.set_inputDirectory(directory + "/input");
	rw.set_outputDirectory(directory + "/output");
	planner.set_output_directory(directory + "/output");
	const std::string alg = argv[2];
	if (alg == "-d") {
		planner.set_algorithm(Algorithm::DIRECT);
	}
	else if (alg == "-m") {
		planner.set_algorithm(Algorithm::MONTECARLO);
	}
	else if (alg == "-a") {
		planner.set_algorithm(Algorithm::ARCS);
	}
	else {
		if (planner.is_master_proc()) std::cerr << "unknown option " << alg << std::endl;
		MPI_Finalize();
		return EXIT_FAILURE;
	}

	auto status = Result::NOT_SOLVED;
	try {
		/* ***************** Read Parameters and Data ************ */
		planner.readInputs();

		/* ******************* Solve the model ****************** */
		status = static_cast<Result>(planner.optimize());
	}
	catch (const std::exception &e) {
		std::cerr << "rank " << _rank << ": " << e.what() << std::endl;
		if (count > 1) MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
		MPI_Finalize();
		return EXIT_FAILURE;
	}

	MPI_Bcast(&status, 1, MPI_INT, 0, MPI_COMM_WORLD);
	MPI_Barrier(MPI_COMM_WORLD);
	MPI_Finalize();
	return (status == Result::OPTIMAL) ? EXIT_SUCCESS : status;
}
