/**
 * @file test_main_gtest.cpp
 * @brief GTest runner for the V2M suite
 *
 * The decoder registers PETSc log events and reports through PetscInfo, so
 * PETSc must be initialized before any test constructs a GraphDecoder.
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

int main(int argc, char **argv) {
    MPI_Init(&argc, &argv);

    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, nullptr);
    if (ierr) {
        MPI_Finalize();
        return static_cast<int>(ierr);
    }

    ::testing::InitGoogleTest(&argc, argv);

    // Results are reported by rank 0 only
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    ierr = PetscFinalize();
    MPI_Finalize();

    return result ? result : static_cast<int>(ierr);
}
