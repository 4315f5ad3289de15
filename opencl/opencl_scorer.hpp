#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "plan_encoding.hpp"


///////////////////////////
///       SCORER        ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched plan scoring.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * that computes the four objective scores and the weighted composite of
 * many candidate seating plans in parallel.
 */
class SeatingOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device (GPU, falling back to CPU),
     * context and command queue, and build the scoring program.
     *
     * @throws std::runtime_error if any OpenCL setup step fails.
     */
    SeatingOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~SeatingOpenCLContext();

    SeatingOpenCLContext(const SeatingOpenCLContext&) = delete;
    SeatingOpenCLContext& operator=(const SeatingOpenCLContext&) = delete;

    /**
     * @brief Score a batch of candidate plans on the device.
     *
     * grid holds numCandidates consecutive tableCount × seatsPerTable blocks
     * of guest positions (see appendPlanGrid()). On return, metrics[i] holds
     * the single-precision scores of candidate i widened to double.
     */
    void evaluateBatch(const EncodedGuests& guests,
                       const std::vector<int>& grid,
                       int numCandidates,
                       int tableCount,
                       int seatsPerTable,
                       const ObjectiveWeights& weights,
                       std::vector<PlanMetrics>& metrics);

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
