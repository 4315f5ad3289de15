///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_scorer.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

/// Scores written per candidate: novelty, diversity, balance, transaction, weighted.
static const int SCORES_PER_CANDIDATE = 5;

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* SEATING_KERNEL_SRC = R"(
int seatAt(__global const int* grid, int base, int seatsPerTable, int t, int s) {
    return grid[base + t * seatsPerTable + s];
}

int connected(__global const int* offsets, __global const int* conns, int a, int b) {
    for (int k = offsets[a]; k < offsets[a + 1]; ++k) {
        if (conns[k] == b) return 1;
    }
    return 0;
}

// Number of distinct non-negative codes among the guests seated at table t.
int countDistinct(__global const int* grid, int base, int seatsPerTable, int t,
                  __global const int* codes) {
    int distinct = 0;
    for (int s = 0; s < seatsPerTable; ++s) {
        int g = seatAt(grid, base, seatsPerTable, t, s);
        if (g < 0 || codes[g] < 0) continue;
        int seen = 0;
        for (int r = 0; r < s; ++r) {
            int h = seatAt(grid, base, seatsPerTable, t, r);
            if (h >= 0 && codes[h] == codes[g]) { seen = 1; break; }
        }
        if (!seen) distinct++;
    }
    return distinct;
}

__kernel void score_plans(
    __global const int* grid,               // numCandidates * tableCount * seatsPerTable
    const int numCandidates,
    const int tableCount,
    const int seatsPerTable,
    __global const int* company,            // per guest, -1 = absent
    __global const int* department,         // per guest, -1 = absent
    __global const int* seniority,          // per guest, -1 = absent
    __global const int* type,               // per guest: 0 buyer, 1 seller, 2 neutral, 3 catalyst
    __global const int* connectionOffsets,  // size: numGuests + 1
    __global const int* connections,
    const float wNovelty,
    const float wDiversity,
    const float wBalance,
    const float wTransaction,
    __global float* scoreOut                // numCandidates * 5
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int base = cid * tableCount * seatsPerTable;

    float noveltySum = 0.0f;
    int pairs = 0;
    float diversitySum = 0.0f;
    float balanceSum = 0.0f;
    float transactionSum = 0.0f;
    int occupied = 0;

    for (int t = 0; t < tableCount; ++t) {
        int n = 0;
        int buyers = 0, sellers = 0, catalysts = 0;
        int levelCount[4] = {0, 0, 0, 0};
        int withSeniority = 0;
        int typeSeen[4] = {0, 0, 0, 0};
        int competing = 0;

        for (int s = 0; s < seatsPerTable; ++s) {
            int g = seatAt(grid, base, seatsPerTable, t, s);
            if (g < 0) continue;
            n++;

            // NOVELTY: pairs with the guests seated before g
            for (int r = 0; r < s; ++r) {
                int h = seatAt(grid, base, seatsPerTable, t, r);
                if (h < 0) continue;
                float pairScore = 1.0f;
                if (company[g] >= 0 && company[g] == company[h]) pairScore -= 0.4f;
                if (department[g] >= 0 && department[g] == department[h]) pairScore -= 0.3f;
                if (connected(connectionOffsets, connections, g, h)) pairScore -= 0.3f;
                noveltySum += fmax(0.0f, pairScore);
                pairs++;

                if (type[g] == 1 && type[h] == 1 && company[g] >= 0 && company[g] == company[h]) {
                    competing = 1;
                }
            }

            if (seniority[g] >= 0) {
                levelCount[seniority[g]]++;
                withSeniority++;
            }
            typeSeen[type[g]] = 1;
            if (type[g] == 0) buyers++;
            else if (type[g] == 1) sellers++;
            else if (type[g] == 3) catalysts++;
        }
        if (n == 0) continue;
        occupied++;

        // DIVERSITY
        float companies = (float)countDistinct(grid, base, seatsPerTable, t, company);
        float departments = (float)countDistinct(grid, base, seatsPerTable, t, department);
        diversitySum += (companies / n + departments / n) / 2.0f;

        // BALANCE
        float seniorityTerm = 0.5f;
        if (withSeniority > 0) {
            float ideal = (float)withSeniority / 4.0f;
            float sum = 0.0f;
            int present = 0;
            for (int l = 0; l < 4; ++l) {
                if (levelCount[l] == 0) continue;
                float term = 1.0f - fabs((float)levelCount[l] - ideal) / fmax(1.0f, ideal);
                sum += clamp(term, 0.0f, 1.0f);
                present++;
            }
            seniorityTerm = sum / present;
        }
        int distinctTypes = typeSeen[0] + typeSeen[1] + typeSeen[2] + typeSeen[3];
        float typeTerm = distinctTypes > 1 ? 1.0f : 0.5f;
        balanceSum += (seniorityTerm + typeTerm) / 2.0f;

        // TRANSACTION
        float tableScore = 0.5f;
        if (buyers > 0 && sellers > 0) {
            tableScore += 0.4f;
            tableScore += 0.2f * (float)min(buyers, sellers) / (float)max(buyers, sellers);
        }
        if (catalysts > 0 && (buyers > 0 || sellers > 0)) tableScore += 0.2f;
        if (competing) tableScore -= 0.3f;
        if ((sellers > 0 && buyers == 0) || (buyers > 0 && sellers == 0)) tableScore -= 0.2f;
        transactionSum += clamp(tableScore, 0.0f, 1.0f);
    }

    float novelty = pairs > 0 ? noveltySum / pairs : 1.0f;
    float diversity = occupied > 0 ? diversitySum / occupied : 1.0f;
    float balance = occupied > 0 ? balanceSum / occupied : 1.0f;
    float transaction = occupied > 0 ? transactionSum / occupied : 0.5f;

    int out = cid * 5;
    scoreOut[out + 0] = novelty;
    scoreOut[out + 1] = diversity;
    scoreOut[out + 2] = balance;
    scoreOut[out + 3] = transaction;
    scoreOut[out + 4] = novelty * wNovelty + diversity * wDiversity +
                        balance * wBalance + transaction * wTransaction;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
SeatingOpenCLContext::SeatingOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        logLine(std::cout, "No GPU found, trying CPU...");
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    logLine(std::cout, std::string("Using OpenCL device: ") + name);

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    checkError(err, "creating command queue");

    program = buildProgram(SEATING_KERNEL_SRC);
}

SeatingOpenCLContext::~SeatingOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program SeatingOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        logLine(std::cerr, std::string("OpenCL build log:\n") + log.data());
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
/// Read-only device buffer initialized from a host vector.
static cl_mem uploadInts(cl_context context, const std::vector<int>& data, const char* what) {
    cl_int err = CL_SUCCESS;
    // Zero-length buffers are invalid; keep one dummy element.
    size_t bytes = std::max<size_t>(1, data.size()) * sizeof(int);
    std::vector<int> padded;
    const int* src = data.data();
    if (data.empty()) {
        padded.assign(1, -1);
        src = padded.data();
    }
    cl_mem buf = clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bytes,
                                const_cast<int*>(src), &err);
    checkError(err, what);
    return buf;
}

void SeatingOpenCLContext::evaluateBatch(const EncodedGuests& guests,
                                         const std::vector<int>& grid,
                                         int numCandidates,
                                         int tableCount,
                                         int seatsPerTable,
                                         const ObjectiveWeights& weights,
                                         std::vector<PlanMetrics>& metrics) {
    cl_int err = CL_SUCCESS;
    metrics.clear();
    if (numCandidates == 0) return;

    std::vector<cl_mem> buffers;
    // Releases every buffer created so far, also when a step throws.
    struct BufferGuard {
        std::vector<cl_mem>& held;
        ~BufferGuard() { for (cl_mem m : held) clReleaseMemObject(m); }
    } guard{buffers};

    buffers.push_back(uploadInts(context, grid, "creating d_grid"));
    buffers.push_back(uploadInts(context, guests.company, "creating d_company"));
    buffers.push_back(uploadInts(context, guests.department, "creating d_department"));
    buffers.push_back(uploadInts(context, guests.seniority, "creating d_seniority"));
    buffers.push_back(uploadInts(context, guests.type, "creating d_type"));
    buffers.push_back(uploadInts(context, guests.connectionOffsets, "creating d_connectionOffsets"));
    buffers.push_back(uploadInts(context, guests.connections, "creating d_connections"));

    size_t scoreBytes = (size_t)numCandidates * SCORES_PER_CANDIDATE * sizeof(float);
    cl_mem d_score = clCreateBuffer(context, CL_MEM_WRITE_ONLY, scoreBytes, nullptr, &err);
    checkError(err, "creating d_score");
    buffers.push_back(d_score);

    // Kernel + args
    cl_kernel kernel = clCreateKernel(program, "score_plans", &err);
    checkError(err, "creating kernel");

    float wNovelty = (float)weights.novelty;
    float wDiversity = (float)weights.diversity;
    float wBalance = (float)weights.balance;
    float wTransaction = (float)weights.transaction;

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[0]); checkError(err, "arg grid");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &tableCount); checkError(err, "arg tableCount");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &seatsPerTable); checkError(err, "arg seatsPerTable");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[1]); checkError(err, "arg company");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[2]); checkError(err, "arg department");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[3]); checkError(err, "arg seniority");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[4]); checkError(err, "arg type");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[5]); checkError(err, "arg connectionOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffers[6]); checkError(err, "arg connections");
        err = clSetKernelArg(kernel, arg++, sizeof(float), &wNovelty); checkError(err, "arg wNovelty");
        err = clSetKernelArg(kernel, arg++, sizeof(float), &wDiversity); checkError(err, "arg wDiversity");
        err = clSetKernelArg(kernel, arg++, sizeof(float), &wBalance); checkError(err, "arg wBalance");
        err = clSetKernelArg(kernel, arg++, sizeof(float), &wTransaction); checkError(err, "arg wTransaction");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_score); checkError(err, "arg scoreOut");

        size_t global = (size_t)numCandidates;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing score_plans");
        err = clFinish(queue);
        checkError(err, "finishing queue");
    } catch (...) {
        clReleaseKernel(kernel);
        throw;
    }
    clReleaseKernel(kernel);

    std::vector<float> scores((size_t)numCandidates * SCORES_PER_CANDIDATE);
    err = clEnqueueReadBuffer(queue, d_score, CL_TRUE, 0, scoreBytes, scores.data(), 0, nullptr, nullptr);
    checkError(err, "reading scores");

    metrics.resize(numCandidates);
    for (int c = 0; c < numCandidates; ++c) {
        const float* s = &scores[(size_t)c * SCORES_PER_CANDIDATE];
        metrics[c].novelty = s[0];
        metrics[c].diversity = s[1];
        metrics[c].balance = s[2];
        metrics[c].transaction = s[3];
        metrics[c].weighted = s[4];
    }
}
